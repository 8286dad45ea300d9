// ==============================================================================
// CHIP-8 Execution Engine Implementation
// ==============================================================================

#include "cpu.hpp"
#include <sstream>

namespace chip8 {

const char* engine_state_to_string(EngineState state) {
    switch (state) {
        case EngineState::READY:           return "Ready";
        case EngineState::RUNNING:         return "Running";
        case EngineState::WAITING_FOR_KEY: return "Waiting for key";
        case EngineState::PAUSED:          return "Paused";
        case EngineState::ERROR:           return "Error";
        default:                           return "Unknown";
    }
}

// ==============================================================================
// Constructors
// ==============================================================================

Chip8Engine::Chip8Engine(const EngineConfig& config)
    : config_(config)
    , rng_(make_random_source(config))
{}

Chip8Engine::Chip8Engine(const ProgramBytes& program, const EngineConfig& config)
    : Chip8Engine(config)
{
    load(program);
}

RandomSource Chip8Engine::make_random_source(const EngineConfig& config) {
    if (config.seed) {
        return RandomSource(*config.seed);
    }
    return RandomSource::from_entropy();
}

// ==============================================================================
// Program Loading
// ==============================================================================

void Chip8Engine::load(const ProgramBytes& program) {
    // Build the new image first so a program that doesn't fit leaves the
    // current machine untouched.
    Chip8Memory fresh;
    fresh.load_program(program);

    memory_ = fresh;
    program_ = program;
    registers_.reset();
    stack_.reset();
    framebuffer_ = Framebuffer();
    keys_.fill(false);
    pc_ = Chip8Address::PROGRAM_START;
    vblank_ready_ = false;
    step_over_breakpoint_ = false;
    rng_ = make_random_source(config_);

    state_ = EngineState::READY;
    pause_reason_ = PauseReason::NONE;
    stats_.reset();
    error_message_.clear();
    error_category_.reset();
    error_location_ = 0;
}

void Chip8Engine::load_file(const std::string& file_path) {
    load(Chip8Memory::read_rom_file(file_path));
}

void Chip8Engine::reset() {
    ProgramBytes program = program_;
    load(program);
}

// ==============================================================================
// Execution Control
// ==============================================================================

EngineState Chip8Engine::cycle() {
    if (state_ == EngineState::ERROR) {
        return state_;
    }

    pause_reason_ = PauseReason::NONE;
    step_over_breakpoint_ = false;
    const Address instruction_pc = pc_;

    try {
        // Fetch
        Word raw = memory_.read_opcode(pc_);
        pc_ = static_cast<Address>(pc_ + 2);

        // Decode + execute
        StepResult result = execute(decode_instruction(raw));
        if (result == StepResult::EXECUTED) {
            stats_.instructions_executed++;
        } else {
            stats_.stall_cycles++;
        }

        if (config_.timer_mode == TimerMode::PER_CYCLE) {
            registers_.tick_timers();
        }

        state_ = result == StepResult::WAITING_FOR_KEY
            ? EngineState::WAITING_FOR_KEY
            : EngineState::RUNNING;

    } catch (const Chip8Error& e) {
        set_error(e, instruction_pc);
    } catch (const std::exception& e) {
        set_error(InternalError(std::string("Unexpected error: ") + e.what()),
                  instruction_pc);
    }

    return state_;
}

EngineState Chip8Engine::run_for(uint64_t max_cycles) {
    if (state_ == EngineState::ERROR) {
        return state_;
    }

    // Only the breakpoint that paused the engine is stepped over
    bool step_over = step_over_breakpoint_ ||
        (state_ == EngineState::PAUSED && pause_reason_ == PauseReason::BREAKPOINT);
    step_over_breakpoint_ = false;

    for (uint64_t count = 0; count < max_cycles; count++) {
        if (!(count == 0 && step_over) && breakpoints_.count(pc_)) {
            state_ = EngineState::PAUSED;
            pause_reason_ = PauseReason::BREAKPOINT;
            break;
        }

        if (cycle() == EngineState::ERROR) {
            break;
        }
    }

    return state_;
}

EngineState Chip8Engine::run_frame(uint64_t cycles) {
    run_for(cycles);
    if (state_ != EngineState::ERROR && state_ != EngineState::PAUSED) {
        frame_tick();
    }
    return state_;
}

void Chip8Engine::frame_tick() {
    if (config_.timer_mode == TimerMode::PER_FRAME) {
        registers_.tick_timers();
    }
    vblank_ready_ = true;
    stats_.frame_count++;
}

void Chip8Engine::resume() {
    if (state_ == EngineState::ERROR || state_ == EngineState::PAUSED) {
        step_over_breakpoint_ = pause_reason_ == PauseReason::BREAKPOINT;
        state_ = EngineState::RUNNING;
        pause_reason_ = PauseReason::NONE;
        error_message_.clear();
        error_category_.reset();
    }
}

// ==============================================================================
// Host Interface
// ==============================================================================

void Chip8Engine::set_key(uint8_t key, bool pressed) {
    if (key >= NUM_KEYS) {
        throw InputError(
            "Key index " + std::to_string(key) +
            " is out of range. The keypad has keys 0x0-0xF.");
    }
    keys_[key] = pressed;
}

void Chip8Engine::clear_keys() {
    keys_.fill(false);
}

bool Chip8Engine::is_key_pressed(uint8_t key) const {
    if (key >= NUM_KEYS) {
        throw InputError(
            "Key index " + std::to_string(key) +
            " is out of range. The keypad has keys 0x0-0xF.");
    }
    return keys_[key];
}

std::optional<uint8_t> Chip8Engine::first_pressed_key() const {
    for (uint8_t key = 0; key < NUM_KEYS; key++) {
        if (keys_[key]) {
            return key;
        }
    }
    return std::nullopt;
}

// ==============================================================================
// Breakpoints
// ==============================================================================

void Chip8Engine::add_breakpoint(Address address) {
    breakpoints_.insert(address);
}

void Chip8Engine::remove_breakpoint(Address address) {
    breakpoints_.erase(address);
}

void Chip8Engine::clear_breakpoints() {
    breakpoints_.clear();
}

bool Chip8Engine::has_breakpoint(Address address) const {
    return breakpoints_.count(address) > 0;
}

std::vector<Address> Chip8Engine::get_breakpoints() const {
    return std::vector<Address>(breakpoints_.begin(), breakpoints_.end());
}

// ==============================================================================
// Disassembly
// ==============================================================================

DecodedInstruction Chip8Engine::get_current_instruction() const {
    return decode_instruction(memory_.read_opcode(pc_));
}

std::string Chip8Engine::disassemble(Address address) const {
    return instruction_to_string(memory_.read_opcode(address));
}

std::vector<std::string> Chip8Engine::disassemble_range(Address start, Address end) const {
    std::vector<std::string> result;
    for (size_t addr = start;
         addr < end && addr + 1 < Chip8Address::RAM_SIZE;
         addr += 2) {
        result.push_back(disassemble(static_cast<Address>(addr)));
    }
    return result;
}

// ==============================================================================
// Execution Core
// ==============================================================================

Chip8Engine::StepResult Chip8Engine::execute(const DecodedInstruction& instr) {
    const Quirks& quirks = config_.quirks;
    const Byte vx = registers_.get(instr.x);
    const Byte vy = registers_.get(instr.y);

    switch (instr.op) {
        case Op::NOOP:
            break;

        case Op::CLEAR_SCREEN:
            framebuffer_.clear();
            break;

        case Op::RETURN_FROM_SUBROUTINE:
            pc_ = stack_.pop();
            stats_.return_count++;
            break;

        case Op::JUMP:
            pc_ = instr.nnn;
            break;

        case Op::CALL_SUBROUTINE:
            stack_.push(pc_);
            pc_ = instr.nnn;
            stats_.call_count++;
            break;

        case Op::SKIP_IF_X_EQ_KK: skip_if(vx == instr.kk); break;
        case Op::SKIP_IF_X_NE_KK: skip_if(vx != instr.kk); break;
        case Op::SKIP_IF_X_EQ_Y:  skip_if(vx == vy);       break;
        case Op::SKIP_IF_X_NE_Y:  skip_if(vx != vy);       break;

        case Op::LOAD_X:
            registers_.set(instr.x, instr.kk);
            break;

        case Op::ADD_TO_X:
            // Wraps; VF untouched
            registers_.set(instr.x, static_cast<Byte>(vx + instr.kk));
            break;

        case Op::LOAD_Y_INTO_X:
            registers_.set(instr.x, vy);
            break;

        case Op::OR_X_Y:
        case Op::AND_X_Y:
        case Op::XOR_X_Y: {
            Byte result = instr.op == Op::OR_X_Y  ? static_cast<Byte>(vx | vy)
                        : instr.op == Op::AND_X_Y ? static_cast<Byte>(vx & vy)
                                                  : static_cast<Byte>(vx ^ vy);
            registers_.set(instr.x, result);
            if (quirks.logic_resets_vf) {
                registers_.set_flag(false);
            }
            break;
        }

        // The flag is written last in every ALU op below, so when x is F
        // the flag wins over the arithmetic result.
        case Op::ADD_Y_TO_X: {
            unsigned sum = static_cast<unsigned>(vx) + vy;
            registers_.set(instr.x, static_cast<Byte>(sum & 0xFF));
            registers_.set_flag(sum > 0xFF);
            break;
        }

        case Op::SUB_Y_FROM_X:
            registers_.set(instr.x, static_cast<Byte>(vx - vy));
            registers_.set_flag(vx >= vy);  // VF = NOT borrow
            break;

        case Op::SUB_X_FROM_Y:
            registers_.set(instr.x, static_cast<Byte>(vy - vx));
            registers_.set_flag(vy >= vx);
            break;

        case Op::SHIFT_RIGHT: {
            Byte source = quirks.shift_uses_vy ? vy : vx;
            registers_.set(instr.x, static_cast<Byte>(source >> 1));
            registers_.set_flag((source & 0x01) != 0);
            break;
        }

        case Op::SHIFT_LEFT: {
            Byte source = quirks.shift_uses_vy ? vy : vx;
            registers_.set(instr.x, static_cast<Byte>(source << 1));
            registers_.set_flag((source & 0x80) != 0);
            break;
        }

        case Op::SET_INDEX:
            registers_.set_index(instr.nnn);
            break;

        case Op::JUMP_PLUS_V0:
            pc_ = jump_target(instr.nnn);
            break;

        case Op::SET_RANDOM:
            registers_.set(instr.x, static_cast<Byte>(rng_.next_byte() & instr.kk));
            break;

        case Op::DISPLAY:
            if (quirks.display_waits_vblank && !vblank_ready_) {
                // Retry on a later cycle, after the next frame_tick()
                pc_ = static_cast<Address>(pc_ - 2);
                return StepResult::WAITING_FOR_VBLANK;
            }
            vblank_ready_ = false;
            draw_sprite(instr.x, instr.y, instr.n);
            break;

        case Op::SKIP_IF_PRESSED:
            skip_if(keys_[vx & 0xF]);
            break;

        case Op::SKIP_IF_NOT_PRESSED:
            skip_if(!keys_[vx & 0xF]);
            break;

        case Op::SET_X_TO_DELAY_TIMER:
            registers_.set(instr.x, registers_.get_delay_timer());
            break;

        case Op::WAIT_FOR_KEY: {
            std::optional<uint8_t> key = first_pressed_key();
            if (!key) {
                pc_ = static_cast<Address>(pc_ - 2);
                return StepResult::WAITING_FOR_KEY;
            }
            registers_.set(instr.x, *key);
            break;
        }

        case Op::SET_DELAY_TIMER_TO_X:
            registers_.set_delay_timer(vx);
            break;

        case Op::SET_SOUND_TIMER_TO_X:
            registers_.set_sound_timer(vx);
            break;

        case Op::ADD_X_TO_I:
            registers_.set_index(static_cast<Word>(registers_.get_index() + vx));
            break;

        case Op::SET_I_TO_SPRITE_X:
            registers_.set_index(static_cast<Word>(
                Chip8Address::FONT_BASE + vx * Chip8Address::FONT_GLYPH_SIZE));
            break;

        case Op::LOAD_BCD_OF_X: {
            const Byte digits[3] = {
                static_cast<Byte>(vx / 100),
                static_cast<Byte>((vx / 10) % 10),
                static_cast<Byte>(vx % 10)
            };
            memory_.write_block(registers_.get_index(), digits, 3);
            break;
        }

        case Op::WRITE_0_THROUGH_X: {
            std::array<Byte, NUM_REGISTERS> values{};
            for (uint8_t r = 0; r <= instr.x; r++) {
                values[r] = registers_.get(r);
            }
            memory_.write_block(registers_.get_index(), values.data(), instr.x + 1u);
            advance_index_after_load_store(instr.x);
            break;
        }

        case Op::LOAD_0_THROUGH_X: {
            std::array<Byte, NUM_REGISTERS> values{};
            memory_.read_block(registers_.get_index(), values.data(), instr.x + 1u);
            for (uint8_t r = 0; r <= instr.x; r++) {
                registers_.set(r, values[r]);
            }
            advance_index_after_load_store(instr.x);
            break;
        }

        default:
            throw InternalError(
                "No handler for opcode " + format_hex(instr.raw, 4) +
                ". The decoder and the engine are out of sync.");
    }

    return StepResult::EXECUTED;
}

void Chip8Engine::skip_if(bool condition) {
    if (condition) {
        pc_ = static_cast<Address>(pc_ + 2);
        stats_.skip_count++;
    }
}

// ==============================================================================
// Sprite Drawing
// ==============================================================================

void Chip8Engine::draw_sprite(uint8_t x, uint8_t y, uint8_t rows) {
    // Only the origin wraps; the sprite body is clipped unless the wrap
    // quirk is on.
    const int start_x = registers_.get(x) % DISPLAY_WIDTH;
    const int start_y = registers_.get(y) % DISPLAY_HEIGHT;
    const size_t sprite_start = registers_.get_index();
    const bool wrap = config_.quirks.wrap_sprites;

    registers_.set_flag(false);
    bool collision = false;

    for (int row = 0; row < rows; row++) {
        size_t source = sprite_start + static_cast<size_t>(row);
        if (source >= Chip8Address::RAM_SIZE) {
            break;  // partial draw
        }
        Byte sprite = memory_.read_byte(static_cast<Address>(source));

        for (int col = 0; col < 8; col++) {
            bool bit = ((sprite >> (7 - col)) & 1) != 0;
            int px = start_x + col;
            int py = start_y + row;

            if (wrap) {
                px %= DISPLAY_WIDTH;
                py %= DISPLAY_HEIGHT;
            }

            // xor_pixel ignores off-screen coordinates
            if (framebuffer_.xor_pixel(px, py, bit)) {
                collision = true;
                registers_.set_flag(true);
            }
        }
    }

    stats_.draw_count++;
    if (collision) {
        stats_.collision_count++;
    }
}

Address Chip8Engine::jump_target(Address nnn) const {
    switch (config_.quirks.jump_offset) {
        case JumpOffsetSource::VX: {
            uint8_t reg = static_cast<uint8_t>((nnn >> 8) & 0xF);
            return static_cast<Address>(nnn + registers_.get(reg));
        }
        case JumpOffsetSource::V0_LOW_NIBBLE:
            return static_cast<Address>(nnn + (registers_.get(0) & 0xF));
        case JumpOffsetSource::V0:
        default:
            return static_cast<Address>(nnn + registers_.get(0));
    }
}

void Chip8Engine::advance_index_after_load_store(uint8_t x) {
    Word index = registers_.get_index();
    switch (config_.quirks.load_store) {
        case IndexIncrement::X:
            registers_.set_index(static_cast<Word>(index + x));
            break;
        case IndexIncrement::X_PLUS_1:
            registers_.set_index(static_cast<Word>(index + x + 1));
            break;
        case IndexIncrement::NONE:
        default:
            break;
    }
}

// ==============================================================================
// Error and Debugging
// ==============================================================================

void Chip8Engine::set_error(const Chip8Error& error, Address location) {
    // Components throw without knowing which instruction was running
    Chip8Error located(error.category(), location, error.message());
    error_message_ = located.what();
    error_category_ = error.category();
    error_location_ = location;
    state_ = EngineState::ERROR;
}

std::string Chip8Engine::dump_state() const {
    std::ostringstream oss;

    oss << "=== CHIP-8 Engine State ===\n";
    oss << "PC=" << format_hex(pc_, 3)
        << " State=" << engine_state_to_string(state_) << "\n";
    oss << registers_.dump_state();

    oss << "Stack (" << stack_.pointer() << "/" << STACK_DEPTH << "):";
    for (Address entry : stack_.entries()) {
        oss << " " << format_hex(entry, 3);
    }
    oss << "\n";

    oss << "Keys down:";
    bool any = false;
    for (uint8_t key = 0; key < NUM_KEYS; key++) {
        if (keys_[key]) {
            oss << " " << format_hex(key, 1);
            any = true;
        }
    }
    if (!any) oss << " none";
    oss << "\n";

    if (state_ == EngineState::ERROR) {
        oss << "Error: " << error_message_ << "\n";
    }

    return oss.str();
}

}  // namespace chip8
