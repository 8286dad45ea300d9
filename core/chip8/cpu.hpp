// ==============================================================================
// CHIP-8 Execution Engine
// ==============================================================================
// Simulates the CHIP-8 virtual machine: fetches opcodes from RAM, decodes
// and executes them, and drives the timers.
//
// The engine provides:
// - Program loading (raw bytes at 0x200)
// - Execution control (cycle, run_for, run_frame, breakpoints)
// - The host interface: framebuffer view, keyboard setter, sound timer
// - Register, stack and memory inspection
// - Disassembly of instructions
// - Execution statistics
//
// Faults (bad opcode, stack overflow/underflow, address out of range) never
// escape cycle(): they put the engine into EngineState::ERROR and the
// details are available from get_error_message() and friends.
// ==============================================================================

#ifndef CHIP8_CPU_HPP
#define CHIP8_CPU_HPP

#include "instruction.hpp"
#include "memory.hpp"
#include "registers.hpp"
#include "call_stack.hpp"
#include "framebuffer.hpp"
#include "random.hpp"
#include "quirks.hpp"
#include <array>
#include <optional>
#include <unordered_set>
#include <vector>
#include <string>

namespace chip8 {

constexpr size_t NUM_KEYS = 16;
constexpr size_t DEFAULT_CYCLES_PER_FRAME = 5;

// ==============================================================================
// Engine State
// ==============================================================================

enum class EngineState {
    READY,            // Program loaded, nothing executed yet
    RUNNING,          // Last cycle completed normally
    WAITING_FOR_KEY,  // Fx0A is spinning until a key goes down
    PAUSED,           // Stopped at a breakpoint
    ERROR             // A fault occurred; see get_error_message()
};

enum class PauseReason {
    NONE,
    BREAKPOINT
};

const char* engine_state_to_string(EngineState state);

// ==============================================================================
// Engine Statistics
// ==============================================================================

struct EngineStats {
    uint64_t instructions_executed = 0;
    uint64_t draw_count = 0;        // Dxyn instructions that actually drew
    uint64_t collision_count = 0;   // draws that set VF=1
    uint64_t call_count = 0;
    uint64_t return_count = 0;
    uint64_t skip_count = 0;        // conditional skips taken
    uint64_t frame_count = 0;       // frame_tick() calls
    uint64_t stall_cycles = 0;      // Fx0A spins and vblank-held Dxyn

    void reset() {
        instructions_executed = 0;
        stall_cycles = 0;
        draw_count = 0;
        collision_count = 0;
        call_count = 0;
        return_count = 0;
        skip_count = 0;
        frame_count = 0;
    }
};

// ==============================================================================
// Engine Class
// ==============================================================================

/**
 * @brief The CHIP-8 execution engine.
 *
 * Basic usage:
 *   EngineConfig config;
 *   Chip8Engine chip(Chip8Memory::read_rom_file("pong.ch8"), config);
 *   while (running) {
 *       chip.run_frame(DEFAULT_CYCLES_PER_FRAME);
 *       render(chip.framebuffer());
 *       beep(chip.is_sound_active());
 *       chip.set_key(0x5, key_down);
 *   }
 *
 * Debugging usage:
 *   chip.add_breakpoint(0x2A4);
 *   chip.run_for(100000);       // Runs until breakpoint
 *   chip.cycle();               // Execute one instruction
 *   Byte v3 = chip.registers().get(3);
 */
class Chip8Engine {
public:
    explicit Chip8Engine(const EngineConfig& config = EngineConfig{});
    Chip8Engine(const ProgramBytes& program, const EngineConfig& config = EngineConfig{});

    // =========================================================================
    // Program Loading
    // =========================================================================

    /**
     * @brief Load a program and return to the power-on state.
     *
     * Equivalent to constructing a fresh engine with the same config:
     * memory, registers, stack, display, keys and statistics are cleared,
     * PC is 0x200 and the random source restarts from its seed.
     *
     * @throws RomLoadError if the program doesn't fit in RAM
     */
    void load(const ProgramBytes& program);

    /**
     * @brief Read a ROM file and load it.
     *
     * @throws RomLoadError if the file can't be read or doesn't fit
     */
    void load_file(const std::string& file_path);

    /**
     * @brief Reload the current program into the power-on state.
     */
    void reset();

    // =========================================================================
    // Execution Control
    // =========================================================================

    /**
     * @brief Execute one fetch/decode/execute cycle.
     *
     * Does nothing in the ERROR state; call resume() first.
     */
    EngineState cycle();

    /**
     * @brief Execute up to max_cycles cycles.
     *
     * Stops early on a fault or when PC reaches a breakpoint, including a
     * breakpoint at PC before the first cycle. Calling run_for again (or
     * resume() then run_for) continues past the breakpoint that paused
     * the engine.
     */
    EngineState run_for(uint64_t max_cycles);

    /**
     * @brief One host frame: run_for(cycles) followed by frame_tick().
     *
     * The frame tick is skipped when the burst ends in ERROR or PAUSED, so
     * a halted engine's timers and frame count stay frozen.
     */
    EngineState run_frame(uint64_t cycles = DEFAULT_CYCLES_PER_FRAME);

    /**
     * @brief The 60 Hz clock edge.
     *
     * Decrements the timers in TimerMode::PER_FRAME and releases a Dxyn
     * that is waiting for vertical blank.
     */
    void frame_tick();

    /**
     * @brief Leave the ERROR or PAUSED state.
     *
     * After a fault raised by an executing instruction, PC already points
     * past it, so resuming skips the offending instruction.
     */
    void resume();

    EngineState get_state() const { return state_; }
    PauseReason get_pause_reason() const { return pause_reason_; }
    bool is_waiting_for_key() const { return state_ == EngineState::WAITING_FOR_KEY; }

    // =========================================================================
    // Host Interface
    // =========================================================================

    /**
     * @brief Read-only view of the display, valid between cycles.
     */
    const Framebuffer& framebuffer() const { return framebuffer_; }

    /**
     * @brief Acknowledge that the host has presented the current frame.
     */
    void clear_display_dirty() { framebuffer_.clear_dirty(); }

    /**
     * @brief Press or release a key on the hex keypad.
     *
     * @throws InputError if key > 0xF
     */
    void set_key(uint8_t key, bool pressed);

    /**
     * @brief Release every key.
     */
    void clear_keys();

    bool is_key_pressed(uint8_t key) const;

    Byte sound_timer() const { return registers_.get_sound_timer(); }
    Byte delay_timer() const { return registers_.get_delay_timer(); }
    bool is_sound_active() const { return registers_.get_sound_timer() > 0; }

    // =========================================================================
    // Register and Memory Inspection
    // =========================================================================

    Address get_pc() const { return pc_; }
    void set_pc(Address pc) { pc_ = pc; }

    const RegisterFile& registers() const { return registers_; }
    RegisterFile& registers() { return registers_; }

    const Chip8Memory& memory() const { return memory_; }
    Chip8Memory& memory() { return memory_; }

    const CallStack& stack() const { return stack_; }

    const EngineConfig& config() const { return config_; }

    /**
     * @brief Change quirks without reloading the program.
     */
    void set_quirks(const Quirks& quirks) { config_.quirks = quirks; }

    // =========================================================================
    // Breakpoints
    // =========================================================================

    void add_breakpoint(Address address);
    void remove_breakpoint(Address address);
    void clear_breakpoints();
    bool has_breakpoint(Address address) const;
    std::vector<Address> get_breakpoints() const;

    // =========================================================================
    // Disassembly
    // =========================================================================

    /**
     * @brief Decode the instruction at PC.
     *
     * @throws DecodeError / AddressFault if PC doesn't hold a valid opcode
     */
    DecodedInstruction get_current_instruction() const;

    /**
     * @brief Disassemble the opcode at an address.
     */
    std::string disassemble(Address address) const;

    /**
     * @brief Disassemble the opcodes in [start, end), stepping 2 bytes.
     */
    std::vector<std::string> disassemble_range(Address start, Address end) const;

    // =========================================================================
    // Statistics and Error
    // =========================================================================

    const EngineStats& get_stats() const { return stats_; }
    const std::string& get_error_message() const { return error_message_; }
    std::optional<ErrorCategory> get_error_category() const { return error_category_; }

    /**
     * @brief Address of the instruction that faulted.
     */
    Address get_error_location() const { return error_location_; }

    /**
     * @brief Registers, PC, stack and keys as text.
     */
    std::string dump_state() const;

private:
    EngineConfig config_;

    // Machine state
    Chip8Memory memory_;
    RegisterFile registers_;
    CallStack stack_;
    Framebuffer framebuffer_;
    RandomSource rng_;
    std::array<bool, NUM_KEYS> keys_{};
    Address pc_ = Chip8Address::PROGRAM_START;
    ProgramBytes program_;

    // Set by frame_tick(), consumed by a vblank-gated Dxyn
    bool vblank_ready_ = false;

    // Set by resume() out of a breakpoint pause
    bool step_over_breakpoint_ = false;

    // Engine state
    EngineState state_ = EngineState::READY;
    PauseReason pause_reason_ = PauseReason::NONE;

    EngineStats stats_;
    std::unordered_set<Address> breakpoints_;

    // Error
    std::string error_message_;
    std::optional<ErrorCategory> error_category_;
    Address error_location_ = 0;

    // =========================================================================
    // Internal
    // =========================================================================

    static RandomSource make_random_source(const EngineConfig& config);

    enum class StepResult {
        EXECUTED,
        WAITING_FOR_KEY,     // Fx0A rewound PC
        WAITING_FOR_VBLANK   // Dxyn rewound PC
    };

    /**
     * @brief Execute one decoded instruction. PC already points past it.
     */
    StepResult execute(const DecodedInstruction& instr);

    void skip_if(bool condition);
    void draw_sprite(uint8_t x, uint8_t y, uint8_t rows);
    Address jump_target(Address nnn) const;
    void advance_index_after_load_store(uint8_t x);
    std::optional<uint8_t> first_pressed_key() const;

    void set_error(const Chip8Error& error, Address location);
};

}  // namespace chip8

#endif  // CHIP8_CPU_HPP
