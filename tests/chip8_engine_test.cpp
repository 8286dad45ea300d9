// ==============================================================================
// CHIP-8 Engine Tests
// ==============================================================================

#include "cpu.hpp"
#include "instruction.hpp"
#include "memory.hpp"
#include <iostream>
#include <cassert>

using namespace chip8;

static int test_count = 0;
static int pass_count = 0;

static void check(bool condition, const std::string& name) {
    test_count++;
    if (condition) {
        pass_count++;
        std::cout << "PASS: " << name << std::endl;
    } else {
        std::cout << "FAIL: " << name << std::endl;
        assert(false);
    }
}

static Chip8Engine make_engine(const ProgramBytes& program) {
    EngineConfig config;
    config.seed = 2;
    return Chip8Engine(program, config);
}

// ==============================================================================
// Instruction Decoder Tests
// ==============================================================================

void test_decode_fields() {
    std::cout << "--- Instruction Decoder ---\n";

    auto d = decode_instruction(0x00E0);
    check(d.op == Op::CLEAR_SCREEN, "00E0 decodes to CLEAR_SCREEN");

    d = decode_instruction(0x00EE);
    check(d.op == Op::RETURN_FROM_SUBROUTINE, "00EE decodes to RETURN");

    d = decode_instruction(0x0123);
    check(d.op == Op::NOOP, "0nnn decodes to NOOP");

    d = decode_instruction(0x1ABC);
    check(d.op == Op::JUMP && d.nnn == 0xABC, "1ABC jump nnn");

    d = decode_instruction(0x6A42);
    check(d.op == Op::LOAD_X && d.x == 0xA && d.kk == 0x42, "6A42 load x kk");

    d = decode_instruction(0xD125);
    check(d.op == Op::DISPLAY && d.x == 1 && d.y == 2 && d.n == 5, "D125 display x y n");

    d = decode_instruction(0x8AB4);
    check(d.op == Op::ADD_Y_TO_X && d.x == 0xA && d.y == 0xB, "8AB4 add y to x");

    d = decode_instruction(0x8AB6);
    check(d.op == Op::SHIFT_RIGHT, "8xy6 shift right");

    d = decode_instruction(0x8ABE);
    check(d.op == Op::SHIFT_LEFT, "8xyE shift left");

    d = decode_instruction(0xE19E);
    check(d.op == Op::SKIP_IF_PRESSED && d.x == 1, "E19E skip if pressed");

    d = decode_instruction(0xE1A1);
    check(d.op == Op::SKIP_IF_NOT_PRESSED, "E1A1 skip if not pressed");

    d = decode_instruction(0xF533);
    check(d.op == Op::LOAD_BCD_OF_X && d.x == 5, "F533 BCD");

    d = decode_instruction(0xF00A);
    check(d.op == Op::WAIT_FOR_KEY, "F00A wait for key");
}

void test_decode_errors() {
    bool threw = false;
    try {
        decode_instruction(0x8AB8);
    } catch (const DecodeError& e) {
        threw = e.opcode() == 0x8AB8 && e.category() == ErrorCategory::DECODE_ERROR;
    }
    check(threw, "unmapped 8xy8 throws DecodeError");

    threw = false;
    try { decode_instruction(0xE1FF); } catch (const DecodeError&) { threw = true; }
    check(threw, "unmapped ExFF throws DecodeError");

    threw = false;
    try { decode_instruction(0xF1FF); } catch (const DecodeError&) { threw = true; }
    check(threw, "unmapped FxFF throws DecodeError");

    check(!is_valid_opcode(0x8AB8), "is_valid_opcode rejects 8xy8");
    check(is_valid_opcode(0x5120), "is_valid_opcode accepts 5xy0");
    check(is_valid_opcode(0x0FFF), "is_valid_opcode accepts 0nnn");
}

void test_disassembly() {
    check(instruction_to_string(static_cast<Word>(0x00E0)) == "CLS", "disassemble CLS");
    check(instruction_to_string(static_cast<Word>(0x00EE)) == "RET", "disassemble RET");
    check(instruction_to_string(static_cast<Word>(0x1123)) == "JP 0x123", "disassemble JP");
    check(instruction_to_string(static_cast<Word>(0x6123)) == "LD V1, 0x23", "disassemble LD Vx, kk");
    check(instruction_to_string(static_cast<Word>(0xD015)) == "DRW V0, V1, 5", "disassemble DRW");
    check(instruction_to_string(static_cast<Word>(0xA123)) == "LD I, 0x123", "disassemble LD I");
    check(instruction_to_string(static_cast<Word>(0xB200)) == "JP V0, 0x200", "disassemble JP V0");
    check(instruction_to_string(static_cast<Word>(0x8126)) == "SHR V1, V2", "disassemble SHR");
    check(instruction_to_string(static_cast<Word>(0xF355)) == "LD [I], V3", "disassemble LD [I]");
    check(instruction_to_string(static_cast<Word>(0xFA65)) == "LD VA, [I]", "disassemble LD Vx, [I]");
    check(instruction_to_string(static_cast<Word>(0x8AB8)) == "DW 0x8AB8", "disassemble invalid as DW");
}

// ==============================================================================
// Memory, Register and Stack Tests
// ==============================================================================

void test_memory() {
    std::cout << "\n--- Memory ---\n";

    Chip8Memory mem;
    check(mem.read_byte(0) == 0xF0, "font glyph 0 at 0x000");
    check(mem.read_byte(5) == 0x20, "font glyph 1 at 0x005");
    check(mem.read_byte(79) == 0x80, "font glyph F ends at 0x04F");

    mem.load_program({0x12, 0x34, 0x56});
    check(mem.program_size() == 3, "program size recorded");
    check(mem.read_opcode(0x200) == 0x1234, "big-endian opcode fetch");

    mem.write_byte(0x300, 42);
    check(mem.read_byte(0x300) == 42, "RAM write/read");

    bool threw = false;
    try { mem.write_byte(0x010, 1); } catch (const AddressFault&) { threw = true; }
    check(threw, "font region write throws AddressFault");
    check(mem.read_byte(0x010) == FONT_SET[0x10], "font unchanged after rejected write");

    threw = false;
    try { mem.read_byte(4096); } catch (const AddressFault& e) { threw = e.address() == 4096; }
    check(threw, "read at 4096 throws AddressFault");

    threw = false;
    try { mem.read_opcode(0xFFF); } catch (const AddressFault&) { threw = true; }
    check(threw, "opcode fetch straddling the end throws");

    mem.write_byte(0xFFE, 7);
    const Byte block[3] = {1, 2, 3};
    threw = false;
    try { mem.write_block(0xFFE, block, 3); } catch (const AddressFault&) { threw = true; }
    check(threw, "block write past the end throws");
    check(mem.read_byte(0xFFE) == 7, "rejected block write leaves memory untouched");

    threw = false;
    try { mem.load_program(ProgramBytes(3585, 0)); } catch (const RomLoadError&) { threw = true; }
    check(threw, "3585-byte program is too large");

    mem.load_program(ProgramBytes(3584, 0xAA));
    check(mem.read_byte(0xFFF) == 0xAA, "3584-byte program fills RAM");

    mem.reset();
    check(mem.read_byte(0x300) == 0 && mem.read_byte(0) == 0xF0, "reset zeroes RAM and keeps font");
}

void test_registers_and_stack() {
    RegisterFile regs;
    regs.set(3, 99);
    check(regs.get(3) == 99, "register write/read");

    bool threw = false;
    try { regs.get(16); } catch (const InputError&) { threw = true; }
    check(threw, "register index 16 throws InputError");

    regs.set_delay_timer(1);
    regs.set_sound_timer(0);
    regs.tick_timers();
    regs.tick_timers();
    check(regs.get_delay_timer() == 0 && regs.get_sound_timer() == 0, "timers stop at zero");

    CallStack stack;
    for (Address i = 0; i < STACK_DEPTH; i++) {
        stack.push(static_cast<Address>(0x200 + i * 2));
    }
    check(stack.full() && stack.pointer() == 16, "stack holds 16 entries");

    threw = false;
    try { stack.push(0x300); } catch (const StackFault&) { threw = true; }
    check(threw, "17th push throws StackFault");
    check(stack.pointer() == 16, "overflow leaves pointer at 16");

    check(stack.pop() == 0x21E, "pop returns last pushed address");
    while (!stack.empty()) stack.pop();

    threw = false;
    try { stack.pop(); } catch (const StackFault&) { threw = true; }
    check(threw, "pop on empty stack throws StackFault");
}

void test_framebuffer() {
    Framebuffer fb;
    check(!fb.xor_pixel(3, 4, true), "xor onto dark pixel: no collision");
    check(fb.get_pixel(3, 4), "pixel lit after xor");
    check(fb.xor_pixel(3, 4, true), "xor onto lit pixel: collision");
    check(!fb.get_pixel(3, 4), "pixel erased after second xor");
    check(!fb.xor_pixel(64, 0, true) && fb.lit_count() == 0, "off-screen xor ignored");
    check(fb.to_string().size() == 65 * 32, "text render has 32 lines of 64");
}

// ==============================================================================
// Engine: Loads, Arithmetic and Flow
// ==============================================================================

void test_load_immediate() {
    std::cout << "\n--- Engine Execution ---\n";

    auto chip = make_engine({0x6A, 0x42});
    check(chip.get_state() == EngineState::READY, "engine ready after load");
    check(chip.get_pc() == 0x200, "PC starts at 0x200");

    chip.cycle();
    check(chip.registers().get(0xA) == 0x42, "6A42: VA=0x42");
    check(chip.get_pc() == 0x202, "6A42: PC advanced by 2");
    check(chip.get_state() == EngineState::RUNNING, "state is RUNNING after a cycle");
}

void test_add_with_carry_all_pairs() {
    auto chip = make_engine({0x80, 0x14});  // V0 += V1
    bool all_ok = true;

    for (unsigned a = 0; a < 256 && all_ok; a++) {
        for (unsigned b = 0; b < 256; b++) {
            chip.set_pc(0x200);
            chip.registers().set(0, static_cast<Byte>(a));
            chip.registers().set(1, static_cast<Byte>(b));
            chip.cycle();

            if (chip.registers().get(0) != ((a + b) & 0xFF) ||
                chip.registers().get(0xF) != (a + b > 255 ? 1 : 0)) {
                all_ok = false;
                break;
            }
        }
    }
    check(all_ok, "8xy4 result and carry for all (a, b)");
}

void test_sub_no_borrow_all_pairs() {
    auto chip = make_engine({0x80, 0x15});  // V0 -= V1
    bool all_ok = true;

    for (unsigned a = 0; a < 256 && all_ok; a++) {
        for (unsigned b = 0; b < 256; b++) {
            chip.set_pc(0x200);
            chip.registers().set(0, static_cast<Byte>(a));
            chip.registers().set(1, static_cast<Byte>(b));
            chip.cycle();

            if (chip.registers().get(0) != ((a - b) & 0xFF) ||
                chip.registers().get(0xF) != (a >= b ? 1 : 0)) {
                all_ok = false;
                break;
            }
        }
    }
    check(all_ok, "8xy5 result and no-borrow flag for all (a, b)");
}

void test_alu_edge_cases() {
    // 8xy7: V1 = V2 - V1
    auto chip = make_engine({0x81, 0x27});
    chip.registers().set(1, 10);
    chip.registers().set(2, 3);
    chip.cycle();
    check(chip.registers().get(1) == 249 && chip.registers().get(0xF) == 0,
          "8xy7 borrow: 3-10 wraps, VF=0");

    // VF as destination: flag overwrites the sum
    chip = make_engine({0x8F, 0x14});
    chip.registers().set(0xF, 0xFF);
    chip.registers().set(1, 1);
    chip.cycle();
    check(chip.registers().get(0xF) == 1, "8F14: carry flag written after result");

    chip = make_engine({0x81, 0x27});
    chip.registers().set(1, 3);
    chip.registers().set(2, 10);
    chip.cycle();
    check(chip.registers().get(1) == 7 && chip.registers().get(0xF) == 1,
          "8xy7 no borrow: 10-3, VF=1");

    // x = F for subtractions and shifts: only the flag survives
    chip = make_engine({0x8F, 0x15});
    chip.registers().set(0xF, 5);
    chip.registers().set(1, 3);
    chip.cycle();
    check(chip.registers().get(0xF) == 1, "8F15: no-borrow flag replaces the difference");

    chip = make_engine({0x8F, 0x17});
    chip.registers().set(0xF, 5);
    chip.registers().set(1, 3);
    chip.cycle();
    check(chip.registers().get(0xF) == 0, "8F17: borrow flag replaces the difference");

    chip = make_engine({0x8F, 0x06});
    chip.registers().set(0xF, 0x02);
    chip.cycle();
    check(chip.registers().get(0xF) == 0, "8F06: shifted-out bit replaces the result");

    chip = make_engine({0x8F, 0x0E});
    chip.registers().set(0xF, 0x81);
    chip.cycle();
    check(chip.registers().get(0xF) == 1, "8F0E: shifted-out bit replaces the result");

    chip = make_engine({0x81, 0x06});
    chip.registers().set(1, 0x05);
    chip.cycle();
    check(chip.registers().get(1) == 0x02 && chip.registers().get(0xF) == 1,
          "8xy6: 5>>1=2, VF=shifted-out bit");

    chip = make_engine({0x81, 0x0E});
    chip.registers().set(1, 0x81);
    chip.cycle();
    check(chip.registers().get(1) == 0x02 && chip.registers().get(0xF) == 1,
          "8xyE: 0x81<<1 wraps to 0x02, VF=1");

    chip = make_engine({0x81, 0x21, 0x83, 0x22, 0x84, 0x23});
    chip.registers().set(1, 0xF0);
    chip.registers().set(2, 0x3C);
    chip.registers().set(3, 0xF0);
    chip.registers().set(4, 0xF0);
    chip.registers().set(0xF, 0x55);
    chip.run_for(3);
    check(chip.registers().get(1) == 0xFC, "8xy1 OR");
    check(chip.registers().get(3) == 0x30, "8xy2 AND");
    check(chip.registers().get(4) == 0xCC, "8xy3 XOR");
    check(chip.registers().get(0xF) == 0x55, "logic ops leave VF alone by default");

    chip = make_engine({0x71, 0x02, 0x82, 0x10});
    chip.registers().set(1, 0xFF);
    chip.registers().set(0xF, 0x55);
    chip.run_for(2);
    check(chip.registers().get(1) == 0x01, "7xkk wraps");
    check(chip.registers().get(0xF) == 0x55, "7xkk leaves VF alone");
    check(chip.registers().get(2) == 0x01, "8xy0 copies Vy into Vx");
}

void test_skips_and_jumps() {
    auto chip = make_engine({0x31, 0x42});
    chip.registers().set(1, 0x42);
    chip.cycle();
    check(chip.get_pc() == 0x204, "3xkk skips when equal");

    chip = make_engine({0x41, 0x42});
    chip.registers().set(1, 0x42);
    chip.cycle();
    check(chip.get_pc() == 0x202, "4xkk does not skip when equal");

    chip = make_engine({0x51, 0x20});
    chip.registers().set(1, 7);
    chip.registers().set(2, 7);
    chip.cycle();
    check(chip.get_pc() == 0x204, "5xy0 skips when registers equal");

    chip = make_engine({0x91, 0x20});
    chip.registers().set(1, 7);
    chip.registers().set(2, 8);
    chip.cycle();
    check(chip.get_pc() == 0x204, "9xy0 skips when registers differ");
    check(chip.get_stats().skip_count == 1, "skip counted");

    chip = make_engine({0x13, 0x45});
    chip.cycle();
    check(chip.get_pc() == 0x345, "1nnn jumps");

    chip = make_engine({0xB3, 0x00});
    chip.registers().set(0, 0xFF);
    chip.cycle();
    check(chip.get_pc() == 0x3FF, "Bnnn adds the full V0 byte");
}

void test_call_and_return() {
    auto chip = make_engine({0x21, 0x23});
    chip.cycle();
    check(chip.stack().pointer() == 1, "2123: stack pointer 1");
    check(chip.stack().at(0) == 0x202, "2123: stack[0]=0x202");
    check(chip.get_pc() == 0x123, "2123: PC=0x123");

    const Address targets[] = {0x204, 0x300, 0x5AA, 0xABE};
    bool all_ok = true;
    for (Address target : targets) {
        ProgramBytes program(static_cast<size_t>(target - 0x200 + 2), 0);
        program[0] = static_cast<Byte>(0x20 | (target >> 8));
        program[1] = static_cast<Byte>(target & 0xFF);
        program[target - 0x200] = 0x00;
        program[target - 0x200 + 1] = 0xEE;

        auto sub = make_engine(program);
        sub.cycle();
        bool at_target = sub.get_pc() == target;
        sub.cycle();
        if (!at_target || sub.get_pc() != 0x202 || sub.stack().pointer() != 0) {
            all_ok = false;
        }
    }
    check(all_ok, "call then return restores PC to the post-call address");
}

// ==============================================================================
// Engine: Index, Memory and BCD
// ==============================================================================

void test_index_and_memory_ops() {
    std::cout << "\n--- Index and Memory ---\n";

    auto chip = make_engine({0xA1, 0x23});
    chip.cycle();
    check(chip.registers().get_index() == 0x123, "A123: I=0x123");

    chip = make_engine({0xF1, 0x1E});
    chip.registers().set_index(0x100);
    chip.registers().set(1, 0x10);
    chip.registers().set(0xF, 0);
    chip.cycle();
    check(chip.registers().get_index() == 0x110, "Fx1E: I += Vx");
    check(chip.registers().get(0xF) == 0, "Fx1E leaves VF alone");

    chip = make_engine({0xF1, 0x29});
    chip.registers().set(1, 0xA);
    chip.cycle();
    check(chip.registers().get_index() == 50, "Fx29: I points at glyph A");

    chip = make_engine({0xF2, 0x33});
    chip.registers().set(2, 123);
    chip.registers().set_index(220);
    chip.cycle();
    check(chip.memory().read_byte(220) == 1 &&
          chip.memory().read_byte(221) == 2 &&
          chip.memory().read_byte(222) == 3, "BCD of 123 at 220");

    chip = make_engine({0xF0, 0x33});
    bool all_ok = true;
    for (unsigned value = 0; value < 256; value++) {
        chip.set_pc(0x200);
        chip.registers().set(0, static_cast<Byte>(value));
        chip.registers().set_index(0x300);
        chip.cycle();
        unsigned d0 = chip.memory().read_byte(0x300);
        unsigned d1 = chip.memory().read_byte(0x301);
        unsigned d2 = chip.memory().read_byte(0x302);
        if (100 * d0 + 10 * d1 + d2 != value || d1 > 9 || d2 > 9) {
            all_ok = false;
            break;
        }
    }
    check(all_ok, "BCD digits recombine for every value 0-255");

    chip = make_engine({0xF3, 0x55, 0xF3, 0x65});
    for (uint8_t r = 0; r < 5; r++) {
        chip.registers().set(r, static_cast<Byte>(r + 1));
    }
    chip.registers().set_index(0x300);
    chip.cycle();
    check(chip.memory().read_byte(0x300) == 1 && chip.memory().read_byte(0x303) == 4,
          "Fx55 writes V0..Vx");
    check(chip.memory().read_byte(0x304) == 0, "Fx55 stops at Vx");
    check(chip.registers().get_index() == 0x300, "Fx55 leaves I unchanged");

    for (uint8_t r = 0; r < 5; r++) {
        chip.registers().set(r, 0);
    }
    chip.cycle();
    check(chip.registers().get(0) == 1 && chip.registers().get(3) == 4,
          "Fx65 reads V0..Vx");
    check(chip.registers().get(4) == 0, "Fx65 stops at Vx");
    check(chip.registers().get_index() == 0x300, "Fx65 leaves I unchanged");
}

// ==============================================================================
// Engine: Display
// ==============================================================================

void test_clear_screen() {
    std::cout << "\n--- Display ---\n";

    // I=0 (glyph 0), draw one row at (0,0), then clear twice
    auto chip = make_engine({0xA0, 0x00, 0xD0, 0x11, 0x00, 0xE0, 0x00, 0xE0});
    chip.run_for(2);
    check(chip.framebuffer().get_pixel(0, 0), "pixel (0,0) lit before clear");

    chip.cycle();
    check(!chip.framebuffer().get_pixel(0, 0), "00E0 turns pixel (0,0) off");
    check(chip.framebuffer().lit_count() == 0, "00E0 clears the whole screen");

    auto once = chip.framebuffer().rows();
    chip.cycle();
    check(chip.framebuffer().rows() == once, "00E0 is idempotent");
}

void test_draw_xor_and_collision() {
    // Draw glyph 0, then glyph 1 twice at the same spot
    auto chip = make_engine({
        0xA0, 0x00, 0xD1, 0x25,
        0xA0, 0x05, 0xD1, 0x25, 0xD1, 0x25});
    chip.registers().set(1, 10);
    chip.registers().set(2, 5);

    chip.run_for(3);
    check(chip.registers().get(0xF) == 0, "first draw: no collision");
    auto before = chip.framebuffer().rows();

    chip.cycle();
    check(chip.registers().get(0xF) == 1, "glyph 1 over glyph 0 collides");

    chip.cycle();
    check(chip.framebuffer().rows() == before, "drawing the same sprite twice restores the screen");
    check(chip.registers().get(0xF) == 1, "erasing draw reports collision");
    check(chip.get_stats().draw_count == 3, "draws counted");
}

void test_draw_clipping() {
    // Glyph 0 first row is 0xF0: four lit pixels
    auto chip = make_engine({0xD1, 0x21});
    chip.registers().set(1, 62);
    chip.registers().set(2, 0);
    chip.cycle();
    check(chip.framebuffer().get_pixel(62, 0) && chip.framebuffer().get_pixel(63, 0),
          "sprite drawn up to the right edge");
    check(!chip.framebuffer().get_pixel(0, 0), "sprite body does not wrap");
    check(chip.framebuffer().lit_count() == 2, "clipped pixels are dropped");

    chip = make_engine({0xD1, 0x21});
    chip.registers().set(1, 64 + 3);
    chip.registers().set(2, 32 + 1);
    chip.cycle();
    check(chip.framebuffer().get_pixel(3, 1), "sprite origin wraps modulo screen size");

    chip = make_engine({0xD1, 0x2F});
    chip.memory().write_byte(0xFFE, 0x80);
    chip.memory().write_byte(0xFFF, 0x80);
    chip.registers().set_index(0xFFE);
    chip.cycle();
    check(chip.get_state() == EngineState::RUNNING, "sprite running past RAM is not a fault");
    check(chip.framebuffer().lit_count() == 2 &&
          chip.framebuffer().get_pixel(0, 0) && chip.framebuffer().get_pixel(0, 1),
          "partial draw stops at the end of RAM");
}

// ==============================================================================
// Engine: Keys, Timers, Random
// ==============================================================================

void test_keys() {
    std::cout << "\n--- Keys and Timers ---\n";

    auto chip = make_engine({0xE1, 0x9E});
    chip.registers().set(1, 5);
    chip.set_key(5, true);
    chip.cycle();
    check(chip.get_pc() == 0x204, "Ex9E skips when key Vx is down");

    chip = make_engine({0xE1, 0xA1});
    chip.registers().set(1, 5);
    chip.cycle();
    check(chip.get_pc() == 0x204, "ExA1 skips when key Vx is up");

    chip = make_engine({0xE1, 0x9E});
    chip.registers().set(1, 5);
    chip.cycle();
    check(chip.get_pc() == 0x202, "Ex9E does not skip when key Vx is up");

    chip = make_engine({0xE1, 0xA1});
    chip.registers().set(1, 5);
    chip.set_key(5, true);
    chip.cycle();
    check(chip.get_pc() == 0x202, "ExA1 does not skip when key Vx is down");

    // Only the low nibble of Vx selects the key
    chip = make_engine({0xE1, 0x9E});
    chip.registers().set(1, 0x25);
    chip.set_key(5, true);
    chip.cycle();
    check(chip.get_pc() == 0x204, "Ex9E with Vx=0x25 tests key 5");

    chip = make_engine({0xE1, 0xA1});
    chip.registers().set(1, 0xF3);
    chip.set_key(3, true);
    chip.cycle();
    check(chip.get_pc() == 0x202, "ExA1 with Vx=0xF3 tests key 3");

    chip = make_engine({0xF3, 0x0A});
    chip.cycle();
    check(chip.get_pc() == 0x200, "Fx0A rewinds PC while no key is down");
    check(chip.is_waiting_for_key(), "engine reports waiting for key");
    chip.cycle();
    check(chip.get_stats().instructions_executed == 0, "Fx0A spins are not executed instructions");
    check(chip.get_stats().stall_cycles == 2, "Fx0A spins counted as stalls");

    chip.set_key(7, true);
    chip.cycle();
    check(chip.registers().get(3) == 7, "Fx0A stores the pressed key");
    check(chip.get_pc() == 0x202, "Fx0A advances once a key is down");
    check(chip.get_state() == EngineState::RUNNING, "engine running after key press");
    check(chip.get_stats().instructions_executed == 1, "completed Fx0A counted once");

    chip = make_engine({0xF3, 0x0A});
    chip.set_key(0xC, true);
    chip.set_key(9, true);
    chip.set_key(4, true);
    chip.cycle();
    check(chip.registers().get(3) == 4, "Fx0A stores the lowest pressed key");

    bool threw = false;
    try { chip.set_key(16, true); } catch (const InputError&) { threw = true; }
    check(threw, "key index 16 throws InputError");

    chip.clear_keys();
    check(!chip.is_key_pressed(7), "clear_keys releases all keys");
}

void test_timers() {
    auto chip = make_engine({0x61, 0x05, 0xF1, 0x15, 0xF2, 0x07, 0x63, 0x03, 0xF3, 0x18});
    chip.run_for(3);
    check(chip.registers().get(2) == 4, "Fx07 reads delay timer after one tick");
    check(chip.delay_timer() == 3, "delay timer ticks once per cycle");

    chip.run_for(2);
    check(chip.sound_timer() == 2 && chip.is_sound_active(), "Fx18 sets sound timer");

    chip.run_for(5);  // 0x0000 bytes beyond the program are NOOPs
    check(chip.sound_timer() == 0 && chip.delay_timer() == 0, "timers stop at zero");
    check(!chip.is_sound_active(), "sound off at zero");
}

void test_random() {
    auto chip = make_engine({0xC1, 0xFF, 0xC2, 0x0F});
    RandomSource expected(2);
    chip.run_for(2);
    check(chip.registers().get(1) == expected.next_byte(), "Cxkk uses the seeded source");
    check((chip.registers().get(2) & 0xF0) == 0, "Cxkk masks with kk");
}

// ==============================================================================
// Engine: Faults
// ==============================================================================

void test_faults() {
    std::cout << "\n--- Faults ---\n";

    auto chip = make_engine({0x00, 0xEE, 0x61, 0x05});
    EngineState state = chip.cycle();
    check(state == EngineState::ERROR, "return on empty stack faults");
    check(chip.get_error_category() == ErrorCategory::STACK_FAULT, "fault category STACK_FAULT");
    check(chip.get_error_location() == 0x200, "fault location is the instruction address");
    check(!chip.get_error_message().empty(), "fault message recorded");

    chip.cycle();
    check(chip.get_pc() == 0x202 && chip.registers().get(1) == 0, "faulted engine does not execute");

    chip.resume();
    chip.cycle();
    check(chip.registers().get(1) == 5, "resume skips the faulting instruction");

    chip = make_engine({0x22, 0x00});  // calls itself forever
    chip.run_for(100);
    check(chip.get_error_category() == ErrorCategory::STACK_FAULT, "17th nested call faults");
    check(chip.stack().pointer() == 16, "stack full at overflow");
    check(chip.get_stats().instructions_executed == 16, "16 calls executed before overflow");

    chip = make_engine({0x8A, 0xB8});
    chip.cycle();
    check(chip.get_error_category() == ErrorCategory::DECODE_ERROR, "unmapped opcode faults");

    chip = make_engine({0xF2, 0x55});
    chip.registers().set_index(0xFFE);
    chip.registers().set(0, 9);
    chip.cycle();
    check(chip.get_error_category() == ErrorCategory::ADDRESS_FAULT, "Fx55 past RAM faults");
    check(chip.memory().read_byte(0xFFE) == 0, "faulting Fx55 writes nothing");

    chip = make_engine({0xF0, 0x55});
    chip.registers().set_index(0);
    chip.cycle();
    check(chip.get_error_category() == ErrorCategory::ADDRESS_FAULT, "Fx55 into the font faults");

    chip = make_engine({});
    chip.set_pc(0xFFF);
    chip.cycle();
    check(chip.get_error_category() == ErrorCategory::ADDRESS_FAULT, "fetch past RAM faults");
}

// ==============================================================================
// Engine: Debugging
// ==============================================================================

void test_breakpoints_and_state() {
    std::cout << "\n--- Debugging ---\n";

    auto chip = make_engine({0x61, 0x01, 0x62, 0x02, 0x63, 0x03, 0x12, 0x06});
    chip.add_breakpoint(0x204);
    EngineState state = chip.run_for(100);
    check(state == EngineState::PAUSED, "breakpoint pauses execution");
    check(chip.get_pause_reason() == PauseReason::BREAKPOINT, "pause reason is BREAKPOINT");
    check(chip.get_pc() == 0x204, "paused at breakpoint address");
    check(chip.registers().get(2) == 2 && chip.registers().get(3) == 0,
          "instructions before breakpoint executed");

    state = chip.run_for(100);
    check(state == EngineState::RUNNING, "continues past breakpoint");
    check(chip.registers().get(3) == 3, "breakpoint instruction executed on resume");
    check(chip.get_stats().instructions_executed == 102, "run_for executes exact count");

    // A breakpoint reached exactly at the end of a frame fires at the start
    // of the next one
    chip = make_engine({0x61, 0x01, 0x62, 0x02, 0x63, 0x03, 0x12, 0x06});
    chip.add_breakpoint(0x204);
    state = chip.run_frame(2);
    check(state == EngineState::RUNNING && chip.get_pc() == 0x204, "frame ends on breakpoint address");
    state = chip.run_frame(2);
    check(state == EngineState::PAUSED, "breakpoint at frame boundary pauses");
    check(chip.get_pc() == 0x204 && chip.registers().get(3) == 0,
          "breakpoint instruction not executed before pause");
    check(chip.get_stats().frame_count == 1, "paused frame does not tick");

    state = chip.run_frame(2);
    check(chip.registers().get(3) == 3, "next frame steps over the breakpoint");
    check(state == EngineState::RUNNING, "running after stepping over");

    // resume() followed by run_for also steps over once
    chip = make_engine({0x61, 0x01, 0x62, 0x02, 0x12, 0x02});
    chip.add_breakpoint(0x202);
    chip.run_for(10);
    check(chip.get_state() == EngineState::PAUSED && chip.get_pc() == 0x202, "paused at 0x202");
    chip.resume();
    chip.run_for(1);
    check(chip.registers().get(2) == 2, "resume then run_for executes the breakpoint instruction");
    chip.run_for(10);
    check(chip.get_state() == EngineState::PAUSED && chip.get_pc() == 0x202,
          "breakpoint fires again on the next visit");

    check(chip.disassemble(0x206) == "JP 0x206", "disassemble from memory");
    check(chip.disassemble_range(0x200, 0x204).size() == 2, "disassemble range");
    check(chip.dump_state().find("PC=0x206") != std::string::npos, "dump_state shows PC");

    chip.load({0x00, 0xE0});
    check(chip.get_pc() == 0x200 && chip.registers().get(1) == 0, "load resets machine");
    check(chip.get_state() == EngineState::READY, "load returns to READY");
    check(chip.get_stats().instructions_executed == 0, "load resets statistics");
}

void test_inspection_api() {
    auto chip = make_engine({0x61, 0x01, 0xD0, 0x11, 0x81, 0x06});

    chip.add_breakpoint(0x202);
    chip.add_breakpoint(0x204);
    chip.remove_breakpoint(0x202);
    check(!chip.has_breakpoint(0x202) && chip.has_breakpoint(0x204), "remove_breakpoint");
    check(chip.get_breakpoints().size() == 1, "get_breakpoints lists remaining");
    chip.clear_breakpoints();
    check(chip.get_breakpoints().empty(), "clear_breakpoints");

    check(chip.get_current_instruction().op == Op::LOAD_X, "current instruction at PC");
    check(chip.memory().dump_range(0x200, 4) == "200: 61 01 D0 11\n", "memory hex dump");
    check(chip.memory().data()[0x203] == 0x11, "raw RAM view");

    chip.run_for(2);
    check(chip.framebuffer().dirty(), "draw marks the display dirty");
    chip.clear_display_dirty();
    check(!chip.framebuffer().dirty(), "host acknowledges the frame");

    Quirks quirks;
    quirks.shift_uses_vy = true;
    chip.set_quirks(quirks);
    chip.registers().set(0, 0x04);
    chip.cycle();
    check(chip.registers().get(1) == 0x02, "set_quirks applies without reloading");
}

// ==============================================================================
// Main
// ==============================================================================

int main() {
    std::cout << "=== CHIP-8 Engine Tests ===\n\n";

    test_decode_fields();
    test_decode_errors();
    test_disassembly();
    test_memory();
    test_registers_and_stack();
    test_framebuffer();
    test_load_immediate();
    test_add_with_carry_all_pairs();
    test_sub_no_borrow_all_pairs();
    test_alu_edge_cases();
    test_skips_and_jumps();
    test_call_and_return();
    test_index_and_memory_ops();
    test_clear_screen();
    test_draw_xor_and_collision();
    test_draw_clipping();
    test_keys();
    test_timers();
    test_random();
    test_faults();
    test_breakpoints_and_state();
    test_inspection_api();

    std::cout << "\n=== " << pass_count << "/" << test_count << " tests passed! ===\n";
    return pass_count == test_count ? 0 : 1;
}
