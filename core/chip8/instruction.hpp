// ==============================================================================
// CHIP-8 Instruction Decoder
// ==============================================================================
// Decodes 16-bit CHIP-8 opcodes into structured representations.
//
// Opcode fields (hex digits of the big-endian word):
//   Gxyn   G   = dispatch group (top nibble)
//          x   = register index, bits 8-11
//          y   = register index, bits 4-7
//          n   = 4-bit immediate, bits 0-3
//          kk  = 8-bit immediate, bits 0-7
//          nnn = 12-bit address, bits 0-11
//
// Groups 0x8, 0xE and 0xF dispatch further on the low nibble or low byte;
// those are the only groups where an opcode can fail to decode.
//
// The decoder is used in two contexts:
//   1. Execution (every cycle decodes exactly one opcode)
//   2. Debug/disassembly (instruction_to_string)
// ==============================================================================

#ifndef CHIP8_INSTRUCTION_HPP
#define CHIP8_INSTRUCTION_HPP

#include "types.hpp"
#include "error.hpp"
#include <string>

namespace chip8 {

// ==============================================================================
// Instruction Kinds
// ==============================================================================

/**
 * @brief Every instruction the interpreter executes.
 *
 * The comment beside each value is the opcode pattern it decodes from.
 */
enum class Op : uint8_t {
    NOOP,                    // 0nnn (legacy machine-code call, ignored)
    CLEAR_SCREEN,            // 00E0
    RETURN_FROM_SUBROUTINE,  // 00EE
    JUMP,                    // 1nnn
    CALL_SUBROUTINE,         // 2nnn
    SKIP_IF_X_EQ_KK,         // 3xkk
    SKIP_IF_X_NE_KK,         // 4xkk
    SKIP_IF_X_EQ_Y,          // 5xy0
    LOAD_X,                  // 6xkk
    ADD_TO_X,                // 7xkk
    LOAD_Y_INTO_X,           // 8xy0
    OR_X_Y,                  // 8xy1
    AND_X_Y,                 // 8xy2
    XOR_X_Y,                 // 8xy3
    ADD_Y_TO_X,              // 8xy4
    SUB_Y_FROM_X,            // 8xy5
    SHIFT_RIGHT,             // 8xy6
    SUB_X_FROM_Y,            // 8xy7
    SHIFT_LEFT,              // 8xyE
    SKIP_IF_X_NE_Y,          // 9xy0
    SET_INDEX,               // Annn
    JUMP_PLUS_V0,            // Bnnn
    SET_RANDOM,              // Cxkk
    DISPLAY,                 // Dxyn
    SKIP_IF_PRESSED,         // Ex9E
    SKIP_IF_NOT_PRESSED,     // ExA1
    SET_X_TO_DELAY_TIMER,    // Fx07
    WAIT_FOR_KEY,            // Fx0A
    SET_DELAY_TIMER_TO_X,    // Fx15
    SET_SOUND_TIMER_TO_X,    // Fx18
    ADD_X_TO_I,              // Fx1E
    SET_I_TO_SPRITE_X,       // Fx29
    LOAD_BCD_OF_X,           // Fx33
    WRITE_0_THROUGH_X,       // Fx55
    LOAD_0_THROUGH_X,        // Fx65
};

// ==============================================================================
// Decoded Instruction
// ==============================================================================

/**
 * @brief A decoded CHIP-8 instruction.
 *
 * `op` is the tag; the operand fields are always extracted from the raw
 * opcode, but only the ones named in the Op comment are meaningful.
 * x and y are nibbles, so they always index a valid register.
 */
struct DecodedInstruction {
    Op op = Op::NOOP;
    Word raw = 0;

    uint8_t x = 0;
    uint8_t y = 0;
    uint8_t n = 0;
    Byte kk = 0;
    Address nnn = 0;
};

// ==============================================================================
// Decoding Functions
// ==============================================================================

/**
 * @brief Decode a 16-bit opcode.
 *
 * @throws DecodeError for unmapped opcodes in groups 0x8, 0xE and 0xF
 */
DecodedInstruction decode_instruction(Word opcode);

/**
 * @brief Check whether an opcode decodes, without throwing.
 */
bool is_valid_opcode(Word opcode);

/**
 * @brief Short mnemonic for an instruction kind ("CLS", "DRW", ...).
 */
const char* op_to_string(Op op);

/**
 * @brief Convert a decoded instruction to human-readable assembly.
 *
 * Examples: "CLS", "JP 0x123", "LD V1, 0x23", "DRW V0, V1, 5", "LD [I], V3"
 */
std::string instruction_to_string(const DecodedInstruction& instr);

/**
 * @brief Decode and disassemble a raw opcode.
 *
 * Opcodes that don't decode come back as "DW 0x8AB8" rather than throwing,
 * so data bytes interleaved with code can still be listed.
 */
std::string instruction_to_string(Word raw_opcode);

}  // namespace chip8

#endif  // CHIP8_INSTRUCTION_HPP
