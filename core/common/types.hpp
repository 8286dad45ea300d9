// ==============================================================================
// Common Type Definitions
// ==============================================================================
// This file defines basic types used throughout the CHIP-8 suite.
// Using explicit types makes the code more readable and helps catch bugs.
// ==============================================================================

#ifndef CHIP8_COMMON_TYPES_HPP
#define CHIP8_COMMON_TYPES_HPP

#include <cstdint>      // For fixed-width integer types
#include <cstddef>      // For size_t
#include <string>       // For std::string
#include <vector>       // For std::vector
#include <optional>     // For std::optional (values that might not exist)

namespace chip8 {

// ==============================================================================
// CHIP-8 Basic Types
// ==============================================================================

/**
 * @brief An 8-bit byte
 *
 * CHIP-8 memory is byte-addressed, and the general purpose registers
 * V0-VF and both timers are 8 bits wide.
 */
using Byte = uint8_t;

/**
 * @brief A 16-bit word
 *
 * Opcodes are 16 bits, stored big-endian as two consecutive bytes.
 * The index register I is also 16 bits wide.
 */
using Word = uint16_t;

/**
 * @brief A memory address
 *
 * The address space is 4K (0x000-0xFFF), so only the lower 12 bits
 * are meaningful. We still store it as 16-bit: the program counter and
 * I can be pushed past 0xFFF by arithmetic, and the memory layer reports
 * that as a fault instead of silently masking it.
 */
using Address = uint16_t;

/**
 * @brief A raw program image, exactly as read from a ROM file.
 */
using ProgramBytes = std::vector<Byte>;

// ==============================================================================
// Helper Functions
// ==============================================================================

/**
 * @brief Format a value as uppercase hexadecimal with a 0x prefix.
 *
 * Example: format_hex(0x123, 3) returns "0x123", format_hex(0xA, 4)
 * returns "0x000A".
 *
 * @param value The value to format
 * @param digits Minimum number of hex digits (zero padded)
 */
std::string format_hex(uint32_t value, int digits);

/**
 * @brief Format a register name: 0 -> "V0", 15 -> "VF".
 */
std::string register_name(uint8_t index);

}  // namespace chip8

#endif  // CHIP8_COMMON_TYPES_HPP
