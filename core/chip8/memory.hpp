// ==============================================================================
// CHIP-8 Memory System
// ==============================================================================
// Manages the interpreter's 4K byte-addressed RAM:
//   - 0x000-0x04F: built-in font (16 hex glyphs, 5 bytes each), read-only
//   - 0x050-0x1FF: reserved for the interpreter on the original hardware
//   - 0x200-0xFFF: program and data
//
// Code and data share the same address space (von Neumann), so opcodes are
// fetched from RAM as two consecutive bytes, high byte first.
// ==============================================================================

#ifndef CHIP8_MEMORY_HPP
#define CHIP8_MEMORY_HPP

#include "types.hpp"
#include "error.hpp"
#include <array>
#include <vector>
#include <string>

namespace chip8 {

// ==============================================================================
// Memory Layout Constants
// ==============================================================================

namespace Chip8Address {
    constexpr Address FONT_BASE = 0x000;
    constexpr size_t  FONT_GLYPH_SIZE = 5;    // bytes per glyph
    constexpr size_t  FONT_SIZE = 80;         // 16 glyphs * 5 bytes
    constexpr Address PROGRAM_START = 0x200;

    constexpr size_t RAM_SIZE = 4096;
    constexpr size_t MAX_PROGRAM_SIZE = RAM_SIZE - PROGRAM_START;  // 3584 bytes
}

/**
 * @brief The built-in hex digit font, glyphs 0-F.
 */
extern const std::array<Byte, Chip8Address::FONT_SIZE> FONT_SET;

// ==============================================================================
// CHIP-8 Memory Class
// ==============================================================================

/**
 * @brief Byte-addressed RAM with the font table pre-loaded.
 *
 * Every accessor is bounds-checked and reports out-of-range accesses as
 * AddressFault. Block accessors validate the whole range before touching
 * any byte, so a faulting instruction never leaves a half-written result.
 */
class Chip8Memory {
public:
    Chip8Memory();

    // =========================================================================
    // Initialization
    // =========================================================================

    /**
     * @brief Zero all memory and re-install the font table.
     */
    void reset();

    // =========================================================================
    // Program Loading
    // =========================================================================

    /**
     * @brief Read a ROM file as raw bytes.
     *
     * @param file_path Path to the .ch8 file
     * @throws RomLoadError if the file cannot be read or doesn't fit in RAM
     */
    static ProgramBytes read_rom_file(const std::string& file_path);

    /**
     * @brief Copy a program image into RAM.
     *
     * No header or content validation is done; bytes land verbatim.
     *
     * @param program Raw program bytes
     * @param origin First address to write (0x200 for regular ROMs)
     * @throws RomLoadError if the program would run past the end of RAM
     *                      or overlap the font table
     */
    void load_program(const ProgramBytes& program,
                      Address origin = Chip8Address::PROGRAM_START);

    /**
     * @brief Number of bytes written by the last load_program().
     */
    size_t program_size() const { return program_size_; }

    // =========================================================================
    // Byte Access
    // =========================================================================

    /**
     * @brief Read a single byte.
     *
     * @throws AddressFault if address >= 4096
     */
    Byte read_byte(Address address) const;

    /**
     * @brief Write a single byte.
     *
     * @throws AddressFault if address >= 4096 or inside the font table
     */
    void write_byte(Address address, Byte value);

    /**
     * @brief Fetch a big-endian opcode from address and address+1.
     *
     * @throws AddressFault if address+1 >= 4096
     */
    Word read_opcode(Address address) const;

    // =========================================================================
    // Block Access
    // =========================================================================

    /**
     * @brief Read count bytes starting at start into dest.
     *
     * @throws AddressFault if any byte of the range is out of bounds
     */
    void read_block(Address start, Byte* dest, size_t count) const;

    /**
     * @brief Write count bytes from src starting at start.
     *
     * @throws AddressFault if any byte of the range is out of bounds or
     *                      inside the font table; nothing is written then
     */
    void write_block(Address start, const Byte* src, size_t count);

    /**
     * @brief Get raw RAM pointer for bulk inspection.
     */
    const Byte* data() const { return ram_.data(); }

    // =========================================================================
    // Debugging
    // =========================================================================

    /**
     * @brief Hex dump of a memory range, 16 bytes per line.
     */
    std::string dump_range(Address start, size_t length) const;

private:
    std::array<Byte, Chip8Address::RAM_SIZE> ram_;
    size_t program_size_ = 0;

    void check_read_range(Address start, size_t count) const;
    void check_write_range(Address start, size_t count) const;
};

}  // namespace chip8

#endif  // CHIP8_MEMORY_HPP
