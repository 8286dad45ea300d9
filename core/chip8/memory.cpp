// ==============================================================================
// CHIP-8 Memory Implementation
// ==============================================================================

#include "memory.hpp"
#include <algorithm>
#include <fstream>
#include <iterator>
#include <sstream>
#include <iomanip>

namespace chip8 {

// ==============================================================================
// Font Table
// ==============================================================================

const std::array<Byte, Chip8Address::FONT_SIZE> FONT_SET = {
    0xF0, 0x90, 0x90, 0x90, 0xF0,  // 0
    0x20, 0x60, 0x20, 0x20, 0x70,  // 1
    0xF0, 0x10, 0xF0, 0x80, 0xF0,  // 2
    0xF0, 0x10, 0xF0, 0x10, 0xF0,  // 3
    0x90, 0x90, 0xF0, 0x10, 0x10,  // 4
    0xF0, 0x80, 0xF0, 0x10, 0xF0,  // 5
    0xF0, 0x80, 0xF0, 0x90, 0xF0,  // 6
    0xF0, 0x10, 0x20, 0x40, 0x40,  // 7
    0xF0, 0x90, 0xF0, 0x90, 0xF0,  // 8
    0xF0, 0x90, 0xF0, 0x10, 0xF0,  // 9
    0xF0, 0x90, 0xF0, 0x90, 0x90,  // A
    0xE0, 0x90, 0xE0, 0x90, 0xE0,  // B
    0xF0, 0x80, 0x80, 0x80, 0xF0,  // C
    0xE0, 0x90, 0x90, 0x90, 0xE0,  // D
    0xF0, 0x80, 0xF0, 0x80, 0xF0,  // E
    0xF0, 0x80, 0xF0, 0x80, 0x80,  // F
};

// ==============================================================================
// Constructor and Initialization
// ==============================================================================

Chip8Memory::Chip8Memory() {
    reset();
}

void Chip8Memory::reset() {
    ram_.fill(0);
    std::copy(FONT_SET.begin(), FONT_SET.end(),
              ram_.begin() + Chip8Address::FONT_BASE);
    program_size_ = 0;
}

// ==============================================================================
// Program Loading
// ==============================================================================

ProgramBytes Chip8Memory::read_rom_file(const std::string& file_path) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        throw RomLoadError(file_path, "Could not open ROM file for reading");
    }

    ProgramBytes bytes((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw RomLoadError(file_path, "I/O error while reading ROM file");
    }

    if (bytes.size() > Chip8Address::MAX_PROGRAM_SIZE) {
        throw RomLoadError(file_path,
            "ROM is " + std::to_string(bytes.size()) + " bytes, but at most " +
            std::to_string(Chip8Address::MAX_PROGRAM_SIZE) +
            " bytes fit above address 0x200.");
    }

    return bytes;
}

void Chip8Memory::load_program(const ProgramBytes& program, Address origin) {
    if (origin < Chip8Address::FONT_BASE + Chip8Address::FONT_SIZE) {
        throw RomLoadError(
            "Program origin " + format_hex(origin, 3) +
            " overlaps the built-in font table.");
    }

    if (origin + program.size() > Chip8Address::RAM_SIZE) {
        throw RomLoadError(
            "Program too large! " + std::to_string(program.size()) +
            " bytes at " + format_hex(origin, 3) + " run past the end of RAM.");
    }

    std::copy(program.begin(), program.end(), ram_.begin() + origin);
    program_size_ = program.size();
}

// ==============================================================================
// Range Checks
// ==============================================================================

void Chip8Memory::check_read_range(Address start, size_t count) const {
    if (static_cast<size_t>(start) + count > Chip8Address::RAM_SIZE) {
        Address first_bad = static_cast<Address>(
            std::max<size_t>(start, Chip8Address::RAM_SIZE));
        throw AddressFault(first_bad,
            "Cannot read " + std::to_string(count) + " byte(s) at " +
            format_hex(start, 3) + ". Valid range is 0x000-0xFFF; "
            "I or PC may have been pushed past the end of RAM.");
    }
}

void Chip8Memory::check_write_range(Address start, size_t count) const {
    if (static_cast<size_t>(start) + count > Chip8Address::RAM_SIZE) {
        Address first_bad = static_cast<Address>(
            std::max<size_t>(start, Chip8Address::RAM_SIZE));
        throw AddressFault(first_bad,
            "Cannot write " + std::to_string(count) + " byte(s) at " +
            format_hex(start, 3) + ". Valid range is 0x000-0xFFF; "
            "I may have been pushed past the end of RAM.");
    }

    if (count > 0 && start < Chip8Address::FONT_BASE + Chip8Address::FONT_SIZE) {
        throw AddressFault(start,
            "Cannot write to " + format_hex(start, 3) +
            ": addresses 0x000-0x04F hold the read-only font table.");
    }
}

// ==============================================================================
// Byte Access
// ==============================================================================

Byte Chip8Memory::read_byte(Address address) const {
    check_read_range(address, 1);
    return ram_[address];
}

void Chip8Memory::write_byte(Address address, Byte value) {
    check_write_range(address, 1);
    ram_[address] = value;
}

Word Chip8Memory::read_opcode(Address address) const {
    check_read_range(address, 2);
    return static_cast<Word>((ram_[address] << 8) | ram_[address + 1]);
}

// ==============================================================================
// Block Access
// ==============================================================================

void Chip8Memory::read_block(Address start, Byte* dest, size_t count) const {
    check_read_range(start, count);
    std::copy_n(ram_.begin() + start, count, dest);
}

void Chip8Memory::write_block(Address start, const Byte* src, size_t count) {
    check_write_range(start, count);
    std::copy_n(src, count, ram_.begin() + start);
}

// ==============================================================================
// Debugging
// ==============================================================================

std::string Chip8Memory::dump_range(Address start, size_t length) const {
    std::ostringstream oss;
    size_t end = std::min<size_t>(static_cast<size_t>(start) + length,
                                  Chip8Address::RAM_SIZE);

    for (size_t addr = start; addr < end; addr += 16) {
        oss << std::hex << std::uppercase << std::setfill('0')
            << std::setw(3) << addr << ":";
        for (size_t i = addr; i < addr + 16 && i < end; i++) {
            oss << " " << std::setw(2) << static_cast<int>(ram_[i]);
        }
        oss << "\n";
    }

    return oss.str();
}

}  // namespace chip8
