// ==============================================================================
// Common Type Implementations
// ==============================================================================

#include "types.hpp"

namespace chip8 {

static const char HEX_DIGITS[] = "0123456789ABCDEF";

std::string format_hex(uint32_t value, int digits) {
    std::string out;
    do {
        out.insert(out.begin(), HEX_DIGITS[value & 0xF]);
        value >>= 4;
    } while (value != 0);

    while (static_cast<int>(out.size()) < digits) {
        out.insert(out.begin(), '0');
    }
    return "0x" + out;
}

std::string register_name(uint8_t index) {
    std::string name = "V";
    name += HEX_DIGITS[index & 0xF];
    return name;
}

}  // namespace chip8
