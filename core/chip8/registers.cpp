// ==============================================================================
// CHIP-8 Register File Implementation
// ==============================================================================

#include "registers.hpp"
#include <sstream>

namespace chip8 {

RegisterFile::RegisterFile() {
    reset();
}

void RegisterFile::reset() {
    v_.fill(0);
    index_ = 0;
    delay_timer_ = 0;
    sound_timer_ = 0;
}

void RegisterFile::check_index(uint8_t index) {
    if (index >= NUM_REGISTERS) {
        throw InputError(
            "Register index " + std::to_string(index) +
            " is out of range. Valid registers are V0-VF.");
    }
}

Byte RegisterFile::get(uint8_t index) const {
    check_index(index);
    return v_[index];
}

void RegisterFile::set(uint8_t index, Byte value) {
    check_index(index);
    v_[index] = value;
}

void RegisterFile::tick_timers() {
    if (delay_timer_ > 0) delay_timer_--;
    if (sound_timer_ > 0) sound_timer_--;
}

std::string RegisterFile::dump_state() const {
    std::ostringstream oss;

    for (uint8_t i = 0; i < NUM_REGISTERS; i++) {
        oss << register_name(i) << "=" << format_hex(v_[i], 2);
        oss << ((i % 8 == 7) ? "\n" : " ");
    }
    oss << "I=" << format_hex(index_, 3)
        << " DT=" << static_cast<int>(delay_timer_)
        << " ST=" << static_cast<int>(sound_timer_) << "\n";

    return oss.str();
}

}  // namespace chip8
