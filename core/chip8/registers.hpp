// ==============================================================================
// CHIP-8 Register File
// ==============================================================================
// Sixteen 8-bit general purpose registers V0-VF, the 16-bit index register I
// and the two 8-bit countdown timers.
//
// VF doubles as the flag register: carry, no-borrow, shifted-out bit and
// sprite collision all land there.
// ==============================================================================

#ifndef CHIP8_REGISTERS_HPP
#define CHIP8_REGISTERS_HPP

#include "types.hpp"
#include "error.hpp"
#include <array>
#include <string>

namespace chip8 {

constexpr size_t NUM_REGISTERS = 16;
constexpr uint8_t FLAG_REGISTER = 0xF;

class RegisterFile {
public:
    RegisterFile();

    /**
     * @brief Zero every register and both timers.
     */
    void reset();

    // =========================================================================
    // General Purpose Registers
    // =========================================================================

    /**
     * @brief Read Vn.
     *
     * @throws InputError if index > 15
     */
    Byte get(uint8_t index) const;

    /**
     * @brief Write Vn.
     *
     * @throws InputError if index > 15
     */
    void set(uint8_t index, Byte value);

    Byte get_flag() const { return v_[FLAG_REGISTER]; }
    void set_flag(bool on) { v_[FLAG_REGISTER] = on ? 1 : 0; }

    // =========================================================================
    // Index Register
    // =========================================================================

    Word get_index() const { return index_; }
    void set_index(Word value) { index_ = value; }

    // =========================================================================
    // Timers
    // =========================================================================

    Byte get_delay_timer() const { return delay_timer_; }
    void set_delay_timer(Byte value) { delay_timer_ = value; }

    Byte get_sound_timer() const { return sound_timer_; }
    void set_sound_timer(Byte value) { sound_timer_ = value; }

    /**
     * @brief Decrement both timers by one, stopping at zero.
     */
    void tick_timers();

    // =========================================================================
    // Debugging
    // =========================================================================

    std::string dump_state() const;

private:
    std::array<Byte, NUM_REGISTERS> v_;
    Word index_ = 0;
    Byte delay_timer_ = 0;
    Byte sound_timer_ = 0;

    static void check_index(uint8_t index);
};

}  // namespace chip8

#endif  // CHIP8_REGISTERS_HPP
