// ==============================================================================
// CHIP-8 Call Stack
// ==============================================================================
// A fixed 16-entry stack of return addresses. It lives outside the 4K
// address space, so programs can only reach it through CALL and RET.
// ==============================================================================

#ifndef CHIP8_CALL_STACK_HPP
#define CHIP8_CALL_STACK_HPP

#include "types.hpp"
#include "error.hpp"
#include <array>
#include <vector>

namespace chip8 {

constexpr size_t STACK_DEPTH = 16;

class CallStack {
public:
    CallStack();

    void reset();

    /**
     * @brief Store a return address at the pointer, then increment it.
     *
     * @throws StackFault if the stack already holds 16 entries
     */
    void push(Address return_address);

    /**
     * @brief Decrement the pointer, then return the entry it points at.
     *
     * @throws StackFault if the stack is empty
     */
    Address pop();

    /**
     * @brief Number of entries in use (the stack pointer), 0-16.
     */
    size_t pointer() const { return pointer_; }

    bool empty() const { return pointer_ == 0; }
    bool full() const { return pointer_ == STACK_DEPTH; }

    /**
     * @brief Read a raw slot, including slots above the pointer.
     *
     * @throws InputError if slot >= 16
     */
    Address at(size_t slot) const;

    /**
     * @brief The live entries, bottom first.
     */
    std::vector<Address> entries() const;

private:
    std::array<Address, STACK_DEPTH> slots_;
    size_t pointer_ = 0;
};

}  // namespace chip8

#endif  // CHIP8_CALL_STACK_HPP
