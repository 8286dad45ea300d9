// ==============================================================================
// CHIP-8 Call Stack Implementation
// ==============================================================================

#include "call_stack.hpp"

namespace chip8 {

CallStack::CallStack() {
    reset();
}

void CallStack::reset() {
    slots_.fill(0);
    pointer_ = 0;
}

void CallStack::push(Address return_address) {
    if (full()) {
        throw StackFault(build_error_message(
            "Call stack overflow: ", STACK_DEPTH,
            " nested calls are already active (return address ",
            format_hex(return_address, 3), ")."));
    }
    slots_[pointer_] = return_address;
    pointer_++;
}

Address CallStack::pop() {
    if (empty()) {
        throw StackFault(
            "Return with empty call stack. The program executed 00EE "
            "without a matching 2nnn call.");
    }
    pointer_--;
    return slots_[pointer_];
}

Address CallStack::at(size_t slot) const {
    if (slot >= STACK_DEPTH) {
        throw InputError(build_error_message(
            "Stack slot ", slot, " is out of range (0-", STACK_DEPTH - 1, ")."));
    }
    return slots_[slot];
}

std::vector<Address> CallStack::entries() const {
    return std::vector<Address>(slots_.begin(), slots_.begin() + pointer_);
}

}  // namespace chip8
