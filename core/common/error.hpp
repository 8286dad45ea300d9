// ==============================================================================
// Error Handling
// ==============================================================================
// This file defines error types and exception classes for the suite.
// Every fault the interpreter can hit maps onto one of these classes, so a
// host can tell a broken ROM file from a bad opcode or a stack overflow.
// ==============================================================================

#ifndef CHIP8_COMMON_ERROR_HPP
#define CHIP8_COMMON_ERROR_HPP

#include <exception>
#include <string>
#include <sstream>
#include <optional>
#include "types.hpp"

namespace chip8 {

// ==============================================================================
// Error Categories
// ==============================================================================

/**
 * @brief Different categories of errors that can occur
 *
 * - ROM_LOAD_ERROR: Couldn't read a ROM file, or the program doesn't fit
 * - DECODE_ERROR: Opcode is not mapped within its dispatch group
 * - STACK_FAULT: Call beyond depth 16, or return with an empty stack
 * - ADDRESS_FAULT: Memory access at or beyond 4096, or a write into the font
 * - CONFIG_ERROR: Unknown quirk keyword or profile name
 * - INPUT_ERROR: Host passed an out-of-range key or register index
 * - INTERNAL_ERROR: Bug in the interpreter itself (shouldn't happen!)
 */
enum class ErrorCategory {
    ROM_LOAD_ERROR,
    DECODE_ERROR,
    STACK_FAULT,
    ADDRESS_FAULT,
    CONFIG_ERROR,
    INPUT_ERROR,
    INTERNAL_ERROR
};

/**
 * @brief Convert ErrorCategory to string for display
 */
inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::ROM_LOAD_ERROR: return "ROM Load Error";
        case ErrorCategory::DECODE_ERROR:   return "Decode Error";
        case ErrorCategory::STACK_FAULT:    return "Stack Fault";
        case ErrorCategory::ADDRESS_FAULT:  return "Address Fault";
        case ErrorCategory::CONFIG_ERROR:   return "Config Error";
        case ErrorCategory::INPUT_ERROR:    return "Input Error";
        case ErrorCategory::INTERNAL_ERROR: return "Internal Error";
        default:                            return "Unknown Error";
    }
}

// ==============================================================================
// Base Exception Class
// ==============================================================================

/**
 * @brief Base exception class for all CHIP-8 suite errors
 *
 * Carries the error category, the address of the instruction that was
 * executing (when known) and a descriptive message.
 *
 * Example usage:
 *   throw Chip8Error(ErrorCategory::STACK_FAULT, 0x204,
 *                    "Return with empty call stack");
 *
 * This will produce:
 *   Stack Fault at 0x0204 - Return with empty call stack
 */
class Chip8Error : public std::exception {
public:
    /**
     * @brief Construct an error with full context
     *
     * @param category What kind of error
     * @param location Address of the faulting instruction
     * @param message Description of what went wrong
     */
    Chip8Error(ErrorCategory category,
               std::optional<Address> location,
               const std::string& message)
        : category_(category)
        , location_(location)
        , message_(message)
    {
        std::ostringstream oss;
        oss << error_category_to_string(category);

        if (location) {
            oss << " at " << format_hex(*location, 4);
        }

        oss << " - " << message;
        full_message_ = oss.str();
    }

    /**
     * @brief Construct a simple error without an instruction address
     */
    Chip8Error(ErrorCategory category, const std::string& message)
        : Chip8Error(category, std::nullopt, message)
    {}

    /**
     * @brief Get the full formatted error message
     */
    const char* what() const noexcept override {
        return full_message_.c_str();
    }

    ErrorCategory category() const { return category_; }

    /**
     * @brief Address of the faulting instruction (empty if unknown)
     */
    const std::optional<Address>& location() const { return location_; }

    /**
     * @brief Get just the error message (without category/address)
     */
    const std::string& message() const { return message_; }

private:
    ErrorCategory category_;
    std::optional<Address> location_;
    std::string message_;
    std::string full_message_;  // Cached formatted message
};

// ==============================================================================
// Specific Exception Types
// ==============================================================================

/**
 * @brief The ROM file couldn't be read, or the program is too large
 */
class RomLoadError : public Chip8Error {
public:
    RomLoadError(const std::string& file, const std::string& message)
        : Chip8Error(ErrorCategory::ROM_LOAD_ERROR,
                     file.empty() ? message : file + ": " + message)
    {}

    RomLoadError(const std::string& message)
        : Chip8Error(ErrorCategory::ROM_LOAD_ERROR, message)
    {}
};

/**
 * @brief An opcode has no mapping within its dispatch group
 *
 * Only groups 0x8, 0xE and 0xF can produce this; every other group maps
 * every bit pattern to some instruction.
 */
class DecodeError : public Chip8Error {
public:
    DecodeError(Word opcode, const std::string& message)
        : Chip8Error(ErrorCategory::DECODE_ERROR, message)
        , opcode_(opcode)
    {}

    Word opcode() const { return opcode_; }

private:
    Word opcode_;
};

/**
 * @brief Call stack overflow (depth 16) or underflow (return at depth 0)
 */
class StackFault : public Chip8Error {
public:
    StackFault(const std::string& message)
        : Chip8Error(ErrorCategory::STACK_FAULT, message)
    {}
};

/**
 * @brief Memory access outside 0x000-0xFFF, or a write into the font table
 */
class AddressFault : public Chip8Error {
public:
    AddressFault(Address address, const std::string& message)
        : Chip8Error(ErrorCategory::ADDRESS_FAULT, message)
        , address_(address)
    {}

    /**
     * @brief The first address that could not be accessed
     */
    Address address() const { return address_; }

private:
    Address address_;
};

/**
 * @brief Unknown quirk keyword or profile name
 */
class ConfigError : public Chip8Error {
public:
    ConfigError(const std::string& message)
        : Chip8Error(ErrorCategory::CONFIG_ERROR, message)
    {}
};

/**
 * @brief The host passed an invalid key or register index
 */
class InputError : public Chip8Error {
public:
    InputError(const std::string& message)
        : Chip8Error(ErrorCategory::INPUT_ERROR, message)
    {}
};

/**
 * @brief Internal error - bug in the interpreter itself
 *
 * These should never happen in a correct implementation.
 */
class InternalError : public Chip8Error {
public:
    InternalError(const std::string& message)
        : Chip8Error(ErrorCategory::INTERNAL_ERROR, message)
    {}
};

// ==============================================================================
// Error Reporting Helpers
// ==============================================================================

/**
 * @brief Build an error message by streaming all arguments together
 *
 * Example:
 *   throw StackFault(build_error_message(
 *       "Call to ", format_hex(nnn, 3), " exceeds stack depth ", 16));
 */
template<typename... Args>
std::string build_error_message(Args&&... args) {
    std::ostringstream oss;
    (oss << ... << args);
    return oss.str();
}

}  // namespace chip8

#endif  // CHIP8_COMMON_ERROR_HPP
