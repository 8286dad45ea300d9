// ==============================================================================
// CHIP-8 Instruction Decoder Implementation
// ==============================================================================

#include "instruction.hpp"

namespace chip8 {

// ==============================================================================
// Opcode -> Op Mapping
// ==============================================================================

// Returns false only for unmapped opcodes in groups 0x8, 0xE and 0xF.
static bool lookup_op(Word opcode, Op& op) {
    const uint8_t group = static_cast<uint8_t>(opcode >> 12);
    const uint8_t low_nibble = static_cast<uint8_t>(opcode & 0x000F);
    const uint8_t low_byte = static_cast<uint8_t>(opcode & 0x00FF);

    switch (group) {
        case 0x0:
            if (opcode == 0x00E0)      op = Op::CLEAR_SCREEN;
            else if (opcode == 0x00EE) op = Op::RETURN_FROM_SUBROUTINE;
            else                       op = Op::NOOP;
            return true;
        case 0x1: op = Op::JUMP;            return true;
        case 0x2: op = Op::CALL_SUBROUTINE; return true;
        case 0x3: op = Op::SKIP_IF_X_EQ_KK; return true;
        case 0x4: op = Op::SKIP_IF_X_NE_KK; return true;
        case 0x5: op = Op::SKIP_IF_X_EQ_Y;  return true;
        case 0x6: op = Op::LOAD_X;          return true;
        case 0x7: op = Op::ADD_TO_X;        return true;
        case 0x8:
            switch (low_nibble) {
                case 0x0: op = Op::LOAD_Y_INTO_X; return true;
                case 0x1: op = Op::OR_X_Y;        return true;
                case 0x2: op = Op::AND_X_Y;       return true;
                case 0x3: op = Op::XOR_X_Y;       return true;
                case 0x4: op = Op::ADD_Y_TO_X;    return true;
                case 0x5: op = Op::SUB_Y_FROM_X;  return true;
                case 0x6: op = Op::SHIFT_RIGHT;   return true;
                case 0x7: op = Op::SUB_X_FROM_Y;  return true;
                case 0xE: op = Op::SHIFT_LEFT;    return true;
                default:  return false;
            }
        case 0x9: op = Op::SKIP_IF_X_NE_Y; return true;
        case 0xA: op = Op::SET_INDEX;      return true;
        case 0xB: op = Op::JUMP_PLUS_V0;   return true;
        case 0xC: op = Op::SET_RANDOM;     return true;
        case 0xD: op = Op::DISPLAY;        return true;
        case 0xE:
            switch (low_byte) {
                case 0x9E: op = Op::SKIP_IF_PRESSED;     return true;
                case 0xA1: op = Op::SKIP_IF_NOT_PRESSED; return true;
                default:   return false;
            }
        case 0xF:
            switch (low_byte) {
                case 0x07: op = Op::SET_X_TO_DELAY_TIMER; return true;
                case 0x0A: op = Op::WAIT_FOR_KEY;         return true;
                case 0x15: op = Op::SET_DELAY_TIMER_TO_X; return true;
                case 0x18: op = Op::SET_SOUND_TIMER_TO_X; return true;
                case 0x1E: op = Op::ADD_X_TO_I;           return true;
                case 0x29: op = Op::SET_I_TO_SPRITE_X;    return true;
                case 0x33: op = Op::LOAD_BCD_OF_X;        return true;
                case 0x55: op = Op::WRITE_0_THROUGH_X;    return true;
                case 0x65: op = Op::LOAD_0_THROUGH_X;     return true;
                default:   return false;
            }
        default:
            return false;
    }
}

// ==============================================================================
// Decode Functions
// ==============================================================================

DecodedInstruction decode_instruction(Word opcode) {
    DecodedInstruction decoded{};
    decoded.raw = opcode;
    decoded.x = static_cast<uint8_t>((opcode >> 8) & 0xF);
    decoded.y = static_cast<uint8_t>((opcode >> 4) & 0xF);
    decoded.n = static_cast<uint8_t>(opcode & 0xF);
    decoded.kk = static_cast<Byte>(opcode & 0xFF);
    decoded.nnn = static_cast<Address>(opcode & 0x0FFF);

    if (!lookup_op(opcode, decoded.op)) {
        throw DecodeError(opcode, build_error_message(
            "Unknown opcode ", format_hex(opcode, 4), " in group ",
            format_hex(opcode >> 12, 1), ". The ROM may be corrupted, "
            "or written for an extended interpreter (SCHIP/XO-CHIP)."));
    }

    return decoded;
}

bool is_valid_opcode(Word opcode) {
    Op op;
    return lookup_op(opcode, op);
}

// ==============================================================================
// Disassembly
// ==============================================================================

const char* op_to_string(Op op) {
    switch (op) {
        case Op::NOOP:                   return "SYS";
        case Op::CLEAR_SCREEN:           return "CLS";
        case Op::RETURN_FROM_SUBROUTINE: return "RET";
        case Op::JUMP:                   return "JP";
        case Op::CALL_SUBROUTINE:        return "CALL";
        case Op::SKIP_IF_X_EQ_KK:
        case Op::SKIP_IF_X_EQ_Y:         return "SE";
        case Op::SKIP_IF_X_NE_KK:
        case Op::SKIP_IF_X_NE_Y:         return "SNE";
        case Op::LOAD_X:
        case Op::LOAD_Y_INTO_X:
        case Op::SET_INDEX:
        case Op::SET_X_TO_DELAY_TIMER:
        case Op::WAIT_FOR_KEY:
        case Op::SET_DELAY_TIMER_TO_X:
        case Op::SET_SOUND_TIMER_TO_X:
        case Op::SET_I_TO_SPRITE_X:
        case Op::LOAD_BCD_OF_X:
        case Op::WRITE_0_THROUGH_X:
        case Op::LOAD_0_THROUGH_X:       return "LD";
        case Op::ADD_TO_X:
        case Op::ADD_Y_TO_X:
        case Op::ADD_X_TO_I:             return "ADD";
        case Op::OR_X_Y:                 return "OR";
        case Op::AND_X_Y:                return "AND";
        case Op::XOR_X_Y:                return "XOR";
        case Op::SUB_Y_FROM_X:           return "SUB";
        case Op::SHIFT_RIGHT:            return "SHR";
        case Op::SUB_X_FROM_Y:           return "SUBN";
        case Op::SHIFT_LEFT:             return "SHL";
        case Op::JUMP_PLUS_V0:           return "JP";
        case Op::SET_RANDOM:             return "RND";
        case Op::DISPLAY:                return "DRW";
        case Op::SKIP_IF_PRESSED:        return "SKP";
        case Op::SKIP_IF_NOT_PRESSED:    return "SKNP";
        default:                         return "???";
    }
}

std::string instruction_to_string(const DecodedInstruction& instr) {
    const std::string mnemonic = op_to_string(instr.op);
    const std::string vx = register_name(instr.x);
    const std::string vy = register_name(instr.y);
    const std::string nnn = format_hex(instr.nnn, 3);
    const std::string kk = format_hex(instr.kk, 2);

    switch (instr.op) {
        case Op::CLEAR_SCREEN:
        case Op::RETURN_FROM_SUBROUTINE:
            return mnemonic;

        case Op::NOOP:
        case Op::JUMP:
        case Op::CALL_SUBROUTINE:
            return mnemonic + " " + nnn;

        case Op::SKIP_IF_X_EQ_KK:
        case Op::SKIP_IF_X_NE_KK:
        case Op::LOAD_X:
        case Op::ADD_TO_X:
        case Op::SET_RANDOM:
            return mnemonic + " " + vx + ", " + kk;

        case Op::SKIP_IF_X_EQ_Y:
        case Op::SKIP_IF_X_NE_Y:
        case Op::LOAD_Y_INTO_X:
        case Op::OR_X_Y:
        case Op::AND_X_Y:
        case Op::XOR_X_Y:
        case Op::ADD_Y_TO_X:
        case Op::SUB_Y_FROM_X:
        case Op::SUB_X_FROM_Y:
        case Op::SHIFT_RIGHT:
        case Op::SHIFT_LEFT:
            return mnemonic + " " + vx + ", " + vy;

        case Op::SET_INDEX:            return "LD I, " + nnn;
        case Op::JUMP_PLUS_V0:         return "JP V0, " + nnn;
        case Op::DISPLAY:
            return mnemonic + " " + vx + ", " + vy + ", " + std::to_string(instr.n);
        case Op::SKIP_IF_PRESSED:
        case Op::SKIP_IF_NOT_PRESSED:  return mnemonic + " " + vx;
        case Op::SET_X_TO_DELAY_TIMER: return "LD " + vx + ", DT";
        case Op::WAIT_FOR_KEY:         return "LD " + vx + ", K";
        case Op::SET_DELAY_TIMER_TO_X: return "LD DT, " + vx;
        case Op::SET_SOUND_TIMER_TO_X: return "LD ST, " + vx;
        case Op::ADD_X_TO_I:           return "ADD I, " + vx;
        case Op::SET_I_TO_SPRITE_X:    return "LD F, " + vx;
        case Op::LOAD_BCD_OF_X:        return "LD B, " + vx;
        case Op::WRITE_0_THROUGH_X:    return "LD [I], " + vx;
        case Op::LOAD_0_THROUGH_X:     return "LD " + vx + ", [I]";
        default:                       return "???";
    }
}

std::string instruction_to_string(Word raw_opcode) {
    if (!is_valid_opcode(raw_opcode)) {
        return "DW " + format_hex(raw_opcode, 4);
    }
    return instruction_to_string(decode_instruction(raw_opcode));
}

}  // namespace chip8
