// ==============================================================================
// Interpreter Quirks Implementation
// ==============================================================================

#include "quirks.hpp"

namespace chip8 {

bool Quirks::operator==(const Quirks& other) const {
    return shift_uses_vy == other.shift_uses_vy &&
           load_store == other.load_store &&
           wrap_sprites == other.wrap_sprites &&
           jump_offset == other.jump_offset &&
           display_waits_vblank == other.display_waits_vblank &&
           logic_resets_vf == other.logic_resets_vf;
}

// ==============================================================================
// Profiles
// ==============================================================================

Quirks quirks_for_profile(const std::string& profile) {
    Quirks quirks;

    if (profile == "classic") {
        return quirks;
    }

    if (profile == "cosmac") {
        quirks.shift_uses_vy = true;
        quirks.load_store = IndexIncrement::X_PLUS_1;
        quirks.display_waits_vblank = true;
        quirks.logic_resets_vf = true;
        return quirks;
    }

    if (profile == "chip48") {
        quirks.load_store = IndexIncrement::X;
        quirks.jump_offset = JumpOffsetSource::VX;
        return quirks;
    }

    if (profile == "schip") {
        quirks.jump_offset = JumpOffsetSource::VX;
        return quirks;
    }

    throw ConfigError(
        "Unknown interpreter profile '" + profile +
        "'. Expected one of: classic, cosmac, chip48, schip.");
}

std::vector<std::string> profile_names() {
    return {"classic", "cosmac", "chip48", "schip"};
}

// ==============================================================================
// Keywords
// ==============================================================================

void enable_quirk(Quirks& quirks, const std::string& keyword) {
    if (keyword == "shift") {
        quirks.shift_uses_vy = true;
    } else if (keyword == "loadstore") {
        quirks.load_store = IndexIncrement::X_PLUS_1;
    } else if (keyword == "loadstore-x") {
        quirks.load_store = IndexIncrement::X;
    } else if (keyword == "wrap") {
        quirks.wrap_sprites = true;
    } else if (keyword == "jump") {
        quirks.jump_offset = JumpOffsetSource::VX;
    } else if (keyword == "jump-nibble") {
        quirks.jump_offset = JumpOffsetSource::V0_LOW_NIBBLE;
    } else if (keyword == "vblank") {
        quirks.display_waits_vblank = true;
    } else if (keyword == "logic") {
        quirks.logic_resets_vf = true;
    } else {
        throw ConfigError(
            "Unknown quirk keyword '" + keyword + "'. Expected one of: shift, "
            "loadstore, loadstore-x, wrap, jump, jump-nibble, vblank, logic.");
    }
}

std::string quirks_to_string(const Quirks& quirks) {
    std::vector<std::string> active;

    if (quirks.shift_uses_vy) active.push_back("shift");
    if (quirks.load_store == IndexIncrement::X_PLUS_1) active.push_back("loadstore");
    if (quirks.load_store == IndexIncrement::X) active.push_back("loadstore-x");
    if (quirks.wrap_sprites) active.push_back("wrap");
    if (quirks.jump_offset == JumpOffsetSource::VX) active.push_back("jump");
    if (quirks.jump_offset == JumpOffsetSource::V0_LOW_NIBBLE) active.push_back("jump-nibble");
    if (quirks.display_waits_vblank) active.push_back("vblank");
    if (quirks.logic_resets_vf) active.push_back("logic");

    if (active.empty()) {
        return "none";
    }

    std::string result = active[0];
    for (size_t i = 1; i < active.size(); i++) {
        result += "," + active[i];
    }
    return result;
}

TimerMode parse_timer_mode(const std::string& text) {
    if (text == "cycle") return TimerMode::PER_CYCLE;
    if (text == "frame") return TimerMode::PER_FRAME;
    throw ConfigError("Unknown timer mode '" + text + "'. Expected 'cycle' or 'frame'.");
}

}  // namespace chip8
