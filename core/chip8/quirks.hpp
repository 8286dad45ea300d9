// ==============================================================================
// Interpreter Quirks and Engine Configuration
// ==============================================================================
// Historical CHIP-8 interpreters disagree on a handful of instructions.
// Each disagreement is a named toggle here; the engine consults them
// while executing the affected instructions.
//
// Every toggle off is the classic baseline:
//   - 8xy6/8xyE shift Vx in place
//   - Fx55/Fx65 leave I unchanged
//   - sprites are clipped at the screen edge
//   - Bnnn jumps to nnn + V0
//   - Dxyn draws immediately
//   - 8xy1/8xy2/8xy3 leave VF alone
// ==============================================================================

#ifndef CHIP8_QUIRKS_HPP
#define CHIP8_QUIRKS_HPP

#include "types.hpp"
#include "error.hpp"
#include <optional>
#include <string>
#include <vector>

namespace chip8 {

/**
 * @brief How Fx55/Fx65 leave the index register afterwards.
 */
enum class IndexIncrement {
    NONE,       // I unchanged
    X,          // I += x (CHIP-48)
    X_PLUS_1    // I += x + 1 (COSMAC VIP)
};

/**
 * @brief Which value Bnnn adds to its target address.
 */
enum class JumpOffsetSource {
    V0,             // nnn + V0
    VX,             // xnn + Vx, x being the high nibble of nnn (CHIP-48/SCHIP)
    V0_LOW_NIBBLE   // nnn + (V0 & 0xF)
};

struct Quirks {
    bool shift_uses_vy = false;         // 8xy6/8xyE shift Vy into Vx
    IndexIncrement load_store = IndexIncrement::NONE;
    bool wrap_sprites = false;          // off-screen sprite pixels wrap around
    JumpOffsetSource jump_offset = JumpOffsetSource::V0;
    bool display_waits_vblank = false;  // at most one Dxyn per frame
    bool logic_resets_vf = false;       // 8xy1/8xy2/8xy3 clear VF

    bool operator==(const Quirks& other) const;
    bool operator!=(const Quirks& other) const { return !(*this == other); }
};

/**
 * @brief When the delay and sound timers count down.
 */
enum class TimerMode {
    PER_CYCLE,  // once per executed cycle
    PER_FRAME   // once per frame_tick(), the 60 Hz host clock
};

/**
 * @brief Everything an engine needs besides the program itself.
 */
struct EngineConfig {
    Quirks quirks;
    TimerMode timer_mode = TimerMode::PER_CYCLE;

    // Empty means seed from std::random_device.
    std::optional<uint64_t> seed;
};

// ==============================================================================
// Profiles and Keywords
// ==============================================================================

/**
 * @brief Quirk preset for a named interpreter.
 *
 * Names: "classic", "cosmac", "chip48", "schip".
 *
 * @throws ConfigError for an unknown name
 */
Quirks quirks_for_profile(const std::string& profile);

/**
 * @brief All profile names accepted by quirks_for_profile().
 */
std::vector<std::string> profile_names();

/**
 * @brief Enable one quirk by keyword.
 *
 * Keywords: shift, loadstore, loadstore-x, wrap, jump, jump-nibble,
 * vblank, logic.
 *
 * @throws ConfigError for an unknown keyword
 */
void enable_quirk(Quirks& quirks, const std::string& keyword);

/**
 * @brief Active quirk keywords, comma separated ("none" if all off).
 */
std::string quirks_to_string(const Quirks& quirks);

/**
 * @brief Parse "cycle" or "frame".
 *
 * @throws ConfigError for anything else
 */
TimerMode parse_timer_mode(const std::string& text);

}  // namespace chip8

#endif  // CHIP8_QUIRKS_HPP
