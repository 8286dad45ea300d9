// ==============================================================================
// Random Byte Source
// ==============================================================================
// Feeds the Cxkk instruction. Seeded explicitly so tests and replays are
// reproducible; production hosts seed from std::random_device.
// ==============================================================================

#ifndef CHIP8_RANDOM_HPP
#define CHIP8_RANDOM_HPP

#include "types.hpp"
#include <random>

namespace chip8 {

class RandomSource {
public:
    explicit RandomSource(uint64_t seed);

    /**
     * @brief Create a source seeded from the OS entropy pool.
     */
    static RandomSource from_entropy();

    /**
     * @brief Restart the sequence from a new seed.
     */
    void reseed(uint64_t seed);

    /**
     * @brief Next pseudo-random byte.
     *
     * Takes the top 8 bits of a 64-bit Mersenne Twister draw; the engine's
     * output is fixed by the standard, so a seed gives the same sequence on
     * every platform.
     */
    Byte next_byte();

    uint64_t seed() const { return seed_; }

private:
    std::mt19937_64 engine_;
    uint64_t seed_;
};

}  // namespace chip8

#endif  // CHIP8_RANDOM_HPP
