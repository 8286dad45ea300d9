// ==============================================================================
// Random Byte Source Implementation
// ==============================================================================

#include "random.hpp"

namespace chip8 {

RandomSource::RandomSource(uint64_t seed)
    : engine_(seed)
    , seed_(seed)
{}

RandomSource RandomSource::from_entropy() {
    std::random_device device;
    uint64_t seed = (static_cast<uint64_t>(device()) << 32) | device();
    return RandomSource(seed);
}

void RandomSource::reseed(uint64_t seed) {
    engine_.seed(seed);
    seed_ = seed;
}

Byte RandomSource::next_byte() {
    return static_cast<Byte>(engine_() >> 56);
}

}  // namespace chip8
