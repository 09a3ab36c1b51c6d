#pragma once

#include <cstdint>

namespace geo_debugger {

// PCG random number generator (permuted congruential generator).
// Splittable, so parallel workers can be seeded deterministically.
class RNG {
public:
    RNG() : state_(0x853c49e6748fea9bULL), inc_(0xda3e39cb94b95bdbULL) {}
    explicit RNG(uint64_t seed) : state_(0), inc_(seed | 1) {
        (void)next();  // Discard for seeding
        state_ += seed;
        (void)next();  // Discard for seeding
    }

    [[nodiscard]] uint64_t next() {
        uint64_t oldstate = state_;
        state_ = oldstate * 6364136223846793005ULL + inc_;
        uint32_t xorshifted = static_cast<uint32_t>(((oldstate >> 18u) ^ oldstate) >> 27u);
        uint32_t rot = static_cast<uint32_t>(oldstate >> 59u);
        return (xorshifted >> rot) | (xorshifted << ((-rot) & 31));
    }

    // [0, 1)
    [[nodiscard]] double uniform() {
        return static_cast<double>(next()) / static_cast<double>(1ULL << 32);
    }

    // [min, max)
    [[nodiscard]] double uniform(double min, double max) {
        return min + uniform() * (max - min);
    }

    // New independent RNG seeded from the current state
    [[nodiscard]] RNG split() {
        return RNG(next());
    }

    [[nodiscard]] bool operator==(const RNG& other) const {
        return state_ == other.state_ && inc_ == other.inc_;
    }

private:
    uint64_t state_;
    uint64_t inc_;
};

}  // namespace geo_debugger
