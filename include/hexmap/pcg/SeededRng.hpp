#pragma once
#include <cstdint>
#include "hexmap/pcg/Hash.hpp"

namespace hexmap::pcg {

// xoshiro256** RNG (fast, high-quality). Plain value type: copying forks the stream.
struct Rng {
    uint64_t s[4];

    static Rng from_seed(uint64_t seed);
    uint64_t next_u64();             // [0, 2^64-1]
    uint32_t next_u32();             // [0, 2^32-1]
    double   next01();               // [0,1)

    // Bernoulli draw. Always consumes exactly one value, even for p <= 0 or p >= 1.
    bool     chance(double p);

    int      rangei(int lo, int hi); // inclusive
    double   ranged(double lo, double hi);
};

} // namespace hexmap::pcg
