#include "hexmap/pcg/SeededRng.hpp"

namespace {
inline uint64_t rotl(const uint64_t x, int k) { return (x << k) | (x >> (64 - k)); }
}

namespace hexmap::pcg {

Rng Rng::from_seed(uint64_t seed) {
    uint64_t x = seed ? seed : 0x106689d45497fdb5ULL;
    Rng r{};
    r.s[0] = splitmix64(x);
    r.s[1] = splitmix64(x);
    r.s[2] = splitmix64(x);
    r.s[3] = splitmix64(x);
    return r;
}

uint64_t Rng::next_u64() {
    const uint64_t result = rotl(s[1] * 5ull, 7) * 9ull;
    const uint64_t t = s[1] << 17;
    s[2] ^= s[0]; s[3] ^= s[1];
    s[1] ^= s[2]; s[0] ^= s[3];
    s[2] ^= t; s[3] = rotl(s[3], 45);
    return result;
}

uint32_t Rng::next_u32() { return static_cast<uint32_t>(next_u64() >> 32); }
double   Rng::next01()   { return (next_u64() >> 11) * (1.0 / (1ull << 53)); }

bool Rng::chance(double p) {
    const double u = next01();
    if (p <= 0.0) return false;
    if (p >= 1.0) return true;
    return u < p;
}

int Rng::rangei(int lo, int hi) {
    if (hi <= lo) return lo;
    uint32_t r = next_u32();
    uint32_t span = static_cast<uint32_t>(hi - lo + 1);
    return lo + static_cast<int>(r % span);
}

double Rng::ranged(double lo, double hi) { return lo + (hi - lo) * next01(); }

} // namespace hexmap::pcg
