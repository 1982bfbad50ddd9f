#include "hexmap/pcg/Noise.hpp"
#include "hexmap/pcg/SeededRng.hpp"
#include <cmath>
#include <algorithm>

namespace hexmap::pcg {

static inline double fade(double t) { return t*t*t*(t*(t*6 - 15) + 10); }
static inline double lerp(double a, double b, double t) { return a + t * (b - a); }
static inline double grad(int hash, double x, double y) {
    // 12 edge gradients of the Perlin cube, projected to z = 0
    int h = hash & 15; double u = h < 8 ? x : y; double v = h < 4 ? y : (h==12||h==14 ? x : 0.0);
    return ((h & 1) ? -u : u) + ((h & 2) ? -v : v);
}

Perlin::Perlin(uint32_t seed) : seed_(seed) {
    std::array<int, 256> perm{};
    for (int i=0;i<256;++i) perm[i] = i;
    Rng rng = Rng::from_seed(seed);
    for (int i=255;i>0;--i) std::swap(perm[i], perm[rng.rangei(0,i)]);
    for (int i=0;i<512;++i) p_[i] = perm[i & 255];
}

double Perlin::noise(double x, double y) const noexcept {
    int X = static_cast<int>(std::floor(x)) & 255;
    int Y = static_cast<int>(std::floor(y)) & 255;
    x -= std::floor(x); y -= std::floor(y);
    double u = fade(x), v = fade(y);

    int A = p_[X  ] + Y;
    int B = p_[X+1] + Y;

    double res =
      lerp( lerp( grad(p_[A  ], x  , y  ),
                  grad(p_[B  ], x-1, y  ), u),
            lerp( grad(p_[A+1], x  , y-1),
                  grad(p_[B+1], x-1, y-1), u), v);
    return std::clamp(res, -1.0, 1.0);
}

double Perlin::fbm(double x, double y, const FbmParams& fp) const noexcept {
    double f = 0.0, amp = 1.0, total = 0.0, freq = fp.frequency;
    for (int i=0;i<fp.octaves;++i) {
        f += amp * noise(x*freq, y*freq);
        total += amp;
        freq *= fp.lacunarity;
        amp *= fp.persistence;
    }
    return total > 0.0 ? f / total : 0.0;
}

} // namespace hexmap::pcg
