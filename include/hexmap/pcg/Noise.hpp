#pragma once
#include <array>
#include <cstdint>

namespace hexmap::pcg {

// Octave settings for fractal Brownian motion.
struct FbmParams {
    int    octaves     = 6;
    double frequency   = 1.0;  // applied to the first octave
    double lacunarity  = 2.0;  // frequency multiplier per octave
    double persistence = 0.5;  // amplitude multiplier per octave
};

// Classic gradient noise over a seeded permutation table.
class Perlin {
public:
    explicit Perlin(uint32_t seed = 0);

    [[nodiscard]] uint32_t seed() const noexcept { return seed_; }

    // 2D Perlin in [-1,1]
    [[nodiscard]] double noise(double x, double y) const noexcept;

    // Sum of octaves divided by the total amplitude, so the result stays in [-1,1].
    [[nodiscard]] double fbm(double x, double y, const FbmParams& p) const noexcept;

private:
    uint32_t seed_ = 0;
    std::array<int, 512> p_{};
};

} // namespace hexmap::pcg
