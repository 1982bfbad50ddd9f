#pragma once
#include <cstdint>
#include <limits>

#include "hexmap/mapgen/Grid2D.hpp"
#include "hexmap/mapgen/MapConfig.hpp"
#include "hexmap/pcg/Noise.hpp"

namespace tf { class Executor; }

namespace hexmap::mapgen {

using ScalarField = Grid2D<double>;

// Height and moisture are min-max normalized to [0,1]; temperature is clamped to [0,1].
struct NoiseFields {
    ScalarField height;
    ScalarField temperature;
    ScalarField moisture;
};

inline constexpr pcg::FbmParams kHeightFbm   { 6, 0.02, 2.0, 0.5 };
inline constexpr pcg::FbmParams kMoistureFbm { 4, 0.03, 2.0, 0.5 };

inline constexpr double   kTemperatureNoiseFrequency = 0.05;
inline constexpr double   kTemperatureNoiseAmplitude = 0.2;
inline constexpr uint32_t kTemperatureSeedOffset     = 1000;
inline constexpr uint32_t kMoistureSeedOffset        = 2000;

// Ranges at or below this are treated as a uniform field and left unscaled.
inline constexpr double kNormalizeEpsilon = std::numeric_limits<double>::epsilon();

// Noise seeds are 32-bit; the map seed is truncated.
constexpr uint32_t noise_seed(uint64_t mapSeed, uint32_t offset = 0) noexcept {
    return static_cast<uint32_t>(mapSeed) + offset;
}

// 1 at the grid centre, falling off radially to 0 at the edge midpoints and beyond.
double edge_falloff(int x, int y, int width, int height) noexcept;

// Rescales to [0,1] in place using the field's own min/max.
void normalize_field(ScalarField& field) noexcept;

ScalarField generate_height_field(const MapConfig& cfg);
ScalarField generate_temperature_field(const MapConfig& cfg);
ScalarField generate_moisture_field(const MapConfig& cfg);

NoiseFields generate_noise_fields(const MapConfig& cfg);
// The three fields share no state; this overload builds them as parallel tasks.
NoiseFields generate_noise_fields(const MapConfig& cfg, tf::Executor& executor);

} // namespace hexmap::mapgen
