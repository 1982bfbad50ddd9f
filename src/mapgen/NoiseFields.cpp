// src/mapgen/NoiseFields.cpp
#include "hexmap/mapgen/NoiseFields.hpp"

#include <algorithm>
#include <cmath>

#include <spdlog/spdlog.h>
#include <taskflow/taskflow.hpp>  // implementation here, not in headers

namespace hexmap::mapgen {

double edge_falloff(int x, int y, int width, int height) noexcept {
    const double ex = std::abs(static_cast<double>(x) / width  - 0.5) * 2.0;
    const double ey = std::abs(static_cast<double>(y) / height - 0.5) * 2.0;
    return 1.0 - std::min(1.0, std::sqrt(ex * ex + ey * ey));
}

void normalize_field(ScalarField& field) noexcept {
    if (field.empty())
        return;

    const auto [lo, hi] = std::minmax_element(field.begin(), field.end());
    const double minV = *lo;
    const double range = *hi - minV;
    if (!(range > kNormalizeEpsilon))
        return;

    for (double& v : field)
        v = (v - minV) / range;
}

ScalarField generate_height_field(const MapConfig& cfg) {
    const auto [W, H] = cfg.dims();
    const pcg::Perlin perlin(noise_seed(cfg.seed));

    ScalarField out(W, H);
    for (int y = 0; y < H; ++y) {
        for (int x = 0; x < W; ++x) {
            const double h = perlin.fbm(static_cast<double>(x), static_cast<double>(y), kHeightFbm);
            out.at(x, y) = h * edge_falloff(x, y, W, H);
        }
    }

    normalize_field(out);
    return out;
}

ScalarField generate_temperature_field(const MapConfig& cfg) {
    const auto [W, H] = cfg.dims();
    const pcg::Perlin perlin(noise_seed(cfg.seed, kTemperatureSeedOffset));

    ScalarField out(W, H);
    for (int y = 0; y < H; ++y) {
        // 1 at the equator (middle row), 0 at the poles
        const double latitude = std::abs(static_cast<double>(y) / H - 0.5) * 2.0;
        const double base = 1.0 - latitude;
        for (int x = 0; x < W; ++x) {
            const double n = perlin.noise(x * kTemperatureNoiseFrequency, y * kTemperatureNoiseFrequency);
            out.at(x, y) = std::clamp(base + n * kTemperatureNoiseAmplitude, 0.0, 1.0);
        }
    }
    return out;
}

ScalarField generate_moisture_field(const MapConfig& cfg) {
    const auto [W, H] = cfg.dims();
    const pcg::Perlin perlin(noise_seed(cfg.seed, kMoistureSeedOffset));

    ScalarField out(W, H);
    for (int y = 0; y < H; ++y)
        for (int x = 0; x < W; ++x)
            out.at(x, y) = perlin.fbm(static_cast<double>(x), static_cast<double>(y), kMoistureFbm);

    normalize_field(out);
    return out;
}

NoiseFields generate_noise_fields(const MapConfig& cfg) {
    NoiseFields f;
    f.height      = generate_height_field(cfg);
    f.temperature = generate_temperature_field(cfg);
    f.moisture    = generate_moisture_field(cfg);
    return f;
}

NoiseFields generate_noise_fields(const MapConfig& cfg, tf::Executor& executor) {
    NoiseFields f;

    tf::Taskflow flow;
    flow.emplace(
        [&] { f.height      = generate_height_field(cfg); },
        [&] { f.temperature = generate_temperature_field(cfg); },
        [&] { f.moisture    = generate_moisture_field(cfg); });

    executor.run(flow).wait();
    spdlog::debug("noise fields: {}x{} built on {} workers",
                  f.height.width(), f.height.height(), executor.num_workers());
    return f;
}

} // namespace hexmap::mapgen
