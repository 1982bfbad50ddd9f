#pragma once
#include <optional>

#include "hexmap/mapgen/MapConfig.hpp"
#include "hexmap/pcg/SeededRng.hpp"
#include "hexmap/tile/Terrain.hpp"
#include "hexmap/tile/TileFeature.hpp"

namespace hexmap::mapgen {

// Temperature bands; a value below the limit falls in that band.
struct BiomeBands {
    double snow      = 0.15;
    double tundra    = 0.30;
    double grassland = 0.50;
    double plains    = 0.80;   // at or above: desert
};

inline constexpr BiomeBands kBiomeBands{};

// Climate limits and roll chances of the feature rules, in rule order. Limits are strict:
// a "min" must be exceeded and a "max" must not be reached.
struct FeatureRules {
    double oasis_min_moisture     = 0.4;
    double oasis_chance           = 0.05;

    double marsh_min_moisture     = 0.7;
    double marsh_chance           = 0.20;

    double jungle_min_temperature = 0.7;
    double jungle_min_moisture    = 0.6;
    double jungle_chance          = 0.50;

    double forest_max_temperature = 0.6;
    double forest_min_moisture    = 0.5;
    double forest_chance          = 0.40;
};

inline constexpr FeatureRules kFeatureRules{};

// Water, then mountain, then a temperature biome (hill variant above hill_threshold).
// Moisture does not influence terrain.
tile::Terrain determine_terrain(double height, double temperature, double moisture,
                                const MapConfig& cfg) noexcept;

// Rolls for at most one feature. Rules are tried in a fixed order (oasis, marsh, jungle,
// forest) and stop at the first success; a rule only draws from `rng` once its climate
// conditions hold, so the sequence of draws depends on the inputs as well as the seed.
std::optional<tile::TileFeature> determine_feature(tile::Terrain terrain,
                                                   double temperature, double moisture,
                                                   pcg::Rng& rng);

} // namespace hexmap::mapgen
