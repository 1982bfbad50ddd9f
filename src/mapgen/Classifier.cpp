#include "hexmap/mapgen/Classifier.hpp"

namespace hexmap::mapgen {

using tile::Terrain;
using tile::TileFeature;

namespace {

// Deep water sits below this fraction of the ocean threshold.
constexpr double kDeepOceanFraction = 0.6;

Terrain biome(double t, bool hill) noexcept {
    if (t < kBiomeBands.snow)      return hill ? Terrain::SnowHill      : Terrain::Snow;
    if (t < kBiomeBands.tundra)    return hill ? Terrain::TundraHill    : Terrain::Tundra;
    if (t < kBiomeBands.grassland) return hill ? Terrain::GrasslandHill : Terrain::Grassland;
    if (t < kBiomeBands.plains)    return hill ? Terrain::PlainsHill    : Terrain::Plains;
    return hill ? Terrain::DesertHill : Terrain::Desert;
}

} // namespace

Terrain determine_terrain(double height, double temperature, double /*moisture*/,
                          const MapConfig& cfg) noexcept {
    if (height < cfg.ocean_threshold)
        return height < cfg.ocean_threshold * kDeepOceanFraction ? Terrain::Ocean : Terrain::Coast;

    if (height > cfg.mountain_threshold)
        return Terrain::Mountain;

    return biome(temperature, height > cfg.hill_threshold);
}

std::optional<TileFeature> determine_feature(Terrain terrain, double temperature, double moisture,
                                             pcg::Rng& rng) {
    if (tile::is_water(terrain) || terrain == Terrain::Mountain ||
        terrain == Terrain::Snow || terrain == Terrain::SnowHill)
        return std::nullopt;

    const FeatureRules& r = kFeatureRules;

    if (terrain == Terrain::Desert && moisture > r.oasis_min_moisture && rng.chance(r.oasis_chance))
        return TileFeature::Oasis;

    if (!tile::is_hill(terrain) && moisture > r.marsh_min_moisture && rng.chance(r.marsh_chance) &&
        tile::can_place_on(TileFeature::Marsh, terrain))
        return TileFeature::Marsh;

    if (temperature > r.jungle_min_temperature && moisture > r.jungle_min_moisture &&
        rng.chance(r.jungle_chance) && tile::can_place_on(TileFeature::Jungle, terrain))
        return TileFeature::Jungle;

    if (temperature < r.forest_max_temperature && moisture > r.forest_min_moisture &&
        rng.chance(r.forest_chance) && tile::can_place_on(TileFeature::Forest, terrain))
        return TileFeature::Forest;

    return std::nullopt;
}

} // namespace hexmap::mapgen
