#include "hexmap/tile/TileFeature.hpp"

#include <algorithm>

namespace hexmap::tile {
namespace {

constexpr std::array<Terrain, 6> kForestTerrains = {
    Terrain::Grassland, Terrain::Plains, Terrain::Tundra,
    Terrain::GrasslandHill, Terrain::PlainsHill, Terrain::TundraHill
};
constexpr std::array<Terrain, 4> kJungleTerrains = {
    Terrain::Grassland, Terrain::Plains, Terrain::GrasslandHill, Terrain::PlainsHill
};
constexpr std::array<Terrain, 1> kMarshTerrains  = { Terrain::Grassland };
constexpr std::array<Terrain, 1> kDesertTerrains = { Terrain::Desert };
constexpr std::array<Terrain, 2> kIceTerrains    = { Terrain::Coast, Terrain::Ocean };

struct FeatureInfo {
    std::string_view name;
    int food;
    int production;
    int gold;
    int movement;
    std::span<const Terrain> terrains;
};

constexpr std::array<FeatureInfo, kFeatureCount> kFeatureTable = {{
    {"Forest",       0,  1, 0, 1, kForestTerrains},
    {"Jungle",       0, -1, 0, 1, kJungleTerrains},
    {"Marsh",       -1,  0, 0, 1, kMarshTerrains},
    {"Floodplains",  2,  0, 0, 0, kDesertTerrains},
    {"Oasis",        3,  0, 1, 0, kDesertTerrains},
    {"Ice",          0,  0, 0, 0, kIceTerrains},
}};

constexpr const FeatureInfo& info(TileFeature f) noexcept {
    return kFeatureTable[static_cast<std::size_t>(f)];
}

} // namespace

int food_modifier(TileFeature f) noexcept       { return info(f).food; }
int production_modifier(TileFeature f) noexcept { return info(f).production; }
int gold_modifier(TileFeature f) noexcept       { return info(f).gold; }
int movement_modifier(TileFeature f) noexcept   { return info(f).movement; }

bool can_place_on(TileFeature f, Terrain t) noexcept {
    const auto terrains = info(f).terrains;
    return std::find(terrains.begin(), terrains.end(), t) != terrains.end();
}

std::span<const Terrain> valid_terrains(TileFeature f) noexcept { return info(f).terrains; }

std::string_view to_string(TileFeature f) noexcept { return info(f).name; }

std::optional<TileFeature> parse_feature(std::string_view name) noexcept {
    for (TileFeature f : kAllFeatures) {
        if (info(f).name == name)
            return f;
    }
    return std::nullopt;
}

} // namespace hexmap::tile
