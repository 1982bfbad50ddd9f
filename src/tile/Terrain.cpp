// src/tile/Terrain.cpp
#include "hexmap/tile/Terrain.hpp"

namespace hexmap::tile {
namespace {

struct TerrainInfo {
    std::string_view name;
    int food;
    int production;
    int gold;
    int movement;
};

// Indexed by the enum's underlying value; keep in declaration order.
constexpr std::array<TerrainInfo, kTerrainCount> kTerrainTable = {{
    {"Grassland",     2, 0, 0, 1},
    {"Plains",        1, 1, 0, 1},
    {"Desert",        0, 0, 0, 1},
    {"Tundra",        1, 0, 0, 1},
    {"Snow",          0, 0, 0, 1},
    {"GrasslandHill", 0, 2, 0, 2},
    {"PlainsHill",    0, 2, 0, 2},
    {"DesertHill",    0, 2, 0, 2},
    {"TundraHill",    0, 2, 0, 2},
    {"SnowHill",      0, 2, 0, 2},
    {"Mountain",      0, 0, 0, kImpassableCost},
    {"Coast",         1, 0, 0, kImpassableCost},
    {"Ocean",         1, 0, 0, kImpassableCost},
    {"Lake",          2, 0, 0, kImpassableCost},
}};

constexpr const TerrainInfo& info(Terrain t) noexcept {
    return kTerrainTable[static_cast<std::size_t>(t)];
}

} // namespace

int base_food(Terrain t) noexcept       { return info(t).food; }
int base_production(Terrain t) noexcept { return info(t).production; }
int base_gold(Terrain t) noexcept       { return info(t).gold; }
int movement_cost(Terrain t) noexcept   { return info(t).movement; }

bool is_water(Terrain t) noexcept {
    switch (t) {
    case Terrain::Coast:
    case Terrain::Ocean:
    case Terrain::Lake:
        return true;
    default:
        return false;
    }
}

bool is_hill(Terrain t) noexcept {
    switch (t) {
    case Terrain::GrasslandHill:
    case Terrain::PlainsHill:
    case Terrain::DesertHill:
    case Terrain::TundraHill:
    case Terrain::SnowHill:
        return true;
    default:
        return false;
    }
}

bool is_passable(Terrain t) noexcept {
    return t != Terrain::Mountain && !is_water(t);
}

bool is_flat_land(Terrain t) noexcept {
    switch (t) {
    case Terrain::Grassland:
    case Terrain::Plains:
    case Terrain::Desert:
    case Terrain::Tundra:
    case Terrain::Snow:
        return true;
    default:
        return false;
    }
}

std::string_view to_string(Terrain t) noexcept { return info(t).name; }

std::optional<Terrain> parse_terrain(std::string_view name) noexcept {
    for (Terrain t : kAllTerrains) {
        if (info(t).name == name)
            return t;
    }
    return std::nullopt;
}

} // namespace hexmap::tile
