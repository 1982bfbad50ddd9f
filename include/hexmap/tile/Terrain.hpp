#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace hexmap::tile {

// Base terrain of a map tile. Five flat biomes, their hill variants, mountains and water.
enum class Terrain : uint8_t {
    // flat
    Grassland, Plains, Desert, Tundra, Snow,
    // hills
    GrasslandHill, PlainsHill, DesertHill, TundraHill, SnowHill,
    Mountain,
    // water
    Coast, Ocean, Lake
};

inline constexpr std::size_t kTerrainCount = 14;

// Movement cost reported for tiles a land unit cannot enter.
inline constexpr int kImpassableCost = 9999;

inline constexpr std::array<Terrain, kTerrainCount> kAllTerrains = {
    Terrain::Grassland, Terrain::Plains, Terrain::Desert, Terrain::Tundra, Terrain::Snow,
    Terrain::GrasslandHill, Terrain::PlainsHill, Terrain::DesertHill, Terrain::TundraHill,
    Terrain::SnowHill, Terrain::Mountain, Terrain::Coast, Terrain::Ocean, Terrain::Lake
};

int base_food(Terrain t) noexcept;
int base_production(Terrain t) noexcept;
int base_gold(Terrain t) noexcept;

// 1 flat, 2 hill, kImpassableCost for mountains and water.
int movement_cost(Terrain t) noexcept;

bool is_water(Terrain t) noexcept;
bool is_hill(Terrain t) noexcept;
bool is_passable(Terrain t) noexcept;
bool is_flat_land(Terrain t) noexcept;

std::string_view to_string(Terrain t) noexcept;
std::optional<Terrain> parse_terrain(std::string_view name) noexcept;

} // namespace hexmap::tile
