#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

#include "hexmap/tile/Terrain.hpp"

namespace hexmap::tile {

// Overlay on top of the base terrain. A tile carries at most one.
enum class TileFeature : uint8_t {
    Forest, Jungle, Marsh, Floodplains, Oasis, Ice
};

inline constexpr std::size_t kFeatureCount = 6;

inline constexpr std::array<TileFeature, kFeatureCount> kAllFeatures = {
    TileFeature::Forest, TileFeature::Jungle, TileFeature::Marsh,
    TileFeature::Floodplains, TileFeature::Oasis, TileFeature::Ice
};

int food_modifier(TileFeature f) noexcept;
int production_modifier(TileFeature f) noexcept;
int gold_modifier(TileFeature f) noexcept;

// Added on top of the terrain's movement cost.
int movement_modifier(TileFeature f) noexcept;

bool can_place_on(TileFeature f, Terrain t) noexcept;
std::span<const Terrain> valid_terrains(TileFeature f) noexcept;

std::string_view to_string(TileFeature f) noexcept;
std::optional<TileFeature> parse_feature(std::string_view name) noexcept;

} // namespace hexmap::tile
