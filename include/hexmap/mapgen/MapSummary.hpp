#pragma once
#include <array>
#include <cstddef>
#include <string>
#include <vector>

#include "hexmap/tile/TileFeature.hpp"
#include "hexmap/tile/TileRecord.hpp"
#include "hexmap/tile/Terrain.hpp"

namespace hexmap::mapgen {

// Terrain and feature histogram of a generated map.
struct MapSummary {
    std::size_t tiles = 0;
    std::size_t water = 0;
    std::size_t mountains = 0;
    std::size_t land = 0;        // passable land (flat + hills)
    std::size_t featured = 0;
    std::array<std::size_t, tile::kTerrainCount> terrain{};
    std::array<std::size_t, tile::kFeatureCount> features{};

    [[nodiscard]] std::size_t count(tile::Terrain t) const noexcept {
        return terrain[static_cast<std::size_t>(t)];
    }
    [[nodiscard]] std::size_t count(tile::TileFeature f) const noexcept {
        return features[static_cast<std::size_t>(f)];
    }
    [[nodiscard]] double water_fraction() const noexcept {
        return tiles ? static_cast<double>(water) / static_cast<double>(tiles) : 0.0;
    }
};

MapSummary summarize(const std::vector<tile::TileRecord>& tiles);

// "1536 tiles: 58.2% water, 3.1% mountain, 38.7% land, 212 features"
std::string describe(const MapSummary& s);

} // namespace hexmap::mapgen
