#pragma once
#include <cstddef>
#include <unordered_map>
#include <vector>

#include <entt/entt.hpp>

#include "hexmap/mapgen/MapConfig.hpp"
#include "hexmap/mapgen/NoiseFields.hpp"
#include "hexmap/tile/TilePosition.hpp"
#include "hexmap/tile/TileRecord.hpp"

namespace tf { class Executor; }

namespace hexmap::mapgen {

// Builds one TileRecord per coordinate of the configured grid.
//
// Coordinates are visited q-major: q in [0, width) outer, r in [0, height) inner. The
// feature rolls share one RNG stream seeded from cfg.seed, so this order is part of the
// output. Every generation pass starts a fresh stream; repeated calls give equal maps.
class MapGenerator {
public:
    explicit MapGenerator(MapConfig cfg);

    [[nodiscard]] const MapConfig& config() const noexcept { return cfg_; }

    // Optional worker pool for building the three noise fields concurrently.
    void set_executor(tf::Executor* executor) noexcept { executor_ = executor; }

    [[nodiscard]] ScalarField generate_height_map() const;
    [[nodiscard]] ScalarField generate_temperature_map() const;
    [[nodiscard]] ScalarField generate_moisture_map() const;
    [[nodiscard]] NoiseFields generate_fields() const;

    // No resources and no rivers are placed; later systems add them via tile::with_resource().
    [[nodiscard]] std::vector<tile::TileRecord> generate_records() const;
    [[nodiscard]] std::vector<tile::TileRecord> generate_records(const NoiseFields& fields) const;

    // One entity per record, each carrying a tile::TileRecord component.
    // Returns the entities in traversal order.
    std::vector<entt::entity> generate(entt::registry& registry) const;

private:
    MapConfig cfg_;
    tf::Executor* executor_ = nullptr;
};

std::vector<entt::entity> spawn_tiles(entt::registry& registry,
                                      const std::vector<tile::TileRecord>& records);

using TileIndex = std::unordered_map<tile::TilePosition, entt::entity>;

// Position lookup over every entity with a TileRecord.
TileIndex build_tile_index(const entt::registry& registry);

} // namespace hexmap::mapgen
