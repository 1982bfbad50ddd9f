#pragma once
#include <optional>

#include "hexmap/tile/RiverEdges.hpp"
#include "hexmap/tile/Terrain.hpp"
#include "hexmap/tile/TileFeature.hpp"
#include "hexmap/tile/TilePosition.hpp"
#include "hexmap/tile/TileResource.hpp"
#include "hexmap/tile/TileYields.hpp"

namespace hexmap::tile {

// Everything the generator knows about one coordinate. `yields` is derived from the
// other fields; build and modify records only through make_tile_record() and the
// with_* helpers so it never goes stale.
struct TileRecord {
    TilePosition position;
    Terrain terrain = Terrain::Grassland;
    std::optional<TileFeature> feature;
    std::optional<TileResource> resource;
    TileYields yields;
    RiverEdges rivers;

    friend bool operator==(const TileRecord&, const TileRecord&) = default;
};

TileRecord make_tile_record(TilePosition position,
                            Terrain terrain,
                            std::optional<TileFeature> feature = std::nullopt,
                            std::optional<TileResource> resource = std::nullopt,
                            RiverEdges rivers = RiverEdges::none());

// Copies with one determinant replaced and yields recomputed.
TileRecord with_feature(const TileRecord& tile, std::optional<TileFeature> feature);
TileRecord with_resource(const TileRecord& tile, std::optional<TileResource> resource);
TileRecord with_rivers(const TileRecord& tile, RiverEdges rivers);

// Terrain cost plus the feature's addend; impassable terrain stays at kImpassableCost.
int movement_cost(const TileRecord& tile) noexcept;

} // namespace hexmap::tile
