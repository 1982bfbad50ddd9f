#include "hexmap/tile/TileRecord.hpp"

namespace hexmap::tile {

TileRecord make_tile_record(TilePosition position,
                            Terrain terrain,
                            std::optional<TileFeature> feature,
                            std::optional<TileResource> resource,
                            RiverEdges rivers) {
    TileRecord tile;
    tile.position = position;
    tile.terrain  = terrain;
    tile.feature  = feature;
    tile.resource = resource;
    tile.rivers   = rivers;
    tile.yields   = TileYields::calculate(terrain, feature, resource, rivers.has_river());
    return tile;
}

TileRecord with_feature(const TileRecord& tile, std::optional<TileFeature> feature) {
    return make_tile_record(tile.position, tile.terrain, feature, tile.resource, tile.rivers);
}

TileRecord with_resource(const TileRecord& tile, std::optional<TileResource> resource) {
    return make_tile_record(tile.position, tile.terrain, tile.feature, resource, tile.rivers);
}

TileRecord with_rivers(const TileRecord& tile, RiverEdges rivers) {
    return make_tile_record(tile.position, tile.terrain, tile.feature, tile.resource, rivers);
}

int movement_cost(const TileRecord& tile) noexcept {
    const int base = movement_cost(tile.terrain);
    if (base >= kImpassableCost || !tile.feature)
        return base;
    return base + movement_modifier(*tile.feature);
}

} // namespace hexmap::tile
