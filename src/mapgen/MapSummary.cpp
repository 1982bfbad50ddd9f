#include "hexmap/mapgen/MapSummary.hpp"

#include <fmt/format.h>

namespace hexmap::mapgen {

MapSummary summarize(const std::vector<tile::TileRecord>& tiles) {
    MapSummary s;
    s.tiles = tiles.size();
    for (const auto& t : tiles) {
        ++s.terrain[static_cast<std::size_t>(t.terrain)];
        if (tile::is_water(t.terrain))
            ++s.water;
        else if (t.terrain == tile::Terrain::Mountain)
            ++s.mountains;
        else
            ++s.land;

        if (t.feature) {
            ++s.features[static_cast<std::size_t>(*t.feature)];
            ++s.featured;
        }
    }
    return s;
}

std::string describe(const MapSummary& s) {
    const double n = s.tiles ? static_cast<double>(s.tiles) : 1.0;
    return fmt::format("{} tiles: {:.1f}% water, {:.1f}% mountain, {:.1f}% land, {} features",
                       s.tiles,
                       100.0 * static_cast<double>(s.water) / n,
                       100.0 * static_cast<double>(s.mountains) / n,
                       100.0 * static_cast<double>(s.land) / n,
                       s.featured);
}

} // namespace hexmap::mapgen
