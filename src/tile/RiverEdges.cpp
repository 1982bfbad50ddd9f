#include "hexmap/tile/RiverEdges.hpp"

namespace hexmap::tile {

static constexpr std::array<std::string_view, 6> kEdgeNames = { "E", "NE", "NW", "W", "SW", "SE" };

std::string_view to_string(HexEdge e) noexcept { return kEdgeNames[edge_index(e)]; }

std::optional<HexEdge> parse_edge(std::string_view name) noexcept {
    for (std::size_t i = 0; i < kEdgeNames.size(); ++i) {
        if (kEdgeNames[i] == name)
            return edge_from_index(i);
    }
    return std::nullopt;
}

} // namespace hexmap::tile
