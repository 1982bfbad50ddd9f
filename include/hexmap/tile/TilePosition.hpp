#pragma once
#include <cstddef>
#include <functional>

#include "hexmap/pcg/Hash.hpp"

namespace hexmap::tile {

// Axial hex coordinate. Neighbour/ring/distance math lives with the host's hex layer.
struct TilePosition {
    int q = 0;
    int r = 0;

    friend constexpr bool operator==(const TilePosition&, const TilePosition&) = default;
};

} // namespace hexmap::tile

template <>
struct std::hash<hexmap::tile::TilePosition> {
    std::size_t operator()(const hexmap::tile::TilePosition& p) const noexcept {
        return static_cast<std::size_t>(hexmap::pcg::hash_pair(p.q, p.r));
    }
};
