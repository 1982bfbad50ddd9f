#pragma once
#include <array>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string_view>
#include <vector>

namespace hexmap::tile {

// Hex edges in bit order (bit 0 = E ... bit 5 = SE).
enum class HexEdge : uint8_t { E, NE, NW, W, SW, SE };

inline constexpr std::array<HexEdge, 6> kAllEdges = {
    HexEdge::E, HexEdge::NE, HexEdge::NW, HexEdge::W, HexEdge::SW, HexEdge::SE
};

constexpr uint8_t edge_bit(HexEdge e) noexcept { return static_cast<uint8_t>(1u << static_cast<unsigned>(e)); }
constexpr std::size_t edge_index(HexEdge e) noexcept { return static_cast<std::size_t>(e); }

constexpr std::optional<HexEdge> edge_from_index(std::size_t i) noexcept {
    if (i >= kAllEdges.size()) return std::nullopt;
    return kAllEdges[i];
}

// Edge shared with the neighbour on the other side (E<->W, NE<->SW, NW<->SE).
constexpr HexEdge opposite(HexEdge e) noexcept {
    return static_cast<HexEdge>((static_cast<unsigned>(e) + 3u) % 6u);
}

std::string_view to_string(HexEdge e) noexcept;
std::optional<HexEdge> parse_edge(std::string_view name) noexcept;

// Which edges of a tile carry a river. Only the low six bits are ever set.
class RiverEdges {
public:
    static constexpr uint8_t kMask = 0b0011'1111;

    constexpr RiverEdges() noexcept = default;
    constexpr explicit RiverEdges(uint8_t bits) noexcept : bits_(bits & kMask) {}
    constexpr RiverEdges(std::initializer_list<HexEdge> edges) noexcept {
        for (HexEdge e : edges) bits_ |= edge_bit(e);
    }

    static constexpr RiverEdges none() noexcept { return RiverEdges{}; }
    static constexpr RiverEdges all() noexcept { return RiverEdges{kMask}; }

    [[nodiscard]] constexpr uint8_t bits() const noexcept { return bits_; }
    [[nodiscard]] constexpr bool has_river() const noexcept { return bits_ != 0; }
    [[nodiscard]] constexpr bool has_edge(HexEdge e) const noexcept { return (bits_ & edge_bit(e)) != 0; }
    [[nodiscard]] constexpr int edge_count() const noexcept { return std::popcount(bits_); }

    constexpr void set_edge(HexEdge e) noexcept    { bits_ |= edge_bit(e); }
    constexpr void clear_edge(HexEdge e) noexcept  { bits_ &= static_cast<uint8_t>(~edge_bit(e)); }
    constexpr void toggle_edge(HexEdge e) noexcept { bits_ ^= edge_bit(e); }

    // Set edges in E..SE order.
    [[nodiscard]] std::vector<HexEdge> edges() const {
        std::vector<HexEdge> out;
        out.reserve(static_cast<std::size_t>(edge_count()));
        for (HexEdge e : kAllEdges)
            if (has_edge(e)) out.push_back(e);
        return out;
    }

    friend constexpr bool operator==(RiverEdges, RiverEdges) = default;

private:
    uint8_t bits_ = 0;
};

} // namespace hexmap::tile
