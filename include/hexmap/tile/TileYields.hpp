#pragma once
#include <cstdint>
#include <optional>

#include "hexmap/tile/Terrain.hpp"
#include "hexmap/tile/TileFeature.hpp"
#include "hexmap/tile/TileResource.hpp"

namespace hexmap::tile {

// Output of a tile. Science/culture/faith never come from terrain; they are carried
// so that bonuses from buildings and specialists can be summed into the same value.
struct TileYields {
    int32_t food = 0;
    int32_t production = 0;
    int32_t gold = 0;
    int32_t science = 0;
    int32_t culture = 0;
    int32_t faith = 0;

    static constexpr TileYields make(int32_t food, int32_t production, int32_t gold) noexcept {
        return TileYields{food, production, gold, 0, 0, 0};
    }

    // Terrain base + feature modifiers + unimproved resource bonus, with food, production
    // and gold clamped at zero. has_river is reserved and currently has no effect.
    static TileYields calculate(Terrain terrain,
                                std::optional<TileFeature> feature,
                                std::optional<TileResource> resource,
                                bool has_river) noexcept;

    // Same as calculate(), using the resource's improved bonus.
    static TileYields calculate_improved(Terrain terrain,
                                         std::optional<TileFeature> feature,
                                         std::optional<TileResource> resource,
                                         bool has_river) noexcept;

    [[nodiscard]] constexpr int32_t total() const noexcept {
        return food + production + gold + science + culture + faith;
    }
    [[nodiscard]] constexpr bool is_empty() const noexcept { return total() == 0; }

    constexpr TileYields& operator+=(const TileYields& o) noexcept {
        food += o.food; production += o.production; gold += o.gold;
        science += o.science; culture += o.culture; faith += o.faith;
        return *this;
    }

    friend constexpr TileYields operator+(TileYields a, const TileYields& b) noexcept { return a += b; }
    friend constexpr bool operator==(const TileYields&, const TileYields&) = default;
};

inline constexpr TileYields kZeroYields{};

} // namespace hexmap::tile
