#include "hexmap/tile/TileYields.hpp"

#include <algorithm>

namespace hexmap::tile {
namespace {

TileYields combine(Terrain terrain, std::optional<TileFeature> feature,
                   const YieldBonus& resource) noexcept {
    TileYields y = TileYields::make(base_food(terrain), base_production(terrain), base_gold(terrain));

    if (feature) {
        y.food       += food_modifier(*feature);
        y.production += production_modifier(*feature);
        y.gold       += gold_modifier(*feature);
    }

    y.food       += resource.food;
    y.production += resource.production;
    y.gold       += resource.gold;

    // A negative modifier can cancel a channel but never drive it below zero.
    y.food       = std::max(0, y.food);
    y.production = std::max(0, y.production);
    y.gold       = std::max(0, y.gold);
    return y;
}

} // namespace

TileYields TileYields::calculate(Terrain terrain,
                                 std::optional<TileFeature> feature,
                                 std::optional<TileResource> resource,
                                 bool /*has_river*/) noexcept {
    return combine(terrain, feature, resource ? base_bonus(*resource) : YieldBonus{});
}

TileYields TileYields::calculate_improved(Terrain terrain,
                                          std::optional<TileFeature> feature,
                                          std::optional<TileResource> resource,
                                          bool /*has_river*/) noexcept {
    return combine(terrain, feature, resource ? improved_bonus(*resource) : YieldBonus{});
}

} // namespace hexmap::tile
