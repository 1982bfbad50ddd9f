// src/tile/TileResource.cpp
#include "hexmap/tile/TileResource.hpp"

namespace hexmap::tile {
namespace {

struct ResourceInfo {
    std::string_view name;
    ResourceCategory category;
    YieldBonus base;
    YieldBonus improved;
};

constexpr auto B = ResourceCategory::Bonus;
constexpr auto S = ResourceCategory::Strategic;
constexpr auto L = ResourceCategory::Luxury;

//                          name          cat   base F P G   improved F P G
constexpr std::array<ResourceInfo, kResourceCount> kResourceTable = {{
    {"Cattle",   B, {0, 1, 0}, {0, 2, 0}},
    {"Sheep",    B, {0, 1, 0}, {0, 2, 0}},
    {"Fish",     B, {1, 0, 0}, {2, 0, 0}},
    {"Stone",    B, {0, 1, 0}, {0, 2, 0}},
    {"Wheat",    B, {1, 0, 0}, {2, 0, 0}},
    {"Bananas",  B, {1, 0, 0}, {2, 0, 0}},
    {"Deer",     B, {1, 0, 0}, {2, 0, 0}},

    {"Horses",   S, {0, 1, 0}, {0, 2, 0}},
    {"Iron",     S, {0, 1, 0}, {0, 2, 0}},
    {"Coal",     S, {0, 1, 0}, {0, 2, 0}},
    {"Oil",      S, {0, 1, 0}, {0, 2, 0}},
    {"Aluminum", S, {0, 1, 0}, {0, 2, 0}},
    {"Uranium",  S, {0, 1, 0}, {0, 2, 0}},

    {"Citrus",   L, {1, 0, 1}, {1, 0, 2}},
    {"Cotton",   L, {0, 0, 2}, {0, 0, 3}},
    {"Copper",   L, {0, 0, 2}, {0, 1, 2}},
    {"Gold",     L, {0, 0, 2}, {0, 0, 2}},
    {"Crab",     L, {1, 0, 0}, {2, 0, 0}},
    {"Whales",   L, {1, 0, 1}, {2, 0, 1}},
    {"Turtles",  L, {1, 0, 1}, {2, 0, 1}},
    {"Olives",   L, {0, 1, 1}, {0, 1, 2}},
    {"Wine",     L, {0, 0, 2}, {0, 0, 3}},
    {"Silk",     L, {0, 0, 2}, {0, 0, 3}},
    {"Spices",   L, {0, 0, 2}, {0, 0, 3}},
    {"Gems",     L, {0, 0, 3}, {0, 0, 3}},
    {"Marble",   L, {0, 1, 1}, {0, 2, 1}},
    {"Ivory",    L, {0, 1, 1}, {0, 2, 1}},
}};

constexpr const ResourceInfo& info(TileResource r) noexcept {
    return kResourceTable[static_cast<std::size_t>(r)];
}

constexpr std::array<std::string_view, 3> kCategoryNames = { "Bonus", "Strategic", "Luxury" };

} // namespace

ResourceCategory category(TileResource r) noexcept { return info(r).category; }
YieldBonus base_bonus(TileResource r) noexcept     { return info(r).base; }
YieldBonus improved_bonus(TileResource r) noexcept { return info(r).improved; }

std::string_view to_string(TileResource r) noexcept { return info(r).name; }

std::string_view to_string(ResourceCategory c) noexcept {
    return kCategoryNames[static_cast<std::size_t>(c)];
}

std::optional<TileResource> parse_resource(std::string_view name) noexcept {
    for (TileResource r : kAllResources) {
        if (info(r).name == name)
            return r;
    }
    return std::nullopt;
}

std::optional<ResourceCategory> parse_resource_category(std::string_view name) noexcept {
    for (std::size_t i = 0; i < kCategoryNames.size(); ++i) {
        if (kCategoryNames[i] == name)
            return static_cast<ResourceCategory>(i);
    }
    return std::nullopt;
}

} // namespace hexmap::tile
