#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace hexmap::tile {

enum class ResourceCategory : uint8_t {
    Bonus,      // common, boosts tile yields
    Strategic,  // needed for advanced units and buildings
    Luxury      // rare, happiness and trade value
};

enum class TileResource : uint8_t {
    // bonus
    Cattle, Sheep, Fish, Stone, Wheat, Bananas, Deer,
    // strategic
    Horses, Iron, Coal, Oil, Aluminum, Uranium,
    // luxury
    Citrus, Cotton, Copper, Gold, Crab, Whales, Turtles,
    Olives, Wine, Silk, Spices, Gems, Marble, Ivory
};

inline constexpr std::size_t kResourceCount = 27;

inline constexpr std::array<TileResource, kResourceCount> kAllResources = {
    TileResource::Cattle, TileResource::Sheep, TileResource::Fish, TileResource::Stone,
    TileResource::Wheat, TileResource::Bananas, TileResource::Deer,
    TileResource::Horses, TileResource::Iron, TileResource::Coal, TileResource::Oil,
    TileResource::Aluminum, TileResource::Uranium,
    TileResource::Citrus, TileResource::Cotton, TileResource::Copper, TileResource::Gold,
    TileResource::Crab, TileResource::Whales, TileResource::Turtles, TileResource::Olives,
    TileResource::Wine, TileResource::Silk, TileResource::Spices, TileResource::Gems,
    TileResource::Marble, TileResource::Ivory
};

// Food/production/gold triple granted by a resource.
struct YieldBonus {
    int food = 0;
    int production = 0;
    int gold = 0;

    friend constexpr bool operator==(const YieldBonus&, const YieldBonus&) = default;
};

ResourceCategory category(TileResource r) noexcept;

// Bonus before any improvement is built on the tile.
YieldBonus base_bonus(TileResource r) noexcept;
// Bonus once the matching improvement exists.
YieldBonus improved_bonus(TileResource r) noexcept;

inline bool is_bonus(TileResource r) noexcept     { return category(r) == ResourceCategory::Bonus; }
inline bool is_strategic(TileResource r) noexcept { return category(r) == ResourceCategory::Strategic; }
inline bool is_luxury(TileResource r) noexcept    { return category(r) == ResourceCategory::Luxury; }

std::string_view to_string(TileResource r) noexcept;
std::string_view to_string(ResourceCategory c) noexcept;
std::optional<TileResource> parse_resource(std::string_view name) noexcept;
std::optional<ResourceCategory> parse_resource_category(std::string_view name) noexcept;

} // namespace hexmap::tile
