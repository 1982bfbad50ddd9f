#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>

namespace hexmap::mapgen {

enum class MapSize : uint8_t { Duel, Tiny, Small, Standard, Large, Huge };

inline constexpr std::array<MapSize, 6> kAllMapSizes = {
    MapSize::Duel, MapSize::Tiny, MapSize::Small, MapSize::Standard, MapSize::Large, MapSize::Huge
};

struct MapDimensions {
    int width = 0;
    int height = 0;

    friend constexpr bool operator==(const MapDimensions&, const MapDimensions&) = default;
};

constexpr MapDimensions dimensions(MapSize size) noexcept {
    switch (size) {
    case MapSize::Duel:     return {48, 32};
    case MapSize::Tiny:     return {56, 36};
    case MapSize::Small:    return {68, 44};
    case MapSize::Standard: return {80, 52};
    case MapSize::Large:    return {104, 64};
    case MapSize::Huge:     return {128, 80};
    }
    return {80, 52};
}

constexpr int total_tiles(MapSize size) noexcept {
    const auto d = dimensions(size);
    return d.width * d.height;
}

std::string_view to_string(MapSize size) noexcept;
// Case-insensitive ("duel", "Duel", "DUEL").
std::optional<MapSize> parse_map_size(std::string_view name) noexcept;

// Generation parameters. Thresholds are compared against the normalized height field and
// are deliberately not range-checked: inverted or out-of-range values skew the terrain mix.
struct MapConfig {
    MapSize  size               = MapSize::Standard;
    uint64_t seed               = 42;
    double   land_coverage      = 0.4;   // reserved, not read by the generator
    double   ocean_threshold    = 0.35;
    double   hill_threshold     = 0.55;
    double   mountain_threshold = 0.75;

    static MapConfig duel()     { return MapConfig{}.with_size(MapSize::Duel); }
    static MapConfig tiny()     { return MapConfig{}.with_size(MapSize::Tiny); }
    static MapConfig small()    { return MapConfig{}.with_size(MapSize::Small); }
    static MapConfig standard() { return MapConfig{}; }
    static MapConfig large()    { return MapConfig{}.with_size(MapSize::Large); }
    static MapConfig huge()     { return MapConfig{}.with_size(MapSize::Huge); }

    [[nodiscard]] MapConfig with_size(MapSize s) const               { MapConfig c = *this; c.size = s; return c; }
    [[nodiscard]] MapConfig with_seed(uint64_t s) const              { MapConfig c = *this; c.seed = s; return c; }
    [[nodiscard]] MapConfig with_ocean_threshold(double t) const     { MapConfig c = *this; c.ocean_threshold = t; return c; }
    [[nodiscard]] MapConfig with_hill_threshold(double t) const      { MapConfig c = *this; c.hill_threshold = t; return c; }
    [[nodiscard]] MapConfig with_mountain_threshold(double t) const  { MapConfig c = *this; c.mountain_threshold = t; return c; }

    [[nodiscard]] MapDimensions dims() const noexcept { return dimensions(size); }

    friend bool operator==(const MapConfig&, const MapConfig&) = default;
};

// Reads a JSON config file. A missing or unparsable file yields defaults; missing or
// mistyped keys keep their default value. Problems are logged as warnings.
MapConfig load_map_config(const std::filesystem::path& path);

bool save_map_config(const MapConfig& cfg, const std::filesystem::path& path);

} // namespace hexmap::mapgen
