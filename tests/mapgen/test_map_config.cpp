// tests/mapgen/test_map_config.cpp
//
// MapConfig presets/builders plus load_map_config / save_map_config.
//
// Goals:
//   - Saving creates the directory and writes JSON
//   - Loading round-trips values
//   - Missing files, corrupt JSON and mistyped keys fall back to defaults (no throw)

#include <doctest/doctest.h>

#include <chrono>
#include <filesystem>
#include <cmath>
#include <fstream>
#include <limits>
#include <string>
#include <system_error>

#include "hexmap/mapgen/MapConfig.hpp"

namespace fs = std::filesystem;
using namespace hexmap::mapgen;

namespace {

fs::path make_unique_temp_dir()
{
    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec || base.empty())
        base = fs::path(".");

    const auto stamp = static_cast<long long>(
        std::chrono::high_resolution_clock::now().time_since_epoch().count());

    fs::path dir = base / ("hexmap_map_config_tests_" + std::to_string(stamp));
    fs::create_directories(dir, ec);
    if (ec)
        return base;

    return dir;
}

void write_file(const fs::path& p, const std::string& text)
{
    std::ofstream os(p, std::ios::binary | std::ios::trunc);
    os << text;
}

} // namespace

TEST_CASE("MapSize: dimensions and tile counts")
{
    CHECK(dimensions(MapSize::Duel) == MapDimensions{48, 32});
    CHECK(dimensions(MapSize::Tiny) == MapDimensions{56, 36});
    CHECK(dimensions(MapSize::Small) == MapDimensions{68, 44});
    CHECK(dimensions(MapSize::Standard) == MapDimensions{80, 52});
    CHECK(dimensions(MapSize::Large) == MapDimensions{104, 64});
    CHECK(dimensions(MapSize::Huge) == MapDimensions{128, 80});

    CHECK(total_tiles(MapSize::Duel) == 1536);
    CHECK(total_tiles(MapSize::Huge) == 10240);

    // Strictly growing.
    for (std::size_t i = 1; i < kAllMapSizes.size(); ++i)
        CHECK(total_tiles(kAllMapSizes[i - 1]) < total_tiles(kAllMapSizes[i]));
}

TEST_CASE("MapSize: names parse case-insensitively")
{
    CHECK(parse_map_size("duel") == MapSize::Duel);
    CHECK(parse_map_size("HUGE") == MapSize::Huge);
    CHECK(parse_map_size("Standard") == MapSize::Standard);
    CHECK_FALSE(parse_map_size("gigantic").has_value());
    CHECK_FALSE(parse_map_size("").has_value());

    for (MapSize s : kAllMapSizes)
        CHECK(parse_map_size(to_string(s)) == s);
}

TEST_CASE("MapConfig: defaults, presets and builders")
{
    const MapConfig def;
    CHECK(def.size == MapSize::Standard);
    CHECK(def.seed == 42u);
    CHECK(def.land_coverage == doctest::Approx(0.4));
    CHECK(def.ocean_threshold == doctest::Approx(0.35));
    CHECK(def.hill_threshold == doctest::Approx(0.55));
    CHECK(def.mountain_threshold == doctest::Approx(0.75));
    CHECK(def == MapConfig::standard());

    CHECK(MapConfig::duel().dims() == MapDimensions{48, 32});
    CHECK(MapConfig::huge().size == MapSize::Huge);
    CHECK(MapConfig::tiny().seed == def.seed);

    const MapConfig custom = MapConfig::small().with_seed(7).with_ocean_threshold(0.5)
                                 .with_hill_threshold(0.6).with_mountain_threshold(0.9);
    CHECK(custom.size == MapSize::Small);
    CHECK(custom.seed == 7u);
    CHECK(custom.ocean_threshold == doctest::Approx(0.5));
    CHECK(custom.hill_threshold == doctest::Approx(0.6));
    CHECK(custom.mountain_threshold == doctest::Approx(0.9));

    // Builders copy; the source is unchanged.
    const MapConfig src;
    const MapConfig other = src.with_size(MapSize::Large);
    CHECK(src.size == MapSize::Standard);
    CHECK(other.size == MapSize::Large);
}

TEST_CASE("save_map_config creates the directory and load_map_config round-trips values")
{
    const fs::path path = make_unique_temp_dir() / "roundtrip" / "map.json";

    const MapConfig cfg = MapConfig::tiny().with_seed(987654321012345ULL).with_hill_threshold(0.61);
    CHECK(save_map_config(cfg, path));
    CHECK(fs::exists(path));

    const MapConfig loaded = load_map_config(path);
    CHECK(loaded == cfg);
}

TEST_CASE("load_map_config: missing file yields defaults")
{
    const fs::path path = make_unique_temp_dir() / "does_not_exist.json";
    CHECK(load_map_config(path) == MapConfig{});
}

TEST_CASE("load_map_config: corrupt JSON yields defaults")
{
    const fs::path path = make_unique_temp_dir() / "corrupt.json";
    write_file(path, "{ \"size\": \"Duel\", \"seed\": ");
    CHECK(load_map_config(path) == MapConfig{});
}

TEST_CASE("load_map_config: missing and mistyped keys keep their defaults")
{
    const fs::path path = make_unique_temp_dir() / "partial.json";
    write_file(path, R"({ "size": "small", "seed": "not-a-number", "mountain_threshold": 0.8 })");

    const MapConfig cfg = load_map_config(path);
    CHECK(cfg.size == MapSize::Small);
    CHECK(cfg.seed == 42u);
    CHECK(cfg.ocean_threshold == doctest::Approx(0.35));
    CHECK(cfg.mountain_threshold == doctest::Approx(0.8));
}

TEST_CASE("load_map_config: unknown size name keeps the default size")
{
    const fs::path path = make_unique_temp_dir() / "badsize.json";
    write_file(path, R"({ "size": "Colossal", "seed": 5 })");

    const MapConfig cfg = load_map_config(path);
    CHECK(cfg.size == MapSize::Standard);
    CHECK(cfg.seed == 5u);
}

TEST_CASE("save_map_config / load_map_config keep infinite and NaN thresholds")
{
    const fs::path path = make_unique_temp_dir() / "nonfinite.json";

    const MapConfig cfg = MapConfig::duel()
        .with_hill_threshold(std::numeric_limits<double>::infinity())
        .with_mountain_threshold(-std::numeric_limits<double>::infinity());
    REQUIRE(save_map_config(cfg, path));
    CHECK(load_map_config(path) == cfg);

    const MapConfig nanCfg = MapConfig{}.with_ocean_threshold(std::numeric_limits<double>::quiet_NaN());
    REQUIRE(save_map_config(nanCfg, path));
    CHECK(std::isnan(load_map_config(path).ocean_threshold));
}

TEST_CASE("load_map_config: unrecognised threshold strings keep their defaults")
{
    const fs::path path = make_unique_temp_dir() / "badreal.json";
    write_file(path, R"({ "hill_threshold": "steep", "ocean_threshold": "inf" })");

    const MapConfig cfg = load_map_config(path);
    CHECK(cfg.hill_threshold == doctest::Approx(0.55));
    CHECK(std::isinf(cfg.ocean_threshold));
}
