#include "hexmap/mapgen/MapConfig.hpp"
#include "hexmap/io/Json.hpp"

#include <cctype>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace hexmap::mapgen {
namespace {

constexpr std::array<std::string_view, 6> kSizeNames = {
    "Duel", "Tiny", "Small", "Standard", "Large", "Huge"
};

bool EqualsI(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size())
        return false;

    for (std::size_t i = 0; i < a.size(); ++i)
    {
        const unsigned char ca = static_cast<unsigned char>(a[i]);
        const unsigned char cb = static_cast<unsigned char>(b[i]);
        if (std::tolower(ca) != std::tolower(cb))
            return false;
    }

    return true;
}

template <typename T>
T GetOr(const json& j, const char* key, const T& fallback)
{
    if (!j.is_object())
        return fallback;
    auto it = j.find(key);
    if (it == j.end())
        return fallback;
    try
    {
        return it->get<T>();
    }
    catch (const json::exception& e)
    {
        spdlog::warn("map config: key '{}' ignored ({})", key, e.what());
        return fallback;
    }
}

double GetRealOr(const json& j, const char* key, double fallback)
{
    if (!j.is_object())
        return fallback;
    auto it = j.find(key);
    if (it == j.end())
        return fallback;
    try
    {
        return io::real_from_json(*it);
    }
    catch (const json::exception& e)
    {
        spdlog::warn("map config: key '{}' ignored ({})", key, e.what());
    }
    catch (const std::invalid_argument& e)
    {
        spdlog::warn("map config: key '{}' ignored ({})", key, e.what());
    }
    return fallback;
}

} // namespace

std::string_view to_string(MapSize size) noexcept
{
    return kSizeNames[static_cast<std::size_t>(size)];
}

std::optional<MapSize> parse_map_size(std::string_view name) noexcept
{
    for (MapSize s : kAllMapSizes)
    {
        if (EqualsI(kSizeNames[static_cast<std::size_t>(s)], name))
            return s;
    }
    return std::nullopt;
}

MapConfig load_map_config(const fs::path& path)
{
    MapConfig cfg;

    std::ifstream f(path, std::ios::in | std::ios::binary);
    if (!f)
    {
        spdlog::warn("map config: could not open '{}', using defaults", path.string());
        return cfg;
    }

    json root;
    try
    {
        f >> root;
    }
    catch (const json::exception& e)
    {
        spdlog::warn("map config: parse error in '{}' ({}), using defaults", path.string(), e.what());
        return cfg;
    }

    const std::string sizeName = GetOr<std::string>(root, "size", std::string(to_string(cfg.size)));
    if (auto s = parse_map_size(sizeName))
        cfg.size = *s;
    else
        spdlog::warn("map config: unknown size '{}', keeping {}", sizeName, to_string(cfg.size));

    cfg.seed               = GetOr<std::uint64_t>(root, "seed",               cfg.seed);
    cfg.land_coverage      = GetRealOr(root, "land_coverage",      cfg.land_coverage);
    cfg.ocean_threshold    = GetRealOr(root, "ocean_threshold",    cfg.ocean_threshold);
    cfg.hill_threshold     = GetRealOr(root, "hill_threshold",     cfg.hill_threshold);
    cfg.mountain_threshold = GetRealOr(root, "mountain_threshold", cfg.mountain_threshold);

    spdlog::debug("map config: loaded '{}' (size={}, seed={})", path.string(), to_string(cfg.size), cfg.seed);
    return cfg;
}

bool save_map_config(const MapConfig& cfg, const fs::path& path)
{
    std::error_code ec;
    if (path.has_parent_path())
        fs::create_directories(path.parent_path(), ec);

    std::ofstream os(path, std::ios::binary | std::ios::trunc);
    if (!os)
    {
        spdlog::error("map config: cannot write '{}'", path.string());
        return false;
    }

    os << json(cfg).dump(2) << '\n';
    return os.good();
}

} // namespace hexmap::mapgen
