#include <algorithm>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <entt/entt.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <taskflow/taskflow.hpp>

#include "hexmap/app/CommandLineArgs.hpp"
#include "hexmap/core/Log.hpp"
#include "hexmap/io/Json.hpp"
#include "hexmap/mapgen/MapConfig.hpp"
#include "hexmap/mapgen/MapGenerator.hpp"
#include "hexmap/mapgen/MapSummary.hpp"

using std::string;
using nlohmann::json;
namespace fs = std::filesystem;
namespace mg = hexmap::mapgen;
using Args = hexmap::app::CommandLineArgs;

// Options that never take a value.
static const std::set<std::string_view> kSwitches = { "--parallel" };

// --- utilities ---------------------------------------------------------------

static bool ensure_dir(const fs::path& p) {
    if (p.empty()) return true;
    std::error_code ec;
    if (fs::exists(p, ec)) return true;
    return fs::create_directories(p, ec);
}

static bool write_text(const fs::path& p, const std::string& s) {
    if (!ensure_dir(p.parent_path())) return false;
    std::ofstream os(p, std::ios::binary);
    if (!os) return false;
    os << s;
    return os.good();
}

// Grayscale PPM quicklook of a [0,1] field.
static bool write_ppm(const fs::path& path, const mg::ScalarField& f) {
    if (!ensure_dir(path.parent_path())) return false;
    std::ofstream o(path, std::ios::binary);
    if (!o) return false;
    o << "P6\n" << f.width() << " " << f.height() << "\n255\n";
    for (double v : f) {
        const auto c = static_cast<unsigned char>(std::clamp(v, 0.0, 1.0) * 255.0);
        o.put(static_cast<char>(c)).put(static_cast<char>(c)).put(static_cast<char>(c));
    }
    return o.good();
}

// defaults -> --config file -> individual flags
static mg::MapConfig resolve_config(const Args& kv) {
    mg::MapConfig cfg = kv.has("--config") ? mg::load_map_config(kv.get("--config")) : mg::MapConfig{};

    if (kv.has("--size")) {
        const auto size = mg::parse_map_size(kv.get("--size"));
        if (!size) throw std::invalid_argument("unknown map size '" + kv.get("--size") + "'");
        cfg.size = *size;
    }
    if (kv.has("--seed"))     cfg.seed = std::stoull(kv.get("--seed"));
    if (kv.has("--ocean"))    cfg.ocean_threshold = std::stod(kv.get("--ocean"));
    if (kv.has("--hill"))     cfg.hill_threshold = std::stod(kv.get("--hill"));
    if (kv.has("--mountain")) cfg.mountain_threshold = std::stod(kv.get("--mountain"));
    return cfg;
}

static bool emit(const Args& kv, const json& j) {
    if (kv.has("--out")) return write_text(kv.get("--out"), j.dump(2) + "\n");
    std::cout << j.dump(2) << "\n";
    return true;
}

// --- commands ----------------------------------------------------------------

static bool cmd_generate(const Args& kv, tf::Executor* exec) {
    mg::MapGenerator gen(resolve_config(kv));
    gen.set_executor(exec);

    const auto tiles = gen.generate_records();
    json j = {
        {"config", gen.config()},
        {"width", gen.config().dims().width},
        {"height", gen.config().dims().height},
        {"tiles", tiles},
    };
    return emit(kv, j);
}

static bool cmd_info(const Args& kv, tf::Executor* exec) {
    mg::MapGenerator gen(resolve_config(kv));
    gen.set_executor(exec);

    entt::registry registry;
    const auto entities = gen.generate(registry);

    std::vector<hexmap::tile::TileRecord> tiles;
    tiles.reserve(entities.size());
    for (auto e : entities) tiles.push_back(registry.get<hexmap::tile::TileRecord>(e));
    const auto summary = mg::summarize(tiles);

    json terrain = json::object();
    for (auto t : hexmap::tile::kAllTerrains)
        terrain[string(to_string(t))] = summary.count(t);
    json features = json::object();
    for (auto f : hexmap::tile::kAllFeatures)
        features[string(to_string(f))] = summary.count(f);

    const auto dims = gen.config().dims();
    json j = {
        {"width", dims.width},
        {"height", dims.height},
        {"seed", gen.config().seed},
        {"tileCount", entities.size()},
        {"terrain", terrain},
        {"features", features},
    };
    spdlog::info("{}", mg::describe(summary));
    return emit(kv, j);
}

static bool cmd_tile(const Args& kv, tf::Executor* exec) {
    if (!kv.positional) {
        spdlog::error("tile: expected coordinates as q,r");
        return false;
    }
    const string& coords = *kv.positional;
    const auto comma = coords.find(',');
    if (comma == string::npos) {
        spdlog::error("tile: bad coordinates '{}', expected q,r", coords);
        return false;
    }
    const hexmap::tile::TilePosition pos{std::stoi(coords.substr(0, comma)), std::stoi(coords.substr(comma + 1))};

    mg::MapGenerator gen(resolve_config(kv));
    gen.set_executor(exec);

    entt::registry registry;
    (void)gen.generate(registry);
    const auto index = mg::build_tile_index(registry);

    const auto it = index.find(pos);
    if (it == index.end()) {
        spdlog::error("tile: ({}, {}) is outside the {}x{} map", pos.q, pos.r,
                      gen.config().dims().width, gen.config().dims().height);
        return false;
    }
    return emit(kv, json(registry.get<hexmap::tile::TileRecord>(it->second)));
}

static bool cmd_fields(const Args& kv, tf::Executor* exec) {
    if (!kv.has("--out")) {
        spdlog::error("fields: --out <dir> is required");
        return false;
    }
    mg::MapGenerator gen(resolve_config(kv));
    gen.set_executor(exec);
    const auto fields = gen.generate_fields();

    const fs::path dir = kv.get("--out");
    const bool ok = write_ppm(dir / "height.ppm", fields.height)
                 && write_ppm(dir / "temperature.ppm", fields.temperature)
                 && write_ppm(dir / "moisture.ppm", fields.moisture);
    if (ok) spdlog::info("fields: wrote height/temperature/moisture.ppm to {}", dir.string());
    return ok;
}

static bool cmd_config(const Args& kv) {
    const auto cfg = resolve_config(kv);
    if (kv.has("--out")) return mg::save_map_config(cfg, kv.get("--out"));
    std::cout << json(cfg).dump(2) << "\n";
    return true;
}

// --- entry -------------------------------------------------------------------

static void usage() {
    std::cerr <<
      "Usage:\n"
      "  hexmapgen generate [options] [--out <tiles.json>]\n"
      "  hexmapgen info     [options] [--out <info.json>]\n"
      "  hexmapgen tile <q,r> [options]\n"
      "  hexmapgen fields   [options] --out <dir>\n"
      "  hexmapgen config   [options] [--out <config.json>]\n"
      "\n"
      "Options:\n"
      "  --config <file>   JSON map config (defaults for anything missing)\n"
      "  --size <name>     duel | tiny | small | standard | large | huge\n"
      "  --seed <n>        map seed\n"
      "  --ocean <t> --hill <t> --mountain <t>   height thresholds\n"
      "  --parallel        build noise fields on a worker pool\n"
      "  --log-level <l>   trace | debug | info | warn | error\n"
      "  --log-file <f>    also log to a file\n";
}

int main(int argc, char** argv) {
    if (argc < 2) { usage(); return 1; }

    const string cmd = argv[1];
    const std::vector<std::string_view> rest(argv + 2, argv + argc);
    const auto kv = hexmap::app::ParseCommandLineArgs(rest, kSwitches);

    hexmap::logsys::LogOptions logOpts;
    if (kv.has("--log-level")) logOpts.level = hexmap::logsys::parse_level(kv.get("--log-level"));
    if (kv.has("--log-file"))  logOpts.file = kv.get("--log-file");
    hexmap::logsys::init(logOpts);

    std::optional<tf::Executor> executor;
    if (kv.has("--parallel")) executor.emplace();
    tf::Executor* exec = executor ? &*executor : nullptr;

    bool ok = false;
    try {
        if      (cmd == "generate") ok = cmd_generate(kv, exec);
        else if (cmd == "info")     ok = cmd_info(kv, exec);
        else if (cmd == "tile")     ok = cmd_tile(kv, exec);
        else if (cmd == "fields")   ok = cmd_fields(kv, exec);
        else if (cmd == "config")   ok = cmd_config(kv);
        else { usage(); return 1; }
    } catch (const std::exception& e) {
        spdlog::error("{}: {}", cmd, e.what());
        return 2;
    }

    if (!ok) { spdlog::error("{} failed", cmd); return 2; }
    return 0;
}
