// src/mapgen/MapGenerator.cpp
#include "hexmap/mapgen/MapGenerator.hpp"
#include "hexmap/mapgen/Classifier.hpp"
#include "hexmap/mapgen/MapSummary.hpp"
#include "hexmap/pcg/SeededRng.hpp"

#include <utility>

#include <spdlog/spdlog.h>

namespace hexmap::mapgen {

MapGenerator::MapGenerator(MapConfig cfg) : cfg_(std::move(cfg)) {}

ScalarField MapGenerator::generate_height_map() const      { return generate_height_field(cfg_); }
ScalarField MapGenerator::generate_temperature_map() const { return generate_temperature_field(cfg_); }
ScalarField MapGenerator::generate_moisture_map() const    { return generate_moisture_field(cfg_); }

NoiseFields MapGenerator::generate_fields() const {
    if (executor_)
        return generate_noise_fields(cfg_, *executor_);
    return generate_noise_fields(cfg_);
}

std::vector<tile::TileRecord> MapGenerator::generate_records() const {
    return generate_records(generate_fields());
}

std::vector<tile::TileRecord> MapGenerator::generate_records(const NoiseFields& fields) const {
    const auto [W, H] = cfg_.dims();
    if (fields.height.width() != W || fields.height.height() != H) {
        spdlog::error("map generator: fields are {}x{}, config wants {}x{}",
                      fields.height.width(), fields.height.height(), W, H);
        return {};
    }

    pcg::Rng rng = pcg::Rng::from_seed(cfg_.seed);

    std::vector<tile::TileRecord> out;
    out.reserve(static_cast<std::size_t>(W) * static_cast<std::size_t>(H));

    for (int q = 0; q < W; ++q) {
        for (int r = 0; r < H; ++r) {
            const double h = fields.height.at(q, r);
            const double t = fields.temperature.at(q, r);
            const double m = fields.moisture.at(q, r);

            const tile::Terrain terrain = determine_terrain(h, t, m, cfg_);
            const auto feature = determine_feature(terrain, t, m, rng);

            out.push_back(tile::make_tile_record(tile::TilePosition{q, r}, terrain, feature));
        }
    }

    spdlog::info("map generator: {} {} seed={}: {}",
                 to_string(cfg_.size), W * H, cfg_.seed, describe(summarize(out)));
    return out;
}

std::vector<entt::entity> MapGenerator::generate(entt::registry& registry) const {
    return spawn_tiles(registry, generate_records());
}

std::vector<entt::entity> spawn_tiles(entt::registry& registry,
                                      const std::vector<tile::TileRecord>& records) {
    std::vector<entt::entity> entities;
    entities.reserve(records.size());
    for (const auto& rec : records) {
        const auto e = registry.create();
        registry.emplace<tile::TileRecord>(e, rec);
        entities.push_back(e);
    }
    return entities;
}

TileIndex build_tile_index(const entt::registry& registry) {
    TileIndex index;
    auto view = registry.view<const tile::TileRecord>();
    for (auto e : view)
        index.emplace(view.get<const tile::TileRecord>(e).position, e);
    return index;
}

} // namespace hexmap::mapgen
