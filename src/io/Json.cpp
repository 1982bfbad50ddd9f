#include "hexmap/io/Json.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

using nlohmann::json;

namespace hexmap::io {
namespace {

template <class Enum, class Parser>
Enum decode_name(const json& j, Parser parse, const char* what) {
    const auto name = j.get<std::string>();
    if (auto v = parse(name))
        return *v;
    throw std::invalid_argument(std::string("unknown ") + what + " '" + name + "'");
}

} // namespace

json real_to_json(double v) {
    if (std::isnan(v)) return "nan";
    if (std::isinf(v)) return v > 0 ? "inf" : "-inf";
    return v;
}

double real_from_json(const json& j) {
    if (!j.is_string())
        return j.get<double>();

    const auto s = j.get<std::string>();
    if (s == "nan")  return std::numeric_limits<double>::quiet_NaN();
    if (s == "inf")  return std::numeric_limits<double>::infinity();
    if (s == "-inf") return -std::numeric_limits<double>::infinity();
    throw std::invalid_argument("not a number: '" + s + "'");
}

} // namespace hexmap::io

namespace hexmap::tile {

void to_json(json& j, Terrain t)       { j = std::string(to_string(t)); }
void from_json(const json& j, Terrain& t) { t = io::decode_name<Terrain>(j, parse_terrain, "terrain"); }

void to_json(json& j, TileFeature f)   { j = std::string(to_string(f)); }
void from_json(const json& j, TileFeature& f) { f = io::decode_name<TileFeature>(j, parse_feature, "feature"); }

void to_json(json& j, TileResource r)  { j = std::string(to_string(r)); }
void from_json(const json& j, TileResource& r) { r = io::decode_name<TileResource>(j, parse_resource, "resource"); }

void to_json(json& j, ResourceCategory c) { j = std::string(to_string(c)); }
void from_json(const json& j, ResourceCategory& c) {
    c = io::decode_name<ResourceCategory>(j, parse_resource_category, "resource category");
}

void to_json(json& j, HexEdge e)       { j = std::string(to_string(e)); }
void from_json(const json& j, HexEdge& e) { e = io::decode_name<HexEdge>(j, parse_edge, "hex edge"); }

void to_json(json& j, const RiverEdges& r) {
    j = json::array();
    for (HexEdge e : r.edges())
        j.push_back(e);
}

void from_json(const json& j, RiverEdges& r) {
    RiverEdges out;
    for (const auto& item : j.get_ref<const json::array_t&>())
        out.set_edge(item.get<HexEdge>());
    r = out;
}

void to_json(json& j, const TileYields& y) {
    j = json{
        {"food", y.food},
        {"production", y.production},
        {"gold", y.gold},
        {"science", y.science},
        {"culture", y.culture},
        {"faith", y.faith},
    };
}

void from_json(const json& j, TileYields& y) {
    j.at("food").get_to(y.food);
    j.at("production").get_to(y.production);
    j.at("gold").get_to(y.gold);
    j.at("science").get_to(y.science);
    j.at("culture").get_to(y.culture);
    j.at("faith").get_to(y.faith);
}

void to_json(json& j, const TilePosition& p) { j = json{{"q", p.q}, {"r", p.r}}; }

void from_json(const json& j, TilePosition& p) {
    j.at("q").get_to(p.q);
    j.at("r").get_to(p.r);
}

void to_json(json& j, const TileRecord& t) {
    j = json{
        {"position", t.position},
        {"terrain", t.terrain},
        {"feature", t.feature ? json(*t.feature) : json(nullptr)},
        {"resource", t.resource ? json(*t.resource) : json(nullptr)},
        {"yields", t.yields},
        {"rivers", t.rivers},
    };
}

void from_json(const json& j, TileRecord& t) {
    std::optional<TileFeature> feature;
    std::optional<TileResource> resource;

    if (auto it = j.find("feature"); it != j.end() && !it->is_null())
        feature = it->get<TileFeature>();
    if (auto it = j.find("resource"); it != j.end() && !it->is_null())
        resource = it->get<TileResource>();

    t = make_tile_record(j.at("position").get<TilePosition>(),
                         j.at("terrain").get<Terrain>(),
                         feature,
                         resource,
                         j.value("rivers", json::array()).get<RiverEdges>());
}

} // namespace hexmap::tile

namespace hexmap::mapgen {

void to_json(json& j, MapSize s) { j = std::string(to_string(s)); }
void from_json(const json& j, MapSize& s) { s = io::decode_name<MapSize>(j, parse_map_size, "map size"); }

void to_json(json& j, const MapConfig& c) {
    j = json{
        {"size", c.size},
        {"seed", c.seed},
        {"land_coverage", io::real_to_json(c.land_coverage)},
        {"ocean_threshold", io::real_to_json(c.ocean_threshold)},
        {"hill_threshold", io::real_to_json(c.hill_threshold)},
        {"mountain_threshold", io::real_to_json(c.mountain_threshold)},
    };
}

void from_json(const json& j, MapConfig& c) {
    j.at("size").get_to(c.size);
    j.at("seed").get_to(c.seed);
    c.land_coverage      = io::real_from_json(j.at("land_coverage"));
    c.ocean_threshold    = io::real_from_json(j.at("ocean_threshold"));
    c.hill_threshold     = io::real_from_json(j.at("hill_threshold"));
    c.mountain_threshold = io::real_from_json(j.at("mountain_threshold"));
}

} // namespace hexmap::mapgen
