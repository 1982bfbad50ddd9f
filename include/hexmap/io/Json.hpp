// include/hexmap/io/Json.hpp
//
// nlohmann::json conversions for the map value types. The functions live in the
// namespaces of the types they convert so that ADL picks them up:
//
//   nlohmann::json j = cfg;               // to_json
//   auto cfg = j.get<MapConfig>();        // from_json
//
// Enums are written as their variant names ("Grassland", "Forest", "Standard", ...).
// Decoding an unknown name throws std::invalid_argument; structural problems (missing
// keys, wrong types) surface as nlohmann::json::exception.
//
// JSON has no NaN or infinity. Doubles that may hold them (the MapConfig thresholds) are
// written with real_to_json(): finite values as numbers, the rest as "nan", "inf", "-inf".
#pragma once

#include <nlohmann/json_fwd.hpp>

#include "hexmap/mapgen/MapConfig.hpp"
#include "hexmap/tile/RiverEdges.hpp"
#include "hexmap/tile/Terrain.hpp"
#include "hexmap/tile/TileFeature.hpp"
#include "hexmap/tile/TilePosition.hpp"
#include "hexmap/tile/TileRecord.hpp"
#include "hexmap/tile/TileResource.hpp"
#include "hexmap/tile/TileYields.hpp"

namespace hexmap::io {

nlohmann::json real_to_json(double v);
// Accepts a number or one of "nan", "inf", "-inf"; other strings throw std::invalid_argument.
double real_from_json(const nlohmann::json& j);

} // namespace hexmap::io

namespace hexmap::tile {

void to_json(nlohmann::json& j, Terrain t);
void from_json(const nlohmann::json& j, Terrain& t);

void to_json(nlohmann::json& j, TileFeature f);
void from_json(const nlohmann::json& j, TileFeature& f);

void to_json(nlohmann::json& j, TileResource r);
void from_json(const nlohmann::json& j, TileResource& r);

void to_json(nlohmann::json& j, ResourceCategory c);
void from_json(const nlohmann::json& j, ResourceCategory& c);

void to_json(nlohmann::json& j, HexEdge e);
void from_json(const nlohmann::json& j, HexEdge& e);

// Array of edge names in E..SE order, e.g. ["E", "SW"].
void to_json(nlohmann::json& j, const RiverEdges& r);
void from_json(const nlohmann::json& j, RiverEdges& r);

void to_json(nlohmann::json& j, const TileYields& y);
void from_json(const nlohmann::json& j, TileYields& y);

void to_json(nlohmann::json& j, const TilePosition& p);
void from_json(const nlohmann::json& j, TilePosition& p);

// `feature` and `resource` are null when absent. Decoding recomputes yields from the
// determinants; the stored "yields" object is informational.
void to_json(nlohmann::json& j, const TileRecord& t);
void from_json(const nlohmann::json& j, TileRecord& t);

} // namespace hexmap::tile

namespace hexmap::mapgen {

void to_json(nlohmann::json& j, MapSize s);
void from_json(const nlohmann::json& j, MapSize& s);

void to_json(nlohmann::json& j, const MapConfig& c);
void from_json(const nlohmann::json& j, MapConfig& c);

} // namespace hexmap::mapgen
