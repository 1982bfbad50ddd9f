// tests/tile/test_tile_feature.cpp
#include <doctest/doctest.h>

#include <algorithm>

#include "hexmap/tile/TileFeature.hpp"

using namespace hexmap::tile;

TEST_CASE("TileFeature: yield and movement modifiers") {
    CHECK(production_modifier(TileFeature::Forest) == 1);
    CHECK(movement_modifier(TileFeature::Forest) == 1);

    CHECK(production_modifier(TileFeature::Jungle) == -1);
    CHECK(movement_modifier(TileFeature::Jungle) == 1);

    CHECK(food_modifier(TileFeature::Marsh) == -1);
    CHECK(movement_modifier(TileFeature::Marsh) == 1);

    CHECK(food_modifier(TileFeature::Floodplains) == 2);
    CHECK(movement_modifier(TileFeature::Floodplains) == 0);

    CHECK(food_modifier(TileFeature::Oasis) == 3);
    CHECK(gold_modifier(TileFeature::Oasis) == 1);

    CHECK(food_modifier(TileFeature::Ice) == 0);
    CHECK(production_modifier(TileFeature::Ice) == 0);
    CHECK(gold_modifier(TileFeature::Ice) == 0);
}

TEST_CASE("TileFeature: placement rules") {
    CHECK(can_place_on(TileFeature::Forest, Terrain::Grassland));
    CHECK(can_place_on(TileFeature::Forest, Terrain::TundraHill));
    CHECK_FALSE(can_place_on(TileFeature::Forest, Terrain::Desert));
    CHECK_FALSE(can_place_on(TileFeature::Forest, Terrain::Snow));

    CHECK(can_place_on(TileFeature::Jungle, Terrain::PlainsHill));
    CHECK_FALSE(can_place_on(TileFeature::Jungle, Terrain::Tundra));

    CHECK(can_place_on(TileFeature::Marsh, Terrain::Grassland));
    CHECK_FALSE(can_place_on(TileFeature::Marsh, Terrain::Plains));
    CHECK_FALSE(can_place_on(TileFeature::Marsh, Terrain::GrasslandHill));

    CHECK(can_place_on(TileFeature::Oasis, Terrain::Desert));
    CHECK_FALSE(can_place_on(TileFeature::Oasis, Terrain::DesertHill));
    CHECK(can_place_on(TileFeature::Floodplains, Terrain::Desert));

    CHECK(can_place_on(TileFeature::Ice, Terrain::Ocean));
    CHECK(can_place_on(TileFeature::Ice, Terrain::Coast));
    CHECK_FALSE(can_place_on(TileFeature::Ice, Terrain::Lake));
}

TEST_CASE("TileFeature: valid_terrains lists exactly the placeable terrains") {
    for (TileFeature f : kAllFeatures) {
        CAPTURE(to_string(f));
        const auto valid = valid_terrains(f);
        CHECK_FALSE(valid.empty());
        for (Terrain t : kAllTerrains) {
            const bool listed = std::find(valid.begin(), valid.end(), t) != valid.end();
            CHECK(listed == can_place_on(f, t));
        }
    }
    CHECK(valid_terrains(TileFeature::Forest).size() == 6);
    CHECK(valid_terrains(TileFeature::Jungle).size() == 4);
}

TEST_CASE("TileFeature: names round-trip") {
    for (TileFeature f : kAllFeatures)
        CHECK(parse_feature(to_string(f)) == f);
    CHECK(to_string(TileFeature::Floodplains) == "Floodplains");
    CHECK_FALSE(parse_feature("Volcano").has_value());
}
