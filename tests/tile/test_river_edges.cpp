// tests/tile/test_river_edges.cpp
#include <doctest/doctest.h>

#include <vector>

#include "hexmap/tile/RiverEdges.hpp"

using namespace hexmap::tile;

TEST_CASE("RiverEdges: empty and full sets") {
    const RiverEdges none = RiverEdges::none();
    CHECK_FALSE(none.has_river());
    CHECK(none.edge_count() == 0);
    CHECK(none.edges().empty());

    const RiverEdges all = RiverEdges::all();
    CHECK(all.has_river());
    CHECK(all.edge_count() == 6);
    for (HexEdge e : kAllEdges)
        CHECK(all.has_edge(e));
}

TEST_CASE("RiverEdges: raw bits are masked to six edges") {
    CHECK(RiverEdges(0xFF).bits() == 0x3F);
    CHECK(RiverEdges(0xFF) == RiverEdges::all());
    CHECK(RiverEdges(0xC0) == RiverEdges::none());
}

TEST_CASE("RiverEdges: set, clear and toggle single edges") {
    RiverEdges r;
    r.set_edge(HexEdge::E);
    r.set_edge(HexEdge::SW);
    r.set_edge(HexEdge::SW);
    CHECK(r.edge_count() == 2);
    CHECK(r == RiverEdges{HexEdge::E, HexEdge::SW});
    CHECK(r.edges() == std::vector<HexEdge>{HexEdge::E, HexEdge::SW});

    r.clear_edge(HexEdge::E);
    CHECK_FALSE(r.has_edge(HexEdge::E));
    CHECK(r.has_edge(HexEdge::SW));

    r.toggle_edge(HexEdge::NW);
    r.toggle_edge(HexEdge::SW);
    CHECK(r == RiverEdges{HexEdge::NW});
}

TEST_CASE("HexEdge: opposite edges and indices") {
    CHECK(opposite(HexEdge::E) == HexEdge::W);
    CHECK(opposite(HexEdge::NE) == HexEdge::SW);
    CHECK(opposite(HexEdge::NW) == HexEdge::SE);
    for (HexEdge e : kAllEdges) {
        CHECK(opposite(opposite(e)) == e);
        CHECK(edge_from_index(edge_index(e)) == e);
        CHECK(parse_edge(to_string(e)) == e);
    }
    CHECK(edge_bit(HexEdge::SE) == 0b10'0000);
    CHECK_FALSE(edge_from_index(6).has_value());
    CHECK_FALSE(parse_edge("N").has_value());
}
