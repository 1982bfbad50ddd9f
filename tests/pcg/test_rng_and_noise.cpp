// tests/pcg/test_rng_and_noise.cpp
#include <doctest/doctest.h>

#include <cstdint>

#include "hexmap/pcg/Hash.hpp"
#include "hexmap/pcg/Noise.hpp"
#include "hexmap/pcg/SeededRng.hpp"

namespace pcg = hexmap::pcg;

// ---------------------- Rng ----------------------
TEST_CASE("Rng: same seed gives the same stream, different seeds diverge") {
    auto a = pcg::Rng::from_seed(42);
    auto b = pcg::Rng::from_seed(42);
    auto c = pcg::Rng::from_seed(43);

    bool diverged = false;
    for (int i = 0; i < 64; ++i) {
        const uint64_t va = a.next_u64();
        CHECK(va == b.next_u64());
        diverged |= (va != c.next_u64());
    }
    CHECK(diverged);
}

TEST_CASE("Rng: seed 0 still produces a live stream") {
    auto r = pcg::Rng::from_seed(0);
    const uint64_t first = r.next_u64();
    bool changed = false;
    for (int i = 0; i < 8; ++i) changed |= (r.next_u64() != first);
    CHECK(changed);
}

TEST_CASE("Rng: chance consumes exactly one draw at every probability") {
    for (double p : {-1.0, 0.0, 0.3, 1.0, 2.0}) {
        CAPTURE(p);
        auto r = pcg::Rng::from_seed(7);
        auto ref = r;
        (void)r.chance(p);
        (void)ref.next01();
        CHECK(r.next_u64() == ref.next_u64());
    }

    auto r = pcg::Rng::from_seed(7);
    for (int i = 0; i < 100; ++i) {
        CHECK_FALSE(r.chance(0.0));
        CHECK(r.chance(1.0));
    }
}

TEST_CASE("Rng: ranges stay inside their bounds") {
    auto r = pcg::Rng::from_seed(1234);
    for (int i = 0; i < 1000; ++i) {
        const double u = r.next01();
        CHECK(u >= 0.0);
        CHECK(u < 1.0);

        const int k = r.rangei(-3, 3);
        CHECK(k >= -3);
        CHECK(k <= 3);

        const double d = r.ranged(2.0, 5.0);
        CHECK(d >= 2.0);
        CHECK(d < 5.0);
    }
    CHECK(r.rangei(5, 5) == 5);
}

TEST_CASE("hash_pair: order sensitive") {
    CHECK(pcg::hash_pair(3, 9) == pcg::hash_pair(3, 9));
    CHECK(pcg::hash_pair(3, 9) != pcg::hash_pair(9, 3));
    CHECK(pcg::hash_pair(-1, 0) != pcg::hash_pair(0, -1));
}

// ---------------------- Perlin ----------------------
TEST_CASE("Perlin: zero on integer lattice points") {
    const pcg::Perlin p(99);
    for (int x = -3; x <= 3; ++x)
        for (int y = -3; y <= 3; ++y)
            CHECK(p.noise(x, y) == doctest::Approx(0.0));
}

TEST_CASE("Perlin: bounded, deterministic and seed dependent") {
    const pcg::Perlin a(42), b(42), c(1042);
    CHECK(a.seed() == 42u);

    bool differs = false;
    for (int i = 0; i < 400; ++i) {
        const double x = i * 0.173 + 0.05;
        const double y = i * 0.291 + 0.11;
        const double v = a.noise(x, y);
        CHECK(v >= -1.0);
        CHECK(v <= 1.0);
        CHECK(v == b.noise(x, y));
        differs |= (v != c.noise(x, y));
    }
    CHECK(differs);
}

TEST_CASE("Perlin: fbm is normalized by total amplitude") {
    const pcg::Perlin p(5);

    // One octave at unit frequency is plain noise.
    const pcg::FbmParams single{1, 1.0, 2.0, 0.5};
    CHECK(p.fbm(3.3, 7.7, single) == doctest::Approx(p.noise(3.3, 7.7)));

    const pcg::FbmParams six{6, 0.02, 2.0, 0.5};
    for (int x = 0; x < 40; ++x) {
        const double v = p.fbm(x, 2.0 * x, six);
        CHECK(v >= -1.0);
        CHECK(v <= 1.0);
    }

    const pcg::FbmParams none{0, 1.0, 2.0, 0.5};
    CHECK(p.fbm(1.5, 1.5, none) == 0.0);
}
