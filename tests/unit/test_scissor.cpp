/**
 * @file test_scissor.cpp
 * @brief Unit tests for logical to physical scissor conversion
 */

#include <catch2/catch_test_macros.hpp>
#include <uishade/scissor.h>

using namespace uishade;

TEST_CASE("physicalScissor scales and snaps", "[scissor]") {
    SECTION("origin floors, extent rounds") {
        auto s = physicalScissor({10.3f, 20.7f, 30.4f, 40.6f}, 2.0f, 800, 600);
        REQUIRE(s.has_value());
        REQUIRE(s->x == 20);         // floor(20.6)
        REQUIRE(s->y == 41);         // floor(41.4)
        REQUIRE(s->width == 61);     // round(60.8)
        REQUIRE(s->height == 81);    // round(81.2)
    }

    SECTION("full viewport is accepted") {
        auto s = physicalScissor({0.0f, 0.0f, 400.0f, 300.0f}, 2.0f, 800, 600);
        REQUIRE(s.has_value());
        REQUIRE(s->width == 800);
        REQUIRE(s->height == 600);
    }
}

TEST_CASE("physicalScissor rejects unusable rects", "[scissor]") {
    SECTION("empty width or height") {
        REQUIRE_FALSE(physicalScissor({0.0f, 0.0f, 0.0f, 10.0f}, 1.0f, 100, 100).has_value());
        REQUIRE_FALSE(physicalScissor({0.0f, 0.0f, 10.0f, 0.2f}, 1.0f, 100, 100).has_value());
    }

    SECTION("extends past the viewport") {
        REQUIRE_FALSE(physicalScissor({90.0f, 0.0f, 20.0f, 10.0f}, 1.0f, 100, 100).has_value());
        REQUIRE_FALSE(physicalScissor({0.0f, 50.0f, 10.0f, 51.0f}, 1.0f, 100, 100).has_value());
    }

    SECTION("huge rects do not wrap around") {
        REQUIRE_FALSE(physicalScissor({1.0f, 0.0f, 4.0e9f, 10.0f}, 1.0f, 100, 100).has_value());
    }
}
