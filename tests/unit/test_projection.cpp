/**
 * @file test_projection.cpp
 * @brief Unit tests for the UI projection and clip-space correction
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <uishade/projection.h>

using namespace uishade;
using Catch::Matchers::WithinAbs;

static glm::vec4 project(const glm::mat4& m, float x, float y) {
    return m * glm::vec4(x, y, 0.0f, 1.0f);
}

TEST_CASE("orthographic maps the logical viewport to clip space", "[projection]") {
    auto m = orthographic(800, 600, 2.0f);
    REQUIRE(m.has_value());

    SECTION("top-left corner maps to (-1, 1)") {
        glm::vec4 p = project(*m, 0.0f, 0.0f);
        REQUIRE_THAT(p.x, WithinAbs(-1.0f, 1e-6f));
        REQUIRE_THAT(p.y, WithinAbs(1.0f, 1e-6f));
        REQUIRE_THAT(p.w, WithinAbs(1.0f, 1e-6f));
    }

    SECTION("bottom-right corner uses logical pixels") {
        // 800x600 physical at scale 2 is 400x300 logical
        glm::vec4 p = project(*m, 400.0f, 300.0f);
        REQUIRE_THAT(p.x, WithinAbs(1.0f, 1e-6f));
        REQUIRE_THAT(p.y, WithinAbs(-1.0f, 1e-6f));
    }

    SECTION("depth is fixed at 0.5") {
        REQUIRE_THAT(project(*m, 123.0f, 45.0f).z, WithinAbs(0.5f, 1e-6f));
    }
}

TEST_CASE("orthographic rejects empty viewports", "[projection]") {
    REQUIRE_FALSE(orthographic(0, 600, 1.0f).has_value());
    REQUIRE_FALSE(orthographic(800, 0, 1.0f).has_value());
    REQUIRE_FALSE(orthographic(800, 600, 0.0f).has_value());
    REQUIRE_FALSE(orthographic(800, 600, -1.0f).has_value());
}

TEST_CASE("clip space correction", "[projection]") {
    SECTION("same convention is identity") {
        REQUIRE(clipSpaceCorrection(webGpuClipSpace(), webGpuClipSpace()) == glm::mat4(1.0f));
        REQUIRE(correctTransform(glm::mat4(2.0f), webGpuClipSpace()) == glm::mat4(2.0f));
    }

    SECTION("Y down flips y only") {
        glm::mat4 c = clipSpaceCorrection(webGpuClipSpace(), vulkanClipSpace());
        glm::vec4 p = c * glm::vec4(0.25f, 0.5f, 0.75f, 1.0f);
        REQUIRE(p == glm::vec4(0.25f, -0.5f, 0.75f, 1.0f));
    }

    SECTION("[0,1] depth maps to [-1,1]") {
        glm::mat4 c = clipSpaceCorrection(webGpuClipSpace(), openGlClipSpace());
        REQUIRE((c * glm::vec4(0.0f, 0.0f, 0.0f, 1.0f)).z == -1.0f);
        REQUIRE((c * glm::vec4(0.0f, 0.0f, 0.5f, 1.0f)).z == 0.0f);
        REQUIRE((c * glm::vec4(0.0f, 0.0f, 1.0f, 1.0f)).z == 1.0f);
    }

    SECTION("depth corrections invert each other") {
        glm::mat4 there = clipSpaceCorrection(webGpuClipSpace(), openGlClipSpace());
        glm::mat4 back = clipSpaceCorrection(openGlClipSpace(), webGpuClipSpace());
        glm::vec4 p(0.1f, -0.2f, 0.3f, 1.0f);
        glm::vec4 q = back * (there * p);
        REQUIRE_THAT(q.z, WithinAbs(p.z, 1e-6f));
        REQUIRE(q.x == p.x);
        REQUIRE(q.y == p.y);
    }

    SECTION("corrected UI transform keeps the top-left corner at the top") {
        auto m = orthographic(640, 480, 1.0f);
        REQUIRE(m.has_value());
        glm::vec4 p = project(correctTransform(*m, vulkanClipSpace()), 0.0f, 0.0f);
        // Y down: top of the framebuffer is -1
        REQUIRE_THAT(p.y, WithinAbs(-1.0f, 1e-6f));
        REQUIRE_THAT(p.x, WithinAbs(-1.0f, 1e-6f));
    }
}
