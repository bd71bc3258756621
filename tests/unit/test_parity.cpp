/**
 * @file test_parity.cpp
 * @brief Cross-backend equivalence of the UI program on the CPU
 *
 * Every target must produce the same pixels for the same scene: same
 * coverage, same colors within 1e-5 per channel.
 */

#include <catch2/catch_test_macros.hpp>
#include <uishade/color.h>
#include <uishade/parity.h>
#include <uishade/shader/ui_program.h>

#include <stdexcept>
#include <vector>

using namespace uishade;
using namespace uishade::shader;

TEST_CASE("default scene", "[parity]") {
    ParityScene scene = defaultParityScene();
    REQUIRE(scene.indices.size() % 3 == 0);
    REQUIRE(scene.texture.valid());

    raster::Framebuffer fb = renderScene(buildUiProgram(), wgslTarget(), scene);
    REQUIRE(fb.width() == 64);
    REQUIRE(fb.coveredCount() > 0);

    SECTION("logical coordinates are scaled to physical pixels") {
        // First quad spans logical (2,2)-(14,14), physical (4,4)-(28,28)
        REQUIRE(fb.covered(5, 5));
        REQUIRE_FALSE(fb.covered(2, 2));
    }
}

/**
 * Every built-in preset keeps bitwise integer ops, so among themselves they
 * differ only in clip space and binding model. The lowered GLSL ES variant
 * is compared in the same run so the arithmetic decode is covered as well.
 */
TEST_CASE("built-in targets agree", "[parity]") {
    std::vector<BackendTarget> builtins = builtinTargets();
    for (const auto& t : builtins) {
        REQUIRE(t.caps.bitwiseIntegerOps);
    }

    std::vector<BackendTarget> targets = builtins;
    BackendTarget lowered = glslEs300Target();
    lowered.name = "glsl-es300-lowered";
    lowered.caps.bitwiseIntegerOps = false;
    targets.push_back(lowered);

    ParityReport report = checkParity(buildUiProgram(), targets, defaultParityScene());

    REQUIRE(report.results.size() == targets.size() - 1);
    for (const auto& r : report.results) {
        INFO(r.reference << " vs " << r.target << ": max difference " << r.maxDifference);
        REQUIRE(r.reference == "wgsl");
        REQUIRE(r.coveredPixels > 0);
        REQUIRE(r.coverageMismatches == 0);
        REQUIRE(r.colorMismatches == 0);
    }
    REQUIRE(report.results.back().target == "glsl-es300-lowered");
    REQUIRE(report.passed());
}

TEST_CASE("custom targets agree with the reference", "[parity]") {
    std::vector<BackendTarget> targets = {wgslTarget()};

    BackendTarget noBitwise = glslEs300Target();
    noBitwise.name = "gles-no-bitwise";
    noBitwise.caps.bitwiseIntegerOps = false;
    noBitwise.caps.hexLiterals = false;
    targets.push_back(noBitwise);

    BackendTarget vulkan = spirvGlslTarget();
    vulkan.name = "vulkan-native";
    vulkan.clipSpace = vulkanClipSpace();
    targets.push_back(vulkan);

    ParityReport report = checkParity(buildUiProgram(), targets, defaultParityScene());
    REQUIRE(report.results.size() == 2);
    REQUIRE(report.passed());
}

TEST_CASE("parity detects a diverging program", "[parity]") {
    ShaderProgram program = buildUiProgram();
    ParityScene scene = defaultParityScene();

    raster::Framebuffer good = renderScene(program, wgslTarget(), scene);

    // Decode with the channels in the wrong order
    auto color = ir::attribute("a_color", ValueType::U32);
    program.varyingValues[1] = ir::vec4(decodeChannel(color, 0), decodeChannel(color, 8),
                                        decodeChannel(color, 16), decodeChannel(color, 24));
    raster::Framebuffer bad = renderScene(program, wgslTarget(), scene);

    REQUIRE(good.coveredCount() == bad.coveredCount());
    bool differs = false;
    for (uint32_t y = 0; y < good.height() && !differs; ++y) {
        for (uint32_t x = 0; x < good.width() && !differs; ++x) {
            differs = good.pixel(x, y) != bad.pixel(x, y);
        }
    }
    REQUIRE(differs);
}

TEST_CASE("parity edge cases", "[parity]") {
    SECTION("a single target has nothing to compare") {
        ParityReport report = checkParity(buildUiProgram(), {wgslTarget()}, defaultParityScene());
        REQUIRE(report.results.empty());
        REQUIRE(report.passed());
    }

    SECTION("empty viewport") {
        ParityScene scene = defaultParityScene();
        scene.width = 0;
        REQUIRE_THROWS_AS(renderScene(buildUiProgram(), wgslTarget(), scene), std::invalid_argument);
    }

    SECTION("malformed index buffer") {
        ParityScene scene = defaultParityScene();
        scene.indices.push_back(0);
        REQUIRE_THROWS_AS(renderScene(buildUiProgram(), wgslTarget(), scene), std::invalid_argument);
    }
}
