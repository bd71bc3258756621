/**
 * @file test_config.cpp
 * @brief Unit tests for JSON generator settings
 */

#include <catch2/catch_test_macros.hpp>
#include <uishade/config.h>
#include <uishade/shader/ui_program.h>

#include <filesystem>
#include <string>

using namespace uishade;
using namespace uishade::shader;

namespace fs = std::filesystem;

static std::string fixture(const std::string& name) {
    return std::string(UISHADE_TEST_FIXTURES_DIR) + "/" + name;
}

TEST_CASE("GeneratorConfig loads presets", "[config]") {
    GeneratorConfig config;
    REQUIRE(config.loadFile(fixture("presets.json")));
    REQUIRE(config.lastError().empty());

    REQUIRE(config.outputDir == "generated/shaders");
    REQUIRE(config.baseName == "ui");
    REQUIRE(config.targets.size() == 3);

    auto builtins = builtinTargets();
    for (size_t i = 0; i < builtins.size(); ++i) {
        REQUIRE(config.targets[i].name == builtins[i].name);
        REQUIRE(config.targets[i].backend == builtins[i].backend);
        REQUIRE(config.targets[i].bindingModel == builtins[i].bindingModel);
        REQUIRE(config.targets[i].caps == builtins[i].caps);
        REQUIRE(config.targets[i].clipSpace == builtins[i].clipSpace);
    }
}

TEST_CASE("GeneratorConfig target overrides", "[config]") {
    GeneratorConfig config;
    REQUIRE(config.loadFile(fixture("custom_targets.json")));
    REQUIRE(config.outputDir == ".");
    REQUIRE(config.baseName == "overlay");
    REQUIRE(config.targets.size() == 2);

    SECTION("capabilities override the preset") {
        const BackendTarget& gles = config.targets[0];
        REQUIRE(gles.name == "gles-compat");
        REQUIRE(gles.glslVersion == 300);
        REQUIRE(gles.glslEs);
        REQUIRE_FALSE(gles.caps.bitwiseIntegerOps);
        REQUIRE_FALSE(gles.caps.hexLiterals);
        // Untouched flags keep the preset's value
        REQUIRE_FALSE(gles.caps.separateSamplers);
        REQUIRE(gles.caps.precisionQualifiers);
    }

    SECTION("target built from scratch") {
        const BackendTarget& vk = config.targets[1];
        REQUIRE(vk.name == "vulkan-native");
        REQUIRE(vk.backend == Backend::Glsl);
        REQUIRE(vk.glslVersion == 450);
        REQUIRE_FALSE(vk.glslEs);
        REQUIRE(vk.clipSpace == vulkanClipSpace());
        REQUIRE(vk.caps == Capabilities{});
    }

    SECTION("output paths name the target and stage") {
        GeneratedShader out = generateShader(buildUiProgram(), config.targets[0]);
        const ShaderSource* fragment = out.sourceFor(ShaderStage::Fragment);
        REQUIRE(fragment);
        fs::path path = config.outputPath(config.targets[0], *fragment);
        REQUIRE(path.filename().string() == "overlay.gles-compat.frag");
        REQUIRE(path.parent_path().string() == ".");
    }
}

TEST_CASE("GeneratorConfig rejects bad settings", "[config]") {
    GeneratorConfig config;
    REQUIRE(config.load(R"({"targets": [{"preset": "wgsl"}]})"));
    REQUIRE(config.targets.size() == 1);

    SECTION("duplicate target names") {
        REQUIRE_FALSE(config.loadFile(fixture("duplicate_target.json")));
        REQUIRE(config.lastError().find("Duplicate") != std::string::npos);
    }

    SECTION("missing file") {
        REQUIRE_FALSE(config.loadFile(fixture("does_not_exist.json")));
    }

    SECTION("malformed documents") {
        REQUIRE_FALSE(config.load("{ not json"));
        REQUIRE_FALSE(config.load("[]"));
        REQUIRE_FALSE(config.load(R"({"targets": []})"));
        REQUIRE_FALSE(config.load(R"({"baseName": "", "targets": [{"preset": "wgsl"}]})"));
        REQUIRE_FALSE(config.load(R"({"baseName": 7, "targets": [{"preset": "wgsl"}]})"));
    }

    SECTION("invalid targets") {
        REQUIRE_FALSE(config.load(R"({"targets": [{"preset": "hlsl"}]})"));
        REQUIRE_FALSE(config.load(R"({"targets": [{"name": "x"}]})"));
        REQUIRE_FALSE(config.load(R"({"targets": [{"name": "x", "backend": "glsl"}]})"));
        REQUIRE_FALSE(config.load(R"({"targets": [{"name": "x", "backend": "metal"}]})"));
        REQUIRE_FALSE(config.load(R"({"targets": [{"backend": "wgsl"}]})"));
        REQUIRE_FALSE(config.load(R"({"targets": [{"preset": "wgsl", "bindingModel": "flat"}]})"));
        REQUIRE_FALSE(config.load(R"({"targets": [{"preset": "wgsl", "clipSpace": "d3d9"}]})"));
        REQUIRE_FALSE(config.load(R"({"targets": [{"preset": "wgsl", "capabilities": {"geometryShaders": true}}]})"));
        REQUIRE_FALSE(config.load(R"({"targets": [{"preset": "wgsl", "capabilities": {"hexLiterals": "no"}}]})"));
    }

    // Failed loads leave the previous settings in place
    REQUIRE(config.targets.size() == 1);
    REQUIRE(config.targets[0].name == "wgsl");
    REQUIRE_FALSE(config.lastError().empty());
}

TEST_CASE("GeneratorConfig save and reload", "[config]") {
    GeneratorConfig config;
    REQUIRE(config.loadFile(fixture("custom_targets.json")));

    fs::path path = fs::temp_directory_path() / "uishade_test_config.json";
    REQUIRE(config.saveFile(path.string()));

    GeneratorConfig reloaded;
    REQUIRE(reloaded.loadFile(path.string()));
    fs::remove(path);

    REQUIRE(reloaded.baseName == config.baseName);
    REQUIRE(reloaded.targets.size() == config.targets.size());
    for (size_t i = 0; i < config.targets.size(); ++i) {
        const auto& a = config.targets[i];
        const auto& b = reloaded.targets[i];
        REQUIRE(a.name == b.name);
        REQUIRE(a.backend == b.backend);
        REQUIRE(a.glslVersion == b.glslVersion);
        REQUIRE(a.glslEs == b.glslEs);
        REQUIRE(a.bindingModel == b.bindingModel);
        REQUIRE(a.caps == b.caps);
        REQUIRE(a.clipSpace == b.clipSpace);
    }
}

TEST_CASE("clip space names", "[config]") {
    ClipSpaceConvention clip;
    REQUIRE(parseClipSpace("opengl", clip));
    REQUIRE(clip == openGlClipSpace());
    REQUIRE(clipSpaceName(vulkanClipSpace()) == "vulkan");
    REQUIRE(clipSpaceName(ClipSpaceConvention{false, false}).empty());
    REQUIRE_FALSE(parseClipSpace("metal", clip));
}
