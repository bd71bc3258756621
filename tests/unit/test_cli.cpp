/**
 * @file test_cli.cpp
 * @brief Tests for the uishadec subcommands
 */

#include <catch2/catch_test_macros.hpp>
#include <uishade/cli.h>
#include <uishade/shader/backend.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace uishade;

namespace fs = std::filesystem;

static int run(std::vector<std::string> args) {
    args.insert(args.begin(), "uishadec");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    return cli::handleCommand(static_cast<int>(argv.size()), argv.data());
}

static std::string readFile(const fs::path& path) {
    std::ifstream file(path);
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

TEST_CASE("generateShaders writes one file per source", "[cli]") {
    fs::path dir = fs::temp_directory_path() / "uishade_cli_generate";
    fs::remove_all(dir);

    GeneratorConfig config;
    config.outputDir = dir.string();
    config.targets = shader::builtinTargets();
    REQUIRE(cli::generateShaders(config, false) == 0);

    REQUIRE(fs::exists(dir / "ui.wgsl.wgsl"));
    REQUIRE(fs::exists(dir / "ui.spirv-glsl450.vert"));
    REQUIRE(fs::exists(dir / "ui.spirv-glsl450.frag"));
    REQUIRE(fs::exists(dir / "ui.glsl-es300.vert"));
    REQUIRE(fs::exists(dir / "ui.glsl-es300.frag"));

    REQUIRE(readFile(dir / "ui.glsl-es300.frag").rfind("#version 300 es", 0) == 0);
    REQUIRE(readFile(dir / "ui.wgsl.wgsl").find("fn vs_main") != std::string::npos);

    fs::remove_all(dir);
}

TEST_CASE("runParity", "[cli]") {
    REQUIRE(cli::runParity(shader::builtinTargets(), 1e-5f) == 0);
    // Nothing to compare against
    REQUIRE(cli::runParity({shader::wgslTarget()}, 1e-5f) == 1);
}

TEST_CASE("handleCommand", "[cli]") {
    SECTION("targets") {
        REQUIRE(run({"targets"}) == 0);
        REQUIRE(run({"targets", "--json"}) == 0);
    }

    SECTION("generate to a directory with a base name") {
        fs::path dir = fs::temp_directory_path() / "uishade_cli_command";
        fs::remove_all(dir);
        REQUIRE(run({"generate", "-t", "wgsl", "-o", dir.string(), "-n", "hud"}) == 0);
        REQUIRE(fs::exists(dir / "hud.wgsl.wgsl"));
        REQUIRE_FALSE(fs::exists(dir / "hud.glsl-es300.vert"));
        fs::remove_all(dir);
    }

    SECTION("parity across selected presets") {
        REQUIRE(run({"parity", "-t", "wgsl", "-t", "glsl-es300"}) == 0);
    }

    SECTION("errors") {
        REQUIRE(run({"generate", "-t", "hlsl"}) == 1);
        REQUIRE(run({"parity", "-t", "wgsl"}) == 1);
        REQUIRE(run({}) != 0);
        REQUIRE(run({"generate", "-c", "/nonexistent/uishade.json"}) != 0);
    }
}
