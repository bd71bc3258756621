// uishade CLI Commands
// Handles: uishadec generate, uishadec targets, uishadec parity

#include <uishade/cli.h>
#include <uishade/uishade.h>
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace uishade::cli {

static bool writeFile(const std::string& path, const std::string& contents) {
    std::ofstream file(path);
    if (!file) {
        std::cerr << "Error: cannot write " << path << "\n";
        return false;
    }
    file << contents;
    return static_cast<bool>(file);
}

int generateShaders(const GeneratorConfig& config, bool toStdout) {
    shader::ShaderProgram program = shader::buildUiProgram();

    if (!toStdout) {
        std::error_code ec;
        fs::create_directories(config.outputDir, ec);
        if (ec) {
            std::cerr << "Error: cannot create " << config.outputDir << ": " << ec.message() << "\n";
            return 1;
        }
    }

    for (const auto& target : config.targets) {
        shader::GeneratedShader generated;
        try {
            generated = shader::generateShader(program, target);
        } catch (const std::invalid_argument& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return 1;
        }

        for (const auto& source : generated.sources) {
            std::string path = config.outputPath(target, source);
            if (toStdout) {
                std::cout << "// ---- " << fs::path(path).filename().string() << " ----\n";
                std::cout << source.code << "\n";
                continue;
            }
            if (!writeFile(path, source.code)) {
                return 1;
            }
            std::cout << "Wrote " << path << "\n";
        }
    }
    return 0;
}

int listTargets(bool asJson) {
    GeneratorConfig presets;
    presets.targets = shader::builtinTargets();

    if (asJson) {
        std::cout << presets.toJson()["targets"].dump(2) << "\n";
        return 0;
    }

    for (const auto& t : presets.targets) {
        std::cout << "  " << std::left << std::setw(16) << t.name
                  << shader::backendName(t.backend);
        if (t.backend == shader::Backend::Glsl) {
            std::cout << " " << t.glslVersion << (t.glslEs ? " es" : "");
        }
        std::cout << ", " << shader::bindingModelName(t.bindingModel) << " bindings"
                  << ", " << clipSpaceName(t.clipSpace) << " clip space"
                  << (t.caps.separateSamplers ? ", separate samplers" : ", combined samplers")
                  << "\n";
    }
    return 0;
}

int runParity(const std::vector<shader::BackendTarget>& targets, float tolerance) {
    if (targets.size() < 2) {
        std::cerr << "Error: parity needs at least two targets\n";
        return 1;
    }

    ParityReport report;
    try {
        report = checkParity(shader::buildUiProgram(), targets, defaultParityScene(), tolerance);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    for (const auto& r : report.results) {
        std::cout << (r.passed() ? "  PASS  " : "  FAIL  ")
                  << r.target << " vs " << r.reference
                  << ": " << r.coveredPixels << " pixels"
                  << ", max difference " << r.maxDifference;
        if (!r.passed()) {
            std::cout << ", " << r.coverageMismatches << " coverage mismatches"
                      << ", " << r.colorMismatches << " color mismatches";
        }
        std::cout << "\n";
    }
    return report.passed() ? 0 : 1;
}

// Targets from --target names, or every preset if none were given
static bool resolveTargets(const std::vector<std::string>& names, std::vector<shader::BackendTarget>& out) {
    if (names.empty()) {
        out = shader::builtinTargets();
        return true;
    }
    for (const auto& name : names) {
        shader::BackendTarget target;
        if (!shader::findTarget(name, target)) {
            std::cerr << "Error: unknown target '" << name << "' (see 'uishadec targets')\n";
            return false;
        }
        out.push_back(target);
    }
    return true;
}

int handleCommand(int argc, char** argv) {
    CLI::App app{"uishadec - UI shader generator and cross-backend checker"};
    app.set_version_flag("-v,--version", std::string(VERSION));
    app.set_help_flag("-h,--help", "Show this help");
    app.require_subcommand(1);

    // 'generate' subcommand
    std::string generateConfig;
    std::vector<std::string> generateTargets;
    std::string generateOutput;
    std::string generateBase;
    bool generateStdout = false;

    auto* generateCmd = app.add_subcommand("generate", "Generate shader sources");
    generateCmd->add_option("-c,--config", generateConfig, "JSON generator config")
               ->check(CLI::ExistingFile);
    generateCmd->add_option("-t,--target", generateTargets, "Target preset (repeatable, default: all)");
    generateCmd->add_option("-o,--output", generateOutput, "Output directory (overrides the config)");
    generateCmd->add_option("-n,--name", generateBase, "Base file name (overrides the config)");
    generateCmd->add_flag("--stdout", generateStdout, "Print sources instead of writing files");

    // 'targets' subcommand
    bool targetsJson = false;
    auto* targetsCmd = app.add_subcommand("targets", "List built-in targets");
    targetsCmd->add_flag("--json", targetsJson, "Output as JSON");

    // 'parity' subcommand
    std::string parityConfig;
    std::vector<std::string> parityTargets;
    float parityTolerance = 1e-5f;

    auto* parityCmd = app.add_subcommand("parity", "Check that targets render identically on the CPU");
    parityCmd->add_option("-c,--config", parityConfig, "JSON generator config")
             ->check(CLI::ExistingFile);
    parityCmd->add_option("-t,--target", parityTargets, "Target preset (repeatable, default: all)");
    parityCmd->add_option("--tolerance", parityTolerance, "Maximum per-channel difference")
             ->check(CLI::NonNegativeNumber);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    if (generateCmd->parsed()) {
        GeneratorConfig config;
        if (!generateConfig.empty()) {
            if (!config.loadFile(generateConfig)) {
                return 1;
            }
        } else {
            if (!resolveTargets(generateTargets, config.targets)) {
                return 1;
            }
            // Without a config or an output directory there is nowhere to write
            if (generateOutput.empty()) {
                generateStdout = true;
            }
        }
        if (!generateOutput.empty()) config.outputDir = generateOutput;
        if (!generateBase.empty()) config.baseName = generateBase;
        return generateShaders(config, generateStdout);
    }

    if (targetsCmd->parsed()) {
        return listTargets(targetsJson);
    }

    if (parityCmd->parsed()) {
        std::vector<shader::BackendTarget> targets;
        if (!parityConfig.empty()) {
            GeneratorConfig config;
            if (!config.loadFile(parityConfig)) {
                return 1;
            }
            targets = config.targets;
        } else if (!resolveTargets(parityTargets, targets)) {
            return 1;
        }
        return runParity(targets, parityTolerance);
    }

    return 0;
}

} // namespace uishade::cli
