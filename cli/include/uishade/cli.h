// uishade CLI Commands
// Handles: uishadec generate, uishadec targets, uishadec parity

#pragma once

#include <uishade/config.h>

#include <string>
#include <vector>

namespace uishade::cli {

// Version info
constexpr const char* VERSION = "1.0.0";

// Parse arguments and run a subcommand; returns the process exit code
int handleCommand(int argc, char** argv);

// Generate every configured target. Writes files under config.outputDir,
// or prints all sources to stdout when toStdout is set.
int generateShaders(const GeneratorConfig& config, bool toStdout);

// Print the built-in target presets
int listTargets(bool asJson);

// Render the parity scene for each target; non-zero if any target differs
int runParity(const std::vector<shader::BackendTarget>& targets, float tolerance);

} // namespace uishade::cli
