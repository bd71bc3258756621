#include <uishade/config.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <utility>

namespace fs = std::filesystem;

namespace uishade {

using nlohmann::json;

std::string clipSpaceName(const ClipSpaceConvention& clip) {
    if (clip == webGpuClipSpace()) return "webgpu";
    if (clip == vulkanClipSpace()) return "vulkan";
    if (clip == openGlClipSpace()) return "opengl";
    return "";
}

bool parseClipSpace(const std::string& name, ClipSpaceConvention& out) {
    if (name == "webgpu") { out = webGpuClipSpace(); return true; }
    if (name == "vulkan") { out = vulkanClipSpace(); return true; }
    if (name == "opengl") { out = openGlClipSpace(); return true; }
    return false;
}

namespace {

struct CapabilityField {
    const char* key;
    bool shader::Capabilities::*member;
};

const CapabilityField CAPABILITY_FIELDS[] = {
    {"hexLiterals", &shader::Capabilities::hexLiterals},
    {"unsignedLiteralSuffix", &shader::Capabilities::unsignedLiteralSuffix},
    {"bitwiseIntegerOps", &shader::Capabilities::bitwiseIntegerOps},
    {"separateSamplers", &shader::Capabilities::separateSamplers},
    {"explicitBindingQualifiers", &shader::Capabilities::explicitBindingQualifiers},
    {"varyingLocations", &shader::Capabilities::varyingLocations},
    {"precisionQualifiers", &shader::Capabilities::precisionQualifiers},
};

// Parses one entry of "targets"; returns an error message or an empty string
std::string parseTarget(const json& j, shader::BackendTarget& target) {
    if (!j.is_object()) {
        return "target entries must be objects";
    }

    if (j.contains("preset")) {
        std::string preset = j["preset"].get<std::string>();
        if (!shader::findTarget(preset, target)) {
            return "unknown target preset '" + preset + "'";
        }
    } else if (!j.contains("backend")) {
        return "target needs a 'preset' or a 'backend'";
    }

    if (j.contains("name")) target.name = j["name"].get<std::string>();
    if (target.name.empty()) {
        return "target without a name";
    }

    if (j.contains("backend")) {
        std::string backend = j["backend"].get<std::string>();
        if (!shader::parseBackend(backend, target.backend)) {
            return "target '" + target.name + "': unknown backend '" + backend + "'";
        }
    }
    target.glslVersion = j.value("glslVersion", target.glslVersion);
    target.glslEs = j.value("glslEs", target.glslEs);

    if (j.contains("bindingModel")) {
        std::string model = j["bindingModel"].get<std::string>();
        if (!shader::parseBindingModel(model, target.bindingModel)) {
            return "target '" + target.name + "': unknown binding model '" + model + "'";
        }
    }
    if (j.contains("clipSpace")) {
        std::string clip = j["clipSpace"].get<std::string>();
        if (!parseClipSpace(clip, target.clipSpace)) {
            return "target '" + target.name + "': unknown clip space '" + clip + "'";
        }
    }

    if (j.contains("capabilities")) {
        const json& caps = j["capabilities"];
        if (!caps.is_object()) {
            return "target '" + target.name + "': 'capabilities' must be an object";
        }
        for (auto it = caps.begin(); it != caps.end(); ++it) {
            bool found = false;
            for (const auto& field : CAPABILITY_FIELDS) {
                if (it.key() == field.key) {
                    target.caps.*field.member = it.value().get<bool>();
                    found = true;
                    break;
                }
            }
            if (!found) {
                return "target '" + target.name + "': unknown capability '" + it.key() + "'";
            }
        }
    }

    if (target.backend == shader::Backend::Glsl && target.glslVersion <= 0) {
        return "target '" + target.name + "': GLSL targets need a glslVersion";
    }
    return "";
}

} // namespace

bool GeneratorConfig::fail(const std::string& message) {
    m_lastError = message;
    std::cerr << "[Config] " << message << std::endl;
    return false;
}

bool GeneratorConfig::load(const std::string& jsonText) {
    json j;
    try {
        j = json::parse(jsonText);
    } catch (const json::parse_error& e) {
        return fail(std::string("Invalid JSON: ") + e.what());
    }
    if (!j.is_object()) {
        return fail("Config root must be an object");
    }

    std::string outDir = outputDir;
    std::string base = baseName;
    std::vector<shader::BackendTarget> parsed;
    try {
        outDir = j.value("outputDir", outDir);
        base = j.value("baseName", base);

        if (!j.contains("targets") || !j["targets"].is_array() || j["targets"].empty()) {
            return fail("Config needs a non-empty 'targets' array");
        }
        for (const auto& entry : j["targets"]) {
            shader::BackendTarget target;
            std::string error = parseTarget(entry, target);
            if (!error.empty()) {
                return fail(error);
            }
            for (const auto& existing : parsed) {
                if (existing.name == target.name) {
                    return fail("Duplicate target name '" + target.name + "'");
                }
            }
            parsed.push_back(std::move(target));
        }
    } catch (const json::exception& e) {
        return fail(std::string("Invalid config value: ") + e.what());
    }

    if (base.empty()) {
        return fail("'baseName' must not be empty");
    }

    outputDir = outDir;
    baseName = base;
    targets = std::move(parsed);
    m_lastError.clear();
    return true;
}

bool GeneratorConfig::loadFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        return fail("Cannot open " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return load(buffer.str());
}

bool GeneratorConfig::saveFile(const std::string& path) const {
    std::ofstream file(path);
    if (!file) {
        std::cerr << "[Config] Cannot write " << path << std::endl;
        return false;
    }
    file << toJson().dump(2) << "\n";
    return static_cast<bool>(file);
}

json GeneratorConfig::toJson() const {
    json j;
    j["outputDir"] = outputDir;
    j["baseName"] = baseName;
    j["targets"] = json::array();

    for (const auto& t : targets) {
        json jt;
        jt["name"] = t.name;
        jt["backend"] = shader::backendName(t.backend);
        if (t.backend == shader::Backend::Glsl) {
            jt["glslVersion"] = t.glslVersion;
            jt["glslEs"] = t.glslEs;
        }
        jt["bindingModel"] = shader::bindingModelName(t.bindingModel);
        jt["clipSpace"] = clipSpaceName(t.clipSpace);

        json caps = json::object();
        for (const auto& field : CAPABILITY_FIELDS) {
            caps[field.key] = t.caps.*field.member;
        }
        jt["capabilities"] = caps;
        j["targets"].push_back(jt);
    }
    return j;
}

std::string GeneratorConfig::outputPath(const shader::BackendTarget& target,
                                        const shader::ShaderSource& source) const {
    return (fs::path(outputDir) / (baseName + "." + target.name + source.fileSuffix)).string();
}

} // namespace uishade
