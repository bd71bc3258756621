#include <uishade/shader/backend.h>

namespace uishade::shader {

const char* backendName(Backend backend) {
    switch (backend) {
        case Backend::Wgsl: return "wgsl";
        case Backend::Glsl: return "glsl";
    }
    return "unknown";
}

bool parseBackend(const std::string& name, Backend& out) {
    if (name == "wgsl") {
        out = Backend::Wgsl;
        return true;
    }
    if (name == "glsl") {
        out = Backend::Glsl;
        return true;
    }
    return false;
}

bool Capabilities::operator==(const Capabilities& o) const {
    return hexLiterals == o.hexLiterals &&
           unsignedLiteralSuffix == o.unsignedLiteralSuffix &&
           bitwiseIntegerOps == o.bitwiseIntegerOps &&
           separateSamplers == o.separateSamplers &&
           explicitBindingQualifiers == o.explicitBindingQualifiers &&
           varyingLocations == o.varyingLocations &&
           precisionQualifiers == o.precisionQualifiers;
}

BackendTarget wgslTarget() {
    BackendTarget t;
    t.name = "wgsl";
    t.backend = Backend::Wgsl;
    t.bindingModel = BindingModel::Grouped;
    t.clipSpace = webGpuClipSpace();
    return t;
}

BackendTarget spirvGlslTarget() {
    BackendTarget t;
    t.name = "spirv-glsl450";
    t.backend = Backend::Glsl;
    t.glslVersion = 450;
    t.bindingModel = BindingModel::Grouped;
    // wgpu flips the Vulkan viewport, so SPIR-V sees WebGPU conventions
    t.clipSpace = webGpuClipSpace();
    return t;
}

BackendTarget glslEs300Target() {
    BackendTarget t;
    t.name = "glsl-es300";
    t.backend = Backend::Glsl;
    t.glslVersion = 300;
    t.glslEs = true;
    t.bindingModel = BindingModel::Unified;
    t.caps.separateSamplers = false;
    t.caps.explicitBindingQualifiers = false;
    t.caps.varyingLocations = false;
    t.caps.precisionQualifiers = true;
    t.clipSpace = openGlClipSpace();
    return t;
}

std::vector<BackendTarget> builtinTargets() {
    return {wgslTarget(), spirvGlslTarget(), glslEs300Target()};
}

bool findTarget(const std::string& name, BackendTarget& out) {
    for (auto& t : builtinTargets()) {
        if (t.name == name) {
            out = t;
            return true;
        }
    }
    return false;
}

glm::mat4 targetTransform(const BackendTarget& target, const glm::mat4& transform) {
    return correctTransform(transform, target.clipSpace);
}

} // namespace uishade::shader
