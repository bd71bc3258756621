#include <uishade/shader/generator.h>

#include <sstream>
#include <utility>

namespace uishade::shader {

WgslGenerator::WgslGenerator(BackendTarget target)
    : ShaderGenerator(std::move(target)) {}

std::string WgslGenerator::typeName(ValueType type) const {
    switch (type) {
        case ValueType::U32: return "u32";
        case ValueType::F32: return "f32";
        case ValueType::Vec2F: return "vec2<f32>";
        case ValueType::Vec4F: return "vec4<f32>";
        case ValueType::Mat4F: return "mat4x4<f32>";
    }
    return "?";
}

std::string WgslGenerator::reference(const Expr& e) const {
    switch (e.kind) {
        case ExprKind::Attribute:
        case ExprKind::Varying:
            return "in." + e.name;
        case ExprKind::Uniform:
            return e.block + "." + e.name;
        default:
            return e.name;
    }
}

std::string WgslGenerator::convertToF32(const std::string& value) const {
    return "f32(" + value + ")";
}

std::string WgslGenerator::sampleTexture(const Expr& e, const std::string& uv) const {
    return "textureSample(" + e.name + ", " + e.samplerName + ", " + uv + ")";
}

GeneratedShader WgslGenerator::emit(const ShaderProgram& program, const BindingLayout& layout) const {
    std::ostringstream ss;
    ss << header() << "\n";

    // Uniform block
    ss << "struct " << program.uniforms.typeName << " {\n";
    for (const auto& m : program.uniforms.members) {
        ss << "    " << m.name << ": " << typeName(m.type) << ",\n";
    }
    ss << "}\n\n";

    // Resources, in layout order
    for (uint32_t group = 0; group < layout.groupCount(); ++group) {
        for (const auto& b : layout.entriesInGroup(group)) {
            ss << "@group(" << b.group << ") @binding(" << b.binding << ") ";
            switch (b.kind) {
                case ResourceKind::UniformBuffer:
                    ss << "var<uniform> " << b.name << ": " << program.uniforms.typeName << ";\n";
                    break;
                case ResourceKind::Texture2D:
                    ss << "var " << b.name << ": texture_2d<f32>;\n";
                    break;
                case ResourceKind::Sampler:
                    ss << "var " << b.name << ": sampler;\n";
                    break;
            }
        }
    }
    ss << "\n";

    // Stage interfaces
    ss << "struct VertexInput {\n";
    for (const auto& a : program.vertexLayout.attributes) {
        ValueType type = formatValueType(a.format);
        ss << "    @location(" << a.location << ") " << a.name << ": " << typeName(type) << ",\n";
    }
    ss << "}\n\n";

    ss << "struct VertexOutput {\n";
    ss << "    @builtin(position) position: vec4<f32>,\n";
    for (const auto& v : program.varyings) {
        ss << "    @location(" << v.location << ") " << v.name << ": " << typeName(v.type) << ",\n";
    }
    ss << "}\n\n";

    // Vertex stage
    ss << "@vertex\n";
    ss << "fn vs_main(in: VertexInput) -> VertexOutput {\n";
    ss << "    var out: VertexOutput;\n";
    ss << "    out.position = " << expression(program.clipPosition) << ";\n";
    for (size_t i = 0; i < program.varyings.size(); ++i) {
        ss << "    out." << program.varyings[i].name << " = "
           << expression(program.varyingValues[i]) << ";\n";
    }
    ss << "    return out;\n";
    ss << "}\n\n";

    // Fragment stage
    ss << "@fragment\n";
    ss << "fn fs_main(in: VertexOutput) -> @location(0) vec4<f32> {\n";
    ss << "    return " << expression(program.fragmentColor) << ";\n";
    ss << "}\n";

    GeneratedShader result;
    result.targetName = m_target.name;
    result.backend = Backend::Wgsl;
    result.vertexEntry = "vs_main";
    result.fragmentEntry = "fs_main";
    result.sources.push_back({ShaderStage::Vertex | ShaderStage::Fragment, ".wgsl", ss.str()});
    return result;
}

} // namespace uishade::shader
