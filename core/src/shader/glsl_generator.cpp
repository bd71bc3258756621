#include <uishade/shader/generator.h>

#include <sstream>
#include <utility>
#include <vector>

namespace uishade::shader {

static const char* FRAGMENT_OUTPUT = "o_color";

GlslGenerator::GlslGenerator(BackendTarget target)
    : ShaderGenerator(std::move(target)) {}

std::string GlslGenerator::typeName(ValueType type) const {
    switch (type) {
        case ValueType::U32: return "uint";
        case ValueType::F32: return "float";
        case ValueType::Vec2F: return "vec2";
        case ValueType::Vec4F: return "vec4";
        case ValueType::Mat4F: return "mat4";
    }
    return "?";
}

std::string GlslGenerator::reference(const Expr& e) const {
    if (e.kind == ExprKind::Uniform) {
        return e.block + "." + e.name;
    }
    // Attributes and varyings are globals in GLSL
    return e.name;
}

std::string GlslGenerator::convertToF32(const std::string& value) const {
    return "float(" + value + ")";
}

std::string GlslGenerator::sampleTexture(const Expr& e, const std::string& uv) const {
    if (m_target.caps.separateSamplers) {
        return "texture(sampler2D(" + e.name + ", " + e.samplerName + "), " + uv + ")";
    }
    // Combined image sampler carries the texture's name
    return "texture(" + e.name + ", " + uv + ")";
}

std::string GlslGenerator::versionLine() const {
    std::string line = "#version " + std::to_string(m_target.glslVersion);
    if (m_target.glslEs) line += " es";
    return line + "\n";
}

std::string GlslGenerator::precisionBlock() const {
    if (!m_target.caps.precisionQualifiers) return "";
    return "precision highp float;\nprecision highp int;\n\n";
}

std::string GlslGenerator::layoutQualifier(const ResourceBinding& binding, const std::string& extra) const {
    std::vector<std::string> parts;
    if (!extra.empty()) parts.push_back(extra);

    if (m_target.caps.explicitBindingQualifiers) {
        // Descriptor sets exist only in Vulkan GLSL
        if (!m_target.glslEs && m_target.glslVersion >= 450) {
            parts.push_back("set = " + std::to_string(binding.group));
        }
        parts.push_back("binding = " + std::to_string(binding.binding));
    }

    if (parts.empty()) return "";

    std::string s = "layout(";
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) s += ", ";
        s += parts[i];
    }
    return s + ") ";
}

std::string GlslGenerator::vertexSource(const ShaderProgram& program, const BindingLayout& layout) const {
    std::ostringstream ss;
    ss << versionLine() << header() << "\n" << precisionBlock();

    for (const auto& a : program.vertexLayout.attributes) {
        ValueType type = formatValueType(a.format);
        ss << "layout(location = " << a.location << ") in " << typeName(type) << " " << a.name << ";\n";
    }
    ss << "\n";

    const ResourceBinding* ubo = layout.find(program.uniforms.instanceName);
    ss << layoutQualifier(*ubo, "std140") << "uniform " << program.uniforms.typeName << " {\n";
    for (const auto& m : program.uniforms.members) {
        ss << "    " << typeName(m.type) << " " << m.name << ";\n";
    }
    ss << "} " << program.uniforms.instanceName << ";\n\n";

    for (const auto& v : program.varyings) {
        if (m_target.caps.varyingLocations) {
            ss << "layout(location = " << v.location << ") ";
        }
        ss << "out " << typeName(v.type) << " " << v.name << ";\n";
    }
    ss << "\n";

    ss << "void main() {\n";
    for (size_t i = 0; i < program.varyings.size(); ++i) {
        ss << "    " << program.varyings[i].name << " = " << expression(program.varyingValues[i]) << ";\n";
    }
    ss << "    gl_Position = " << expression(program.clipPosition) << ";\n";
    ss << "}\n";
    return ss.str();
}

std::string GlslGenerator::fragmentSource(const ShaderProgram& program, const BindingLayout& layout) const {
    std::ostringstream ss;
    ss << versionLine() << header() << "\n" << precisionBlock();

    for (const auto& v : program.varyings) {
        if (m_target.caps.varyingLocations) {
            ss << "layout(location = " << v.location << ") ";
        }
        ss << "in " << typeName(v.type) << " " << v.name << ";\n";
    }
    ss << "\n";

    const ResourceBinding* texture = layout.find(program.textureName);
    if (m_target.caps.separateSamplers) {
        const ResourceBinding* sampler = layout.find(program.samplerName);
        ss << layoutQualifier(*texture, "") << "uniform texture2D " << texture->name << ";\n";
        ss << layoutQualifier(*sampler, "") << "uniform sampler " << sampler->name << ";\n";
    } else {
        ss << layoutQualifier(*texture, "") << "uniform sampler2D " << texture->name << ";\n";
    }
    ss << "\n";

    ss << "layout(location = 0) out vec4 " << FRAGMENT_OUTPUT << ";\n\n";

    ss << "void main() {\n";
    ss << "    " << FRAGMENT_OUTPUT << " = " << expression(program.fragmentColor) << ";\n";
    ss << "}\n";
    return ss.str();
}

GeneratedShader GlslGenerator::emit(const ShaderProgram& program, const BindingLayout& layout) const {
    GeneratedShader result;
    result.targetName = m_target.name;
    result.backend = Backend::Glsl;
    result.vertexEntry = "main";
    result.fragmentEntry = "main";
    result.sources.push_back({ShaderStage::Vertex, ".vert", vertexSource(program, layout)});
    result.sources.push_back({ShaderStage::Fragment, ".frag", fragmentSource(program, layout)});
    return result;
}

} // namespace uishade::shader
