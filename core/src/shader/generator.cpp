#include <uishade/shader/generator.h>
#include <uishade/shader/lowering.h>

#include <iomanip>
#include <locale>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace uishade::shader {

const ShaderSource* GeneratedShader::sourceFor(ShaderStage stage) const {
    for (const auto& s : sources) {
        if (hasStage(s.stages, stage)) return &s;
    }
    return nullptr;
}

ShaderGenerator::ShaderGenerator(BackendTarget target)
    : m_target(std::move(target)) {}

GeneratedShader ShaderGenerator::generate(const ShaderProgram& program) const {
    std::string error = program.validate();
    if (!error.empty()) {
        throw std::invalid_argument("[" + m_target.name + "] invalid program: " + error);
    }

    BindingLayout layout = m_target.bindingLayout();
    error = layout.validate();
    if (!error.empty()) {
        throw std::invalid_argument("[" + m_target.name + "] invalid binding layout: " + error);
    }

    for (const auto& name : {program.uniforms.instanceName, program.textureName, program.samplerName}) {
        if (!layout.find(name)) {
            throw std::invalid_argument("[" + m_target.name + "] binding layout has no '" + name + "'");
        }
    }

    return emit(lowerForTarget(program, m_target), layout);
}

std::string ShaderGenerator::header() const {
    return "// Generated by uishade for target '" + m_target.name + "'. Do not edit.\n";
}

std::string ShaderGenerator::literalU32(uint32_t value) const {
    const Capabilities& caps = m_target.caps;

    std::ostringstream ss;
    ss.imbue(std::locale::classic());

    // Masks read better in hex: 0xFF rather than 255
    bool isMask = value >= 0xF && (value & (value + 1)) == 0;
    if (isMask && caps.hexLiterals) {
        ss << "0x" << std::uppercase << std::hex << value;
    } else {
        ss << value;
    }

    if (caps.unsignedLiteralSuffix) {
        return ss.str() + "u";
    }
    return typeName(ValueType::U32) + "(" + ss.str() + ")";
}

std::string ShaderGenerator::literalF32(float value) const {
    std::ostringstream ss;
    ss.imbue(std::locale::classic());
    ss << std::setprecision(9) << value;
    std::string s = ss.str();
    if (s.find_first_of(".eE") == std::string::npos) {
        s += ".0";
    }
    return s;
}

std::string ShaderGenerator::expression(const ExprPtr& e) const {
    static const char* SWIZZLE = "xyzw";

    switch (e->kind) {
        case ExprKind::Attribute:
        case ExprKind::Uniform:
        case ExprKind::Varying:
            return reference(*e);

        case ExprKind::ConstU32:
            return literalU32(e->u32Value);

        case ExprKind::ConstF32:
            return literalF32(e->f32Value);

        case ExprKind::ToF32:
            return convertToF32(expression(e->operands[0]));

        case ExprKind::Binary:
            return "(" + expression(e->operands[0]) + " " + binaryOpSymbol(e->op) + " " +
                   expression(e->operands[1]) + ")";

        case ExprKind::MakeVec4: {
            std::string s = typeName(ValueType::Vec4F) + "(";
            for (size_t i = 0; i < e->operands.size(); ++i) {
                if (i > 0) s += ", ";
                s += expression(e->operands[i]);
            }
            return s + ")";
        }

        case ExprKind::Component:
            return expression(e->operands[0]) + "." + SWIZZLE[e->component];

        case ExprKind::MatVecMul:
            return "(" + expression(e->operands[0]) + " * " + expression(e->operands[1]) + ")";

        case ExprKind::SampleTexture:
            return sampleTexture(*e, expression(e->operands[0]));
    }

    throw std::invalid_argument("unhandled expression kind");
}

std::unique_ptr<ShaderGenerator> createGenerator(const BackendTarget& target) {
    switch (target.backend) {
        case Backend::Wgsl: return std::make_unique<WgslGenerator>(target);
        case Backend::Glsl: return std::make_unique<GlslGenerator>(target);
    }
    throw std::invalid_argument("unknown backend for target '" + target.name + "'");
}

GeneratedShader generateShader(const ShaderProgram& program, const BackendTarget& target) {
    return createGenerator(target)->generate(program);
}

} // namespace uishade::shader
