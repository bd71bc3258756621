#include <uishade/shader/evaluator.h>
#include <uishade/shader/lowering.h>
#include <uishade/shader/ui_program.h>

#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>

namespace uishade::shader {

Evaluator::Evaluator(ShaderProgram program)
    : m_program(std::move(program)) {
    std::string error = m_program.validate();
    if (!error.empty()) {
        throw std::invalid_argument("Evaluator: " + error);
    }
}

Evaluator Evaluator::forTarget(const ShaderProgram& program, const BackendTarget& target) {
    return Evaluator(lowerForTarget(program, target));
}

int Evaluator::varyingIndex(const std::string& name) const {
    for (size_t i = 0; i < m_program.varyings.size(); ++i) {
        if (m_program.varyings[i].name == name) return static_cast<int>(i);
    }
    return -1;
}

StageOutputs Evaluator::runVertex(const Vertex& vertex, const TransformUniforms& uniforms) const {
    Inputs in;
    in.vertex = &vertex;
    in.uniforms = &uniforms;

    StageOutputs out;
    out.clipPosition = eval(*m_program.clipPosition, in).v;
    out.varyings.reserve(m_program.varyingValues.size());
    for (const auto& value : m_program.varyingValues) {
        out.varyings.push_back(eval(*value, in).v);
    }
    return out;
}

glm::vec4 Evaluator::runFragment(const std::vector<glm::vec4>& varyings,
                                 const raster::TextureSource& textures) const {
    if (varyings.size() != m_program.varyings.size()) {
        throw std::invalid_argument("Evaluator: fragment stage expects " +
                                    std::to_string(m_program.varyings.size()) + " varyings");
    }
    Inputs in;
    in.varyings = &varyings;
    in.textures = &textures;
    return eval(*m_program.fragmentColor, in).v;
}

VertexOutput Evaluator::vertex(const Vertex& vertex, const TransformUniforms& uniforms) const {
    StageOutputs stage = runVertex(vertex, uniforms);

    VertexOutput out;
    out.clipPosition = stage.clipPosition;
    int uv = varyingIndex(VARYING_TEX_COORD);
    int color = varyingIndex(VARYING_COLOR);
    if (uv >= 0) out.texCoord = glm::vec2(stage.varyings[uv]);
    if (color >= 0) out.color = stage.varyings[color];
    return out;
}

glm::vec4 Evaluator::fragment(const FragmentInput& input, const raster::TextureSource& textures) const {
    std::vector<glm::vec4> varyings(m_program.varyings.size(), glm::vec4(0.0f));
    int uv = varyingIndex(VARYING_TEX_COORD);
    int color = varyingIndex(VARYING_COLOR);
    if (uv >= 0) varyings[uv] = glm::vec4(input.texCoord, 0.0f, 0.0f);
    if (color >= 0) varyings[color] = input.color;
    return runFragment(varyings, textures);
}

Evaluator::Value Evaluator::readAttribute(const Expr& e, const Inputs& in) const {
    if (!in.vertex) {
        throw std::invalid_argument("Evaluator: attribute read outside the vertex stage");
    }
    const VertexAttribute* attr = m_program.vertexLayout.find(e.name);
    if (!attr || attr->offset + formatSize(attr->format) > sizeof(Vertex)) {
        throw std::invalid_argument("Evaluator: attribute '" + e.name + "' is not in the vertex record");
    }

    const auto* bytes = reinterpret_cast<const unsigned char*>(in.vertex);
    Value val;
    val.type = e.type;
    if (attr->format == VertexFormat::Uint32) {
        std::memcpy(&val.u, bytes + attr->offset, sizeof(uint32_t));
    } else {
        float xy[2];
        std::memcpy(xy, bytes + attr->offset, sizeof(xy));
        val.v = glm::vec4(xy[0], xy[1], 0.0f, 0.0f);
    }
    return val;
}

Evaluator::Value Evaluator::readUniform(const Expr& e, const Inputs& in) const {
    if (!in.uniforms) {
        throw std::invalid_argument("Evaluator: no uniforms bound");
    }
    const UniformMemberDecl* member = m_program.findUniform(e.name);
    if (!member || member->type != ValueType::Mat4F ||
        member->offset + sizeof(glm::mat4) > sizeof(TransformUniforms)) {
        throw std::invalid_argument("Evaluator: uniform '" + e.name + "' is not in the uniform block");
    }

    const auto* bytes = reinterpret_cast<const unsigned char*>(in.uniforms);
    Value val;
    val.type = ValueType::Mat4F;
    std::memcpy(&val.m, bytes + member->offset, sizeof(glm::mat4));
    return val;
}

Evaluator::Value Evaluator::readVarying(const Expr& e, const Inputs& in) const {
    if (!in.varyings) {
        throw std::invalid_argument("Evaluator: varying read outside the fragment stage");
    }
    int index = varyingIndex(e.name);
    if (index < 0) {
        throw std::invalid_argument("Evaluator: unknown varying '" + e.name + "'");
    }
    Value val;
    val.type = e.type;
    val.v = (*in.varyings)[index];
    if (e.type == ValueType::Vec2F) {
        val.v.z = 0.0f;
        val.v.w = 0.0f;
    }
    return val;
}

Evaluator::Value Evaluator::binary(BinaryOp op, const Value& a, const Value& b, ValueType resultType) {
    Value r;
    r.type = resultType;

    if (a.type == ValueType::U32) {
        switch (op) {
            case BinaryOp::Add: r.u = a.u + b.u; break;
            case BinaryOp::Sub: r.u = a.u - b.u; break;
            case BinaryOp::Mul: r.u = a.u * b.u; break;
            case BinaryOp::Div:
                if (b.u == 0) throw std::domain_error("Evaluator: u32 division by zero");
                r.u = a.u / b.u;
                break;
            case BinaryOp::Mod:
                if (b.u == 0) throw std::domain_error("Evaluator: u32 modulo by zero");
                r.u = a.u % b.u;
                break;
            case BinaryOp::ShiftRight:
                if (b.u >= 32) throw std::domain_error("Evaluator: shift amount " + std::to_string(b.u) + " is not below 32");
                r.u = a.u >> b.u;
                break;
            case BinaryOp::BitAnd: r.u = a.u & b.u; break;
        }
        return r;
    }

    // f32 scalars broadcast against vectors
    glm::vec4 x = a.type == ValueType::F32 ? glm::vec4(a.v.x) : a.v;
    glm::vec4 y = b.type == ValueType::F32 ? glm::vec4(b.v.x) : b.v;
    switch (op) {
        case BinaryOp::Add: r.v = x + y; break;
        case BinaryOp::Sub: r.v = x - y; break;
        case BinaryOp::Mul: r.v = x * y; break;
        case BinaryOp::Div: r.v = x / y; break;
        default:
            throw std::invalid_argument(std::string("Evaluator: '") + binaryOpSymbol(op) + "' on floats");
    }
    if (resultType == ValueType::F32) {
        r.v = glm::vec4(r.v.x, 0.0f, 0.0f, 0.0f);
    } else if (resultType == ValueType::Vec2F) {
        r.v.z = 0.0f;
        r.v.w = 0.0f;
    }
    return r;
}

Evaluator::Value Evaluator::eval(const Expr& e, const Inputs& in) const {
    switch (e.kind) {
        case ExprKind::Attribute:
            return readAttribute(e, in);

        case ExprKind::Uniform:
            return readUniform(e, in);

        case ExprKind::Varying:
            return readVarying(e, in);

        case ExprKind::ConstU32: {
            Value val;
            val.type = ValueType::U32;
            val.u = e.u32Value;
            return val;
        }

        case ExprKind::ConstF32: {
            Value val;
            val.type = ValueType::F32;
            val.v.x = e.f32Value;
            return val;
        }

        case ExprKind::ToF32: {
            Value src = eval(*e.operands[0], in);
            Value val;
            val.type = ValueType::F32;
            val.v.x = static_cast<float>(src.u);
            return val;
        }

        case ExprKind::Binary:
            return binary(e.op, eval(*e.operands[0], in), eval(*e.operands[1], in), e.type);

        case ExprKind::MakeVec4: {
            Value val;
            val.type = ValueType::Vec4F;
            if (e.operands.size() == 3) {
                Value xy = eval(*e.operands[0], in);
                val.v = glm::vec4(xy.v.x, xy.v.y, eval(*e.operands[1], in).v.x, eval(*e.operands[2], in).v.x);
            } else {
                for (int i = 0; i < 4; ++i) {
                    val.v[i] = eval(*e.operands[i], in).v.x;
                }
            }
            return val;
        }

        case ExprKind::Component: {
            Value src = eval(*e.operands[0], in);
            Value val;
            val.type = ValueType::F32;
            val.v.x = src.v[static_cast<int>(e.component)];
            return val;
        }

        case ExprKind::MatVecMul: {
            Value m = eval(*e.operands[0], in);
            Value v = eval(*e.operands[1], in);
            Value val;
            val.type = ValueType::Vec4F;
            val.v = m.m * v.v;
            return val;
        }

        case ExprKind::SampleTexture: {
            if (!in.textures) {
                throw std::invalid_argument("Evaluator: texture sampled outside the fragment stage");
            }
            Value uv = eval(*e.operands[0], in);
            Value val;
            val.type = ValueType::Vec4F;
            val.v = in.textures->sample(e.name, e.samplerName, glm::vec2(uv.v));
            return val;
        }
    }

    throw std::invalid_argument("Evaluator: unhandled expression kind");
}

} // namespace uishade::shader
