#include <uishade/shader/ir.h>
#include <set>
#include <stdexcept>
#include <utility>

namespace uishade::shader {

const char* valueTypeName(ValueType type) {
    switch (type) {
        case ValueType::U32: return "u32";
        case ValueType::F32: return "f32";
        case ValueType::Vec2F: return "vec2f";
        case ValueType::Vec4F: return "vec4f";
        case ValueType::Mat4F: return "mat4f";
    }
    return "?";
}

ValueType formatValueType(VertexFormat format) {
    return format == VertexFormat::Uint32 ? ValueType::U32 : ValueType::Vec2F;
}

const char* binaryOpSymbol(BinaryOp op) {
    switch (op) {
        case BinaryOp::Add: return "+";
        case BinaryOp::Sub: return "-";
        case BinaryOp::Mul: return "*";
        case BinaryOp::Div: return "/";
        case BinaryOp::Mod: return "%";
        case BinaryOp::ShiftRight: return ">>";
        case BinaryOp::BitAnd: return "&";
    }
    return "?";
}

namespace ir {

static void require(bool condition, const std::string& message) {
    if (!condition) {
        throw std::invalid_argument("shader IR: " + message);
    }
}

static void requireOperand(const ExprPtr& e, const char* what) {
    require(e != nullptr, std::string(what) + " operand is null");
}

static std::shared_ptr<Expr> makeNamed(ExprKind kind, const std::string& name, ValueType type) {
    require(!name.empty(), "named input without a name");
    auto e = std::make_shared<Expr>();
    e->kind = kind;
    e->type = type;
    e->name = name;
    return e;
}

ExprPtr attribute(const std::string& name, ValueType type) {
    return makeNamed(ExprKind::Attribute, name, type);
}

ExprPtr uniform(const std::string& block, const std::string& member, ValueType type) {
    require(!block.empty(), "uniform '" + member + "' without a block");
    auto e = makeNamed(ExprKind::Uniform, member, type);
    e->block = block;
    return e;
}

ExprPtr varying(const std::string& name, ValueType type) {
    return makeNamed(ExprKind::Varying, name, type);
}

ExprPtr u32(uint32_t value) {
    auto e = std::make_shared<Expr>();
    e->kind = ExprKind::ConstU32;
    e->type = ValueType::U32;
    e->u32Value = value;
    return e;
}

ExprPtr f32(float value) {
    auto e = std::make_shared<Expr>();
    e->kind = ExprKind::ConstF32;
    e->type = ValueType::F32;
    e->f32Value = value;
    return e;
}

ExprPtr toF32(ExprPtr value) {
    requireOperand(value, "toF32");
    require(value->type == ValueType::U32, "toF32 expects u32");
    auto e = std::make_shared<Expr>();
    e->kind = ExprKind::ToF32;
    e->type = ValueType::F32;
    e->operands = {std::move(value)};
    return e;
}

ExprPtr binary(BinaryOp op, ExprPtr lhs, ExprPtr rhs) {
    requireOperand(lhs, binaryOpSymbol(op));
    requireOperand(rhs, binaryOpSymbol(op));

    bool integerOnly = op == BinaryOp::ShiftRight || op == BinaryOp::BitAnd;
    if (integerOnly) {
        require(lhs->type == ValueType::U32 && rhs->type == ValueType::U32,
                std::string("'") + binaryOpSymbol(op) + "' expects u32 operands");
        require(op != BinaryOp::ShiftRight || rhs->kind != ExprKind::ConstU32 || rhs->u32Value < 32,
                "shift amount must be below 32");
    } else if (op == BinaryOp::Mod) {
        require(lhs->type == ValueType::U32 && rhs->type == ValueType::U32,
                "'%' is only defined for u32 operands");
    } else {
        // Scalar broadcast is allowed for f32 on either side
        bool sameType = lhs->type == rhs->type;
        bool broadcast = (lhs->type == ValueType::F32 && rhs->type != ValueType::U32 && rhs->type != ValueType::Mat4F) ||
                         (rhs->type == ValueType::F32 && lhs->type != ValueType::U32 && lhs->type != ValueType::Mat4F);
        require(sameType || broadcast,
                std::string("mismatched operands for '") + binaryOpSymbol(op) + "': " +
                    valueTypeName(lhs->type) + ", " + valueTypeName(rhs->type));
        require(lhs->type != ValueType::Mat4F, "matrix arithmetic other than matMul is not supported");
    }

    auto e = std::make_shared<Expr>();
    e->kind = ExprKind::Binary;
    e->op = op;
    e->type = lhs->type == ValueType::F32 ? rhs->type : lhs->type;
    e->operands = {std::move(lhs), std::move(rhs)};
    return e;
}

ExprPtr add(ExprPtr lhs, ExprPtr rhs) { return binary(BinaryOp::Add, std::move(lhs), std::move(rhs)); }
ExprPtr sub(ExprPtr lhs, ExprPtr rhs) { return binary(BinaryOp::Sub, std::move(lhs), std::move(rhs)); }
ExprPtr mul(ExprPtr lhs, ExprPtr rhs) { return binary(BinaryOp::Mul, std::move(lhs), std::move(rhs)); }
ExprPtr div(ExprPtr lhs, ExprPtr rhs) { return binary(BinaryOp::Div, std::move(lhs), std::move(rhs)); }
ExprPtr mod(ExprPtr lhs, ExprPtr rhs) { return binary(BinaryOp::Mod, std::move(lhs), std::move(rhs)); }
ExprPtr shr(ExprPtr value, ExprPtr amount) { return binary(BinaryOp::ShiftRight, std::move(value), std::move(amount)); }
ExprPtr bitAnd(ExprPtr lhs, ExprPtr rhs) { return binary(BinaryOp::BitAnd, std::move(lhs), std::move(rhs)); }

ExprPtr vec4(ExprPtr x, ExprPtr y, ExprPtr z, ExprPtr w) {
    for (const auto* c : {&x, &y, &z, &w}) {
        requireOperand(*c, "vec4");
        require((*c)->type == ValueType::F32, "vec4 components must be f32");
    }
    auto e = std::make_shared<Expr>();
    e->kind = ExprKind::MakeVec4;
    e->type = ValueType::Vec4F;
    e->operands = {std::move(x), std::move(y), std::move(z), std::move(w)};
    return e;
}

ExprPtr vec4(ExprPtr xy, ExprPtr z, ExprPtr w) {
    requireOperand(xy, "vec4");
    requireOperand(z, "vec4");
    requireOperand(w, "vec4");
    require(xy->type == ValueType::Vec2F, "vec4(xy, z, w) expects a vec2f first operand");
    require(z->type == ValueType::F32 && w->type == ValueType::F32, "vec4 components must be f32");
    auto e = std::make_shared<Expr>();
    e->kind = ExprKind::MakeVec4;
    e->type = ValueType::Vec4F;
    e->operands = {std::move(xy), std::move(z), std::move(w)};
    return e;
}

ExprPtr component(ExprPtr vec, uint32_t index) {
    requireOperand(vec, "component");
    uint32_t size = vec->type == ValueType::Vec2F ? 2 : (vec->type == ValueType::Vec4F ? 4 : 0);
    require(size > 0, "component() expects a vector");
    require(index < size, "component index out of range");
    auto e = std::make_shared<Expr>();
    e->kind = ExprKind::Component;
    e->type = ValueType::F32;
    e->component = index;
    e->operands = {std::move(vec)};
    return e;
}

ExprPtr matMul(ExprPtr matrix, ExprPtr vec) {
    requireOperand(matrix, "matMul");
    requireOperand(vec, "matMul");
    require(matrix->type == ValueType::Mat4F && vec->type == ValueType::Vec4F,
            "matMul expects mat4f * vec4f");
    auto e = std::make_shared<Expr>();
    e->kind = ExprKind::MatVecMul;
    e->type = ValueType::Vec4F;
    e->operands = {std::move(matrix), std::move(vec)};
    return e;
}

ExprPtr sample(const std::string& texture, const std::string& sampler, ExprPtr uv) {
    requireOperand(uv, "sample");
    require(uv->type == ValueType::Vec2F, "texture coordinates must be vec2f");
    require(!texture.empty() && !sampler.empty(), "sample() needs a texture and a sampler");
    auto e = std::make_shared<Expr>();
    e->kind = ExprKind::SampleTexture;
    e->type = ValueType::Vec4F;
    e->name = texture;
    e->samplerName = sampler;
    e->operands = {std::move(uv)};
    return e;
}

} // namespace ir

const VaryingDecl* ShaderProgram::findVarying(const std::string& name) const {
    for (const auto& v : varyings) {
        if (v.name == name) return &v;
    }
    return nullptr;
}

const UniformMemberDecl* ShaderProgram::findUniform(const std::string& name) const {
    for (const auto& m : uniforms.members) {
        if (m.name == name) return &m;
    }
    return nullptr;
}

std::string ShaderProgram::validate() const {
    std::string layoutError = vertexLayout.validate();
    if (!layoutError.empty()) return layoutError;

    if (!clipPosition || clipPosition->type != ValueType::Vec4F) {
        return "clip position must be a vec4f expression";
    }
    if (!fragmentColor || fragmentColor->type != ValueType::Vec4F) {
        return "fragment color must be a vec4f expression";
    }
    if (varyings.size() != varyingValues.size()) {
        return "every varying needs exactly one value";
    }

    std::set<uint32_t> locations;
    for (size_t i = 0; i < varyings.size(); ++i) {
        if (!varyingValues[i] || varyingValues[i]->type != varyings[i].type) {
            return "varying '" + varyings[i].name + "' has a value of the wrong type";
        }
        if (!locations.insert(varyings[i].location).second) {
            return "duplicate varying location " + std::to_string(varyings[i].location);
        }
    }

    auto checkUniform = [&](const Expr& e) -> std::string {
        const UniformMemberDecl* member = e.block == uniforms.instanceName ? findUniform(e.name) : nullptr;
        if (!member) {
            return "unknown uniform '" + e.block + "." + e.name + "'";
        }
        if (member->type != e.type) {
            return "uniform '" + e.block + "." + e.name + "' read with the wrong type";
        }
        return {};
    };

    std::string error;
    auto checkVertexNode = [&](const Expr& e) {
        if (!error.empty()) return;
        if (e.kind == ExprKind::Varying) {
            error = "vertex stage reads varying '" + e.name + "'";
        } else if (e.kind == ExprKind::SampleTexture) {
            error = "vertex stage samples a texture";
        } else if (e.kind == ExprKind::Attribute) {
            const VertexAttribute* attr = vertexLayout.find(e.name);
            if (!attr) {
                error = "unknown vertex attribute '" + e.name + "'";
            } else if (formatValueType(attr->format) != e.type) {
                error = "vertex attribute '" + e.name + "' read with the wrong type";
            }
        } else if (e.kind == ExprKind::Uniform) {
            error = checkUniform(e);
        }
    };
    auto checkFragmentNode = [&](const Expr& e) {
        if (!error.empty()) return;
        if (e.kind == ExprKind::Attribute) {
            error = "fragment stage reads attribute '" + e.name + "'";
        } else if (e.kind == ExprKind::Varying) {
            const VaryingDecl* decl = findVarying(e.name);
            if (!decl) {
                error = "unknown varying '" + e.name + "'";
            } else if (decl->type != e.type) {
                error = "varying '" + e.name + "' read with the wrong type";
            }
        } else if (e.kind == ExprKind::SampleTexture &&
                   (e.name != textureName || e.samplerName != samplerName)) {
            error = "sample() refers to an undeclared texture or sampler";
        } else if (e.kind == ExprKind::Uniform) {
            error = checkUniform(e);
        }
    };

    visitExpr(clipPosition, checkVertexNode);
    for (const auto& v : varyingValues) {
        visitExpr(v, checkVertexNode);
    }
    visitExpr(fragmentColor, checkFragmentNode);
    return error;
}

} // namespace uishade::shader
