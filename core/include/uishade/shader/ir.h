#pragma once

/**
 * @file ir.h
 * @brief Typed expression IR for the UI shading stages
 *
 * The transform, color-decode and composite formulas are written once as
 * expression trees. Code generators print them for each backend and the
 * Evaluator interprets them on the CPU, so every backend is derived from the
 * same source.
 *
 * Nodes are immutable and shared. Builder functions check operand types and
 * throw std::invalid_argument for malformed expressions.
 *
 * @par Example
 * @code
 * auto c = ir::attribute("a_color", ValueType::U32);
 * auto red = ir::div(ir::toF32(ir::bitAnd(ir::shr(c, ir::u32(24)), ir::u32(0xFF))),
 *                    ir::f32(255.0f));
 * @endcode
 */

#include <uishade/shader/binding_layout.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace uishade::shader {

enum class ValueType {
    U32,
    F32,
    Vec2F,
    Vec4F,
    Mat4F
};

const char* valueTypeName(ValueType type);

/// Shader-side type of a vertex attribute of the given format
ValueType formatValueType(VertexFormat format);

enum class BinaryOp {
    Add,
    Sub,
    Mul,
    Div,
    Mod,
    ShiftRight,
    BitAnd
};

const char* binaryOpSymbol(BinaryOp op);

enum class ExprKind {
    Attribute,      ///< Vertex input read (vertex stage)
    Uniform,        ///< Uniform block member read
    Varying,        ///< Interpolated input read (fragment stage)
    ConstU32,
    ConstF32,
    ToF32,          ///< Numeric conversion u32 -> f32
    Binary,
    MakeVec4,       ///< vec4 from 4 scalars, or from a vec2 and 2 scalars
    Component,      ///< Single component of a vector
    MatVecMul,
    SampleTexture   ///< Filtered 2D texture read (fragment stage)
};

struct Expr;
using ExprPtr = std::shared_ptr<const Expr>;

struct Expr {
    ExprKind kind;
    ValueType type;
    std::string name;          ///< Attribute/uniform/varying/texture name
    std::string samplerName;   ///< SampleTexture only
    std::string block;         ///< Uniform only: uniform block instance
    uint32_t u32Value = 0;
    float f32Value = 0.0f;
    BinaryOp op = BinaryOp::Add;
    uint32_t component = 0;
    std::vector<ExprPtr> operands;
};

namespace ir {

ExprPtr attribute(const std::string& name, ValueType type);
ExprPtr uniform(const std::string& block, const std::string& member, ValueType type);
ExprPtr varying(const std::string& name, ValueType type);
ExprPtr u32(uint32_t value);
ExprPtr f32(float value);
ExprPtr toF32(ExprPtr value);
ExprPtr binary(BinaryOp op, ExprPtr lhs, ExprPtr rhs);
ExprPtr add(ExprPtr lhs, ExprPtr rhs);
ExprPtr sub(ExprPtr lhs, ExprPtr rhs);
ExprPtr mul(ExprPtr lhs, ExprPtr rhs);
ExprPtr div(ExprPtr lhs, ExprPtr rhs);
ExprPtr mod(ExprPtr lhs, ExprPtr rhs);
/// Logical shift right; a constant amount must be below 32
ExprPtr shr(ExprPtr value, ExprPtr amount);
ExprPtr bitAnd(ExprPtr lhs, ExprPtr rhs);
ExprPtr vec4(ExprPtr x, ExprPtr y, ExprPtr z, ExprPtr w);
ExprPtr vec4(ExprPtr xy, ExprPtr z, ExprPtr w);
ExprPtr component(ExprPtr vec, uint32_t index);
ExprPtr matMul(ExprPtr matrix, ExprPtr vec);
ExprPtr sample(const std::string& texture, const std::string& sampler, ExprPtr uv);

} // namespace ir

/// Interpolated value passed from the vertex to the fragment stage
struct VaryingDecl {
    std::string name;
    ValueType type;
    uint32_t location;
};

struct UniformMemberDecl {
    std::string name;
    ValueType type;
    uint32_t offset;
};

struct UniformBlockDecl {
    std::string typeName;       ///< Struct / block type name
    std::string instanceName;   ///< Matches the binding layout resource name
    std::vector<UniformMemberDecl> members;
};

/**
 * @brief A complete vertex + fragment program
 */
struct ShaderProgram {
    VertexLayout vertexLayout;
    UniformBlockDecl uniforms;
    std::string textureName;
    std::string samplerName;

    ExprPtr clipPosition;                ///< Vertex stage builtin position (Vec4F)
    std::vector<VaryingDecl> varyings;
    std::vector<ExprPtr> varyingValues;  ///< One per varying, same order
    ExprPtr fragmentColor;               ///< Fragment output at location 0 (Vec4F)

    const VaryingDecl* findVarying(const std::string& name) const;
    const UniformMemberDecl* findUniform(const std::string& name) const;

    /// Empty string when valid, otherwise a description of the first problem
    std::string validate() const;
};

/// Visit every node of an expression tree, parents before children
template <typename Fn>
void visitExpr(const ExprPtr& expr, Fn&& fn) {
    if (!expr) return;
    fn(*expr);
    for (const auto& child : expr->operands) {
        visitExpr(child, fn);
    }
}

} // namespace uishade::shader
