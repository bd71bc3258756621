#pragma once

/**
 * @file evaluator.h
 * @brief CPU interpreter for ShaderProgram
 *
 * Runs the vertex and fragment stages of a program for one vertex or one
 * fragment, with the same arithmetic a GPU uses: wrapping u32 integer math
 * and IEEE f32 floating point. Programs lowered for different targets can be
 * compared on the CPU to check that they compute the same values.
 *
 * @par Example
 * @code
 * auto ev = Evaluator::forTarget(buildUiProgram(), glslEs300Target());
 * VertexOutput out = ev.vertex(Vertex(10, 20, 0, 0, 0xFF0000FF), TransformUniforms(m));
 * @endcode
 */

#include <uishade/raster/texture.h>
#include <uishade/shader/backend.h>
#include <uishade/shader/ir.h>
#include <uishade/types.h>

#include <glm/glm.hpp>
#include <string>
#include <vector>

namespace uishade::shader {

/// Vertex stage results; varyings follow the program's varying order
struct StageOutputs {
    glm::vec4 clipPosition{0.0f};
    std::vector<glm::vec4> varyings;  ///< vec2 varyings use .xy
};

class Evaluator {
public:
    /// Throws std::invalid_argument if the program does not validate
    explicit Evaluator(ShaderProgram program);

    /// Evaluator for the program as lowered for a target
    static Evaluator forTarget(const ShaderProgram& program, const BackendTarget& target);

    const ShaderProgram& program() const { return m_program; }

    StageOutputs runVertex(const Vertex& vertex, const TransformUniforms& uniforms) const;

    /// @param varyings Interpolated values, in the program's varying order
    glm::vec4 runFragment(const std::vector<glm::vec4>& varyings, const raster::TextureSource& textures) const;

    /// @name UI program interface
    /// @{
    VertexOutput vertex(const Vertex& vertex, const TransformUniforms& uniforms) const;
    glm::vec4 fragment(const FragmentInput& input, const raster::TextureSource& textures) const;
    /// @}

private:
    struct Value {
        ValueType type = ValueType::F32;
        uint32_t u = 0;
        glm::vec4 v{0.0f};
        glm::mat4 m{1.0f};
    };

    struct Inputs {
        const Vertex* vertex = nullptr;
        const TransformUniforms* uniforms = nullptr;
        const std::vector<glm::vec4>* varyings = nullptr;
        const raster::TextureSource* textures = nullptr;
    };

    Value eval(const Expr& e, const Inputs& in) const;
    Value readAttribute(const Expr& e, const Inputs& in) const;
    Value readUniform(const Expr& e, const Inputs& in) const;
    Value readVarying(const Expr& e, const Inputs& in) const;
    static Value binary(BinaryOp op, const Value& a, const Value& b, ValueType resultType);

    int varyingIndex(const std::string& name) const;

    ShaderProgram m_program;
};

} // namespace uishade::shader
