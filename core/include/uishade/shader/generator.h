#pragma once

/**
 * @file generator.h
 * @brief Backend code generators for ShaderProgram
 *
 * A generator prints one lowered ShaderProgram in a target's language. The
 * expression printer is shared; subclasses supply spelling (type names,
 * conversions, sampling) and the stage interface declarations.
 *
 * @par Example
 * @code
 * auto program = buildUiProgram();
 * GeneratedShader wgsl = generateShader(program, wgslTarget());
 * pipeline.init(device, wgsl, wgslTarget(), WGPUTextureFormat_BGRA8Unorm);
 * @endcode
 */

#include <uishade/shader/backend.h>
#include <uishade/shader/ir.h>

#include <memory>
#include <string>
#include <vector>

namespace uishade::shader {

/**
 * @brief One compilable source unit
 */
struct ShaderSource {
    ShaderStage stages;       ///< Stages whose entry points this source contains
    std::string fileSuffix;   ///< e.g. ".wgsl", ".vert", ".frag"
    std::string code;
};

/**
 * @brief Result of generating one program for one target
 */
struct GeneratedShader {
    std::string targetName;
    Backend backend = Backend::Wgsl;
    std::string vertexEntry;
    std::string fragmentEntry;
    std::vector<ShaderSource> sources;

    /// Source containing the given stage, or nullptr
    const ShaderSource* sourceFor(ShaderStage stage) const;
};

/**
 * @brief Base class for backend code generators
 */
class ShaderGenerator {
public:
    explicit ShaderGenerator(BackendTarget target);
    virtual ~ShaderGenerator() = default;

    const BackendTarget& target() const { return m_target; }

    /**
     * @brief Validate, lower and print a program
     *
     * Throws std::invalid_argument if the program is malformed or refers to a
     * resource that the target's binding layout does not declare.
     */
    GeneratedShader generate(const ShaderProgram& program) const;

protected:
    virtual GeneratedShader emit(const ShaderProgram& program, const BindingLayout& layout) const = 0;

    virtual std::string typeName(ValueType type) const = 0;
    virtual std::string reference(const Expr& e) const = 0;
    virtual std::string convertToF32(const std::string& value) const = 0;
    virtual std::string sampleTexture(const Expr& e, const std::string& uv) const = 0;

    /// Print an expression; every binary node is parenthesized
    std::string expression(const ExprPtr& e) const;

    std::string literalU32(uint32_t value) const;
    std::string literalF32(float value) const;

    std::string header() const;

    BackendTarget m_target;
};

class WgslGenerator : public ShaderGenerator {
public:
    explicit WgslGenerator(BackendTarget target);

protected:
    GeneratedShader emit(const ShaderProgram& program, const BindingLayout& layout) const override;
    std::string typeName(ValueType type) const override;
    std::string reference(const Expr& e) const override;
    std::string convertToF32(const std::string& value) const override;
    std::string sampleTexture(const Expr& e, const std::string& uv) const override;
};

class GlslGenerator : public ShaderGenerator {
public:
    explicit GlslGenerator(BackendTarget target);

protected:
    GeneratedShader emit(const ShaderProgram& program, const BindingLayout& layout) const override;
    std::string typeName(ValueType type) const override;
    std::string reference(const Expr& e) const override;
    std::string convertToF32(const std::string& value) const override;
    std::string sampleTexture(const Expr& e, const std::string& uv) const override;

private:
    std::string versionLine() const;
    std::string precisionBlock() const;
    std::string layoutQualifier(const ResourceBinding& binding, const std::string& extra) const;
    std::string vertexSource(const ShaderProgram& program, const BindingLayout& layout) const;
    std::string fragmentSource(const ShaderProgram& program, const BindingLayout& layout) const;
};

/// Generator for the target's backend
std::unique_ptr<ShaderGenerator> createGenerator(const BackendTarget& target);

/// Shorthand for createGenerator(target)->generate(program)
GeneratedShader generateShader(const ShaderProgram& program, const BackendTarget& target);

} // namespace uishade::shader
