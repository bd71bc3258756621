#pragma once

// uishade - Capability Lowering
// Rewrites a program into constructs a target can express, preserving every value exactly

#include <uishade/shader/backend.h>
#include <uishade/shader/ir.h>

namespace uishade::shader {

/**
 * @brief Rewrite integer bit operations into division and modulo
 *
 * x >> n       ->  x / 2^n      (n constant, n < 32)
 * x & (2^k-1)  ->  x % 2^k      (k < 32; all-ones mask drops out)
 *
 * Both forms are exact for u32. Throws std::invalid_argument for a shift or
 * mask that has no exact arithmetic equivalent.
 */
ExprPtr lowerBitwise(const ExprPtr& expr);

/**
 * @brief Lower a whole program for a target
 *
 * Returns the program unchanged when the target supports every construct.
 */
ShaderProgram lowerForTarget(const ShaderProgram& program, const BackendTarget& target);

/// True if the expression contains a >> or & node
bool usesBitwiseOps(const ExprPtr& expr);

} // namespace uishade::shader
