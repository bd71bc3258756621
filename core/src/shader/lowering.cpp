#include <uishade/shader/lowering.h>
#include <stdexcept>
#include <utility>

namespace uishade::shader {

static bool isConstU32(const ExprPtr& e) {
    return e && e->kind == ExprKind::ConstU32;
}

// Returns k when value == 2^k - 1, otherwise -1
static int lowMaskBits(uint32_t value) {
    if (value == 0xFFFFFFFFu) return 32;
    if ((value & (value + 1)) != 0) return -1;
    int bits = 0;
    while (value) {
        value >>= 1;
        ++bits;
    }
    return bits;
}

static ExprPtr withOperands(const Expr& node, std::vector<ExprPtr> operands) {
    auto copy = std::make_shared<Expr>(node);
    copy->operands = std::move(operands);
    return copy;
}

ExprPtr lowerBitwise(const ExprPtr& expr) {
    if (!expr) return expr;

    std::vector<ExprPtr> operands;
    operands.reserve(expr->operands.size());
    bool changed = false;
    for (const auto& child : expr->operands) {
        operands.push_back(lowerBitwise(child));
        changed = changed || operands.back() != child;
    }

    if (expr->kind == ExprKind::Binary && expr->op == BinaryOp::ShiftRight) {
        const ExprPtr& amount = operands[1];
        if (!isConstU32(amount) || amount->u32Value >= 32) {
            throw std::invalid_argument("lowering: shift amount must be a constant below 32");
        }
        if (amount->u32Value == 0) return operands[0];
        return ir::div(operands[0], ir::u32(1u << amount->u32Value));
    }

    if (expr->kind == ExprKind::Binary && expr->op == BinaryOp::BitAnd) {
        const ExprPtr* mask = &operands[1];
        const ExprPtr* value = &operands[0];
        if (!isConstU32(*mask)) {
            std::swap(mask, value);
        }
        int bits = isConstU32(*mask) ? lowMaskBits((*mask)->u32Value) : -1;
        if (bits < 0) {
            throw std::invalid_argument("lowering: '&' needs a constant low-bit mask");
        }
        if (bits == 32) return *value;
        if (bits == 0) return ir::u32(0);
        return ir::mod(*value, ir::u32(1u << bits));
    }

    return changed ? withOperands(*expr, std::move(operands)) : expr;
}

bool usesBitwiseOps(const ExprPtr& expr) {
    bool found = false;
    visitExpr(expr, [&](const Expr& e) {
        if (e.kind == ExprKind::Binary &&
            (e.op == BinaryOp::ShiftRight || e.op == BinaryOp::BitAnd)) {
            found = true;
        }
    });
    return found;
}

ShaderProgram lowerForTarget(const ShaderProgram& program, const BackendTarget& target) {
    if (target.caps.bitwiseIntegerOps) {
        return program;
    }

    ShaderProgram lowered = program;
    lowered.clipPosition = lowerBitwise(program.clipPosition);
    for (auto& value : lowered.varyingValues) {
        value = lowerBitwise(value);
    }
    lowered.fragmentColor = lowerBitwise(program.fragmentColor);
    return lowered;
}

} // namespace uishade::shader
