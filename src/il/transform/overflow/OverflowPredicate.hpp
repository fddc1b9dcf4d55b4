//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/il/transform/overflow/OverflowPredicate.hpp
// Purpose: Builds width-specific overflow conditions as small expression DAGs
//          that can be evaluated directly or lowered to IL.
// Key invariants: Every predicate is a pure function of the two operands.
//                 Intermediate nodes wrap at their own width, so lowering with
//                 wrapping IL arithmetic yields exactly evaluate()'s answer.
//                 A predicate never divides by a value that can be zero.
// Ownership/Lifetime: Nodes are immutable and shared through ExprPtr; a
//                     predicate keeps its whole DAG alive.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/transform/overflow/ArithClassifier.hpp"

#include <array>
#include <cstddef>
#include <memory>
#include <vector>

namespace sentinel::il::transform::overflow
{

struct Expr;
using ExprPtr = std::shared_ptr<const Expr>;

/// @brief One node of an overflow predicate.
struct Expr
{
    enum class Kind
    {
        Left,  ///< Left operand of the guarded instruction.
        Right, ///< Right operand of the guarded instruction.
        Const, ///< Literal @ref value.
        Add,
        Sub,
        Mul,
        SDiv, ///< Signed division; MIN / -1 wraps to MIN.
        BitOr,
        Sext, ///< Sign-extend ops[0] to @ref bits.
        Zext, ///< Zero-extend the i1 in ops[0] to @ref bits.
        Eq,
        Ne,
        Lt, ///< Signed comparisons from here to Ge.
        Le,
        Gt,
        Ge,
        And, ///< Logical and of two i1 values.
        Or,  ///< Logical or of two i1 values.
    };

    Kind kind;
    /// Result width in bits; 1 for comparisons and logical nodes.
    int bits;
    long long value = 0;
    std::array<ExprPtr, 2> ops{};
};

/// @brief How multiplication overflow is detected.
enum class MulStrategy
{
    /// Multiply in twice the width and range-check the product.
    Widen,
    /// Multiply in the original width and divide the product back.
    BackDivision,
};

/// @brief One node of a predicate in evaluation order.
struct PredicateStep
{
    const Expr *expr = nullptr;
    /// Indices of the steps producing ops[0] and ops[1]; -1 when absent.
    int lhs = -1;
    int rhs = -1;
};

/// @brief Upper bound on the number of distinct nodes in a predicate.
inline constexpr std::size_t kMaxPredicateSteps = 64;

/// @brief Overflow condition for one operation at one width.
struct OverflowPredicate
{
    GuardOp op;
    Width width;
    /// i1-valued root; true exactly when the operation overflows.
    ExprPtr root;
    /// Every distinct node of the DAG once, operands before users, root last.
    std::vector<PredicateStep> steps;
};

/// @brief Build the overflow condition for @p op at @p width.
/// @param strategy Only consulted for GuardOp::Mul.
OverflowPredicate buildPredicate(GuardOp op, Width width, MulStrategy strategy = MulStrategy::Widen);

/// @brief Evaluate @p pred for operands @p lhs and @p rhs.
/// @details Operands are first reduced to the predicate width, so callers may
///          pass any representation of an in-range value.
bool evaluate(const OverflowPredicate &pred, long long lhs, long long rhs);

} // namespace sentinel::il::transform::overflow
