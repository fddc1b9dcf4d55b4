//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the overflow predicate builders.  With r the right operand and
// MIN/MAX the bounds of the guarded width:
//
//   add:  (r >= 0 && l > MAX - r) || (r < 0 && l < MIN - r)
//   sub:  (r <= 0 && l > MAX + r) || (r > 0 && l < MIN + r)
//   div:  r == -1 && l == MIN
//   mul (widen):         p = sext(l) * sext(r);  p < MIN || p > MAX
//   mul (back-division): p = l * r;  d = r | zext(r == 0);
//                        l != 0 && r != 0 && (p / d != l || (l == MIN && r == -1))
//
// Each boundary expression only overflows on the side its guard excludes, so
// evaluating both sides of every conjunction is safe.
//
//===----------------------------------------------------------------------===//

#include "il/transform/overflow/OverflowPredicate.hpp"

#include "common/IntegerHelpers.hpp"

#include <cstddef>
#include <stdexcept>
#include <unordered_map>
#include <utility>

namespace sentinel::il::transform::overflow
{

namespace integer = sentinel::common::integer;

namespace
{

using Kind = Expr::Kind;

ExprPtr node(Kind kind, int bits, ExprPtr a = nullptr, ExprPtr b = nullptr)
{
    return std::make_shared<const Expr>(Expr{kind, bits, 0, {std::move(a), std::move(b)}});
}

ExprPtr constant(long long value, int bits)
{
    return std::make_shared<const Expr>(Expr{Kind::Const, bits, value, {}});
}

ExprPtr cmp(Kind kind, ExprPtr a, ExprPtr b)
{
    return node(kind, 1, std::move(a), std::move(b));
}

ExprPtr both(ExprPtr a, ExprPtr b)
{
    return node(Kind::And, 1, std::move(a), std::move(b));
}

ExprPtr either(ExprPtr a, ExprPtr b)
{
    return node(Kind::Or, 1, std::move(a), std::move(b));
}

/// @brief Operand leaves shared by every builder for one width.
struct Leaves
{
    explicit Leaves(int w)
        : w(w), l(node(Kind::Left, w)), r(node(Kind::Right, w)),
          min(constant(integer::detail::min_for(w), w)), max(constant(integer::detail::max_for(w), w)),
          zero(constant(0, w)), minusOne(constant(-1, w))
    {
    }

    int w;
    ExprPtr l, r, min, max, zero, minusOne;
};

template <GuardOp Op, Width W> ExprPtr build(MulStrategy strategy);

template <Width W> ExprPtr buildAdd()
{
    const Leaves x(bits(W));
    auto positive = both(cmp(Kind::Ge, x.r, x.zero),
                         cmp(Kind::Gt, x.l, node(Kind::Sub, x.w, x.max, x.r)));
    auto negative = both(cmp(Kind::Lt, x.r, x.zero),
                         cmp(Kind::Lt, x.l, node(Kind::Sub, x.w, x.min, x.r)));
    return either(std::move(positive), std::move(negative));
}

template <Width W> ExprPtr buildSub()
{
    const Leaves x(bits(W));
    auto high = both(cmp(Kind::Le, x.r, x.zero),
                     cmp(Kind::Gt, x.l, node(Kind::Add, x.w, x.max, x.r)));
    auto low = both(cmp(Kind::Gt, x.r, x.zero),
                    cmp(Kind::Lt, x.l, node(Kind::Add, x.w, x.min, x.r)));
    return either(std::move(high), std::move(low));
}

template <Width W> ExprPtr buildDiv()
{
    const Leaves x(bits(W));
    return both(cmp(Kind::Eq, x.r, x.minusOne), cmp(Kind::Eq, x.l, x.min));
}

template <Width W> ExprPtr buildMulWiden()
{
    const Leaves x(bits(W));
    const int wide = 2 * x.w;
    auto product = node(Kind::Mul, wide, node(Kind::Sext, wide, x.l), node(Kind::Sext, wide, x.r));
    return either(cmp(Kind::Lt, product, constant(integer::detail::min_for(x.w), wide)),
                  cmp(Kind::Gt, product, constant(integer::detail::max_for(x.w), wide)));
}

template <Width W> ExprPtr buildMulBackDivision()
{
    const Leaves x(bits(W));
    auto product = node(Kind::Mul, x.w, x.l, x.r);
    auto rIsZero = cmp(Kind::Eq, x.r, x.zero);
    auto divisor = node(Kind::BitOr, x.w, x.r, node(Kind::Zext, x.w, rIsZero));
    auto quotient = node(Kind::SDiv, x.w, product, divisor);
    auto nonZero = both(cmp(Kind::Ne, x.l, x.zero), cmp(Kind::Ne, x.r, x.zero));
    auto minTimesMinusOne = both(cmp(Kind::Eq, x.l, x.min), cmp(Kind::Eq, x.r, x.minusOne));
    return both(std::move(nonZero), either(cmp(Kind::Ne, quotient, x.l), std::move(minTimesMinusOne)));
}

template <GuardOp Op, Width W> ExprPtr build([[maybe_unused]] MulStrategy strategy)
{
    if constexpr (Op == GuardOp::Add)
        return buildAdd<W>();
    else if constexpr (Op == GuardOp::Sub)
        return buildSub<W>();
    else if constexpr (Op == GuardOp::Div)
        return buildDiv<W>();
    else
        return strategy == MulStrategy::Widen ? buildMulWiden<W>() : buildMulBackDivision<W>();
}

using BuildFn = ExprPtr (*)(MulStrategy);

constexpr std::size_t kNumOps = 4;
constexpr std::size_t kNumWidths = 3;

constexpr std::size_t widthIndex(Width w)
{
    switch (w)
    {
        case Width::W8:
            return 0;
        case Width::W16:
            return 1;
        case Width::W32:
            return 2;
    }
    return kNumWidths;
}

constexpr std::array<Width, kNumWidths> kWidths = {Width::W8, Width::W16, Width::W32};

template <GuardOp Op, std::size_t... J>
constexpr std::array<BuildFn, kNumWidths> row(std::index_sequence<J...>)
{
    return {&build<Op, kWidths[J]>...};
}

template <std::size_t... I>
constexpr std::array<std::array<BuildFn, kNumWidths>, kNumOps> makeBuilders(std::index_sequence<I...>)
{
    return {row<static_cast<GuardOp>(I)>(std::make_index_sequence<kNumWidths>{})...};
}

/// Row i holds GuardOp(i), column j holds kWidths[j].
constexpr auto kBuilders = makeBuilders(std::make_index_sequence<kNumOps>{});

constexpr bool widthsIndexed()
{
    for (std::size_t j = 0; j < kNumWidths; ++j)
        if (widthIndex(kWidths[j]) != j)
            return false;
    return true;
}

static_assert(static_cast<std::size_t>(GuardOp::Div) + 1 == kNumOps, "a GuardOp has no builder row");
static_assert(widthIndex(Width::W32) + 1 == kNumWidths, "a Width has no builder column");
static_assert(widthsIndexed(), "builder columns out of order");

long long wrap(long long v, int bits)
{
    return integer::narrow_to(v, bits, integer::OverflowPolicy::Wrap);
}

/// @brief Append @p expr and its operands to @p steps in post-order.
int schedule(const Expr &expr, std::vector<PredicateStep> &steps, std::unordered_map<const Expr *, int> &seen)
{
    if (auto it = seen.find(&expr); it != seen.end())
        return it->second;
    PredicateStep step;
    step.expr = &expr;
    if (expr.ops[0])
        step.lhs = schedule(*expr.ops[0], steps, seen);
    if (expr.ops[1])
        step.rhs = schedule(*expr.ops[1], steps, seen);
    const int index = static_cast<int>(steps.size());
    steps.push_back(step);
    seen.emplace(&expr, index);
    return index;
}

long long apply(const Expr &expr, long long a, long long b, long long lhs, long long rhs)
{
    switch (expr.kind)
    {
        case Kind::Left:
            return wrap(lhs, expr.bits);
        case Kind::Right:
            return wrap(rhs, expr.bits);
        case Kind::Const:
            return wrap(expr.value, expr.bits);
        case Kind::Add:
            return wrap(integer::wrapping_add(a, b), expr.bits);
        case Kind::Sub:
            return wrap(integer::wrapping_sub(a, b), expr.bits);
        case Kind::Mul:
            return wrap(integer::wrapping_mul(a, b), expr.bits);
        case Kind::SDiv:
            // Divisors built by this file are never zero.
            if (b == 0)
                return 0;
            if (b == -1)
                return wrap(integer::wrapping_sub(0, a), expr.bits);
            return wrap(a / b, expr.bits);
        case Kind::BitOr:
            return wrap(a | b, expr.bits);
        case Kind::Sext:
            return a;
        case Kind::Zext:
            return a & 1;
        case Kind::Eq:
            return a == b;
        case Kind::Ne:
            return a != b;
        case Kind::Lt:
            return a < b;
        case Kind::Le:
            return a <= b;
        case Kind::Gt:
            return a > b;
        case Kind::Ge:
            return a >= b;
        case Kind::And:
            return a & b;
        case Kind::Or:
            return a | b;
    }
    return 0;
}

} // namespace

OverflowPredicate buildPredicate(GuardOp op, Width width, MulStrategy strategy)
{
    const BuildFn fn = kBuilders[static_cast<std::size_t>(op)][widthIndex(width)];
    OverflowPredicate pred{op, width, fn(strategy), {}};
    std::unordered_map<const Expr *, int> seen;
    schedule(*pred.root, pred.steps, seen);
    if (pred.steps.size() > kMaxPredicateSteps)
        throw std::logic_error("overflow predicate exceeds step limit");
    return pred;
}

bool evaluate(const OverflowPredicate &pred, long long lhs, long long rhs)
{
    std::array<long long, kMaxPredicateSteps> values;
    const std::size_t n = pred.steps.size();
    for (std::size_t i = 0; i < n; ++i)
    {
        const PredicateStep &step = pred.steps[i];
        const long long a = step.lhs >= 0 ? values[static_cast<std::size_t>(step.lhs)] : 0;
        const long long b = step.rhs >= 0 ? values[static_cast<std::size_t>(step.rhs)] : 0;
        values[i] = apply(*step.expr, a, b, lhs, rhs);
    }
    return n != 0 && values[n - 1] != 0;
}

} // namespace sentinel::il::transform::overflow
