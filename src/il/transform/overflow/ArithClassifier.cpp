//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the arithmetic classifier.  Structural checks run before the
// qualification test so that a broken arithmetic instruction is reported even
// when its type would not be guarded.
//
//===----------------------------------------------------------------------===//

#include "il/transform/overflow/ArithClassifier.hpp"

#include "il/core/OpcodeInfo.hpp"

namespace sentinel::il::transform::overflow
{

using namespace sentinel::il::core;

namespace
{

ClassifyResult malformed(const Instr &instr, std::string detail)
{
    ClassifyResult r;
    r.kind = Classification::Malformed;
    r.reason = std::string(core::toString(instr.op)) + ": " + std::move(detail);
    return r;
}

} // namespace

const char *toString(GuardOp op) noexcept
{
    switch (op)
    {
        case GuardOp::Add:
            return "add";
        case GuardOp::Sub:
            return "sub";
        case GuardOp::Mul:
            return "mul";
        case GuardOp::Div:
            return "sdiv";
    }
    return "?";
}

const char *toString(Width w) noexcept
{
    switch (w)
    {
        case Width::W8:
            return "i8";
        case Width::W16:
            return "i16";
        case Width::W32:
            return "i32";
    }
    return "?";
}

std::optional<GuardOp> guardOpFor(Opcode op) noexcept
{
    switch (op)
    {
        case Opcode::Add:
            return GuardOp::Add;
        case Opcode::Sub:
            return GuardOp::Sub;
        case Opcode::Mul:
            return GuardOp::Mul;
        case Opcode::SDiv:
            return GuardOp::Div;
        default:
            return std::nullopt;
    }
}

std::optional<Width> guardWidthFor(Type::Kind kind) noexcept
{
    switch (kind)
    {
        case Type::Kind::I8:
            return Width::W8;
        case Type::Kind::I16:
            return Width::W16;
        case Type::Kind::I32:
            return Width::W32;
        default:
            return std::nullopt;
    }
}

ClassifyResult classifyNode(const Instr &instr)
{
    if (!isArithmetic(instr.op))
        return {};

    const Type::Kind kind = instr.type.kind;
    if (!isInteger(kind) || kind == Type::Kind::I1)
        return malformed(instr, "non-integer operand type " + instr.type.toString());
    if (instr.operands.size() != 2)
        return malformed(instr, "expected 2 operands, found " + std::to_string(instr.operands.size()));
    if (!instr.result)
        return malformed(instr, "missing result");
    if ((instr.op == Opcode::SDiv || instr.op == Opcode::SRem) && !isSignedInteger(kind))
        return malformed(instr, "signed division on " + instr.type.toString());
    if ((instr.op == Opcode::UDiv || instr.op == Opcode::URem) && isSignedInteger(kind))
        return malformed(instr, "unsigned division on " + instr.type.toString());

    if (instr.arith.overflowChecked || instr.arith.guardInternal)
        return {};

    const auto op = guardOpFor(instr.op);
    const auto width = guardWidthFor(kind);
    if (!op || !width)
        return {};

    ClassifyResult r;
    r.kind = Classification::Qualifies;
    r.site = ArithSite{*op, *width};
    return r;
}

std::optional<ArithSite> classify(const Instr &instr)
{
    auto r = classifyNode(instr);
    if (r.kind != Classification::Qualifies)
        return std::nullopt;
    return r.site;
}

} // namespace sentinel::il::transform::overflow
