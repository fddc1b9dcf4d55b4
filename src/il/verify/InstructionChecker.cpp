//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements per-instruction verification.  Generic arity rules come from the
// opcode table; category-specific rules then check operand and result types.
// Integer literals adopt the type expected at their position.
//
//===----------------------------------------------------------------------===//

#include "il/verify/InstructionChecker.hpp"

#include "il/core/Module.hpp"
#include "il/core/OpcodeInfo.hpp"
#include "il/verify/DiagFormat.hpp"

namespace sentinel::il::verify
{

using namespace sentinel::il::core;
using support::Expected;
using support::makeError;

namespace
{

Expected<void> fail(const VerifyCtx &ctx, std::string_view message)
{
    return Expected<void>{
        makeError(ctx.instr.loc, formatInstrDiag(ctx.fn, ctx.block, ctx.instr, message))};
}

/// @brief Resolve the type of operand @p index, failing on undefined temporaries.
Expected<void> operandType(const VerifyCtx &ctx, size_t index, Type constType, Type &out)
{
    bool missing = false;
    out = ctx.types.valueType(ctx.instr.operands[index], constType, &missing);
    if (missing)
        return fail(ctx, "use of undefined value " + core::toString(ctx.instr.operands[index]));
    return {};
}

Expected<void> checkArity(const VerifyCtx &ctx)
{
    const auto &info = getOpcodeInfo(ctx.instr.op);
    const size_t count = ctx.instr.operands.size();
    if (count < info.numOperandsMin ||
        (!isVariadicOperandCount(info.numOperandsMax) && count > info.numOperandsMax))
        return fail(ctx, "invalid operand count");
    if (info.resultArity == ResultArity::One && !ctx.instr.result)
        return fail(ctx, "missing result");
    if (info.resultArity == ResultArity::None && ctx.instr.result)
        return fail(ctx, "unexpected result");
    if (ctx.instr.labels.size() != info.numSuccessors)
        return fail(ctx, "invalid successor count");
    return {};
}

Expected<void> checkIntegerBinary(const VerifyCtx &ctx)
{
    const Type type = ctx.instr.type;
    if (!isInteger(type.kind))
        return fail(ctx, "integer type required");
    if (getOpcodeInfo(ctx.instr.op).category == OpcodeCategory::Arithmetic &&
        type.kind == Type::Kind::I1)
        return fail(ctx, "arithmetic on i1");
    switch (ctx.instr.op)
    {
        case Opcode::SDiv:
        case Opcode::SRem:
            if (!isSignedInteger(type.kind))
                return fail(ctx, "signed division requires a signed type");
            break;
        case Opcode::UDiv:
        case Opcode::URem:
            if (isSignedInteger(type.kind))
                return fail(ctx, "unsigned division requires an unsigned type");
            break;
        default:
            break;
    }
    for (size_t i = 0; i < 2; ++i)
    {
        Type opType;
        if (auto r = operandType(ctx, i, type, opType); !r)
            return r;
        if (opType != type)
            return fail(ctx, "operand type mismatch");
    }
    return {};
}

Expected<void> checkCompare(const VerifyCtx &ctx)
{
    if (ctx.instr.type.kind != Type::Kind::I1)
        return fail(ctx, "comparison must produce i1");
    Type lhs;
    Type rhs;
    // Literal operands adopt the type of the other side.
    bool missing = false;
    lhs = ctx.types.valueType(ctx.instr.operands[0], Type(Type::Kind::Void), &missing);
    if (missing)
        return fail(ctx, "use of undefined value " + core::toString(ctx.instr.operands[0]));
    rhs = ctx.types.valueType(ctx.instr.operands[1], lhs, &missing);
    if (missing)
        return fail(ctx, "use of undefined value " + core::toString(ctx.instr.operands[1]));
    if (lhs.kind == Type::Kind::Void)
        lhs = rhs;
    if (lhs.kind == Type::Kind::Void)
        return {};
    if (!isInteger(lhs.kind) || lhs != rhs)
        return fail(ctx, "operand type mismatch");
    return {};
}

Expected<void> checkCast(const VerifyCtx &ctx)
{
    const Type type = ctx.instr.type;
    Type src;
    if (auto r = operandType(ctx, 0, type, src); !r)
        return r;
    if (!isInteger(type.kind) || !isInteger(src.kind))
        return fail(ctx, "integer type required");
    const int dstWidth = integerWidth(type.kind);
    const int srcWidth = integerWidth(src.kind);
    if (ctx.instr.op == Opcode::Trunc ? dstWidth >= srcWidth : dstWidth <= srcWidth)
        return fail(ctx, "invalid cast width");
    return {};
}

Expected<void> checkConstStr(const VerifyCtx &ctx)
{
    const Value &v = ctx.instr.operands[0];
    if (ctx.instr.type.kind != Type::Kind::Str || v.kind != Value::Kind::GlobalAddr)
        return fail(ctx, "const_str requires a global operand and str result");
    for (const auto &g : ctx.module.globals)
    {
        if (g.name == v.str)
            return {};
    }
    return fail(ctx, "unknown global @" + v.str);
}

Expected<void> checkCall(const VerifyCtx &ctx)
{
    auto it = ctx.signatures.find(ctx.instr.callee);
    if (it == ctx.signatures.end())
        return fail(ctx, "unknown callee @" + ctx.instr.callee);
    const Signature &sig = it->second;
    if (ctx.instr.operands.size() != sig.params.size())
        return fail(ctx, "call argument count mismatch");
    for (size_t i = 0; i < sig.params.size(); ++i)
    {
        Type argType;
        if (auto r = operandType(ctx, i, sig.params[i], argType); !r)
            return r;
        if (argType != sig.params[i])
            return fail(ctx, "call argument type mismatch");
    }
    if (ctx.instr.result && ctx.instr.type != sig.retType)
        return fail(ctx, "call result type mismatch");
    if (ctx.instr.result && sig.retType.kind == Type::Kind::Void)
        return fail(ctx, "void call cannot produce a result");
    return {};
}

Expected<void> checkControl(const VerifyCtx &ctx)
{
    switch (ctx.instr.op)
    {
        case Opcode::CBr:
        {
            Type cond;
            if (auto r = operandType(ctx, 0, Type(Type::Kind::I1), cond); !r)
                return r;
            if (cond.kind != Type::Kind::I1)
                return fail(ctx, "branch condition must be i1");
            return {};
        }
        case Opcode::Ret:
        {
            const bool isVoid = ctx.fn.retType.kind == Type::Kind::Void;
            if (isVoid != ctx.instr.operands.empty())
                return fail(ctx, "return value does not match function type");
            if (!isVoid)
            {
                Type value;
                if (auto r = operandType(ctx, 0, ctx.fn.retType, value); !r)
                    return r;
                if (value != ctx.fn.retType)
                    return fail(ctx, "return type mismatch");
            }
            return {};
        }
        default:
            return {};
    }
}

} // namespace

Expected<void> checkInstruction(const VerifyCtx &ctx)
{
    if (auto r = checkArity(ctx); !r)
        return r;
    switch (getOpcodeInfo(ctx.instr.op).category)
    {
        case OpcodeCategory::Arithmetic:
        case OpcodeCategory::Bitwise:
            return checkIntegerBinary(ctx);
        case OpcodeCategory::Compare:
            return checkCompare(ctx);
        case OpcodeCategory::Cast:
            return checkCast(ctx);
        case OpcodeCategory::Constant:
            return checkConstStr(ctx);
        case OpcodeCategory::Call:
            return checkCall(ctx);
        case OpcodeCategory::Control:
            return checkControl(ctx);
    }
    return fail(ctx, "unknown opcode");
}

} // namespace sentinel::il::verify
