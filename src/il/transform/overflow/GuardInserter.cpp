//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements guard lowering and block splicing.  A guarded instruction
//
//     %t = add i8 %a, %b
//
// becomes
//
//     <check instructions>           ; still in the original block
//     cbr %ovf, ovf.fault.N, ovf.cont.N
//   ovf.fault.N:
//     %s = const_str @ovf.msg
//     call @rt_panic(%s)
//     trap
//   ovf.cont.N:
//     %t = add i8 %a, %b !checked
//     <rest of the original block>
//
//===----------------------------------------------------------------------===//

#include "il/transform/overflow/GuardInserter.hpp"

#include "common/IntegerHelpers.hpp"
#include "il/core/Function.hpp"
#include "il/core/Module.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace sentinel::il::transform::overflow
{

using namespace sentinel::il::core;
using support::Expected;
using support::makeError;

namespace
{

Type typeForBits(int bits)
{
    switch (bits)
    {
        case 1:
            return Type(Type::Kind::I1);
        case 8:
            return Type(Type::Kind::I8);
        case 16:
            return Type(Type::Kind::I16);
        case 32:
            return Type(Type::Kind::I32);
        default:
            return Type(Type::Kind::I64);
    }
}

Opcode opcodeFor(Expr::Kind kind)
{
    switch (kind)
    {
        case Expr::Kind::Add:
            return Opcode::Add;
        case Expr::Kind::Sub:
            return Opcode::Sub;
        case Expr::Kind::Mul:
            return Opcode::Mul;
        case Expr::Kind::SDiv:
            return Opcode::SDiv;
        case Expr::Kind::BitOr:
        case Expr::Kind::Or:
            return Opcode::Or;
        case Expr::Kind::And:
            return Opcode::And;
        case Expr::Kind::Sext:
            return Opcode::Sext;
        case Expr::Kind::Zext:
            return Opcode::Zext;
        case Expr::Kind::Eq:
            return Opcode::ICmpEq;
        case Expr::Kind::Ne:
            return Opcode::ICmpNe;
        case Expr::Kind::Lt:
            return Opcode::SCmpLT;
        case Expr::Kind::Le:
            return Opcode::SCmpLE;
        case Expr::Kind::Gt:
            return Opcode::SCmpGT;
        case Expr::Kind::Ge:
            return Opcode::SCmpGE;
        default:
            break;
    }
    throw std::logic_error("expression kind has no opcode");
}

/// @brief Operand @p v as seen by the guarded instruction.
/// @details Integer literals are reduced to @p bits the way the instruction
///          itself reduces them, so the check sees the value it computes with.
Value operandLeaf(const Value &v, int bits)
{
    if (v.kind != Value::Kind::ConstInt || v.isBool)
        return v;
    return Value::constInt(
        sentinel::common::integer::narrow_to(v.i64, bits, sentinel::common::integer::OverflowPolicy::Wrap));
}

/// @brief Emit the predicate's steps in order; each step yields one value.
Value lowerPredicate(const Instr &node,
                     const OverflowPredicate &pred,
                     GuardNames &names,
                     std::vector<Instr> &out)
{
    std::vector<Value> values(pred.steps.size());

    auto append = [&](const Expr &expr, std::vector<Value> operands)
    {
        Instr instr;
        instr.result = names.nextTemp();
        instr.op = opcodeFor(expr.kind);
        instr.type = typeForBits(expr.bits);
        instr.operands = std::move(operands);
        instr.loc = node.loc;
        instr.arith.guardInternal = true;
        out.push_back(std::move(instr));
        return Value::temp(*out.back().result);
    };

    for (std::size_t i = 0; i < pred.steps.size(); ++i)
    {
        const PredicateStep &step = pred.steps[i];
        const Expr &expr = *step.expr;
        switch (expr.kind)
        {
            case Expr::Kind::Left:
                values[i] = operandLeaf(node.operands[0], expr.bits);
                break;
            case Expr::Kind::Right:
                values[i] = operandLeaf(node.operands[1], expr.bits);
                break;
            case Expr::Kind::Const:
                values[i] = Value::constInt(expr.value);
                break;
            case Expr::Kind::Sext:
                // A literal is already its own sign extension.
                if (values[step.lhs].kind == Value::Kind::ConstInt)
                    values[i] = values[step.lhs];
                else
                    values[i] = append(expr, {values[step.lhs]});
                break;
            case Expr::Kind::Zext:
                values[i] = append(expr, {values[step.lhs]});
                break;
            default:
                values[i] = append(expr, {values[step.lhs], values[step.rhs]});
                break;
        }
    }
    return values.back();
}

std::vector<Instr> buildFaultPath(const Instr &node, GuardNames &names)
{
    std::vector<Instr> fault;

    Instr msg;
    msg.result = names.nextTemp();
    msg.op = Opcode::ConstStr;
    msg.type = Type(Type::Kind::Str);
    msg.operands.push_back(Value::global(kPanicMessageGlobal));
    msg.loc = node.loc;
    const Value msgValue = Value::temp(*msg.result);
    fault.push_back(std::move(msg));

    Instr call;
    call.op = Opcode::Call;
    call.type = Type(Type::Kind::Void);
    call.callee = kPanicFunction;
    call.operands.push_back(msgValue);
    call.loc = node.loc;
    fault.push_back(std::move(call));

    Instr trap;
    trap.op = Opcode::Trap;
    trap.type = Type(Type::Kind::Void);
    trap.loc = node.loc;
    fault.push_back(std::move(trap));
    return fault;
}

} // namespace

GuardNames::GuardNames(const Function &fn)
{
    auto see = [this](unsigned id) { nextTemp_ = std::max(nextTemp_, id + 1); };
    for (const auto &p : fn.params)
        see(p.id);
    for (const auto &bb : fn.blocks)
    {
        labels_.insert(bb.label);
        for (const auto &p : bb.params)
            see(p.id);
        for (const auto &in : bb.instructions)
        {
            if (in.result)
                see(*in.result);
        }
    }
}

unsigned GuardNames::nextTemp()
{
    return nextTemp_++;
}

void GuardNames::nextLabels(std::string &fault, std::string &cont)
{
    for (;; ++nextLabel_)
    {
        const std::string suffix = std::to_string(nextLabel_);
        fault = "ovf.fault." + suffix;
        cont = "ovf.cont." + suffix;
        if (!labels_.count(fault) && !labels_.count(cont))
            break;
    }
    ++nextLabel_;
    labels_.insert(fault);
    labels_.insert(cont);
}

InstrumentedNode insertGuard(const Instr &node, const OverflowPredicate &pred, GuardNames &names)
{
    InstrumentedNode out;
    out.condition = lowerPredicate(node, pred, names, out.check);

    out.original = node;
    out.original.arith.overflowChecked = true;

    names.nextLabels(out.faultLabel, out.contLabel);
    out.fault = buildFaultPath(node, names);
    return out;
}

std::size_t spliceGuard(Function &fn, std::size_t blockIdx, std::size_t instrIdx, InstrumentedNode guarded)
{
    BasicBlock cont;
    cont.label = std::move(guarded.contLabel);
    cont.instructions.push_back(std::move(guarded.original));

    {
        BasicBlock &head = fn.blocks[blockIdx];
        auto split = head.instructions.begin() + static_cast<std::ptrdiff_t>(instrIdx);
        cont.instructions.insert(cont.instructions.end(),
                                 std::make_move_iterator(std::next(split)),
                                 std::make_move_iterator(head.instructions.end()));
        cont.terminated = head.terminated;
        head.instructions.erase(split, head.instructions.end());

        head.instructions.insert(head.instructions.end(),
                                 std::make_move_iterator(guarded.check.begin()),
                                 std::make_move_iterator(guarded.check.end()));
        Instr branch;
        branch.op = Opcode::CBr;
        branch.type = Type(Type::Kind::Void);
        branch.operands.push_back(std::move(guarded.condition));
        branch.labels = {guarded.faultLabel, cont.label};
        branch.brArgs = {{}, {}};
        branch.loc = cont.instructions.front().loc;
        head.instructions.push_back(std::move(branch));
        head.terminated = true;
    }

    BasicBlock fault;
    fault.label = std::move(guarded.faultLabel);
    fault.instructions = std::move(guarded.fault);
    fault.terminated = true;

    auto pos = fn.blocks.begin() + static_cast<std::ptrdiff_t>(blockIdx) + 1;
    pos = fn.blocks.insert(pos, std::move(fault));
    fn.blocks.insert(std::next(pos), std::move(cont));
    return blockIdx + 2;
}

Expected<void> ensurePanicDecl(Module &module)
{
    for (const auto &fn : module.functions)
    {
        if (fn.name == kPanicFunction)
            return makeError({}, std::string("function @") + kPanicFunction + " conflicts with the overflow runtime");
    }

    auto ext = std::find_if(module.externs.begin(),
                            module.externs.end(),
                            [](const Extern &e) { return e.name == kPanicFunction; });
    const bool haveExtern = ext != module.externs.end();
    if (haveExtern && (ext->retType.kind != Type::Kind::Void || ext->params.size() != 1 ||
                       ext->params[0].kind != Type::Kind::Str))
        return makeError({}, std::string("conflicting declaration of @") + kPanicFunction);

    auto glob = std::find_if(module.globals.begin(),
                             module.globals.end(),
                             [](const Global &g) { return g.name == kPanicMessageGlobal; });
    const bool haveGlobal = glob != module.globals.end();
    if (haveGlobal && (glob->type.kind != Type::Kind::Str || glob->init != kOverflowMessage))
        return makeError({}, std::string("conflicting definition of @") + kPanicMessageGlobal);

    if (!haveExtern)
        module.externs.push_back(Extern{kPanicFunction, Type(Type::Kind::Void), {Type(Type::Kind::Str)}});
    if (!haveGlobal)
        module.globals.push_back(Global{kPanicMessageGlobal, Type(Type::Kind::Str), kOverflowMessage});
    return {};
}

} // namespace sentinel::il::transform::overflow
