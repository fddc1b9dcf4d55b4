//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/il/build/IRBuilder.cpp
// Purpose: Provide a structured API for constructing IL modules programmatically.
// Key invariants: Builder maintains a current function/block insertion context
//                 and monotonically increasing SSA identifiers.
// Ownership/Lifetime: Builder references a module owned by the caller.
//
//===----------------------------------------------------------------------===//

#include "il/build/IRBuilder.hpp"

#include "il/core/OpcodeInfo.hpp"

#include <cassert>
#include <stdexcept>

namespace sentinel::il::build
{

using namespace sentinel::il::core;
using namespace sentinel::support;

//===----------------------------------------------------------------------===//
// Debug Assertion Helpers
//===----------------------------------------------------------------------===//

#ifndef NDEBUG
static void assertUniqueLabelInFunction(const Function &fn, const std::string &label)
{
    for (const auto &block : fn.blocks)
    {
        assert(block.label != label && "block label already exists in function");
    }
}

static void assertUniqueExternName(const Module &mod, const std::string &name)
{
    for (const auto &ex : mod.externs)
    {
        assert(ex.name != name && "extern name already exists in module");
    }
}

static void assertValidParamTypes(const std::vector<Param> &params)
{
    for (const auto &p : params)
    {
        assert(p.type.kind != Type::Kind::Void && "parameter cannot have Void type");
    }
}
#endif // NDEBUG

/// @brief Construct a builder and seed the callee table from @p m.
/// @details Existing functions and externs become valid call targets so that
///          a builder can extend a partially populated module.
IRBuilder::IRBuilder(Module &m) : mod(m)
{
    for (const auto &fn : mod.functions)
        calleeReturnTypes[fn.name] = fn.retType;
    for (const auto &ex : mod.externs)
        calleeReturnTypes[ex.name] = ex.retType;
}

Extern &IRBuilder::addExtern(const std::string &name, Type ret, const std::vector<Type> &params)
{
#ifndef NDEBUG
    assert(!name.empty() && "extern name cannot be empty");
    assertUniqueExternName(mod, name);
#endif
    mod.externs.push_back({name, ret, params});
    calleeReturnTypes[name] = ret;
    return mod.externs.back();
}

Global &IRBuilder::addGlobalStr(const std::string &name, const std::string &value)
{
    assert(!name.empty() && "global name cannot be empty");
    mod.globals.push_back({name, Type(Type::Kind::Str), value});
    return mod.globals.back();
}

/// @brief Start a new function and reset per-function temporary numbering.
Function &IRBuilder::startFunction(const std::string &name,
                                   Type ret,
                                   const std::vector<Param> &params)
{
#ifndef NDEBUG
    assert(!name.empty() && "function name cannot be empty");
    assertValidParamTypes(params);
#endif
    mod.functions.push_back({name, ret, {}, {}, {}});
    calleeReturnTypes[name] = ret;
    curFunc = &mod.functions.back();
    curBlock = nullptr;
    nextTemp = 0;
    for (auto p : params)
    {
        Param np = p;
        np.id = nextTemp++;
        curFunc->params.push_back(np);
    }
    curFunc->valueNames.resize(nextTemp);
    for (const auto &p : curFunc->params)
        curFunc->valueNames[p.id] = p.name;
    return *curFunc;
}

BasicBlock &IRBuilder::createBlock(Function &fn,
                                   const std::string &label,
                                   const std::vector<Param> &params)
{
#ifndef NDEBUG
    assert(!label.empty() && "block label cannot be empty");
    assertUniqueLabelInFunction(fn, label);
    assertValidParamTypes(params);
#endif
    fn.blocks.push_back({label, {}, {}, false});
    BasicBlock &bb = fn.blocks.back();
    for (auto p : params)
    {
        Param np = p;
        np.id = nextTemp++;
        bb.params.push_back(np);
        if (fn.valueNames.size() <= np.id)
            fn.valueNames.resize(np.id + 1);
        fn.valueNames[np.id] = np.name;
    }
    return bb;
}

BasicBlock &IRBuilder::addBlock(Function &fn, const std::string &label)
{
    return createBlock(fn, label, {});
}

Value IRBuilder::blockParam(BasicBlock &bb, unsigned idx)
{
    assert(idx < bb.params.size());
    return Value::temp(bb.params[idx].id);
}

Value IRBuilder::param(Function &fn, unsigned idx)
{
    assert(idx < fn.params.size());
    return Value::temp(fn.params[idx].id);
}

void IRBuilder::setInsertPoint(BasicBlock &bb)
{
    curBlock = &bb;
}

Value IRBuilder::emitBinary(Opcode op, Type type, Value lhs, Value rhs, SourceLoc loc)
{
    assert((getOpcodeInfo(op).category == OpcodeCategory::Arithmetic ||
            getOpcodeInfo(op).category == OpcodeCategory::Bitwise) &&
           "emitBinary requires an arithmetic or bitwise opcode");
    Instr instr;
    instr.op = op;
    instr.type = type;
    instr.operands = {std::move(lhs), std::move(rhs)};
    instr.loc = loc;
    return emitValue(std::move(instr));
}

Value IRBuilder::emitCmp(Opcode op, Value lhs, Value rhs, SourceLoc loc)
{
    assert(getOpcodeInfo(op).category == OpcodeCategory::Compare &&
           "emitCmp requires a comparison opcode");
    Instr instr;
    instr.op = op;
    instr.type = Type(Type::Kind::I1);
    instr.operands = {std::move(lhs), std::move(rhs)};
    instr.loc = loc;
    return emitValue(std::move(instr));
}

Value IRBuilder::emitCast(Opcode op, Type type, Value v, SourceLoc loc)
{
    assert(getOpcodeInfo(op).category == OpcodeCategory::Cast && "emitCast requires a cast opcode");
    Instr instr;
    instr.op = op;
    instr.type = type;
    instr.operands.push_back(std::move(v));
    instr.loc = loc;
    return emitValue(std::move(instr));
}

void IRBuilder::br(BasicBlock &dst, const std::vector<Value> &args)
{
    assert(args.size() == dst.params.size() &&
           "branch argument count must match block parameter count");
    Instr instr;
    instr.op = Opcode::Br;
    instr.type = Type(Type::Kind::Void);
    instr.labels.push_back(dst.label);
    instr.brArgs.push_back(args);
    append(std::move(instr));
}

void IRBuilder::cbr(Value cond,
                    BasicBlock &t,
                    const std::vector<Value> &targs,
                    BasicBlock &f,
                    const std::vector<Value> &fargs)
{
    assert(targs.size() == t.params.size() &&
           "true branch argument count must match target block parameters");
    assert(fargs.size() == f.params.size() &&
           "false branch argument count must match target block parameters");
    Instr instr;
    instr.op = Opcode::CBr;
    instr.type = Type(Type::Kind::Void);
    instr.operands.push_back(cond);
    instr.labels.push_back(t.label);
    instr.labels.push_back(f.label);
    instr.brArgs.push_back(targs);
    instr.brArgs.push_back(fargs);
    append(std::move(instr));
}

/// @brief Append an instruction, tracking block termination.
Instr &IRBuilder::append(Instr instr)
{
    assert(curBlock && "insert point not set");
    assert(curFunc && "no active function");
#ifndef NDEBUG
    if (!isTerminator(instr.op))
    {
        assert(!curBlock->terminated &&
               "cannot append non-terminator instruction to terminated block");
    }
    for (const auto &operand : instr.operands)
    {
        if (operand.kind == Value::Kind::Temp)
        {
            assert(operand.id < nextTemp &&
                   "operand temp ID exceeds allocated temporaries (dangling reference)");
        }
    }
#endif
    if (isTerminator(instr.op))
    {
        assert(!curBlock->terminated && "block already terminated");
        curBlock->terminated = true;
    }
    curBlock->instructions.push_back(std::move(instr));
    return curBlock->instructions.back();
}

Value IRBuilder::emitValue(Instr instr)
{
    const unsigned id = reserveTempId();
    instr.result = id;
    append(std::move(instr));
    return Value::temp(id);
}

void IRBuilder::emitCall(const std::string &callee,
                         const std::vector<Value> &args,
                         const std::optional<Value> &dst,
                         SourceLoc loc)
{
    Instr instr;
    instr.op = Opcode::Call;
    const auto it = calleeReturnTypes.find(callee);
    if (it == calleeReturnTypes.end())
        throw std::logic_error("emitCall: unknown callee '" + callee + "'");
    instr.type = it->second;
    instr.callee = callee;
    instr.operands = args;
    if (dst)
    {
        instr.result = dst->id;
        if (dst->id >= nextTemp)
        {
            nextTemp = dst->id + 1;
            if (curFunc->valueNames.size() <= dst->id)
                curFunc->valueNames.resize(dst->id + 1);
        }
    }
    instr.loc = loc;
    append(std::move(instr));
}

void IRBuilder::emitRet(const std::optional<Value> &v, SourceLoc loc)
{
    Instr instr;
    instr.op = Opcode::Ret;
    instr.type = Type(Type::Kind::Void);
    if (v)
        instr.operands.push_back(*v);
    instr.loc = loc;
    append(std::move(instr));
}

void IRBuilder::emitTrap(SourceLoc loc)
{
    Instr instr;
    instr.op = Opcode::Trap;
    instr.type = Type(Type::Kind::Void);
    instr.loc = loc;
    append(std::move(instr));
}

unsigned IRBuilder::reserveTempId()
{
    assert(curFunc && "reserveTempId requires an active function");
    unsigned id = nextTemp++;
    if (curFunc->valueNames.size() <= id)
        curFunc->valueNames.resize(id + 1);
    return id;
}

} // namespace sentinel::il::build
