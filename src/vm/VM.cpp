//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the reference interpreter.  Execution walks blocks by index and
// dispatches on the opcode category; every integer result is normalised to
// its IL type before it is stored.  Traps are C++ exceptions caught once in
// VM::run(), where the last recorded position locates them.
//
//===----------------------------------------------------------------------===//

#include "vm/VM.hpp"

#include "common/IntegerHelpers.hpp"
#include "il/core/OpcodeInfo.hpp"

#include <algorithm>

namespace sentinel::vm
{

using namespace sentinel::il::core;
namespace integer = sentinel::common::integer;

namespace
{

Slot intSlot(int64_t v)
{
    Slot s;
    s.i64 = v;
    return s;
}

int64_t normalize(int64_t v, Type::Kind kind)
{
    if (kind == Type::Kind::I1)
        return v & 1;
    if (!isInteger(kind))
        return v;
    const int w = integerWidth(kind);
    if (isSignedInteger(kind))
        return integer::narrow_to(v, w, integer::OverflowPolicy::Wrap);
    return integer::widen_to(v, w, integer::Signedness::Unsigned);
}

Slot normalizeSlot(Slot s, Type::Kind kind)
{
    if (isInteger(kind))
        s.i64 = normalize(s.i64, kind);
    return s;
}

int widthOf(Type::Kind kind)
{
    const int w = integerWidth(kind);
    return w > 0 ? w : 64;
}

[[noreturn]] void divideByZero()
{
    vm_raise(TrapKind::DivideByZero, "integer divide by zero");
}

int64_t binary(Opcode op, Type::Kind kind, int64_t a, int64_t b)
{
    const int w = widthOf(kind);
    const uint64_t mask = integer::detail::mask_for(w);
    const uint64_t ua = static_cast<uint64_t>(a) & mask;
    const uint64_t ub = static_cast<uint64_t>(b) & mask;
    const auto amount = static_cast<unsigned>(ub % static_cast<uint64_t>(w));

    switch (op)
    {
        case Opcode::Add:
            return integer::wrapping_add(a, b);
        case Opcode::Sub:
            return integer::wrapping_sub(a, b);
        case Opcode::Mul:
            return integer::wrapping_mul(a, b);
        case Opcode::SDiv:
            if (b == 0)
                divideByZero();
            return b == -1 ? integer::wrapping_sub(0, a) : a / b;
        case Opcode::SRem:
            if (b == 0)
                divideByZero();
            return b == -1 ? 0 : a % b;
        case Opcode::UDiv:
            if (ub == 0)
                divideByZero();
            return static_cast<int64_t>(ua / ub);
        case Opcode::URem:
            if (ub == 0)
                divideByZero();
            return static_cast<int64_t>(ua % ub);
        case Opcode::And:
            return a & b;
        case Opcode::Or:
            return a | b;
        case Opcode::Xor:
            return a ^ b;
        case Opcode::Shl:
            return static_cast<int64_t>(ua << amount);
        case Opcode::LShr:
            return static_cast<int64_t>(ua >> amount);
        case Opcode::AShr:
            return integer::widen_to(a, w, integer::Signedness::Signed) >> amount;
        default:
            break;
    }
    vm_raise(TrapKind::RuntimeError, std::string("unsupported opcode ") + il::core::toString(op));
}

bool compare(Opcode op, Type::Kind kind, int64_t a, int64_t b)
{
    const int w = widthOf(kind);
    const uint64_t mask = integer::detail::mask_for(w);
    const uint64_t ua = static_cast<uint64_t>(a) & mask;
    const uint64_t ub = static_cast<uint64_t>(b) & mask;
    const int64_t sa = integer::widen_to(a, w, integer::Signedness::Signed);
    const int64_t sb = integer::widen_to(b, w, integer::Signedness::Signed);

    switch (op)
    {
        case Opcode::ICmpEq:
            return ua == ub;
        case Opcode::ICmpNe:
            return ua != ub;
        case Opcode::SCmpLT:
            return sa < sb;
        case Opcode::SCmpLE:
            return sa <= sb;
        case Opcode::SCmpGT:
            return sa > sb;
        case Opcode::SCmpGE:
            return sa >= sb;
        case Opcode::UCmpLT:
            return ua < ub;
        case Opcode::UCmpLE:
            return ua <= ub;
        case Opcode::UCmpGT:
            return ua > ub;
        case Opcode::UCmpGE:
            return ua >= ub;
        default:
            break;
    }
    vm_raise(TrapKind::RuntimeError, std::string("unsupported opcode ") + il::core::toString(op));
}

int64_t cast(Opcode op, Type::Kind from, Type::Kind to, int64_t v)
{
    const int w = widthOf(from);
    switch (op)
    {
        case Opcode::Sext:
            return normalize(integer::widen_to(v, w, integer::Signedness::Signed), to);
        case Opcode::Zext:
            return normalize(integer::widen_to(v, w, integer::Signedness::Unsigned), to);
        default:
            return normalize(v, to);
    }
}

/// @brief Decrements the call depth when a frame unwinds.
struct DepthGuard
{
    explicit DepthGuard(unsigned &depth) : depth(depth)
    {
        ++depth;
    }

    ~DepthGuard()
    {
        --depth;
    }

    unsigned &depth;
};

} // namespace

struct VM::Frame
{
    const Function &fn;
    const FunctionInfo &info;
    std::vector<Slot> regs;

    Type::Kind kindOf(const Value &v, Type::Kind fallback) const
    {
        if (v.kind == Value::Kind::Temp && v.id < info.tempKinds.size() &&
            info.tempKinds[v.id] != Type::Kind::Void)
            return info.tempKinds[v.id];
        return fallback;
    }

    /// @brief Read @p v; literals are normalised to @p kind.
    Slot eval(const Value &v, Type::Kind kind) const
    {
        switch (v.kind)
        {
            case Value::Kind::Temp:
                if (v.id >= regs.size())
                    vm_raise(TrapKind::RuntimeError, "use of undefined temporary %t" + std::to_string(v.id));
                return regs[v.id];
            case Value::Kind::ConstInt:
                return intSlot(normalize(v.i64, kind));
            case Value::Kind::ConstStr:
            {
                Slot s;
                s.str = v.str.c_str();
                return s;
            }
            case Value::Kind::NullPtr:
                return intSlot(0);
            case Value::Kind::GlobalAddr:
                break;
        }
        vm_raise(TrapKind::RuntimeError, "global address of @" + v.str + " used as a value");
    }

    int64_t evalInt(const Value &v, Type::Kind kind) const
    {
        return normalize(eval(v, kind).i64, kind);
    }

    void store(const Instr &in, Slot value)
    {
        if (in.result)
            regs[*in.result] = value;
    }
};

std::string TrapReport::toString() const
{
    return vm_format_error(error, frame, message);
}

VM::VM(const Module &module, RuntimeBridge bridge) : module_(module), bridge_(std::move(bridge))
{
    for (const auto &fn : module_.functions)
        functions_.emplace(fn.name, &fn);
    for (const auto &g : module_.globals)
        globals_.emplace(g.name, &g);
}

const VM::FunctionInfo &VM::infoFor(const Function &fn)
{
    auto it = infos_.find(&fn);
    if (it != infos_.end())
        return it->second;

    FunctionInfo info;
    auto define = [&info](unsigned id, Type type)
    {
        if (id >= info.tempKinds.size())
            info.tempKinds.resize(id + 1, Type::Kind::Void);
        info.tempKinds[id] = type.kind;
    };
    for (const auto &p : fn.params)
        define(p.id, p.type);
    for (size_t i = 0; i < fn.blocks.size(); ++i)
    {
        const BasicBlock &bb = fn.blocks[i];
        info.blocks.emplace(bb.label, i);
        for (const auto &p : bb.params)
            define(p.id, p.type);
        for (const auto &in : bb.instructions)
        {
            if (in.result)
                define(*in.result, in.type);
        }
    }
    return infos_.emplace(&fn, std::move(info)).first->second;
}

Slot VM::call(const Instr &in, Frame &frame)
{
    std::vector<Slot> args;
    args.reserve(in.operands.size());

    if (auto it = functions_.find(in.callee); it != functions_.end())
    {
        const Function &callee = *it->second;
        for (size_t i = 0; i < in.operands.size(); ++i)
        {
            const Type::Kind kind =
                i < callee.params.size() ? callee.params[i].type.kind : Type::Kind::I64;
            args.push_back(frame.eval(in.operands[i], kind));
        }
        const Position saved = current_;
        Slot result = execFunction(callee, args);
        current_ = saved;
        return result;
    }

    const RuntimeBridge::Handler *handler = bridge_.find(in.callee);
    if (!handler)
        vm_raise(TrapKind::RuntimeError, "unresolved extern @" + in.callee);
    for (const auto &op : in.operands)
        args.push_back(frame.eval(op, frame.kindOf(op, Type::Kind::I64)));
    return (*handler)(args);
}

Slot VM::execFunction(const Function &fn, const std::vector<Slot> &args)
{
    DepthGuard guard(depth_);
    if (depth_ > kMaxCallDepth)
        vm_raise(TrapKind::RuntimeError, "call depth exceeded in @" + fn.name);
    if (fn.blocks.empty())
        vm_raise(TrapKind::RuntimeError, "function @" + fn.name + " has no body");
    if (args.size() != fn.params.size())
        vm_raise(TrapKind::RuntimeError, "argument count mismatch calling @" + fn.name);

    const FunctionInfo &info = infoFor(fn);
    Frame frame{fn, info, std::vector<Slot>(info.tempKinds.size(), intSlot(0))};
    for (size_t i = 0; i < args.size(); ++i)
        frame.regs[fn.params[i].id] = normalizeSlot(args[i], fn.params[i].type.kind);

    size_t b = 0;
    for (;;)
    {
        const BasicBlock &bb = fn.blocks[b];
        std::optional<size_t> next;

        auto jump = [&](const std::string &label, const std::vector<Value> &brArgs)
        {
            auto target = info.blocks.find(label);
            if (target == info.blocks.end())
                vm_raise(TrapKind::RuntimeError, "unknown block '" + label + "'");
            const BasicBlock &dst = fn.blocks[target->second];
            if (brArgs.size() != dst.params.size())
                vm_raise(TrapKind::RuntimeError, "branch argument count mismatch for '" + label + "'");
            std::vector<Slot> incoming;
            incoming.reserve(brArgs.size());
            for (size_t i = 0; i < brArgs.size(); ++i)
                incoming.push_back(normalizeSlot(frame.eval(brArgs[i], dst.params[i].type.kind),
                                                 dst.params[i].type.kind));
            for (size_t i = 0; i < incoming.size(); ++i)
                frame.regs[dst.params[i].id] = incoming[i];
            next = target->second;
        };

        for (size_t ip = 0; ip < bb.instructions.size() && !next; ++ip)
        {
            const Instr &in = bb.instructions[ip];
            current_ = Position{&fn, &bb, ip, &in};

            switch (getOpcodeInfo(in.op).category)
            {
                case OpcodeCategory::Arithmetic:
                case OpcodeCategory::Bitwise:
                {
                    const Type::Kind kind = in.type.kind;
                    const int64_t a = frame.evalInt(in.operands[0], kind);
                    const int64_t b2 = frame.evalInt(in.operands[1], kind);
                    frame.store(in, intSlot(normalize(binary(in.op, kind, a, b2), kind)));
                    break;
                }
                case OpcodeCategory::Compare:
                {
                    const Type::Kind kind = frame.kindOf(
                        in.operands[0], frame.kindOf(in.operands[1], Type::Kind::I64));
                    const int64_t a = frame.evalInt(in.operands[0], kind);
                    const int64_t b2 = frame.evalInt(in.operands[1], kind);
                    frame.store(in, intSlot(compare(in.op, kind, a, b2) ? 1 : 0));
                    break;
                }
                case OpcodeCategory::Cast:
                {
                    const Type::Kind from = frame.kindOf(in.operands[0], in.type.kind);
                    const int64_t v = frame.evalInt(in.operands[0], from);
                    frame.store(in, intSlot(cast(in.op, from, in.type.kind, v)));
                    break;
                }
                case OpcodeCategory::Constant:
                {
                    auto g = globals_.find(in.operands[0].str);
                    if (g == globals_.end())
                        vm_raise(TrapKind::RuntimeError, "unknown global @" + in.operands[0].str);
                    Slot s;
                    s.str = g->second->init.c_str();
                    frame.store(in, s);
                    break;
                }
                case OpcodeCategory::Call:
                {
                    Slot result = call(in, frame);
                    frame.store(in, normalizeSlot(result, in.type.kind));
                    break;
                }
                case OpcodeCategory::Control:
                    switch (in.op)
                    {
                        case Opcode::Br:
                            jump(in.labels[0], in.brArgs.empty() ? std::vector<Value>{} : in.brArgs[0]);
                            break;
                        case Opcode::CBr:
                        {
                            const size_t idx = frame.evalInt(in.operands[0], Type::Kind::I1) ? 0 : 1;
                            jump(in.labels[idx],
                                 idx < in.brArgs.size() ? in.brArgs[idx] : std::vector<Value>{});
                            break;
                        }
                        case Opcode::Ret:
                            if (in.operands.empty())
                                return intSlot(0);
                            return normalizeSlot(frame.eval(in.operands[0], fn.retType.kind),
                                                 fn.retType.kind);
                        case Opcode::Trap:
                            vm_raise(TrapKind::DomainError, "trap");
                        default:
                            vm_raise(TrapKind::RuntimeError,
                                     std::string("unsupported opcode ") + il::core::toString(in.op));
                    }
                    break;
            }
        }

        if (!next)
            vm_raise(TrapKind::RuntimeError, "block '" + bb.label + "' has no terminator");
        b = *next;
    }
}

RunResult VM::run(std::string_view function, const std::vector<Slot> &args)
{
    RunResult result;
    auto it = functions_.find(function);
    if (it == functions_.end())
    {
        TrapReport report;
        report.message = "unknown function @" + std::string(function);
        result.trap = std::move(report);
        return result;
    }

    current_ = Position{};
    depth_ = 0;
    try
    {
        const Slot value = execFunction(*it->second, args);
        if (it->second->retType.kind != Type::Kind::Void)
            result.value = value.i64;
    }
    catch (const TrapSignal &signal)
    {
        TrapReport report;
        report.error = signal.error();
        report.message = signal.what();
        if (current_.fn)
            report.frame.function = current_.fn->name;
        if (current_.block)
            report.frame.block = current_.block->label;
        report.frame.ip = current_.ip;
        if (current_.instr && current_.instr->loc.isValid())
            report.frame.line = static_cast<int32_t>(current_.instr->loc.line);
        result.trap = std::move(report);
    }
    return result;
}

int VM::runMain(std::ostream &err)
{
    const RunResult result = run("main");
    if (result.trap)
    {
        err << result.trap->toString() << std::endl;
        return 1;
    }
    return static_cast<int>(result.value.value_or(0));
}

} // namespace sentinel::vm
