//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the textual serializer for IL modules.  Output is deterministic
// so that two structurally equal modules always print identically.
//
//===----------------------------------------------------------------------===//

#include "il/io/Serializer.hpp"

#include "il/core/Module.hpp"
#include "il/core/OpcodeInfo.hpp"

#include <algorithm>
#include <array>
#include <sstream>
#include <vector>

namespace sentinel::il::io
{

using namespace sentinel::il::core;

namespace
{

using Formatter = void (*)(const Instr &, std::ostream &);

constexpr size_t toIndex(Opcode op)
{
    return static_cast<size_t>(op);
}

void printValueList(std::ostream &os, const std::vector<Value> &values)
{
    for (size_t i = 0; i < values.size(); ++i)
    {
        if (i)
            os << ", ";
        os << core::toString(values[i]);
    }
}

void printDefaultOperands(const Instr &instr, std::ostream &os)
{
    if (instr.operands.empty())
        return;
    os << ' ';
    printValueList(os, instr.operands);
}

void printCallOperands(const Instr &instr, std::ostream &os)
{
    os << " @" << instr.callee << "(";
    printValueList(os, instr.operands);
    os << ')';
}

void printBranchTarget(const Instr &instr, size_t index, std::ostream &os)
{
    if (index >= instr.labels.size())
        return;
    os << instr.labels[index];
    if (index < instr.brArgs.size() && !instr.brArgs[index].empty())
    {
        os << '(';
        printValueList(os, instr.brArgs[index]);
        os << ')';
    }
}

void printBrOperands(const Instr &instr, std::ostream &os)
{
    if (instr.labels.empty())
        return;
    os << ' ';
    printBranchTarget(instr, 0, os);
}

void printCBrOperands(const Instr &instr, std::ostream &os)
{
    if (instr.operands.empty() || instr.labels.size() < 2)
    {
        os << " ; malformed";
        return;
    }
    os << ' ' << core::toString(instr.operands[0]) << ", ";
    printBranchTarget(instr, 0, os);
    os << ", ";
    printBranchTarget(instr, 1, os);
}

const Formatter &formatterFor(Opcode op)
{
    static const auto formatters = []
    {
        std::array<Formatter, kNumOpcodes> table;
        table.fill(&printDefaultOperands);
        table[toIndex(Opcode::Call)] = &printCallOperands;
        table[toIndex(Opcode::Br)] = &printBrOperands;
        table[toIndex(Opcode::CBr)] = &printCBrOperands;
        return table;
    }();
    return formatters[toIndex(op)];
}

void printExtern(const Extern &e, std::ostream &os)
{
    os << "extern @" << e.name << "(";
    for (size_t i = 0; i < e.params.size(); ++i)
    {
        if (i)
            os << ", ";
        os << e.params[i].toString();
    }
    os << ") -> " << e.retType.toString() << "\n";
}

void printGlobal(const Global &g, std::ostream &os)
{
    os << "global const " << g.type.toString() << " @" << g.name << " = "
       << core::toString(Value::constStr(g.init)) << "\n";
}

void printInstr(const Instr &in, std::ostream &os)
{
    os << "  ";
    if (in.result)
        os << "%t" << *in.result << ':' << in.type.toString() << " = ";
    os << core::toString(in.op);
    formatterFor(in.op)(in, os);
    if (isArithmetic(in.op))
    {
        if (in.arith.overflowChecked)
            os << " !checked";
        if (in.arith.guardInternal)
            os << " !wrap";
    }
    if (in.loc.isValid())
        os << " ; line " << in.loc.line;
    os << "\n";
}

void printFunction(const Function &f, std::ostream &os)
{
    os << "func @" << f.name << "(";
    for (size_t i = 0; i < f.params.size(); ++i)
    {
        if (i)
            os << ", ";
        os << f.params[i].type.toString() << " %t" << f.params[i].id;
    }
    os << ") -> " << f.retType.toString() << " {\n";
    for (const auto &bb : f.blocks)
    {
        os << bb.label;
        if (!bb.params.empty())
        {
            os << '(';
            for (size_t i = 0; i < bb.params.size(); ++i)
            {
                if (i)
                    os << ", ";
                os << "%t" << bb.params[i].id << ':' << bb.params[i].type.toString();
            }
            os << ')';
        }
        os << ":\n";
        for (const auto &in : bb.instructions)
            printInstr(in, os);
    }
    os << "}\n";
}

} // namespace

void Serializer::write(const Module &m, std::ostream &os, Mode mode)
{
    os << "il " << m.version << "\n";
    if (!m.packagePath.empty())
        os << "package " << core::toString(Value::constStr(m.packagePath)) << "\n";

    std::vector<const Extern *> externs;
    for (const auto &e : m.externs)
        externs.push_back(&e);
    std::vector<const Global *> globals;
    for (const auto &g : m.globals)
        globals.push_back(&g);
    if (mode == Mode::Canonical)
    {
        std::sort(externs.begin(),
                  externs.end(),
                  [](const Extern *a, const Extern *b) { return a->name < b->name; });
        std::sort(globals.begin(),
                  globals.end(),
                  [](const Global *a, const Global *b) { return a->name < b->name; });
    }

    for (const auto *e : externs)
        printExtern(*e, os);
    for (const auto *g : globals)
        printGlobal(*g, os);
    for (const auto &f : m.functions)
        printFunction(f, os);
}

std::string Serializer::toString(const Module &m, Mode mode)
{
    std::ostringstream oss;
    write(m, oss, mode);
    return oss.str();
}

} // namespace sentinel::il::io
