//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the shared formatting helpers used when emitting verifier
// diagnostics.
//
//===----------------------------------------------------------------------===//

#include "il/verify/DiagFormat.hpp"

#include "il/core/BasicBlock.hpp"
#include "il/core/Function.hpp"
#include "il/core/Instr.hpp"

#include <sstream>

namespace sentinel::il::verify
{

std::string makeSnippet(const core::Instr &instr)
{
    std::ostringstream oss;
    if (instr.result)
        oss << "%t" << *instr.result << " = ";
    oss << core::toString(instr.op);
    if (instr.op == core::Opcode::Call)
        oss << " @" << instr.callee;
    for (size_t i = 0; i < instr.operands.size(); ++i)
        oss << (i == 0 ? " " : ", ") << core::toString(instr.operands[i]);
    return oss.str();
}

std::string formatBlockDiag(const core::Function &fn,
                            const core::BasicBlock &bb,
                            std::string_view message)
{
    std::ostringstream oss;
    oss << fn.name << ":" << bb.label;
    if (!message.empty())
        oss << ": " << message;
    return oss.str();
}

std::string formatInstrDiag(const core::Function &fn,
                            const core::BasicBlock &bb,
                            const core::Instr &instr,
                            std::string_view message)
{
    std::ostringstream oss;
    oss << fn.name << ":" << bb.label << ": " << makeSnippet(instr);
    if (!message.empty())
        oss << ": " << message;
    return oss.str();
}

} // namespace sentinel::il::verify
