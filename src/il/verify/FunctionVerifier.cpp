//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements function-level verification: label uniqueness, terminator
// placement, branch target resolution and per-instruction checks.
//
//===----------------------------------------------------------------------===//

#include "il/verify/FunctionVerifier.hpp"

#include "il/core/Module.hpp"
#include "il/core/OpcodeInfo.hpp"
#include "il/verify/DiagFormat.hpp"

#include <unordered_map>

namespace sentinel::il::verify
{

using namespace sentinel::il::core;
using support::Expected;
using support::makeError;

namespace
{

Expected<void> blockError(const Function &fn, const BasicBlock &bb, std::string_view message)
{
    return Expected<void>{makeError({}, formatBlockDiag(fn, bb, message))};
}

Expected<void> instrError(const Function &fn,
                          const BasicBlock &bb,
                          const Instr &in,
                          std::string_view message)
{
    return Expected<void>{makeError(in.loc, formatInstrDiag(fn, bb, in, message))};
}

} // namespace

FunctionVerifier::FunctionVerifier(const SignatureTable &signatures) : signatures_(signatures) {}

Expected<void> FunctionVerifier::run(const Module &m) const
{
    for (const auto &fn : m.functions)
    {
        if (auto r = verifyFunction(m, fn); !r)
            return r;
    }
    return {};
}

Expected<void> FunctionVerifier::verifyFunction(const Module &m, const Function &fn) const
{
    if (fn.blocks.empty())
        return Expected<void>{makeError({}, fn.name + ": function has no blocks")};

    std::unordered_map<std::string, const BasicBlock *> blocks;
    for (const auto &bb : fn.blocks)
    {
        if (bb.label.empty())
            return Expected<void>{makeError({}, fn.name + ": empty block label")};
        if (!blocks.emplace(bb.label, &bb).second)
            return blockError(fn, bb, "duplicate label");
    }

    TypeInference types;
    if (auto r = types.collect(fn); !r)
        return r;

    for (const auto &bb : fn.blocks)
    {
        if (bb.instructions.empty())
            return blockError(fn, bb, "empty block");
        if (!isTerminator(bb.instructions.back().op))
            return blockError(fn, bb, "missing terminator");

        for (size_t i = 0; i < bb.instructions.size(); ++i)
        {
            const Instr &in = bb.instructions[i];
            if (isTerminator(in.op) && i + 1 != bb.instructions.size())
                return instrError(fn, bb, in, "terminator not at end of block");

            VerifyCtx ctx{m, signatures_, fn, bb, in, types};
            if (auto r = checkInstruction(ctx); !r)
                return r;

            for (size_t t = 0; t < in.labels.size(); ++t)
            {
                auto it = blocks.find(in.labels[t]);
                if (it == blocks.end())
                    return instrError(fn, bb, in, "unknown label " + in.labels[t]);
                const size_t argc = t < in.brArgs.size() ? in.brArgs[t].size() : 0;
                if (argc != it->second->params.size())
                    return instrError(fn, bb, in, "branch argument count mismatch");
                for (size_t a = 0; a < argc; ++a)
                {
                    bool missing = false;
                    const Type expected = it->second->params[a].type;
                    if (types.valueType(in.brArgs[t][a], expected, &missing) != expected || missing)
                        return instrError(fn, bb, in, "branch argument type mismatch");
                }
            }
        }
    }
    return {};
}

} // namespace sentinel::il::verify
