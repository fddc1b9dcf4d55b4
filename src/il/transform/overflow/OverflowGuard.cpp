//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the overflow guard driver.  The walk is index based because
// splicing inserts blocks and invalidates references into the function.  After
// a splice the walk resumes at the second instruction of the continuation
// block, the first being the guarded original.
//
//===----------------------------------------------------------------------===//

#include "il/transform/overflow/OverflowGuard.hpp"

#include "il/core/Module.hpp"
#include "il/transform/PassManager.hpp"
#include "il/transform/overflow/ArithClassifier.hpp"
#include "il/transform/overflow/GuardInserter.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace sentinel::il::transform::overflow
{

using namespace sentinel::il::core;
using support::Expected;
using support::makeError;

namespace
{

/// @brief Builds each (operation, width) predicate at most once per run.
class PredicateCache
{
  public:
    explicit PredicateCache(MulStrategy strategy) : strategy_(strategy) {}

    const OverflowPredicate &get(const ArithSite &site)
    {
        const auto key = std::make_pair(site.op, site.width);
        auto it = cache_.find(key);
        if (it == cache_.end())
            it = cache_.emplace(key, buildPredicate(site.op, site.width, strategy_)).first;
        return it->second;
    }

  private:
    MulStrategy strategy_;
    std::map<std::pair<GuardOp, Width>, OverflowPredicate> cache_;
};

std::size_t countCandidates(const Module &module)
{
    std::size_t candidates = 0;
    for (const auto &fn : module.functions)
        for (const auto &bb : fn.blocks)
            candidates += static_cast<std::size_t>(
                std::count_if(bb.instructions.begin(), bb.instructions.end(),
                              [](const Instr &in) { return classify(in).has_value(); }));
    return candidates;
}

/// @brief Guard every candidate in @p fn, recording each visit in @p states.
void guardFunction(Function &fn, PredicateCache &predicates, std::vector<NodeState> &states)
{
    GuardNames names(fn);
    std::size_t ordinal = 0;

    std::size_t b = 0;
    while (b < fn.blocks.size())
    {
        std::size_t i = 0;
        while (i < fn.blocks[b].instructions.size())
        {
            assert(ordinal < states.size() && states[ordinal] == NodeState::Unvisited);
            const Instr &in = fn.blocks[b].instructions[i];
            if (auto site = classify(in))
            {
                InstrumentedNode guarded = insertGuard(in, predicates.get(*site), names);
                b = spliceGuard(fn, b, i, std::move(guarded));
                i = 1;
                states[ordinal++] = NodeState::Instrumented;
                continue;
            }
            states[ordinal++] = NodeState::Unchanged;
            ++i;
        }
        ++b;
    }
    assert(ordinal == states.size() && "instruction visited twice or skipped");

    if (!fn.valueNames.empty() && fn.valueNames.size() < names.tempCount())
        fn.valueNames.resize(names.tempCount());
}

std::size_t instructionCount(const Function &fn)
{
    std::size_t n = 0;
    for (const auto &bb : fn.blocks)
        n += bb.instructions.size();
    return n;
}

} // namespace

OverflowGuard::OverflowGuard(GuardOptions options) : options_(options) {}

const ExemptionSet &OverflowGuard::exemptions() const
{
    return options_.exemptions ? *options_.exemptions : ExemptionSet::processDefault();
}

std::ostream &OverflowGuard::trace() const
{
    return options_.traceStream ? *options_.traceStream : std::cerr;
}

Expected<GuardStats> OverflowGuard::run(Module &module) const
{
    return run(module, exemptions().shouldInstrument(module.packagePath));
}

Expected<GuardStats> OverflowGuard::run(Module &module, bool instrumentUnit) const
{
    support::DiagnosticEngine diags;
    if (reportMalformed(module, diags) > 0)
        return diags.diagnostics().front();

    GuardStats stats;
    if (!instrumentUnit)
    {
        stats.exemptUnit = true;
        if (options_.trace)
            trace() << "overflow-guard: package '" << module.packagePath << "' exempt\n";
        return stats;
    }

    if (countCandidates(module) > 0)
    {
        if (auto decl = ensurePanicDecl(module); !decl)
            return decl.error();
    }

    PredicateCache predicates(options_.mulStrategy);
    for (auto &fn : module.functions)
    {
        std::vector<NodeState> states(instructionCount(fn), NodeState::Unvisited);
        guardFunction(fn, predicates, states);

        const auto instrumented =
            static_cast<std::size_t>(std::count(states.begin(), states.end(), NodeState::Instrumented));
        stats.visited += states.size();
        stats.instrumented += instrumented;
        stats.unchanged += states.size() - instrumented;

        if (options_.trace)
            trace() << "overflow-guard: @" << fn.name << " instrumented=" << instrumented
                    << " unchanged=" << states.size() - instrumented << "\n";
    }
    return stats;
}

std::size_t reportMalformed(const Module &module, support::DiagnosticEngine &diags)
{
    std::size_t count = 0;
    for (const auto &fn : module.functions)
    {
        for (const auto &bb : fn.blocks)
        {
            for (const auto &in : bb.instructions)
            {
                const ClassifyResult r = classifyNode(in);
                if (r.kind != Classification::Malformed)
                    continue;
                diags.report({support::Severity::Error,
                              "overflow-guard: malformed instruction in @" + fn.name + ":" + bb.label +
                                  ": " + r.reason,
                              in.loc});
                ++count;
            }
        }
    }
    return count;
}

void registerOverflowGuardPass(PassManager &pm, GuardOptions options)
{
    const ExemptionSet *exemptions =
        options.exemptions ? options.exemptions : &ExemptionSet::processDefault();

    pm.registerModuleAnalysis<bool>(kExemptionAnalysisId,
                                    [exemptions](Module &module)
                                    { return exemptions->shouldInstrument(module.packagePath); });

    pm.registerModulePass(
        kOverflowGuardPassId,
        [options](Module &module, AnalysisManager &analysis) -> PreservedAnalyses
        {
            support::DiagnosticEngine diags;
            if (reportMalformed(module, diags) > 0)
            {
                std::ostringstream os;
                diags.printAll(os);
                throw std::logic_error(os.str());
            }
            const bool instrumentUnit = analysis.getModuleResult<bool>(kExemptionAnalysisId);
            auto stats = OverflowGuard(options).run(module, instrumentUnit);
            if (!stats)
                throw std::logic_error(stats.error().message);
            if (stats.value().instrumented == 0)
                return PreservedAnalyses::all();
            PreservedAnalyses preserved = PreservedAnalyses::none();
            preserved.preserveModule(kExemptionAnalysisId);
            return preserved;
        });
}

} // namespace sentinel::il::transform::overflow
