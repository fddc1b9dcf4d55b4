//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements pipeline execution: pass lookup, analysis invalidation and the
// print/verify instrumentation hooks around each pass.
//
//===----------------------------------------------------------------------===//

#include "il/transform/PassManager.hpp"

#include "il/core/Module.hpp"
#include "il/io/Serializer.hpp"
#include "il/verify/Verifier.hpp"

#include <iostream>
#include <utility>

namespace sentinel::il::transform
{

using support::Expected;
using support::makeError;

PassManager::PassManager()
{
#ifndef NDEBUG
    verifyBetweenPasses_ = true;
#else
    verifyBetweenPasses_ = false;
#endif
    instrumentationStream_ = &std::cerr;
}

void PassManager::registerPipeline(const std::string &id, Pipeline pipeline)
{
    pipelines_[id] = std::move(pipeline);
}

const PassManager::Pipeline *PassManager::getPipeline(const std::string &id) const
{
    auto it = pipelines_.find(id);
    return it == pipelines_.end() ? nullptr : &it->second;
}

void PassManager::setVerifyBetweenPasses(bool enable)
{
    verifyBetweenPasses_ = enable;
}

void PassManager::setPrintBeforeEach(bool enable)
{
    printBeforeEach_ = enable;
}

void PassManager::setPrintAfterEach(bool enable)
{
    printAfterEach_ = enable;
}

void PassManager::setInstrumentationStream(std::ostream &os)
{
    instrumentationStream_ = &os;
}

void PassManager::dump(const char *when, std::string_view passId, const core::Module &module) const
{
    if (!instrumentationStream_)
        return;
    *instrumentationStream_ << "*** IR " << when << " pass '" << passId << "' ***\n";
    io::Serializer::write(module, *instrumentationStream_);
    *instrumentationStream_ << "\n";
}

Expected<void> PassManager::run(core::Module &module, const Pipeline &pipeline) const
{
    AnalysisManager analysis(module, analysisRegistry_);
    for (const auto &passId : pipeline)
    {
        const PassRegistry::ModulePassFactory *factory = passRegistry_.lookup(passId);
        if (!factory || !*factory)
            return Expected<void>{makeError({}, "unknown pass '" + passId + "'")};
        auto pass = (*factory)();
        if (!pass)
            return Expected<void>{makeError({}, "pass '" + passId + "' could not be created")};

        if (printBeforeEach_)
            dump("before", passId, module);

        PreservedAnalyses preserved = pass->run(module, analysis);
        analysis.invalidateAfterModulePass(preserved);

        if (printAfterEach_)
            dump("after", passId, module);

        if (verifyBetweenPasses_)
        {
            auto result = verify::Verifier::verify(module);
            if (!result)
            {
                if (instrumentationStream_)
                {
                    *instrumentationStream_ << "verification failed after pass '" << passId
                                            << "'\n";
                    support::printDiag(result.error(), *instrumentationStream_);
                }
                return result;
            }
        }
    }
    return {};
}

Expected<void> PassManager::runPipeline(core::Module &module, const std::string &pipelineId) const
{
    const Pipeline *pipeline = getPipeline(pipelineId);
    if (!pipeline)
        return Expected<void>{makeError({}, "unknown pipeline '" + pipelineId + "'")};
    return run(module, *pipeline);
}

} // namespace sentinel::il::transform
