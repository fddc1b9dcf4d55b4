//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the PassManager, which owns the pass and analysis
// registries and runs pipelines of module passes with optional
// instrumentation: IL dumps before/after each pass and verification between
// passes. Instrumentation output goes to a configurable stream (std::cerr by
// default).
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/core/fwd.hpp"
#include "il/transform/AnalysisManager.hpp"
#include "il/transform/PassRegistry.hpp"
#include "support/diag_expected.hpp"

#include <functional>
#include <ostream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sentinel::il::transform
{

/// @brief Registry owner and pipeline driver.
class PassManager
{
  public:
    /// @brief Ordered list of pass identifiers forming a pipeline.
    using Pipeline = std::vector<std::string>;

    PassManager();

    PassRegistry &passes()
    {
        return passRegistry_;
    }

    AnalysisRegistry &analyses()
    {
        return analysisRegistry_;
    }

    /// @brief Register module analysis @p id.
    template <typename Result>
    void registerModuleAnalysis(const std::string &id, std::function<Result(core::Module &)> fn)
    {
        analysisRegistry_.registerModuleAnalysis<Result>(id, std::move(fn));
    }

    void registerModulePass(const std::string &id, PassRegistry::ModulePassFactory factory)
    {
        passRegistry_.registerModulePass(id, std::move(factory));
    }

    void registerModulePass(const std::string &id, PassRegistry::ModulePassCallback callback)
    {
        passRegistry_.registerModulePass(id, std::move(callback));
    }

    /// @brief Store a named pipeline for runPipeline().
    void registerPipeline(const std::string &id, Pipeline pipeline);

    /// @brief Retrieve a named pipeline, or nullptr.
    const Pipeline *getPipeline(const std::string &id) const;

    /// @brief Run the verifier after every pass.
    void setVerifyBetweenPasses(bool enable);

    /// @brief Dump the module before every pass.
    void setPrintBeforeEach(bool enable);

    /// @brief Dump the module after every pass.
    void setPrintAfterEach(bool enable);

    /// @brief Redirect instrumentation output.
    void setInstrumentationStream(std::ostream &os);

    /// @brief Execute @p pipeline on @p module.
    /// @return Error on an unknown pass id or a verification failure; passes
    ///         already run keep their effects.
    [[nodiscard]] support::Expected<void> run(core::Module &module, const Pipeline &pipeline) const;

    /// @brief Execute the pipeline registered as @p pipelineId.
    [[nodiscard]] support::Expected<void> runPipeline(core::Module &module,
                                                      const std::string &pipelineId) const;

  private:
    AnalysisRegistry analysisRegistry_;
    PassRegistry passRegistry_;
    std::unordered_map<std::string, Pipeline> pipelines_;
    bool verifyBetweenPasses_ = false;
    bool printBeforeEach_ = false;
    bool printAfterEach_ = false;
    std::ostream *instrumentationStream_ = nullptr;

    void dump(const char *when, std::string_view passId, const core::Module &module) const;
};

} // namespace sentinel::il::transform
