//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the analysis manager, which handles registration, caching
// and invalidation of module analysis results during pipeline execution.
//
// Caching and Invalidation Model:
// - Registration: Each analysis registers a compute function for a module
// - On-demand computation: The first request computes and caches the result
// - Preservation-based invalidation: After each pass, results the pass did not
//   declare preserved are dropped from the cache
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/core/fwd.hpp"

#include <any>
#include <cassert>
#include <cstddef>
#include <functional>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <utility>

namespace sentinel::il::transform
{

class PreservedAnalyses;

namespace detail
{
/// @brief Type-erased compute function plus the result type it produces.
struct ModuleAnalysisRecord
{
    std::function<std::any(core::Module &)> compute;
    std::type_index type{typeid(void)};
};
} // namespace detail

using ModuleAnalysisMap = std::unordered_map<std::string, detail::ModuleAnalysisRecord>;

/// @brief Compute function registry keyed by analysis id.
class AnalysisRegistry
{
  public:
    /// @brief Register module analysis @p id producing @p Result.
    template <typename Result>
    void registerModuleAnalysis(const std::string &id, std::function<Result(core::Module &)> fn)
    {
        moduleAnalyses_[id] = detail::ModuleAnalysisRecord{
            [fn = std::move(fn)](core::Module &module) -> std::any { return fn(module); },
            std::type_index(typeid(Result))};
    }

    const ModuleAnalysisMap &moduleAnalyses() const
    {
        return moduleAnalyses_;
    }

  private:
    ModuleAnalysisMap moduleAnalyses_;
};

/// @brief Per-pipeline cache of analysis results for one module.
class AnalysisManager
{
  public:
    AnalysisManager(core::Module &module, const AnalysisRegistry &registry);

    /// @brief Fetch (computing on first use) the result of analysis @p id.
    template <typename Result> Result &getModuleResult(const std::string &id)
    {
        auto it = moduleAnalyses_->find(id);
        assert(it != moduleAnalyses_->end() && "unknown module analysis");
        assert(it->second.type == std::type_index(typeid(Result)) &&
               "analysis result type mismatch");
        std::any &cache = moduleCache_[id];
        if (!cache.has_value())
        {
            cache = it->second.compute(module_);
            ++computations_;
        }
        auto *value = std::any_cast<Result>(&cache);
        assert(value && "analysis result cast failed");
        return *value;
    }

    /// @brief True when analysis @p id has a registered compute function.
    bool hasModuleAnalysis(const std::string &id) const
    {
        return moduleAnalyses_->count(id) != 0;
    }

    /// @brief Drop cached results not preserved by the last pass.
    void invalidateAfterModulePass(const PreservedAnalyses &preserved);

    core::Module &module()
    {
        return module_;
    }

    /// @brief Number of analysis computations performed so far.
    std::size_t computations() const
    {
        return computations_;
    }

  private:
    core::Module &module_;
    const ModuleAnalysisMap *moduleAnalyses_ = nullptr;
    std::unordered_map<std::string, std::any> moduleCache_;
    std::size_t computations_ = 0;
};

} // namespace sentinel::il::transform
