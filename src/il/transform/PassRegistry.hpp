//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the pass registration infrastructure and preservation
// tracking for the IL transformation pipeline. The registry maps pass
// identifiers to factories so pipelines can be described as lists of names.
//
// Preservation Model:
// Passes return PreservedAnalyses objects indicating which cached module
// analyses remain valid. The pass manager invalidates everything else.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/core/fwd.hpp"

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

namespace sentinel::il::transform
{

class AnalysisManager;

/// @brief Set of module analyses that survive a pass.
class PreservedAnalyses
{
  public:
    /// @brief Every cached analysis stays valid.
    static PreservedAnalyses all();

    /// @brief No cached analysis stays valid.
    static PreservedAnalyses none();

    /// @brief Mark analysis @p id as preserved.
    PreservedAnalyses &preserveModule(const std::string &id);

    /// @brief True when constructed through all().
    bool preservesAllModuleAnalyses() const;

    /// @brief True when @p id survives the pass.
    bool isModulePreserved(const std::string &id) const;

    /// @brief True when at least one analysis was named explicitly.
    bool hasModulePreservations() const;

  private:
    bool preserveAll_ = false;
    std::unordered_set<std::string> moduleAnalyses_;
};

/// @brief Transformation over a whole module.
class ModulePass
{
  public:
    virtual ~ModulePass() = default;

    /// @brief Stable identifier used in pipelines and trace banners.
    virtual std::string_view id() const = 0;

    /// @brief Transform @p module.
    /// @return Analyses that remain valid afterwards.
    virtual PreservedAnalyses run(core::Module &module, AnalysisManager &analysis) = 0;
};

/// @brief Maps pass identifiers to factories.
class PassRegistry
{
  public:
    using ModulePassFactory = std::function<std::unique_ptr<ModulePass>()>;
    using ModulePassCallback = std::function<PreservedAnalyses(core::Module &, AnalysisManager &)>;

    /// @brief Register or replace a pass created by @p factory.
    void registerModulePass(const std::string &id, ModulePassFactory factory);

    /// @brief Register or replace a pass implemented by @p callback.
    void registerModulePass(const std::string &id, ModulePassCallback callback);

    /// @brief Find the factory for @p id, or nullptr.
    const ModulePassFactory *lookup(std::string_view id) const;

  private:
    std::unordered_map<std::string, ModulePassFactory> registry_;
};

} // namespace sentinel::il::transform
