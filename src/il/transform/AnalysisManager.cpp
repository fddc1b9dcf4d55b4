//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/il/transform/AnalysisManager.cpp
// Purpose: Cache invalidation for module analyses.
// Key invariants: A cached result is dropped unless the last pass preserved it.
// Ownership/Lifetime: The manager borrows the module and registry.
//
//===----------------------------------------------------------------------===//

#include "il/transform/AnalysisManager.hpp"

#include "il/transform/PassRegistry.hpp"

namespace sentinel::il::transform
{

AnalysisManager::AnalysisManager(core::Module &module, const AnalysisRegistry &registry)
    : module_(module), moduleAnalyses_(&registry.moduleAnalyses())
{
}

void AnalysisManager::invalidateAfterModulePass(const PreservedAnalyses &preserved)
{
    if (preserved.preservesAllModuleAnalyses())
        return;
    if (!preserved.hasModulePreservations())
    {
        moduleCache_.clear();
        return;
    }
    for (auto it = moduleCache_.begin(); it != moduleCache_.end();)
    {
        if (preserved.isModulePreserved(it->first))
        {
            ++it;
            continue;
        }
        it = moduleCache_.erase(it);
    }
}

} // namespace sentinel::il::transform
