//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the transform pass registry and preservation summaries.  The
// registry decouples pass registration from pipeline execution so callers can
// look up factories by identifier without hard-coding dependencies.
//
//===----------------------------------------------------------------------===//

#include "il/transform/PassRegistry.hpp"

#include "il/transform/AnalysisManager.hpp"

#include <utility>

namespace sentinel::il::transform
{

PreservedAnalyses PreservedAnalyses::all()
{
    PreservedAnalyses p;
    p.preserveAll_ = true;
    return p;
}

PreservedAnalyses PreservedAnalyses::none()
{
    return PreservedAnalyses{};
}

PreservedAnalyses &PreservedAnalyses::preserveModule(const std::string &id)
{
    moduleAnalyses_.insert(id);
    return *this;
}

bool PreservedAnalyses::preservesAllModuleAnalyses() const
{
    return preserveAll_;
}

bool PreservedAnalyses::isModulePreserved(const std::string &id) const
{
    return preserveAll_ || moduleAnalyses_.count(id) > 0;
}

bool PreservedAnalyses::hasModulePreservations() const
{
    return !moduleAnalyses_.empty();
}

namespace
{

/// @brief Adapter exposing a callback through the ModulePass interface.
class LambdaModulePass : public ModulePass
{
  public:
    LambdaModulePass(std::string id, PassRegistry::ModulePassCallback cb)
        : id_(std::move(id)), callback_(std::move(cb))
    {
    }

    std::string_view id() const override
    {
        return id_;
    }

    PreservedAnalyses run(core::Module &module, AnalysisManager &analysis) override
    {
        return callback_(module, analysis);
    }

  private:
    std::string id_;
    PassRegistry::ModulePassCallback callback_;
};

} // namespace

void PassRegistry::registerModulePass(const std::string &id, ModulePassFactory factory)
{
    registry_[id] = std::move(factory);
}

void PassRegistry::registerModulePass(const std::string &id, ModulePassCallback callback)
{
    registry_[id] = [passId = std::string(id), cb = std::move(callback)]()
    { return std::make_unique<LambdaModulePass>(passId, cb); };
}

const PassRegistry::ModulePassFactory *PassRegistry::lookup(std::string_view id) const
{
    auto it = registry_.find(std::string(id));
    if (it == registry_.end())
        return nullptr;
    return &it->second;
}

} // namespace sentinel::il::transform
