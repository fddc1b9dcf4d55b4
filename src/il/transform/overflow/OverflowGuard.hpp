//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/il/transform/overflow/OverflowGuard.hpp
// Purpose: Module-level driver that guards signed narrow-integer arithmetic
//          against overflow, and its registration with the pass manager.
// Key invariants: Every instruction present before the run is visited exactly
//                 once; instructions created by the run are never visited.
//                 A malformed arithmetic instruction aborts the run before
//                 any IL is changed.  Running twice equals running once.
// Ownership/Lifetime: OverflowGuard borrows its exemption set, which must
//                     outlive every run.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/core/fwd.hpp"
#include "il/transform/overflow/ExemptionSet.hpp"
#include "il/transform/overflow/OverflowPredicate.hpp"
#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"

#include <cstddef>
#include <ostream>

namespace sentinel::il::transform
{
class PassManager;
} // namespace sentinel::il::transform

namespace sentinel::il::transform::overflow
{

/// @brief Pass identifier used in pipelines.
inline constexpr const char *kOverflowGuardPassId = "overflow-guard";

/// @brief Module analysis caching the unit-level exemption decision.
inline constexpr const char *kExemptionAnalysisId = "overflow-exemption";

/// @brief Configuration of one guard instance.
struct GuardOptions
{
    /// Exemption policy; nullptr selects ExemptionSet::processDefault().
    const ExemptionSet *exemptions = nullptr;

    MulStrategy mulStrategy = MulStrategy::Widen;

    /// Emit one summary line per function and one per exempt unit.
    bool trace = false;

    /// Destination for trace lines; nullptr selects std::cerr.
    std::ostream *traceStream = nullptr;
};

/// @brief Counters describing a completed run.
struct GuardStats
{
    std::size_t visited = 0;
    std::size_t instrumented = 0;
    std::size_t unchanged = 0;
    bool exemptUnit = false;
};

/// @brief Per-instruction progress of a run.
enum class NodeState
{
    Unvisited,
    Unchanged,
    Instrumented,
};

/// @brief Inserts overflow guards into a module.
class OverflowGuard
{
  public:
    explicit OverflowGuard(GuardOptions options = {});

    /// @brief Guard @p module unless its package is exempt.
    support::Expected<GuardStats> run(core::Module &module) const;

    /// @brief Guard @p module with the unit decision already made.
    /// @param instrumentUnit False leaves every function untouched.
    /// @return Counters, or an error naming the first malformed instruction.
    support::Expected<GuardStats> run(core::Module &module, bool instrumentUnit) const;

    const ExemptionSet &exemptions() const;

  private:
    GuardOptions options_;

    std::ostream &trace() const;
};

/// @brief Report every malformed arithmetic instruction of @p module.
/// @details One error per instruction, in function and block order, each
///          located at the instruction and naming its function and block.
/// @return Number of diagnostics added to @p diags.
std::size_t reportMalformed(const core::Module &module, support::DiagnosticEngine &diags);

/// @brief Register the overflow guard and its exemption analysis.
/// @details The registered pass throws std::logic_error listing every
///          malformed arithmetic instruction of the module.
void registerOverflowGuardPass(PassManager &pm, GuardOptions options = {});

} // namespace sentinel::il::transform::overflow
