//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/il/transform/overflow/GuardInserter.hpp
// Purpose: Rewrites one qualifying instruction into a checked sequence and
//          splices that sequence into its function.
// Key invariants: insertGuard() never touches the function it allocates
//                 names for; only spliceGuard() mutates IL.  The original
//                 instruction keeps its result id, type and operands.  The
//                 fault path ends in a terminator and never reaches the
//                 continuation.
// Ownership/Lifetime: InstrumentedNode owns copies of every instruction it
//                     describes; splicing moves them into the function.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/core/fwd.hpp"
#include "il/core/Instr.hpp"
#include "il/transform/overflow/OverflowPredicate.hpp"
#include "support/diag_expected.hpp"

#include <cstddef>
#include <string>
#include <unordered_set>
#include <vector>

namespace sentinel::il::transform::overflow
{

/// @brief Runtime routine invoked on the fault path.
inline constexpr const char *kPanicFunction = "rt_panic";

/// @brief Global holding the fault message.
inline constexpr const char *kPanicMessageGlobal = "ovf.msg";

/// @brief Message passed to the runtime on overflow.
inline constexpr const char *kOverflowMessage = "integer overflow";

/// @brief Allocates fresh temporaries and block labels within one function.
class GuardNames
{
  public:
    /// @brief Scan @p fn for temporaries and labels already in use.
    explicit GuardNames(const core::Function &fn);

    /// @brief Reserve a temporary id not yet used in the function.
    unsigned nextTemp();

    /// @brief Reserve the label pair ovf.fault.N / ovf.cont.N for the
    ///        smallest N not clashing with an existing label.
    void nextLabels(std::string &fault, std::string &cont);

    /// @brief One past the largest temporary id handed out or found.
    unsigned tempCount() const
    {
        return nextTemp_;
    }

  private:
    unsigned nextTemp_ = 0;
    unsigned nextLabel_ = 0;
    std::unordered_set<std::string> labels_;
};

/// @brief A guarded instruction ready to be spliced.
struct InstrumentedNode
{
    /// Instructions computing @ref condition; appended to the head block.
    std::vector<core::Instr> check;
    /// i1 value, true when the operation overflows.
    core::Value condition;
    /// The guarded instruction, marked overflowChecked.
    core::Instr original;
    std::string faultLabel;
    std::string contLabel;
    /// Body of the fault block: message load, panic call, trap.
    std::vector<core::Instr> fault;
};

/// @brief Lower @p pred over the operands of @p node.
/// @details Operands are referenced, never recomputed; shared predicate
///          nodes are lowered once.  Every produced instruction carries the
///          location of @p node.
InstrumentedNode insertGuard(const core::Instr &node, const OverflowPredicate &pred, GuardNames &names);

/// @brief Replace instruction @p instrIdx of block @p blockIdx with @p guarded.
/// @details The head block keeps its label and now ends with a cbr to the
///          fault and continuation blocks, which are inserted directly after
///          it.  The continuation starts with the original instruction and
///          holds the rest of the head block.
/// @return Index of the continuation block.
std::size_t spliceGuard(core::Function &fn, std::size_t blockIdx, std::size_t instrIdx, InstrumentedNode guarded);

/// @brief Declare the panic routine and message global in @p module.
/// @return Error when a declaration with the same name but a different shape
///         already exists.
support::Expected<void> ensurePanicDecl(core::Module &module);

} // namespace sentinel::il::transform::overflow
