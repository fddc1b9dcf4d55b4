//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the Verifier class, the entry point for structural and
// type validation of IL modules. The pass manager runs it between passes when
// verification is enabled, and tests use it to confirm that instrumented IL is
// still well formed.
//
// Checks, in order:
// - Module: extern, global and function names are unique
// - Function: non-empty body, unique block labels, single definition of every
//   temporary, every used temporary defined
// - Block: ends in exactly one terminator, no terminator elsewhere, branch
//   targets exist and argument counts match block parameters
// - Instruction: operand and result arity, integer operand types matching the
//   instruction type, i1 conditions, declared callees
//
// The first error encountered stops verification and is returned.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/core/fwd.hpp"
#include "support/diag_expected.hpp"

namespace sentinel::il::verify
{

/// @brief Verifies structural and type rules for a module.
class Verifier
{
  public:
    /// @brief Verify module @p m.
    /// @return Empty on success; otherwise the first diagnostic describing the
    ///         violation.
    [[nodiscard]] static support::Expected<void> verify(const core::Module &m);
};

} // namespace sentinel::il::verify
