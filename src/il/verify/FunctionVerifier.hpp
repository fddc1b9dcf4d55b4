//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/il/verify/FunctionVerifier.hpp
// Purpose: Verify block structure and instructions of every function.
// Key invariants: Stops at the first violation.
// Ownership/Lifetime: Borrows the signature table for the duration of run().
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/core/fwd.hpp"
#include "il/verify/InstructionChecker.hpp"
#include "support/diag_expected.hpp"

namespace sentinel::il::verify
{

/// @brief Verifies functions of a module against a prebuilt signature table.
class FunctionVerifier
{
  public:
    explicit FunctionVerifier(const SignatureTable &signatures);

    /// @brief Verify every function of @p m.
    [[nodiscard]] support::Expected<void> run(const core::Module &m) const;

  private:
    const SignatureTable &signatures_;

    support::Expected<void> verifyFunction(const core::Module &m, const core::Function &fn) const;
};

} // namespace sentinel::il::verify
