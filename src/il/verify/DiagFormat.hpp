//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/il/verify/DiagFormat.hpp
// Purpose: Shared formatting helpers for verifier diagnostics.
// Key invariants: Messages are prefixed with "<fn>:<block>".
// Ownership/Lifetime: Stateless helpers returning owned strings.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/core/fwd.hpp"

#include <string>
#include <string_view>

namespace sentinel::il::verify
{

/// @brief Render a one-line summary of @p instr, e.g. "%t3 = add".
std::string makeSnippet(const core::Instr &instr);

/// @brief Format "<fn>:<block>: message".
std::string formatBlockDiag(const core::Function &fn,
                            const core::BasicBlock &bb,
                            std::string_view message);

/// @brief Format "<fn>:<block>: <snippet>: message".
std::string formatInstrDiag(const core::Function &fn,
                            const core::BasicBlock &bb,
                            const core::Instr &instr,
                            std::string_view message);

} // namespace sentinel::il::verify
