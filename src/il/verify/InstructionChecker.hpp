//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/il/verify/InstructionChecker.hpp
// Purpose: Per-instruction arity and type checks.
// Key invariants: Checks only read the function; the environment is prebuilt.
// Ownership/Lifetime: VerifyCtx borrows everything it references.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/core/Type.hpp"
#include "il/core/fwd.hpp"
#include "il/verify/TypeInference.hpp"
#include "support/diag_expected.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace sentinel::il::verify
{

/// @brief Call signature of a function or extern.
struct Signature
{
    core::Type retType;
    std::vector<core::Type> params;
};

/// @brief Callable symbols of the module keyed by name.
using SignatureTable = std::unordered_map<std::string, Signature>;

/// @brief Everything one instruction check needs.
struct VerifyCtx
{
    const core::Module &module;
    const SignatureTable &signatures;
    const core::Function &fn;
    const core::BasicBlock &block;
    const core::Instr &instr;
    const TypeInference &types;
};

/// @brief Validate @p ctx.instr against its opcode metadata and operand types.
[[nodiscard]] support::Expected<void> checkInstruction(const VerifyCtx &ctx);

} // namespace sentinel::il::verify
