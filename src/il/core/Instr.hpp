//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the Instr struct, which represents a single IL instruction
// within a basic block.
//
// - Standard operations (add, sdiv, icmp_eq, ...) use the operands vector
// - Call instructions additionally store a callee name
// - Branch instructions store target labels and per-target arguments
// - All instructions can have an optional result temporary
//
// Instructions follow SSA form: each instruction that produces a value assigns
// it to a unique temporary ID within the function scope.
//
// Arithmetic instructions additionally carry ArithFlags recording whether the
// overflow guard has already processed them. The flags are part of the IL so
// that a module instrumented once is recognised as such by any later run.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/core/Opcode.hpp"
#include "il/core/Type.hpp"
#include "il/core/Value.hpp"
#include "support/source_location.hpp"
#include <optional>
#include <string>
#include <vector>

namespace sentinel::il::core
{

/// @brief Overflow-guard bookkeeping attached to arithmetic instructions.
/// @details Ignored by every opcode outside OpcodeCategory::Arithmetic.
struct ArithFlags
{
    /// @brief The instruction is dominated by an overflow check for its operands.
    bool overflowChecked = false;

    /// @brief The instruction was synthesised inside a guard and wraps at its width.
    bool guardInternal = false;
};

/// @brief Instruction within a basic block.
struct Instr
{
    /// Destination temporary id.
    /// Disengaged if the instruction has no result.
    std::optional<unsigned> result;

    /// Operation code selecting semantics.
    Opcode op;

    /// Result type or void.
    /// Must be void when result is absent.
    Type type;

    /// General operands.
    /// Size and content depend on opcode.
    std::vector<Value> operands;

    /// Callee name for call instructions.
    /// Must be non-empty when op == Opcode::Call.
    std::string callee;

    /// Branch target labels.
    /// Each must correspond to a basic block in the same function.
    std::vector<std::string> labels;

    /// Branch arguments per target.
    /// Outer vector matches labels in size.
    std::vector<std::vector<Value>> brArgs;

    /// Source location.
    /// Line and column are >=1 when known; {0,0} denotes unknown.
    support::SourceLoc loc;

    /// @brief Overflow-guard state of arithmetic instructions.
    ArithFlags arith{};
};

} // namespace sentinel::il::core
