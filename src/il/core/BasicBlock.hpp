//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/il/core/BasicBlock.hpp
// Purpose: Declares the basic block container.
// Key invariants: A verified block ends in exactly one terminator.
// Ownership/Lifetime: Functions own blocks by value; blocks own instructions.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/core/Instr.hpp"
#include "il/core/Param.hpp"

#include <string>
#include <vector>

namespace sentinel::il::core
{

/// @brief Labelled straight-line instruction sequence.
struct BasicBlock
{
    /// @brief Label unique within the enclosing function.
    std::string label;

    /// @brief Block parameters receiving branch arguments.
    std::vector<Param> params;

    /// @brief Instructions in execution order.
    std::vector<Instr> instructions;

    /// @brief Set once a terminator has been appended through IRBuilder.
    bool terminated = false;
};

} // namespace sentinel::il::core
