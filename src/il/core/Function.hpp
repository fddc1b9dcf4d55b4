//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/il/core/Function.hpp
// Purpose: Declares the IL function definition.
// Key invariants: The first block is the entry block; valueNames is indexed by
//                 temporary id.
// Ownership/Lifetime: Modules own functions by value.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/core/BasicBlock.hpp"
#include "il/core/Param.hpp"
#include "il/core/Type.hpp"

#include <string>
#include <vector>

namespace sentinel::il::core
{

/// @brief Function definition with parameters and a body of blocks.
struct Function
{
    std::string name;                    ///< Symbol name without the '@' sigil
    Type retType;                        ///< Return type
    std::vector<Param> params;           ///< Parameters bound on entry
    std::vector<BasicBlock> blocks;      ///< Body; blocks[0] is the entry
    std::vector<std::string> valueNames; ///< Optional debug names per temp id
};

} // namespace sentinel::il::core
