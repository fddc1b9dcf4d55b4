//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/il/core/Extern.hpp
// Purpose: Declares external function declarations resolved by the runtime.
// Key invariants: Names are unique within a module.
// Ownership/Lifetime: Modules own externs by value.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/core/Type.hpp"

#include <string>
#include <vector>

namespace sentinel::il::core
{

/// @brief Signature of a runtime-provided function.
struct Extern
{
    std::string name;         ///< Symbol name without '@'
    Type retType;             ///< Return type
    std::vector<Type> params; ///< Parameter types in order
};

} // namespace sentinel::il::core
