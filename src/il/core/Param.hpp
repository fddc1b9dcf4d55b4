//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/il/core/Param.hpp
// Purpose: Declares function and block parameters.
// Key invariants: id is the SSA temporary bound to the parameter.
// Ownership/Lifetime: Value type owned by its function or block.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/core/Type.hpp"

#include <string>

namespace sentinel::il::core
{

/// @brief Named, typed parameter bound to a temporary id.
struct Param
{
    std::string name; ///< Source-level name, used for printing only
    Type type;        ///< Parameter type
    unsigned id = 0;  ///< Temporary id defined on entry
};

} // namespace sentinel::il::core
