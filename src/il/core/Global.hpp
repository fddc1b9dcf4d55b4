//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/il/core/Global.hpp
// Purpose: Declares module-level constant globals.
// Key invariants: Only string globals are supported; init holds the bytes.
// Ownership/Lifetime: Modules own globals by value.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/core/Type.hpp"

#include <string>

namespace sentinel::il::core
{

/// @brief Immutable global string constant.
struct Global
{
    std::string name; ///< Symbol name without '@'
    Type type;        ///< Always Str
    std::string init; ///< Literal contents
};

} // namespace sentinel::il::core
