//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/il/core/Module.hpp
// Purpose: Declares the IL compilation unit.
// Key invariants: packagePath identifies the unit for package-scoped policies.
// Ownership/Lifetime: Module owns all contained entities by value.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/core/Extern.hpp"
#include "il/core/Function.hpp"
#include "il/core/Global.hpp"
#include "sentinel/version.hpp"

#include <string>
#include <vector>

namespace sentinel::il::core
{

/// @brief One compilation unit: a package's externs, globals and functions.
struct Module
{
    /// @brief IL format version.
    std::string version = SENTINEL_IL_VERSION_STR;

    /// @brief Fully qualified package path, e.g. "example.com/app/util".
    std::string packagePath;

    std::vector<Extern> externs;
    std::vector<Global> globals;
    std::vector<Function> functions;
};

} // namespace sentinel::il::core
