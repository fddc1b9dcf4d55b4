//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/RuntimeBridge.hpp
// Purpose: Maps extern names to native handlers invoked by call instructions.
// Key invariants: Handlers receive arguments already normalised to the
//                 extern's parameter types.  A handler that traps does so
//                 through vm_raise() and does not return.
// Ownership/Lifetime: Owned by value by each VM.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "vm/Slot.hpp"

#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sentinel::vm
{

/// @brief Registry of native functions reachable from IL.
class RuntimeBridge
{
  public:
    using Handler = std::function<Slot(const std::vector<Slot> &args)>;

    /// @brief A bridge providing the built-in runtime routines.
    /// @details rt_panic(str) raises an Overflow trap carrying its argument.
    static RuntimeBridge withDefaults();

    /// @brief Add or replace the handler for @p name.
    void registerExtern(std::string name, Handler handler);

    /// @brief Handler bound to @p name, or nullptr.
    const Handler *find(std::string_view name) const;

  private:
    std::unordered_map<std::string, Handler> externs_;
};

} // namespace sentinel::vm
