//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the TypeInference class, which maintains the type
// environment of one function during verification. Definitions are collected
// up front from function parameters, block parameters and instruction results
// so that uses can be checked independently of block order.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/core/Type.hpp"
#include "il/core/Value.hpp"
#include "il/core/fwd.hpp"
#include "support/diag_expected.hpp"

#include <unordered_map>

namespace sentinel::il::verify
{

/// @brief Temporary-to-type environment for a single function.
class TypeInference
{
  public:
    /// @brief Collect every definition in @p fn.
    /// @return Error naming the first temporary defined more than once.
    [[nodiscard]] support::Expected<void> collect(const core::Function &fn);

    /// @brief Type of @p value; integer literals report @p constType when it
    ///        is an integer type or void, and i64 otherwise.
    /// @param missing Set to true when @p value names an undefined temporary.
    core::Type valueType(const core::Value &value,
                         core::Type constType,
                         bool *missing = nullptr) const;

    /// @brief Whether temporary @p id has a definition.
    bool isDefined(unsigned id) const;

  private:
    std::unordered_map<unsigned, core::Type> temps_;

    bool define(unsigned id, core::Type type);
};

} // namespace sentinel::il::verify
