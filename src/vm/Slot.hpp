//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Slot.hpp
// Purpose: Declares the untyped register cell used by the interpreter.
// Key invariants: Integer slots always hold the value normalised to its IL
//                 type: signed kinds sign-extended, unsigned kinds and i1
//                 zero-extended.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>

namespace sentinel::vm
{

/// @brief Storage for one IL value.
union Slot
{
    /// @brief Integer value of any width.
    int64_t i64;

    /// @brief String contents; points into module-owned storage.
    const char *str;
};

} // namespace sentinel::vm
