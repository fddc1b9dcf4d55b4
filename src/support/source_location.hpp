//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_location.hpp
// Purpose: Declares lightweight source location POD for diagnostics and IL metadata.
// Key invariants: line == 0 denotes an unknown location; line/column are 1-based when valid.
// Ownership/Lifetime: Value type with no dynamic ownership.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>

namespace sentinel::support
{

/// @brief Represents a position within the compilation unit being instrumented.
/// @invariant line == 0 indicates an unknown location.
struct SourceLoc
{
    /// @brief Identifier of the originating file; 0 when not tracked.
    uint32_t file_id = 0;

    /// @brief One-based line number within the file; 0 when unknown.
    uint32_t line = 0;

    /// @brief One-based column number within the line; 0 when unknown.
    uint32_t column = 0;

    /// @brief Check whether the location carries at least a line number.
    [[nodiscard]] bool isValid() const
    {
        return line != 0;
    }

    /// @brief Determine whether a 1-based column number is available.
    [[nodiscard]] bool hasColumn() const
    {
        return column != 0;
    }
};

} // namespace sentinel::support
