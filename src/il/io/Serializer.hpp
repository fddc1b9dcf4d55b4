//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the Serializer class, which converts in-memory IL modules
// to their textual representation. The text is used for pass tracing
// (print-before/print-after) and for golden comparisons in tests.
//
// Output Format:
//   il <version>
//   package "<path>"
//   extern @name(types) -> type
//   global const str @name = "..."
//   func @name(type %tN, ...) -> type {
//   label(%tN:type, ...):
//     %tN:type = opcode operands [!checked | !wrap]
//   }
//
// The trailing markers expose ArithFlags: "!checked" marks an arithmetic
// instruction already protected by an overflow guard, "!wrap" marks helper
// arithmetic synthesised by a guard.
//
// Canonical mode sorts externs and globals by name so that modules built in
// different orders compare equal.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/core/fwd.hpp"

#include <ostream>
#include <string>

namespace sentinel::il::io
{

/// @brief Serializes IL modules to text.
class Serializer
{
  public:
    /// @brief Output ordering policy.
    enum class Mode
    {
        Pretty,   ///< Preserve declaration order
        Canonical ///< Sort externs and globals by name
    };

    /// @brief Write module @p m to stream @p os.
    static void write(const core::Module &m, std::ostream &os, Mode mode = Mode::Pretty);

    /// @brief Convert module @p m to a string.
    static std::string toString(const core::Module &m, Mode mode = Mode::Pretty);
};

} // namespace sentinel::il::io
