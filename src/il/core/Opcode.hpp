//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/il/core/Opcode.hpp
// Purpose: Enumerates IL instruction opcodes.
// Key invariants: Enumeration order matches Opcode.def.
// Ownership/Lifetime: Not applicable.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>

namespace sentinel::il::core
{

/// @brief All IL opcodes, generated from Opcode.def.
enum class Opcode
{
#define IL_OPCODE(NAME, ...) NAME,
#include "il/core/Opcode.def"
#undef IL_OPCODE
    Count
};

/// @brief Number of opcodes excluding the Count sentinel.
constexpr size_t kNumOpcodes = static_cast<size_t>(Opcode::Count);

/// @brief Convert opcode @p op to its mnemonic.
/// @return Mnemonic string, or "" for out-of-range values.
const char *toString(Opcode op);

} // namespace sentinel::il::core
