//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/**
 * @file OpcodeNames.cpp
 * @brief Provides lightweight mnemonic lookups for IL opcodes.
 * @details
 *     The file defines a constexpr lookup table generated from `Opcode.def` and
 *     exposes `toString` for translating opcodes into mnemonic strings.
 */

#include "il/core/Opcode.hpp"
#include "il/core/OpcodeInfo.hpp"

#include <array>

namespace sentinel::il::core
{
namespace
{
/**
 * @brief Compile-time array of opcode mnemonics in enumeration order.
 */
constexpr std::array<const char *, kNumOpcodes> kOpcodeNames = {
#define IL_OPCODE(NAME, MNEMONIC, ...) MNEMONIC,
#include "il/core/Opcode.def"
#undef IL_OPCODE
};

static_assert(kOpcodeNames.size() == kNumOpcodes, "Opcode name table must match enum count");
} // namespace

/**
 * @brief Converts an opcode into its mnemonic string representation.
 *
 * Out-of-range inputs yield an empty string literal.
 *
 * @param op Opcode to translate.
 * @return Pointer to a null-terminated mnemonic string.
 */
const char *toString(Opcode op)
{
    const size_t index = static_cast<size_t>(op);
    if (index < kOpcodeNames.size())
        return kOpcodeNames[index];
    return "";
}

} // namespace sentinel::il::core
