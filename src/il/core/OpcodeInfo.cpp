//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Defines metadata describing IL opcode signatures and behaviours. The table is
// expanded from Opcode.def so that the enumeration, mnemonics and metadata can
// never drift apart.
//
//===----------------------------------------------------------------------===//

#include "il/core/OpcodeInfo.hpp"

namespace sentinel::il::core
{

const std::array<OpcodeInfo, kNumOpcodes> kOpcodeTable = {{
#define IL_OPCODE(NAME, MNEMONIC, RESULT, OPS_MIN, OPS_MAX, SUCCESSORS, TERMINATOR, CATEGORY)    \
    OpcodeInfo{MNEMONIC,                                                                         \
               ResultArity::RESULT,                                                              \
               static_cast<uint8_t>(OPS_MIN),                                                    \
               static_cast<uint8_t>(OPS_MAX),                                                    \
               static_cast<uint8_t>(SUCCESSORS),                                                 \
               TERMINATOR,                                                                       \
               OpcodeCategory::CATEGORY},
#include "il/core/Opcode.def"
#undef IL_OPCODE
}};

const OpcodeInfo &getOpcodeInfo(Opcode op)
{
    return kOpcodeTable[static_cast<size_t>(op)];
}

bool isVariadicOperandCount(uint8_t value)
{
    return value == kVariadicOperandCount;
}

bool isArithmetic(Opcode op)
{
    return getOpcodeInfo(op).category == OpcodeCategory::Arithmetic;
}

bool isTerminator(Opcode op)
{
    return getOpcodeInfo(op).isTerminator;
}

} // namespace sentinel::il::core
