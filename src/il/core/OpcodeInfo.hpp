//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/il/core/OpcodeInfo.hpp
// Purpose: Declares metadata describing IL opcode signatures and behaviours.
// Key invariants: Table entries cover every Opcode enumerator exactly once.
// Ownership/Lifetime: Metadata is static storage duration and read-only.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/core/Opcode.hpp"

#include <array>
#include <cstdint>
#include <limits>

namespace sentinel::il::core
{

/// @brief Marker for opcodes that accept an open-ended operand list.
inline constexpr uint8_t kVariadicOperandCount = std::numeric_limits<uint8_t>::max();

/// @brief Number of results an opcode produces.
enum class ResultArity : uint8_t
{
    None = 0,       ///< Instruction never produces a result.
    One = 1,        ///< Instruction must produce exactly one result.
    Optional = 0xFF ///< Instruction may omit or provide a result.
};

/// @brief Coarse grouping of opcodes used by passes and the verifier.
enum class OpcodeCategory : uint8_t
{
    Arithmetic, ///< Integer add, sub, mul, div and rem.
    Bitwise,    ///< Logical and shift operations.
    Compare,    ///< Integer comparisons producing i1.
    Cast,       ///< Width and signedness conversions.
    Constant,   ///< Materialises a constant.
    Call,       ///< Direct call.
    Control     ///< Block terminators.
};

/// @brief Static description of one opcode.
struct OpcodeInfo
{
    const char *name;          ///< Canonical mnemonic.
    ResultArity resultArity;   ///< Expected result arity.
    uint8_t numOperandsMin;    ///< Minimum operand count.
    uint8_t numOperandsMax;    ///< Maximum operand count or kVariadicOperandCount.
    uint8_t numSuccessors;     ///< Number of successor labels required.
    bool isTerminator;         ///< Instruction terminates a block.
    OpcodeCategory category;   ///< Grouping used by passes.
};

extern const std::array<OpcodeInfo, kNumOpcodes> kOpcodeTable;

/// @brief Look up the metadata row for @p op.
const OpcodeInfo &getOpcodeInfo(Opcode op);

/// @brief Whether @p value encodes an unbounded operand count.
bool isVariadicOperandCount(uint8_t value);

/// @brief Convenience query for OpcodeCategory::Arithmetic.
bool isArithmetic(Opcode op);

/// @brief Convenience query for OpcodeInfo::isTerminator.
bool isTerminator(Opcode op);

} // namespace sentinel::il::core
