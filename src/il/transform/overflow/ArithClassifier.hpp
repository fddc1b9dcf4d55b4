//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/il/transform/overflow/ArithClassifier.hpp
// Purpose: Decides which IL instructions receive an overflow guard.
// Key invariants: Only add, sub, mul and sdiv on i8, i16 or i32 qualify.
//                 64-bit, unsigned and pointer-sized integers never qualify.
//                 Instructions already carrying guard flags never qualify.
// Ownership/Lifetime: Stateless free functions over borrowed instructions.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/core/Instr.hpp"

#include <optional>
#include <string>

namespace sentinel::il::transform::overflow
{

/// @brief Arithmetic operations that can be guarded.
enum class GuardOp
{
    Add,
    Sub,
    Mul,
    Div,
};

/// @brief Signed integer widths that can be guarded.
enum class Width
{
    W8 = 8,
    W16 = 16,
    W32 = 32,
};

/// @brief A qualifying instruction reduced to what the predicate needs.
struct ArithSite
{
    GuardOp op;
    Width width;
};

/// @brief Outcome of inspecting one instruction.
enum class Classification
{
    Ignored,   ///< Not a guard candidate; leave untouched.
    Qualifies, ///< Guard with the attached ArithSite.
    Malformed, ///< Arithmetic instruction violating its own invariants.
};

struct ClassifyResult
{
    Classification kind = Classification::Ignored;
    std::optional<ArithSite> site;
    /// Human-readable reason when kind == Malformed.
    std::string reason;
};

/// @brief Number of bits in @p w.
constexpr int bits(Width w) noexcept
{
    return static_cast<int>(w);
}

/// @brief Mnemonic used in diagnostics, e.g. "add".
const char *toString(GuardOp op) noexcept;

/// @brief Type mnemonic for @p w, e.g. "i16".
const char *toString(Width w) noexcept;

/// @brief Map an opcode to its guard operation, if it has one.
std::optional<GuardOp> guardOpFor(core::Opcode op) noexcept;

/// @brief Map a type kind to its guard width, if it has one.
std::optional<Width> guardWidthFor(core::Type::Kind kind) noexcept;

/// @brief Inspect @p instr and report whether it should be guarded.
ClassifyResult classifyNode(const core::Instr &instr);

/// @brief Convenience wrapper returning the site of a qualifying instruction.
std::optional<ArithSite> classify(const core::Instr &instr);

/// @brief True when @p instr is a guard candidate.
inline bool qualifies(const core::Instr &instr)
{
    return classify(instr).has_value();
}

} // namespace sentinel::il::transform::overflow
