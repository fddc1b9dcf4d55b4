//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the Value struct, which represents operands and constants
// in IL instructions. Values are tagged unions that can hold temporaries,
// integer or string literals, global addresses, or null pointers.
//
// Supported Value Kinds:
// - Temp: SSA temporary reference (%t0, %t1, etc.)
// - ConstInt: Integer literal; the isBool flag marks i1 literals
// - ConstStr: String literal ("hello")
// - GlobalAddr: Address of global symbol (@name)
// - NullPtr: Null pointer constant
//
// Factory methods construct Values with the appropriate kind and payload so
// that callers never pair a discriminant with the wrong payload field.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string>

namespace sentinel::il::core
{

/// @brief Operand or constant value in the IL.
struct Value
{
    /// @brief Discriminator for the active payload.
    enum class Kind
    {
        Temp,
        ConstInt,
        ConstStr,
        GlobalAddr,
        NullPtr
    };

    /// @brief Active payload kind.
    Kind kind;

    /// @brief Integer payload when kind == ConstInt.
    long long i64{0};

    /// @brief Temporary id when kind == Temp.
    unsigned id{0};

    /// @brief String payload for ConstStr and GlobalAddr.
    std::string str;

    /// @brief ConstInt originates from a boolean literal.
    bool isBool{false};

    /// @brief Construct a temporary value reference.
    static Value temp(unsigned t);

    /// @brief Construct an integer constant.
    static Value constInt(long long v);

    /// @brief Construct an i1 constant printed as true/false.
    static Value constBool(bool v);

    /// @brief Construct a string literal.
    static Value constStr(std::string s);

    /// @brief Construct a reference to global @p s.
    static Value global(std::string s);

    /// @brief Construct a null pointer.
    static Value null();
};

/// @brief Structural equality over kind and active payload.
bool operator==(const Value &a, const Value &b);

inline bool operator!=(const Value &a, const Value &b)
{
    return !(a == b);
}

/// @brief Render @p v in IL textual form.
std::string toString(const Value &v);

} // namespace sentinel::il::core
