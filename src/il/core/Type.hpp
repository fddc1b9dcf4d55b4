//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/il/core/Type.hpp
// Purpose: Declares IL type representation.
// Key invariants: Kind field determines width and signedness.
// Ownership/Lifetime: Types are lightweight values.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string>

namespace sentinel::il::core
{

/// @brief Simple type wrapper for IL primitive types.
struct Type
{
    /// @brief Enumerates primitive IL types.
    enum class Kind
    {
        Void,
        I1,
        I8,
        I16,
        I32,
        I64,
        U8,
        U16,
        U32,
        U64,
        ISize,
        USize,
        F64,
        Ptr,
        Str
    };
    Kind kind; ///< Discriminator specifying the active kind

    /// @brief Construct a type of kind @p k.
    /// @param k Desired kind.
    explicit Type(Kind k = Kind::Void);

    /// @brief Convert type to string representation.
    /// @return Lowercase type mnemonic.
    std::string toString() const;

    bool operator==(const Type &other) const
    {
        return kind == other.kind;
    }

    bool operator!=(const Type &other) const
    {
        return kind != other.kind;
    }
};

/// @brief Convert kind @p k to its mnemonic string.
/// @param k Kind to convert.
/// @return Lowercase mnemonic such as "i32" or "usize".
std::string kindToString(Type::Kind k);

/// @brief True for every integer kind, signed or unsigned, including i1.
bool isInteger(Type::Kind k);

/// @brief True for the signed fixed-width and pointer-sized integer kinds.
/// @details i1 is a boolean and is not considered signed.
bool isSignedInteger(Type::Kind k);

/// @brief Bit width of an integer kind; 0 for non-integers.
/// @details Pointer-sized kinds report 64.
int integerWidth(Type::Kind k);

} // namespace sentinel::il::core
