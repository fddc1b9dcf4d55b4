//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/il/core/Type.cpp
// Purpose: Implements mnemonic and width queries for IL primitive types.
// Key invariants: Mnemonics match the serializer's textual form.
// Ownership/Lifetime: Stateless helpers.
//
//===----------------------------------------------------------------------===//

#include "il/core/Type.hpp"

namespace sentinel::il::core
{

Type::Type(Kind k) : kind(k) {}

std::string kindToString(Type::Kind k)
{
    switch (k)
    {
        case Type::Kind::Void:
            return "void";
        case Type::Kind::I1:
            return "i1";
        case Type::Kind::I8:
            return "i8";
        case Type::Kind::I16:
            return "i16";
        case Type::Kind::I32:
            return "i32";
        case Type::Kind::I64:
            return "i64";
        case Type::Kind::U8:
            return "u8";
        case Type::Kind::U16:
            return "u16";
        case Type::Kind::U32:
            return "u32";
        case Type::Kind::U64:
            return "u64";
        case Type::Kind::ISize:
            return "isize";
        case Type::Kind::USize:
            return "usize";
        case Type::Kind::F64:
            return "f64";
        case Type::Kind::Ptr:
            return "ptr";
        case Type::Kind::Str:
            return "str";
    }
    return "";
}

std::string Type::toString() const
{
    return kindToString(kind);
}

bool isInteger(Type::Kind k)
{
    return integerWidth(k) != 0;
}

bool isSignedInteger(Type::Kind k)
{
    switch (k)
    {
        case Type::Kind::I8:
        case Type::Kind::I16:
        case Type::Kind::I32:
        case Type::Kind::I64:
        case Type::Kind::ISize:
            return true;
        default:
            return false;
    }
}

int integerWidth(Type::Kind k)
{
    switch (k)
    {
        case Type::Kind::I1:
            return 1;
        case Type::Kind::I8:
        case Type::Kind::U8:
            return 8;
        case Type::Kind::I16:
        case Type::Kind::U16:
            return 16;
        case Type::Kind::I32:
        case Type::Kind::U32:
            return 32;
        case Type::Kind::I64:
        case Type::Kind::U64:
        case Type::Kind::ISize:
        case Type::Kind::USize:
            return 64;
        default:
            return 0;
    }
}

} // namespace sentinel::il::core
