//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Provides the helper constructors and formatting routines that accompany the
// lightweight IL value type.  The textual encodings produced here are the ones
// the serializer emits for operands.
//
//===----------------------------------------------------------------------===//

#include "il/core/Value.hpp"

#include <cstdio>
#include <utility>

namespace sentinel::il::core
{
namespace
{
/// @brief Escape quotes, backslashes and control bytes for a string literal.
std::string escapeLiteral(const std::string &input)
{
    std::string out;
    out.reserve(input.size());
    for (unsigned char c : input)
    {
        if (c == '\\' || c == '"')
        {
            out.push_back('\\');
            out.push_back(static_cast<char>(c));
        }
        else if (c == '\n')
        {
            out.append("\\n");
        }
        else if (c < 0x20 || c == 0x7F)
        {
            char buf[5];
            std::snprintf(buf, sizeof(buf), "\\x%02X", c);
            out.append(buf);
        }
        else
        {
            out.push_back(static_cast<char>(c));
        }
    }
    return out;
}
} // namespace

Value Value::temp(unsigned t)
{
    return Value{Kind::Temp, 0, t, ""};
}

Value Value::constInt(long long v)
{
    return Value{Kind::ConstInt, v, 0, ""};
}

Value Value::constBool(bool v)
{
    return Value{Kind::ConstInt, v ? 1 : 0, 0, "", true};
}

Value Value::constStr(std::string s)
{
    return Value{Kind::ConstStr, 0, 0, std::move(s)};
}

Value Value::global(std::string s)
{
    return Value{Kind::GlobalAddr, 0, 0, std::move(s)};
}

Value Value::null()
{
    return Value{Kind::NullPtr, 0, 0, ""};
}

bool operator==(const Value &a, const Value &b)
{
    if (a.kind != b.kind)
        return false;
    switch (a.kind)
    {
        case Value::Kind::Temp:
            return a.id == b.id;
        case Value::Kind::ConstInt:
            return a.i64 == b.i64 && a.isBool == b.isBool;
        case Value::Kind::ConstStr:
        case Value::Kind::GlobalAddr:
            return a.str == b.str;
        case Value::Kind::NullPtr:
            return true;
    }
    return false;
}

std::string toString(const Value &v)
{
    switch (v.kind)
    {
        case Value::Kind::Temp:
            return "%t" + std::to_string(v.id);
        case Value::Kind::ConstInt:
            if (v.isBool)
                return v.i64 != 0 ? "true" : "false";
            return std::to_string(v.i64);
        case Value::Kind::ConstStr:
            return "\"" + escapeLiteral(v.str) + "\"";
        case Value::Kind::GlobalAddr:
            return "@" + v.str;
        case Value::Kind::NullPtr:
            return "null";
    }
    return "";
}

} // namespace sentinel::il::core
