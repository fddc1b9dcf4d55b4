//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/il/verify/TypeInference.cpp
// Purpose: Build and query the per-function temporary type environment.
// Key invariants: Each temporary id maps to exactly one type.
// Ownership/Lifetime: Owned by the FunctionVerifier for one function.
//
//===----------------------------------------------------------------------===//

#include "il/verify/TypeInference.hpp"

#include "il/core/Function.hpp"
#include "il/verify/DiagFormat.hpp"

namespace sentinel::il::verify
{

using namespace sentinel::il::core;
using support::Expected;
using support::makeError;

bool TypeInference::define(unsigned id, Type type)
{
    return temps_.emplace(id, type).second;
}

Expected<void> TypeInference::collect(const Function &fn)
{
    temps_.clear();
    for (const auto &p : fn.params)
    {
        if (!define(p.id, p.type))
            return Expected<void>{makeError({}, fn.name + ": duplicate parameter %t" + std::to_string(p.id))};
    }
    for (const auto &bb : fn.blocks)
    {
        for (const auto &p : bb.params)
        {
            if (!define(p.id, p.type))
                return Expected<void>{makeError(
                    {}, formatBlockDiag(fn, bb, "redefinition of %t" + std::to_string(p.id)))};
        }
        for (const auto &in : bb.instructions)
        {
            if (!in.result)
                continue;
            if (!define(*in.result, in.type))
                return Expected<void>{makeError(
                    in.loc,
                    formatInstrDiag(fn, bb, in, "redefinition of %t" + std::to_string(*in.result)))};
        }
    }
    return {};
}

Type TypeInference::valueType(const Value &value, Type constType, bool *missing) const
{
    if (missing)
        *missing = false;
    switch (value.kind)
    {
        case Value::Kind::Temp:
        {
            auto it = temps_.find(value.id);
            if (it == temps_.end())
            {
                if (missing)
                    *missing = true;
                return Type(Type::Kind::Void);
            }
            return it->second;
        }
        case Value::Kind::ConstInt:
            if (value.isBool)
                return Type(Type::Kind::I1);
            // Integer literals never stand in for strings or pointers.
            if (constType.kind == Type::Kind::Void || isInteger(constType.kind))
                return constType;
            return Type(Type::Kind::I64);
        case Value::Kind::ConstStr:
            return Type(Type::Kind::Str);
        case Value::Kind::GlobalAddr:
        case Value::Kind::NullPtr:
            return Type(Type::Kind::Ptr);
    }
    return Type(Type::Kind::Void);
}

bool TypeInference::isDefined(unsigned id) const
{
    return temps_.count(id) != 0;
}

} // namespace sentinel::il::verify
