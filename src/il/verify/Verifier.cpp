//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/il/verify/Verifier.cpp
// Purpose: Drive module-level symbol checks and function verification,
//          returning the first failure as a single Expected result.
//
//===----------------------------------------------------------------------===//

#include "il/verify/Verifier.hpp"

#include "il/core/Module.hpp"
#include "il/verify/FunctionVerifier.hpp"

#include <unordered_set>

namespace sentinel::il::verify
{

using namespace sentinel::il::core;
using support::Expected;
using support::makeError;

Expected<void> Verifier::verify(const Module &m)
{
    SignatureTable signatures;
    for (const auto &e : m.externs)
    {
        if (!signatures.emplace(e.name, Signature{e.retType, e.params}).second)
            return Expected<void>{makeError({}, "duplicate extern @" + e.name)};
    }
    for (const auto &fn : m.functions)
    {
        std::vector<Type> params;
        for (const auto &p : fn.params)
            params.push_back(p.type);
        if (!signatures.emplace(fn.name, Signature{fn.retType, std::move(params)}).second)
            return Expected<void>{makeError({}, "duplicate function @" + fn.name)};
    }

    std::unordered_set<std::string> globals;
    for (const auto &g : m.globals)
    {
        if (!globals.insert(g.name).second)
            return Expected<void>{makeError({}, "duplicate global @" + g.name)};
        if (g.type.kind != Type::Kind::Str)
            return Expected<void>{makeError({}, "global @" + g.name + " must be str")};
    }

    FunctionVerifier functionVerifier(signatures);
    return functionVerifier.run(m);
}

} // namespace sentinel::il::verify
