//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/common/TestIRBuilder.cpp
// Purpose: Implement the TestIRBuilder helper.
//
//===----------------------------------------------------------------------===//

#include "common/TestIRBuilder.hpp"

#include <utility>

namespace sentinel::tests
{

using namespace sentinel::il::core;

TestIRBuilder::TestIRBuilder(std::string packagePath) : builder_(module_)
{
    module_.packagePath = std::move(packagePath);
}

void TestIRBuilder::addBinaryFunction(const std::string &name, Opcode op, Type::Kind kind, support::SourceLoc loc)
{
    const Type type(kind);
    Function &fn = builder_.startFunction(name, type, {Param{"a", type, 0}, Param{"b", type, 0}});
    BasicBlock &entry = builder_.addBlock(fn, "entry");
    builder_.setInsertPoint(entry);
    const Value result = builder_.emitBinary(op, type, builder_.param(fn, 0), builder_.param(fn, 1), loc);
    builder_.emitRet(result, loc);
}

void TestIRBuilder::addConstantMain(Opcode op, Type::Kind kind, long long lhs, long long rhs)
{
    const Type type(kind);
    Function &fn = builder_.startFunction("main", type, {});
    BasicBlock &entry = builder_.addBlock(fn, "entry");
    builder_.setInsertPoint(entry);
    const Value result =
        builder_.emitBinary(op, type, Value::constInt(lhs), Value::constInt(rhs), defaultLoc());
    builder_.emitRet(result, defaultLoc());
}

} // namespace sentinel::tests
