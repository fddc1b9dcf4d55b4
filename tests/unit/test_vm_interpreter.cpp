//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/test_vm_interpreter.cpp
// Purpose: Interpreter semantics for unguarded IL.
// Key invariants: Integer results wrap at their type's width; division by
//                 zero traps; traps are reported once per run.
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "common/TestIRBuilder.hpp"
#include "common/VmFixture.hpp"
#include "il/build/IRBuilder.hpp"
#include "vm/VM.hpp"

using namespace sentinel::il::core;
using sentinel::il::build::IRBuilder;
using sentinel::tests::TestIRBuilder;
using sentinel::tests::VmFixture;
using sentinel::vm::RunResult;
using sentinel::vm::RuntimeBridge;
using sentinel::vm::Slot;
using sentinel::vm::TrapKind;

namespace
{

long long eval(Opcode op, Type::Kind kind, long long a, long long b)
{
    TestIRBuilder builder;
    builder.addBinaryFunction("f", op, kind);
    const RunResult r = VmFixture().call(builder.module(), "f", {a, b});
    if (r.trapped())
        ADD_FAILURE() << r.trap->toString();
    return r.value.value_or(0);
}

/// @brief `f(T %a) -> R { %r = castOp R %a; ret %r }`.
Module castModule(Opcode op, Type::Kind from, Type::Kind to)
{
    Module m;
    IRBuilder builder(m);
    Function &fn = builder.startFunction("f", Type(to), {Param{"a", Type(from), 0}});
    BasicBlock &entry = builder.addBlock(fn, "entry");
    builder.setInsertPoint(entry);
    builder.emitRet(builder.emitCast(op, Type(to), builder.param(fn, 0), {}), {});
    return m;
}

} // namespace

TEST(VMInterpreter, ArithmeticWrapsAtTypeWidth)
{
    EXPECT_EQ(eval(Opcode::Add, Type::Kind::I8, 127, 1), -128);
    EXPECT_EQ(eval(Opcode::Add, Type::Kind::U8, 255, 1), 0);
    EXPECT_EQ(eval(Opcode::Sub, Type::Kind::U16, 0, 1), 65535);
    EXPECT_EQ(eval(Opcode::Mul, Type::Kind::I16, 300, 300), 24464);
    EXPECT_EQ(eval(Opcode::Mul, Type::Kind::I32, 2, 2147483647), -2);
    EXPECT_EQ(eval(Opcode::Add, Type::Kind::I64, 9223372036854775807LL, 1), (-9223372036854775807LL - 1));
}

TEST(VMInterpreter, DivisionAndRemainder)
{
    EXPECT_EQ(eval(Opcode::SDiv, Type::Kind::I32, -7, 2), -3);
    EXPECT_EQ(eval(Opcode::SRem, Type::Kind::I32, -7, 2), -1);
    EXPECT_EQ(eval(Opcode::SRem, Type::Kind::I8, -128, -1), 0);
    EXPECT_EQ(eval(Opcode::UDiv, Type::Kind::U8, 200, 3), 66);
    EXPECT_EQ(eval(Opcode::URem, Type::Kind::U32, 4294967295LL, 10), 5);
    EXPECT_EQ(eval(Opcode::SDiv, Type::Kind::I32, -2147483648LL, -1), -2147483648LL);
}

TEST(VMInterpreter, DivisionByZeroTraps)
{
    for (Opcode op : {Opcode::SDiv, Opcode::SRem})
    {
        TestIRBuilder b;
        b.addBinaryFunction("f", op, Type::Kind::I32);
        const RunResult r = VmFixture().call(b.module(), "f", {1, 0});
        ASSERT_TRUE(r.trapped());
        EXPECT_EQ(r.trap->error.kind, TrapKind::DivideByZero);
        EXPECT_EQ(r.trap->message, "integer divide by zero");
    }
    TestIRBuilder u;
    u.addBinaryFunction("f", Opcode::URem, Type::Kind::U64);
    const RunResult r = VmFixture().call(u.module(), "f", {1, 0});
    ASSERT_TRUE(r.trapped());
    EXPECT_EQ(r.trap->error.kind, TrapKind::DivideByZero);
}

TEST(VMInterpreter, BitwiseAndShifts)
{
    EXPECT_EQ(eval(Opcode::Shl, Type::Kind::I8, 1, 7), -128);
    EXPECT_EQ(eval(Opcode::LShr, Type::Kind::I8, -128, 7), 1);
    EXPECT_EQ(eval(Opcode::AShr, Type::Kind::I8, -128, 7), -1);
    EXPECT_EQ(eval(Opcode::Shl, Type::Kind::I32, 1, 33), 2);
    EXPECT_EQ(eval(Opcode::Xor, Type::Kind::U8, 0xf0, 0xff), 0x0f);
    EXPECT_EQ(eval(Opcode::And, Type::Kind::I16, -1, 0x1234), 0x1234);
}

TEST(VMInterpreter, SignedAndUnsignedComparisons)
{
    Module m;
    IRBuilder builder(m);
    const Type i8(Type::Kind::I8);
    for (Opcode op : {Opcode::SCmpLT, Opcode::UCmpLT})
    {
        Function &fn = builder.startFunction(op == Opcode::SCmpLT ? "slt" : "ult",
                                             Type(Type::Kind::I1),
                                             {Param{"a", i8, 0}, Param{"b", i8, 0}});
        BasicBlock &entry = builder.addBlock(fn, "entry");
        builder.setInsertPoint(entry);
        builder.emitRet(builder.emitCmp(op, builder.param(fn, 0), builder.param(fn, 1), {}), {});
    }
    EXPECT_EQ(VmFixture().call(m, "slt", {-1, 1}).value, 1);
    EXPECT_EQ(VmFixture().call(m, "ult", {-1, 1}).value, 0);
    EXPECT_EQ(VmFixture().call(m, "ult", {1, -1}).value, 1);
}

TEST(VMInterpreter, Casts)
{
    EXPECT_EQ(VmFixture().call(castModule(Opcode::Sext, Type::Kind::I8, Type::Kind::I32), "f", {-1}).value, -1);
    EXPECT_EQ(VmFixture().call(castModule(Opcode::Zext, Type::Kind::I8, Type::Kind::I32), "f", {-1}).value, 255);
    EXPECT_EQ(VmFixture().call(castModule(Opcode::Trunc, Type::Kind::I32, Type::Kind::I8), "f", {300}).value, 44);
    EXPECT_EQ(VmFixture().call(castModule(Opcode::Sext, Type::Kind::U8, Type::Kind::I16), "f", {200}).value, -56);
}

TEST(VMInterpreter, LoopWithBlockParameters)
{
    Module m;
    IRBuilder builder(m);
    const Type i32(Type::Kind::I32);
    Function &fn = builder.startFunction("sum", i32, {Param{"n", i32, 0}});
    builder.addBlock(fn, "entry");
    builder.createBlock(fn, "loop", {Param{"acc", i32, 0}, Param{"i", i32, 0}});
    builder.addBlock(fn, "body");
    builder.createBlock(fn, "done", {Param{"r", i32, 0}});
    BasicBlock &entry = fn.blocks[0];
    BasicBlock &loop = fn.blocks[1];
    BasicBlock &body = fn.blocks[2];
    BasicBlock &done = fn.blocks[3];

    builder.setInsertPoint(entry);
    builder.br(loop, {Value::constInt(0), Value::constInt(1)});

    builder.setInsertPoint(loop);
    const Value acc = builder.blockParam(loop, 0);
    const Value i = builder.blockParam(loop, 1);
    const Value stop = builder.emitCmp(Opcode::SCmpGT, i, builder.param(fn, 0), {});
    builder.cbr(stop, done, {acc}, body, {});

    builder.setInsertPoint(body);
    const Value nextAcc = builder.emitBinary(Opcode::Add, i32, acc, i, {});
    const Value nextI = builder.emitBinary(Opcode::Add, i32, i, Value::constInt(1), {});
    builder.br(loop, {nextAcc, nextI});

    builder.setInsertPoint(done);
    builder.emitRet(builder.blockParam(done, 0), {});

    EXPECT_EQ(VmFixture().call(m, "sum", {10}).value, 55);
    EXPECT_EQ(VmFixture().call(m, "sum", {0}).value, 0);
}

TEST(VMInterpreter, CallsAndExterns)
{
    TestIRBuilder b;
    b.addBinaryFunction("add", Opcode::Add, Type::Kind::I64);
    Module &m = b.module();
    IRBuilder builder(m);
    const Type i64(Type::Kind::I64);
    builder.addExtern("rt_double", i64, {i64});
    Function &fn = builder.startFunction("g", i64, {Param{"x", i64, 0}});
    BasicBlock &entry = builder.addBlock(fn, "entry");
    builder.setInsertPoint(entry);
    const Value sum = Value::temp(builder.reserveTempId());
    builder.emitCall("add", {builder.param(fn, 0), Value::constInt(1)}, sum, {});
    const Value doubled = Value::temp(builder.reserveTempId());
    builder.emitCall("rt_double", {sum}, doubled, {});
    builder.emitRet(doubled, {});

    RuntimeBridge bridge = RuntimeBridge::withDefaults();
    bridge.registerExtern("rt_double",
                          [](const std::vector<Slot> &args)
                          {
                              Slot s;
                              s.i64 = args.at(0).i64 * 2;
                              return s;
                          });
    sentinel::vm::VM machine(m, bridge);
    Slot x;
    x.i64 = 20;
    const RunResult r = machine.run("g", {x});
    ASSERT_FALSE(r.trapped()) << r.trap->toString();
    EXPECT_EQ(r.value, 42);

    // Without the handler the extern cannot be resolved.
    const RunResult missing = sentinel::vm::VM(m).run("g", {x});
    ASSERT_TRUE(missing.trapped());
    EXPECT_EQ(missing.trap->error.kind, TrapKind::RuntimeError);
    EXPECT_NE(missing.trap->message.find("rt_double"), std::string::npos);
}

TEST(VMInterpreter, TrapInstructionAndUnknownFunction)
{
    Module m;
    IRBuilder builder(m);
    Function &fn = builder.startFunction("boom", Type(Type::Kind::Void), {});
    BasicBlock &entry = builder.addBlock(fn, "entry");
    builder.setInsertPoint(entry);
    builder.emitTrap({1, 12, 1});

    const RunResult r = sentinel::vm::VM(m).run("boom");
    ASSERT_TRUE(r.trapped());
    EXPECT_EQ(r.trap->error.kind, TrapKind::DomainError);
    EXPECT_EQ(r.trap->toString(), "Trap @boom:entry#0 line 12: DomainError (code=0): trap");

    const RunResult unknown = sentinel::vm::VM(m).run("nope");
    ASSERT_TRUE(unknown.trapped());
    EXPECT_EQ(unknown.trap->message, "unknown function @nope");
}

TEST(VMInterpreter, UnboundedRecursionIsStopped)
{
    Module m;
    IRBuilder builder(m);
    const Type i64(Type::Kind::I64);
    Function &fn = builder.startFunction("loop", i64, {});
    BasicBlock &entry = builder.addBlock(fn, "entry");
    builder.setInsertPoint(entry);
    const Value r = Value::temp(builder.reserveTempId());
    builder.emitCall("loop", {}, r, {});
    builder.emitRet(r, {});

    const RunResult result = sentinel::vm::VM(m).run("loop");
    ASSERT_TRUE(result.trapped());
    EXPECT_EQ(result.trap->error.kind, TrapKind::RuntimeError);
    EXPECT_NE(result.trap->message.find("call depth"), std::string::npos);
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
