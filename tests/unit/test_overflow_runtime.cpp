//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/test_overflow_runtime.cpp
// Purpose: Execute guarded modules on the VM and observe overflow faults.
// Key invariants: A guarded overflow faults with exactly "integer overflow";
//                 every other outcome matches the unguarded program.
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "common/IntegerHelpers.hpp"
#include "common/TestIRBuilder.hpp"
#include "common/VmFixture.hpp"
#include "sentinel/pass/OverflowGuard.hpp"
#include "vm/VM.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>

using namespace sentinel::il::core;
using namespace sentinel::il::transform::overflow;
using sentinel::tests::TestIRBuilder;
using sentinel::tests::VmFixture;
using sentinel::vm::RunResult;
using sentinel::vm::TrapKind;
namespace integer = sentinel::common::integer;

namespace
{

/// @brief Module holding `f = op kind` for @p package, guarded with @p opts.
Module guardedBinary(Opcode op, Type::Kind kind, const std::string &package = "example.com/app",
                     GuardOptions opts = {})
{
    TestIRBuilder b(package);
    b.addBinaryFunction("f", op, kind);
    auto stats = OverflowGuard(opts).run(b.module());
    if (!stats)
        throw std::runtime_error(stats.error().message);
    return std::move(b.module());
}

void expectOverflowFault(const RunResult &r)
{
    ASSERT_TRUE(r.trapped());
    EXPECT_EQ(r.trap->error.kind, TrapKind::Overflow);
    EXPECT_EQ(r.trap->message, "integer overflow");
    EXPECT_FALSE(r.value.has_value());
}

} // namespace

TEST(OverflowRuntime, AddI8MaxPlusOneFaults)
{
    const Module m = guardedBinary(Opcode::Add, Type::Kind::I8);
    expectOverflowFault(VmFixture().call(m, "f", {127, 1}));
}

TEST(OverflowRuntime, AddI8MinPlusMinusOneFaults)
{
    const Module m = guardedBinary(Opcode::Add, Type::Kind::I8);
    expectOverflowFault(VmFixture().call(m, "f", {-128, -1}));
}

TEST(OverflowRuntime, DivI16MinByMinusOneFaults)
{
    const Module m = guardedBinary(Opcode::SDiv, Type::Kind::I16);
    expectOverflowFault(VmFixture().call(m, "f", {-32768, -1}));
}

TEST(OverflowRuntime, MulI32TwoTimesMaxFaults)
{
    const Module m = guardedBinary(Opcode::Mul, Type::Kind::I32);
    expectOverflowFault(VmFixture().call(m, "f", {2, 2147483647}));

    GuardOptions opts;
    opts.mulStrategy = MulStrategy::BackDivision;
    const Module back = guardedBinary(Opcode::Mul, Type::Kind::I32, "example.com/app", opts);
    expectOverflowFault(VmFixture().call(back, "f", {2, 2147483647}));
}

TEST(OverflowRuntime, InRangeAddReturnsSum)
{
    const Module m = guardedBinary(Opcode::Add, Type::Kind::I8);
    const RunResult r = VmFixture().call(m, "f", {10, 20});
    ASSERT_FALSE(r.trapped()) << r.trap->toString();
    EXPECT_EQ(r.value, 30);
}

TEST(OverflowRuntime, ExemptPackageWraps)
{
    const Module m = guardedBinary(Opcode::Add, Type::Kind::I8, "runtime");
    const RunResult r = VmFixture().call(m, "f", {127, 1});
    ASSERT_FALSE(r.trapped()) << r.trap->toString();
    EXPECT_EQ(r.value, -128);
}

TEST(OverflowRuntime, PrefixExemptPackageNeverFaults)
{
    struct Case
    {
        Opcode op;
        Type::Kind kind;
        long long lhs;
        long long rhs;
        long long wrapped;
    };
    const Case cases[] = {
        {Opcode::Add, Type::Kind::I8, 127, 1, -128},
        {Opcode::Sub, Type::Kind::I8, -128, 1, 127},
        {Opcode::SDiv, Type::Kind::I16, -32768, -1, -32768},
        {Opcode::Mul, Type::Kind::I32, 2, 2147483647, -2},
    };
    for (const Case &c : cases)
    {
        const Module m = guardedBinary(c.op, c.kind, "internal/abi");
        EXPECT_EQ(m.functions[0].blocks.size(), 1u);
        const RunResult r = VmFixture().call(m, "f", {c.lhs, c.rhs});
        ASSERT_FALSE(r.trapped()) << r.trap->toString();
        EXPECT_EQ(r.value, c.wrapped) << toString(c.op);
    }
}

TEST(OverflowRuntime, WideLiteralOperandsAreCheckedAtInstructionWidth)
{
    // 200 is -56 as an i8, so the sum is -156.
    TestIRBuilder overflowing;
    overflowing.addConstantMain(Opcode::Add, Type::Kind::I8, -100, 200);
    ASSERT_TRUE(OverflowGuard().run(overflowing.module()));
    expectOverflowFault(VmFixture().call(overflowing.module(), "main", {}));

    // 255 is -1 as an i8, so 0 - 255 computes 1.
    TestIRBuilder inRange;
    inRange.addConstantMain(Opcode::Sub, Type::Kind::I8, 0, 255);
    ASSERT_TRUE(OverflowGuard().run(inRange.module()));
    const RunResult r = VmFixture().call(inRange.module(), "main", {});
    ASSERT_FALSE(r.trapped()) << r.trap->toString();
    EXPECT_EQ(r.value, 1);
}

TEST(OverflowRuntime, DivideByZeroIsNotReportedAsOverflow)
{
    const Module m = guardedBinary(Opcode::SDiv, Type::Kind::I16);
    const RunResult r = VmFixture().call(m, "f", {5, 0});
    ASSERT_TRUE(r.trapped());
    EXPECT_EQ(r.trap->error.kind, TrapKind::DivideByZero);
    EXPECT_EQ(r.trap->message, "integer divide by zero");
}

TEST(OverflowRuntime, UnguardedMinByMinusOneWraps)
{
    TestIRBuilder b;
    b.addBinaryFunction("f", Opcode::SDiv, Type::Kind::I16);
    const RunResult r = VmFixture().call(b.module(), "f", {-32768, -1});
    ASSERT_FALSE(r.trapped());
    EXPECT_EQ(r.value, -32768);
}

TEST(OverflowRuntime, FaultIsLocatedInTheFaultBlock)
{
    const Module m = guardedBinary(Opcode::Add, Type::Kind::I8);
    const RunResult r = VmFixture().call(m, "f", {127, 1});
    ASSERT_TRUE(r.trapped());
    EXPECT_EQ(r.trap->frame.function, "f");
    EXPECT_EQ(r.trap->frame.block, "ovf.fault.0");
    EXPECT_EQ(r.trap->frame.ip, 1u);
    EXPECT_EQ(r.trap->frame.line, static_cast<int32_t>(TestIRBuilder::defaultLoc().line));
    EXPECT_EQ(r.trap->toString(), "Trap @f:ovf.fault.0#1 line 3: Overflow (code=0): integer overflow");
}

TEST(OverflowRuntime, GuardedWidth8MatchesWrappingSemantics)
{
    for (Opcode op : {Opcode::Add, Opcode::Sub, Opcode::Mul, Opcode::SDiv})
    {
        for (MulStrategy s : {MulStrategy::Widen, MulStrategy::BackDivision})
        {
            GuardOptions opts;
            opts.mulStrategy = s;
            const Module m = guardedBinary(op, Type::Kind::I8, "example.com/app", opts);
            sentinel::vm::VM machine(m);
            for (long long l = -128; l <= 127; ++l)
            {
                for (long long r = -128; r <= 127; ++r)
                {
                    sentinel::vm::Slot a;
                    sentinel::vm::Slot c;
                    a.i64 = l;
                    c.i64 = r;
                    const RunResult res = machine.run("f", {a, c});

                    long long exact = 0;
                    bool divByZero = false;
                    switch (op)
                    {
                        case Opcode::Add:
                            exact = l + r;
                            break;
                        case Opcode::Sub:
                            exact = l - r;
                            break;
                        case Opcode::Mul:
                            exact = l * r;
                            break;
                        default:
                            divByZero = r == 0;
                            exact = divByZero ? 0 : l / r;
                            break;
                    }

                    if (divByZero)
                    {
                        ASSERT_TRUE(res.trapped());
                        ASSERT_EQ(res.trap->error.kind, TrapKind::DivideByZero);
                    }
                    else if (!integer::fits_signed(exact, 8))
                    {
                        ASSERT_TRUE(res.trapped()) << toString(op) << " " << l << " " << r;
                        ASSERT_EQ(res.trap->message, "integer overflow");
                    }
                    else
                    {
                        ASSERT_FALSE(res.trapped()) << toString(op) << " " << l << " " << r;
                        ASSERT_EQ(res.value, exact) << toString(op) << " " << l << " " << r;
                    }
                }
            }
        }
    }
}

TEST(OverflowRuntime, RunMainReportsFaultAndExitsNonZero)
{
    TestIRBuilder b;
    b.addConstantMain(Opcode::Add, Type::Kind::I8, 127, 1);
    ASSERT_TRUE(OverflowGuard().run(b.module()));
    const Module &m = b.module();

    EXPECT_EXIT(std::exit(sentinel::vm::VM(m).runMain()), ::testing::ExitedWithCode(1), "integer overflow");

    const auto child = VmFixture().runMainInChild(m);
    EXPECT_TRUE(child.exited);
    EXPECT_EQ(child.exitCode, 1);
    EXPECT_NE(child.stderrText.find("Overflow (code=0): integer overflow"), std::string::npos);
}

TEST(OverflowRuntime, RunMainReturnsResultWhenInRange)
{
    TestIRBuilder b;
    b.addConstantMain(Opcode::Add, Type::Kind::I8, 10, 20);
    ASSERT_TRUE(OverflowGuard().run(b.module()));

    const auto child = VmFixture().runMainInChild(b.module());
    EXPECT_TRUE(child.exited);
    EXPECT_EQ(child.exitCode, 30);
    EXPECT_TRUE(child.stderrText.empty());
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
