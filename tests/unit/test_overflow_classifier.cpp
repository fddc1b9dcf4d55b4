//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/test_overflow_classifier.cpp
// Purpose: Which instructions qualify for an overflow guard.
// Key invariants: Only signed add, sub, mul and sdiv on i8/i16/i32 qualify.
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "il/transform/overflow/ArithClassifier.hpp"

using namespace sentinel::il::core;
using namespace sentinel::il::transform::overflow;

namespace
{

Instr makeBinary(Opcode op, Type::Kind kind)
{
    Instr in;
    in.result = 2;
    in.op = op;
    in.type = Type(kind);
    in.operands = {Value::temp(0), Value::temp(1)};
    return in;
}

} // namespace

TEST(OverflowClassifier, SignedNarrowArithmeticQualifies)
{
    const std::pair<Opcode, GuardOp> ops[] = {
        {Opcode::Add, GuardOp::Add},
        {Opcode::Sub, GuardOp::Sub},
        {Opcode::Mul, GuardOp::Mul},
        {Opcode::SDiv, GuardOp::Div},
    };
    const std::pair<Type::Kind, Width> widths[] = {
        {Type::Kind::I8, Width::W8},
        {Type::Kind::I16, Width::W16},
        {Type::Kind::I32, Width::W32},
    };
    for (const auto &[opcode, op] : ops)
    {
        for (const auto &[kind, width] : widths)
        {
            auto site = classify(makeBinary(opcode, kind));
            ASSERT_TRUE(site.has_value()) << toString(op) << " " << toString(width);
            EXPECT_EQ(site->op, op);
            EXPECT_EQ(site->width, width);
        }
    }
}

TEST(OverflowClassifier, WideUnsignedAndPointerSizedNeverQualify)
{
    for (Type::Kind kind : {Type::Kind::I64, Type::Kind::ISize, Type::Kind::USize, Type::Kind::U8,
                            Type::Kind::U16, Type::Kind::U32, Type::Kind::U64})
    {
        for (Opcode op : {Opcode::Add, Opcode::Sub, Opcode::Mul})
        {
            const ClassifyResult r = classifyNode(makeBinary(op, kind));
            EXPECT_EQ(r.kind, Classification::Ignored) << kindToString(kind);
        }
    }
    EXPECT_FALSE(qualifies(makeBinary(Opcode::SDiv, Type::Kind::I64)));
    EXPECT_FALSE(qualifies(makeBinary(Opcode::UDiv, Type::Kind::U32)));
}

TEST(OverflowClassifier, OtherOpcodesAreIgnored)
{
    for (Opcode op : {Opcode::SRem, Opcode::And, Opcode::Or, Opcode::Xor, Opcode::Shl, Opcode::AShr})
    {
        EXPECT_EQ(classifyNode(makeBinary(op, Type::Kind::I32)).kind, Classification::Ignored);
    }

    Instr cmp = makeBinary(Opcode::SCmpLT, Type::Kind::I1);
    EXPECT_EQ(classifyNode(cmp).kind, Classification::Ignored);
}

TEST(OverflowClassifier, GuardFlagsSuppressQualification)
{
    Instr checked = makeBinary(Opcode::Add, Type::Kind::I8);
    checked.arith.overflowChecked = true;
    EXPECT_FALSE(qualifies(checked));

    Instr internal = makeBinary(Opcode::Mul, Type::Kind::I16);
    internal.arith.guardInternal = true;
    EXPECT_FALSE(qualifies(internal));
}

TEST(OverflowClassifier, MalformedArithmeticIsReported)
{
    Instr boolAdd = makeBinary(Opcode::Add, Type::Kind::I1);
    EXPECT_EQ(classifyNode(boolAdd).kind, Classification::Malformed);

    Instr strAdd = makeBinary(Opcode::Add, Type::Kind::Str);
    EXPECT_EQ(classifyNode(strAdd).kind, Classification::Malformed);

    Instr unary = makeBinary(Opcode::Sub, Type::Kind::I32);
    unary.operands.pop_back();
    const ClassifyResult r = classifyNode(unary);
    EXPECT_EQ(r.kind, Classification::Malformed);
    EXPECT_NE(r.reason.find("expected 2 operands"), std::string::npos);

    Instr noResult = makeBinary(Opcode::Mul, Type::Kind::I8);
    noResult.result.reset();
    EXPECT_EQ(classifyNode(noResult).kind, Classification::Malformed);

    EXPECT_EQ(classifyNode(makeBinary(Opcode::SDiv, Type::Kind::U16)).kind, Classification::Malformed);
    EXPECT_EQ(classifyNode(makeBinary(Opcode::UDiv, Type::Kind::I16)).kind, Classification::Malformed);
}

TEST(OverflowClassifier, MalformedWinsOverGuardFlags)
{
    Instr in = makeBinary(Opcode::Add, Type::Kind::I8);
    in.arith.overflowChecked = true;
    in.operands.clear();
    EXPECT_EQ(classifyNode(in).kind, Classification::Malformed);
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
