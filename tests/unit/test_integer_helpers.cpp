//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/test_integer_helpers.cpp
// Purpose: Exercise common::integer helpers with targeted invariants.
// Key invariants: Wrapping conversions must sign-extend for negative results.
// Ownership/Lifetime: Standalone unit test binary.
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "common/IntegerHelpers.hpp"

#include <limits>
#include <stdexcept>

using namespace sentinel::common::integer;

TEST(IntegerHelpers, NarrowWrapSignExtends)
{
    EXPECT_EQ(narrow_to(-1, 8, OverflowPolicy::Wrap), -1);
    EXPECT_EQ(narrow_to(-2, 12, OverflowPolicy::Wrap), -2);
    EXPECT_EQ(narrow_to(-65, 17, OverflowPolicy::Wrap), -65);
    EXPECT_EQ(narrow_to(128, 8, OverflowPolicy::Wrap), -128);
    EXPECT_EQ(narrow_to(65536 + 5, 16, OverflowPolicy::Wrap), 5);
    EXPECT_EQ(narrow_to(-1, 0, OverflowPolicy::Wrap), 0);
}

TEST(IntegerHelpers, NarrowTrapThrowsOutsideRange)
{
    EXPECT_EQ(narrow_to(127, 8, OverflowPolicy::Trap), 127);
    EXPECT_EQ(narrow_to(-128, 8, OverflowPolicy::Trap), -128);
    EXPECT_THROW((void)narrow_to(128, 8, OverflowPolicy::Trap), std::overflow_error);
    EXPECT_THROW((void)narrow_to(-129, 8, OverflowPolicy::Trap), std::overflow_error);
}

TEST(IntegerHelpers, WidenHonoursSignedness)
{
    EXPECT_EQ(widen_to(0xff, 8, Signedness::Signed), -1);
    EXPECT_EQ(widen_to(0xff, 8, Signedness::Unsigned), 255);
    EXPECT_EQ(widen_to(0x8000, 16, Signedness::Signed), -32768);
    EXPECT_EQ(widen_to(-1, 32, Signedness::Unsigned), 4294967295LL);
}

TEST(IntegerHelpers, SignedRangeBoundaries)
{
    EXPECT_TRUE(fits_signed(-2147483648LL, 32));
    EXPECT_FALSE(fits_signed(2147483648LL, 32));
    EXPECT_TRUE(fits_signed(std::numeric_limits<Value>::min(), 64));
    EXPECT_EQ(detail::min_for(16), -32768);
    EXPECT_EQ(detail::max_for(16), 32767);
}

TEST(IntegerHelpers, WrappingArithmeticAt64Bits)
{
    const Value max = std::numeric_limits<Value>::max();
    const Value min = std::numeric_limits<Value>::min();
    EXPECT_EQ(wrapping_add(max, 1), min);
    EXPECT_EQ(wrapping_sub(min, 1), max);
    EXPECT_EQ(wrapping_mul(min, -1), min);
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
