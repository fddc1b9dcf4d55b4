//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/test_overflow_exemptions.cpp
// Purpose: Package exemption matching and configuration parsing.
// Key invariants: Prefix entries match at path-segment boundaries only.
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "il/transform/overflow/ExemptionSet.hpp"

using namespace sentinel::il::transform::overflow;

TEST(OverflowExemptions, DefaultExactEntries)
{
    for (const char *pkg : {"runtime", "sync", "os", "syscall", "math", "unsafe"})
    {
        EXPECT_FALSE(shouldInstrument(pkg)) << pkg;
    }
}

TEST(OverflowExemptions, ExactEntriesDoNotCoverSubpackages)
{
    EXPECT_TRUE(shouldInstrument("runtime/debug"));
    EXPECT_TRUE(shouldInstrument("math/big"));
    EXPECT_TRUE(shouldInstrument("osutil"));
    EXPECT_TRUE(shouldInstrument("example.com/app/os"));
}

TEST(OverflowExemptions, PrefixMatchesAtSegmentBoundary)
{
    EXPECT_FALSE(shouldInstrument("internal"));
    EXPECT_FALSE(shouldInstrument("internal/abi"));
    EXPECT_FALSE(shouldInstrument("internal/fmtsort/deep"));
    EXPECT_TRUE(shouldInstrument("internalfoo"));
    EXPECT_TRUE(shouldInstrument("example.com/internal/x"));
}

TEST(OverflowExemptions, OrdinaryPackagesAreInstrumented)
{
    EXPECT_TRUE(shouldInstrument("example.com/app"));
    EXPECT_TRUE(shouldInstrument("main"));
    EXPECT_TRUE(shouldInstrument(""));
}

TEST(OverflowExemptions, ProcessDefaultIsBuiltOnce)
{
    const ExemptionSet &a = ExemptionSet::processDefault();
    const ExemptionSet &b = ExemptionSet::processDefault();
    EXPECT_EQ(&a, &b);
    EXPECT_EQ(a.toString(), ExemptionSet::defaults().toString());
    EXPECT_EQ(a.toString(), "math,os,runtime,sync,syscall,unsafe,internal/*");
}

TEST(OverflowExemptions, BuilderDeduplicatesAndNormalisesPrefixes)
{
    const ExemptionSet set =
        ExemptionSet::Builder().addExact("b").addExact("a").addExact("b").addPrefix("vendor/").build();
    ASSERT_EQ(set.exactEntries().size(), 2u);
    EXPECT_EQ(set.exactEntries()[0], "a");
    ASSERT_EQ(set.prefixEntries().size(), 1u);
    EXPECT_EQ(set.prefixEntries()[0], "vendor");
    EXPECT_TRUE(set.isExempt("vendor/x"));
}

TEST(OverflowExemptions, EmptySetExemptsNothing)
{
    const ExemptionSet set;
    EXPECT_TRUE(set.shouldInstrument("runtime"));
    EXPECT_TRUE(set.shouldInstrument("internal/abi"));
}

TEST(OverflowExemptions, ParseAcceptsExactAndPrefixEntries)
{
    auto parsed = ExemptionSet::parse(" gen , third_party/* ,tools/lint");
    ASSERT_TRUE(parsed);
    const ExemptionSet &set = parsed.value();
    EXPECT_TRUE(set.isExempt("gen"));
    EXPECT_FALSE(set.isExempt("gen/x"));
    EXPECT_TRUE(set.isExempt("third_party"));
    EXPECT_TRUE(set.isExempt("third_party/zlib"));
    EXPECT_FALSE(set.isExempt("third_partyx"));
    EXPECT_TRUE(set.isExempt("tools/lint"));
    EXPECT_FALSE(set.isExempt("tools"));
}

TEST(OverflowExemptions, ParseRejectsMalformedEntries)
{
    EXPECT_FALSE(ExemptionSet::parse(""));
    EXPECT_FALSE(ExemptionSet::parse("a,,b"));
    EXPECT_FALSE(ExemptionSet::parse("a,"));
    EXPECT_FALSE(ExemptionSet::parse("/abs"));
    EXPECT_FALSE(ExemptionSet::parse("a*"));
    EXPECT_FALSE(ExemptionSet::parse("a/*/b"));
    EXPECT_FALSE(ExemptionSet::parse("/*"));

    auto bad = ExemptionSet::parse("ok,x*y");
    ASSERT_FALSE(bad);
    EXPECT_NE(bad.error().message.find("x*y"), std::string::npos);
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
