#pragma once

#include <utility/algorithm/case_convert.hpp>

#include <gtest/gtest.h>

namespace Utility::Test
{
    TEST(CaseConvertTests, LowerCasesAsciiLetters)
    {
        EXPECT_EQ(Algorithm::toLowerCase("WaRn"), "warn");
    }

    TEST(CaseConvertTests, LeavesOtherCharactersAlone)
    {
        EXPECT_EQ(Algorithm::toLowerCase("Level_2 \xC4"), "level_2 \xC4");
    }

    TEST(CaseConvertTests, ComparisonIgnoresCase)
    {
        static_assert(Algorithm::equalsIgnoreCase("CRITICAL", "critical"));
        EXPECT_TRUE(Algorithm::equalsIgnoreCase("Warning", "wARNING"));
        EXPECT_FALSE(Algorithm::equalsIgnoreCase("warn", "warning"));
        EXPECT_TRUE(Algorithm::equalsIgnoreCase("", ""));
    }
}
