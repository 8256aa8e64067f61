#include "securevault/core/Timestamp.hpp"

#include <chrono>
#include <gtest/gtest.h>

namespace
{

using namespace std::chrono;
using securevault::core::formatIso8601;
using securevault::core::parseIso8601;
using securevault::core::Timestamp;

} // namespace

TEST(Timestamp, FormatsEpochWithMilliseconds)
{
    EXPECT_EQ(formatIso8601(Timestamp{}), "1970-01-01T00:00:00.000Z");
}

TEST(Timestamp, FormatsCalendarDate)
{
    const Timestamp t{ sys_days{ year{ 2024 } / February / 29 } + hours{ 13 } + minutes{ 5 } + seconds{ 9 } +
                       milliseconds{ 42 } };
    EXPECT_EQ(formatIso8601(t), "2024-02-29T13:05:09.042Z");
}

TEST(Timestamp, ParsesWhatItFormats)
{
    const Timestamp t{ sys_days{ year{ 2031 } / December / 31 } + hours{ 23 } + minutes{ 59 } + seconds{ 59 } +
                       milliseconds{ 999 } };
    const auto parsed{ parseIso8601(formatIso8601(t)) };
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, t);
}

TEST(Timestamp, AcceptsSecondPrecision)
{
    const auto parsed{ parseIso8601("2020-05-17T08:30:00Z") };
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(formatIso8601(*parsed), "2020-05-17T08:30:00.000Z");
}

TEST(Timestamp, RejectsMalformedInput)
{
    for (const char* text : { "", "2024-02-29", "2024-02-29T13:05:09.042", "2024-02-29 13:05:09.042Z",
                              "2024-02-30T00:00:00.000Z", "2023-02-29T00:00:00.000Z", "2024-13-01T00:00:00.000Z",
                              "2024-01-01T24:00:00.000Z", "2024-01-01T00:60:00.000Z", "2024-01-01T00:00:00,000Z",
                              "2024-01-01T00:00:00.00Z", "2024-01-01T00:00:00.0000Z", "20a4-01-01T00:00:00.000Z",
                              "2024-01-01T00:00:00.000+01:00" })
    {
        EXPECT_FALSE(parseIso8601(text).has_value()) << text;
    }
}
