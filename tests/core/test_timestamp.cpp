// Metadata timestamp tests

#include <diffdb/core/timestamp.hpp>

#include <gtest/gtest.h>

#include <ctime>

using namespace diffdb;
using namespace std::chrono;

TEST(TimestampTest, ParseFixedFormat) {
    auto ts = parse_timestamp("2023-04-05 06:07:08");
    ASSERT_TRUE(ts.has_value()) << ts.error().format();

    Timestamp expected = sys_days{year{2023} / April / 5} + hours{6} + minutes{7} + seconds{8};
    EXPECT_EQ(*ts, expected);
}

TEST(TimestampTest, FormatIsZeroPadded) {
    Timestamp ts = sys_days{year{2024} / January / 2} + hours{3} + minutes{4} + seconds{5};
    EXPECT_EQ(format_timestamp(ts), "2024-01-02 03:04:05");
}

TEST(TimestampTest, FormatThenParse) {
    Timestamp now = now_timestamp();
    auto parsed = parse_timestamp(format_timestamp(now));

    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, now);
}

TEST(TimestampTest, WrittenInUtc) {
    std::time_t raw = system_clock::to_time_t(system_clock::now());
    Timestamp ts = std::chrono::floor<seconds>(system_clock::from_time_t(raw));

    char expected[32];
    std::tm utc{};
    ASSERT_NE(gmtime_r(&raw, &utc), nullptr);
    ASSERT_GT(std::strftime(expected, sizeof(expected), "%Y-%m-%d %H:%M:%S", &utc), 0u);
    EXPECT_EQ(format_timestamp(ts), expected);

    EXPECT_LE(std::chrono::abs(now_timestamp() - ts), seconds{5});
}

TEST(TimestampTest, RejectsOtherShapes) {
    const char* bad[] = {
        "",
        "2023-04-05",
        "2023-04-05T06:07:08",
        "2023/04/05 06:07:08",
        "2023-04-05 06:07:08.123",
        "2023-4-5 6:7:8",
        "2023-13-05 06:07:08",
        "2023-02-30 06:07:08",
        "2023-04-05 24:00:00",
        "yesterday at noon!!",
    };

    for (const char* text : bad) {
        auto ts = parse_timestamp(text);
        ASSERT_FALSE(ts.has_value()) << text;
        EXPECT_EQ(ts.error().category(), ErrorCategory::Parse) << text;
    }
}
