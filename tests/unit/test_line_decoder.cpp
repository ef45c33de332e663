#include <gtest/gtest.h>
#include <string>
#include <variant>

#include "acq/line_decoder.hpp"

using namespace pulseplot;
using namespace pulseplot::acq;

// --- Framing ---

TEST(LineDecoder, SplitsOnNewline)
{
    LineDecoder d;
    d.feed("12\n34\n");
    ASSERT_EQ(d.pending_lines(), 2u);
    EXPECT_EQ(d.pop_line(), "12");
    EXPECT_EQ(d.pop_line(), "34");
    EXPECT_FALSE(d.has_line());
}

TEST(LineDecoder, HandlesCrLfAndWhitespace)
{
    LineDecoder d;
    d.feed("  512\r\n\t7 \r\n");
    EXPECT_EQ(d.pop_line(), "512");
    EXPECT_EQ(d.pop_line(), "7");
}

TEST(LineDecoder, JoinsPartialReads)
{
    LineDecoder d;
    d.feed("10");
    EXPECT_FALSE(d.has_line());
    d.feed("23\n4");
    ASSERT_TRUE(d.has_line());
    EXPECT_EQ(d.pop_line(), "1023");
    EXPECT_FALSE(d.has_line());
}

TEST(LineDecoder, DropsBlankLines)
{
    LineDecoder d;
    d.feed("\n\r\n   \n5\n");
    EXPECT_EQ(d.pending_lines(), 1u);
    EXPECT_EQ(d.pop_line(), "5");
}

TEST(LineDecoder, FinishFlushesTrailingLine)
{
    LineDecoder d;
    d.feed("99");
    d.finish();
    EXPECT_EQ(d.pop_line(), "99");
}

TEST(LineDecoder, OverlongLineYieldsOneUnparsableLine)
{
    LineDecoder d(8);
    d.feed("123456789012\n");
    ASSERT_EQ(d.pending_lines(), 1u);
    auto v = parse_sample_value(d.pop_line());
    EXPECT_TRUE(std::holds_alternative<DecodeError>(v));
    EXPECT_FALSE(d.has_line());
}

TEST(LineDecoder, OverlongTailNeverBecomesALine)
{
    LineDecoder d;
    d.feed(std::string(255, 'x'));
    d.feed("42\n");
    ASSERT_EQ(d.pending_lines(), 1u);
    auto v = parse_sample_value(d.pop_line());
    ASSERT_TRUE(std::holds_alternative<DecodeError>(v));
    EXPECT_EQ(std::get<DecodeError>(v).input.size(), LineDecoder::DEFAULT_MAX_LINE_LENGTH);
    EXPECT_FALSE(d.has_line());
}

TEST(LineDecoder, ResumesAfterDiscardedLine)
{
    LineDecoder d(4);
    d.feed("1234567");
    d.feed("89\n");
    d.feed("42\n");
    ASSERT_EQ(d.pending_lines(), 2u);
    EXPECT_EQ(d.pop_line(), "1234");
    EXPECT_EQ(d.pop_line(), "42");
}

TEST(LineDecoder, LiteralFeedExcludesTerminator)
{
    LineDecoder d;
    d.feed("7");
    d.finish();
    EXPECT_EQ(d.pop_line(), "7");
}

TEST(LineDecoder, ClearDropsEverything)
{
    LineDecoder d;
    d.feed("1\n2");
    d.clear();
    d.feed("\n");
    EXPECT_FALSE(d.has_line());
}

// --- Value parsing ---

TEST(ParseSampleValue, AcceptsIntegers)
{
    auto v = parse_sample_value("512");
    ASSERT_TRUE(std::holds_alternative<double>(v));
    EXPECT_DOUBLE_EQ(std::get<double>(v), 512.0);

    EXPECT_DOUBLE_EQ(std::get<double>(parse_sample_value("-3")), -3.0);
    EXPECT_DOUBLE_EQ(std::get<double>(parse_sample_value("+8")), 8.0);
    EXPECT_DOUBLE_EQ(std::get<double>(parse_sample_value(" 0 ")), 0.0);
}

TEST(ParseSampleValue, RejectsGarbage)
{
    for (const char* bad : {"oops", "12abc", "1.5", "", "+", "+-1", "--1", "0x10"})
    {
        auto v = parse_sample_value(bad);
        EXPECT_TRUE(std::holds_alternative<DecodeError>(v)) << "input: '" << bad << "'";
    }
}

TEST(ParseSampleValue, ErrorKeepsInput)
{
    auto v = parse_sample_value("oops");
    ASSERT_TRUE(std::holds_alternative<DecodeError>(v));
    EXPECT_EQ(std::get<DecodeError>(v).input, "oops");
    EXPECT_FALSE(std::get<DecodeError>(v).reason.empty());
}

TEST(ParseSampleValue, OutOfRange)
{
    auto v = parse_sample_value("99999999999999999999999");
    ASSERT_TRUE(std::holds_alternative<DecodeError>(v));
    EXPECT_EQ(std::get<DecodeError>(v).reason, "value out of range");
}
