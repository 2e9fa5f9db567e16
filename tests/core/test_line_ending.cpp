#include "srcfmt/core/line_ending.hpp"
#include "srcfmt/errors.hpp"
#include <gtest/gtest.h>

namespace srcfmt {

TEST(LineEndingTest, ParsesNamesCaseInsensitively)
{
    EXPECT_EQ(line_endings::parse("AUTO"), LineEnding::AUTO);
    EXPECT_EQ(line_endings::parse("keep"), LineEnding::KEEP);
    EXPECT_EQ(line_endings::parse("Lf"), LineEnding::LF);
    EXPECT_EQ(line_endings::parse(" crlf "), LineEnding::CRLF);
    EXPECT_EQ(line_endings::parse("CR"), LineEnding::CR);
}

TEST(LineEndingTest, UnknownNameIsConfigError)
{
    EXPECT_THROW(line_endings::parse("unix"), ConfigError);
    EXPECT_THROW(line_endings::parse(""), ConfigError);
}

TEST(LineEndingTest, NamesRoundTripThroughParse)
{
    for (auto ending : {LineEnding::AUTO, LineEnding::KEEP, LineEnding::LF, LineEnding::CRLF,
                        LineEnding::CR}) {
        EXPECT_EQ(line_endings::parse(line_endings::name(ending)), ending);
    }
}

TEST(LineEndingTest, FixedPoliciesMapToTheirCharacters)
{
    EXPECT_EQ(line_endings::separator(LineEnding::LF), "\n");
    EXPECT_EQ(line_endings::separator(LineEnding::CRLF), "\r\n");
    EXPECT_EQ(line_endings::separator(LineEnding::CR), "\r");
    EXPECT_EQ(line_endings::separator(LineEnding::AUTO), line_endings::native_separator());
}

TEST(LineEndingTest, DetectsSingleStyle)
{
    EXPECT_EQ(line_endings::detect("a\nb\n"), LineEnding::LF);
    EXPECT_EQ(line_endings::detect("a\r\nb\r\n"), LineEnding::CRLF);
    EXPECT_EQ(line_endings::detect("a\rb\r"), LineEnding::CR);
}

TEST(LineEndingTest, MixedOrAbsentSeparatorsAreNotDetected)
{
    EXPECT_FALSE(line_endings::detect("a\nb\r\n").has_value());
    EXPECT_FALSE(line_endings::detect("a\rb\n").has_value());
    EXPECT_FALSE(line_endings::detect("single line").has_value());
}

TEST(LineEndingTest, KeepUsesDetectedStyle)
{
    EXPECT_EQ(line_endings::resolve_separator(LineEnding::KEEP, "a\r\nb\r\n"), "\r\n");
    EXPECT_EQ(line_endings::resolve_separator(LineEnding::KEEP, "a\rb"), "\r");
}

TEST(LineEndingTest, KeepFallsBackToNativeWhenMixed)
{
    EXPECT_EQ(line_endings::resolve_separator(LineEnding::KEEP, "a\nb\r\n"),
              line_endings::native_separator());
}

TEST(LineEndingTest, FixedPolicyIgnoresContent)
{
    EXPECT_EQ(line_endings::resolve_separator(LineEnding::LF, "a\r\nb\r\n"), "\n");
    EXPECT_EQ(line_endings::resolve_separator(LineEnding::AUTO, "a\r\nb\r\n"),
              line_endings::native_separator());
}

} // namespace srcfmt
