#include "srcfmt/config/options_loader.hpp"
#include "srcfmt/errors.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <sstream>

namespace srcfmt {

class OptionsLoaderTest : public ::testing::Test {
protected:
    TempDirectory temp_;
};

TEST_F(OptionsLoaderTest, EmptyPathYieldsEmptyOptions)
{
    auto options = load_formatter_options("", temp_.path());

    ASSERT_TRUE(options.has_value());
    EXPECT_TRUE(options->empty());
}

TEST_F(OptionsLoaderTest, MissingFileYieldsNothing)
{
    EXPECT_FALSE(load_formatter_options("java.properties", temp_.path()).has_value());
}

TEST_F(OptionsLoaderTest, RelativePathIsResolvedAgainstBasedir)
{
    temp_.write("src/config/formatter/java.properties",
                "org.eclipse.jdt.core.formatter.tabulation.char=tab\n");

    auto options = load_formatter_options("src/config/formatter/java.properties", temp_.path());

    ASSERT_TRUE(options.has_value());
    EXPECT_EQ(options->at("org.eclipse.jdt.core.formatter.tabulation.char"), "tab");
}

TEST_F(OptionsLoaderTest, DirectoryIsConfigError)
{
    std::filesystem::create_directories(temp_.path() / "java.properties");

    EXPECT_THROW(load_formatter_options("java.properties", temp_.path()), ConfigError);
}

TEST_F(OptionsLoaderTest, MalformedFileIsConfigError)
{
    temp_.write("java.properties", "a=1\njust words\n");

    try {
        load_formatter_options("java.properties", temp_.path());
        FAIL() << "Expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_STREQ(e.what(), "Cannot parse config file [java.properties]: malformed line 2");
    }
}

TEST(ParseFormatterOptionsTest, AcceptsBothSeparatorsAndComments)
{
    std::istringstream in("#Eclipse formatter\r\n"
                          "! legacy comment\r\n"
                          "\r\n"
                          "a.b = space\r\n"
                          "c.d: 8\r\n"
                          "e.f=\r\n");

    auto options = parse_formatter_options(in, "inline");

    EXPECT_EQ(options, (FormatterOptions{{"a.b", "space"}, {"c.d", "8"}, {"e.f", ""}}));
}

TEST(ParseFormatterOptionsTest, LaterKeyWins)
{
    std::istringstream in("a=1\na=2\n");

    EXPECT_EQ(parse_formatter_options(in, "inline").at("a"), "2");
}

TEST(ParseFormatterOptionsTest, MissingKeyIsConfigError)
{
    std::istringstream in("=value\n");

    EXPECT_THROW(parse_formatter_options(in, "inline"), ConfigError);
}

} // namespace srcfmt
