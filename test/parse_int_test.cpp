#include <gtest/gtest.h>

#include <cstdint>

#include "utils/parse_int.hpp"

namespace assview {

TEST(ParseIntTest, ParseInt)
{
	ParseIntResult<int> result = ParseInt<int>("");
	ASSERT_FALSE(result.has_value());
	EXPECT_EQ(result.error(), ParseIntError::ParseError);

	result = ParseInt<int>("abcd");
	ASSERT_FALSE(result.has_value());
	EXPECT_EQ(result.error(), ParseIntError::ParseError);

	result = ParseInt<int>("12abc");
	ASSERT_TRUE(result.has_value());
	EXPECT_EQ(result.value(), 12);

	result = ParseInt<int>("99999999999999999999999");
	ASSERT_FALSE(result.has_value());
	EXPECT_EQ(result.error(), ParseIntError::OutOfRange);

	result = ParseInt<int>("-42");
	ASSERT_TRUE(result.has_value());
	EXPECT_EQ(result.value(), -42);

	ParseIntResult<int8_t> shortResult = ParseInt<int8_t>("200");
	ASSERT_FALSE(shortResult.has_value());
	EXPECT_EQ(shortResult.error(), ParseIntError::OutOfRange);

	result = ParseInt<int>("50", 0, 10);
	ASSERT_FALSE(result.has_value());
	EXPECT_EQ(result.error(), ParseIntError::OutOfRange);
}

TEST(ParseIntTest, EndOfParse)
{
	constexpr std::string_view Str = "123,456";
	const char *end = nullptr;
	const ParseIntResult<int> result = ParseInt<int>(Str, 0, 1000, &end);
	ASSERT_TRUE(result.has_value());
	EXPECT_EQ(result.value(), 123);
	EXPECT_EQ(end, Str.data() + 3);
}

TEST(ParseIntTest, ParseWholeInt)
{
	EXPECT_EQ(ParseWholeInt<int>("0010").value_or(-1), 10);
	EXPECT_FALSE(ParseWholeInt<int>("12abc").has_value());
	EXPECT_FALSE(ParseWholeInt<int>(" 12").has_value());
	EXPECT_FALSE(ParseWholeInt<int>("").has_value());
}

TEST(ParseIntTest, ParseFloat)
{
	EXPECT_FLOAT_EQ(ParseFloat("28.5").value_or(0), 28.5F);
	EXPECT_FLOAT_EQ(ParseFloat("-3").value_or(0), -3.0F);
	EXPECT_FALSE(ParseFloat("1.5px").has_value());
	EXPECT_FALSE(ParseFloat("").has_value());
	EXPECT_FALSE(ParseFloat("big").has_value());
}

TEST(ParseIntTest, ParseFloatRejectsNonFinite)
{
	EXPECT_FALSE(ParseFloat("nan").has_value());
	EXPECT_FALSE(ParseFloat("inf").has_value());
	EXPECT_FALSE(ParseFloat("-inf").has_value());
	EXPECT_FALSE(ParseFloat("infinity").has_value());
}

} // namespace assview
