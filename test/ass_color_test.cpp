#include <gtest/gtest.h>

#include <fmt/format.h>

#include "subtitles/ass_color.hpp"

namespace assview {

TEST(AssColor, RedChannelIsLastByteGroup)
{
	const AssColor color = ParseAssColor("&H000000FF");
	EXPECT_EQ(color.r, 255);
	EXPECT_EQ(color.g, 0);
	EXPECT_EQ(color.b, 0);
	EXPECT_FLOAT_EQ(color.a, 1.0F);
}

TEST(AssColor, ByteOrderIsAlphaBlueGreenRed)
{
	const AssColor color = ParseAssColor("&H00112233");
	EXPECT_EQ(color.b, 0x11);
	EXPECT_EQ(color.g, 0x22);
	EXPECT_EQ(color.r, 0x33);
}

TEST(AssColor, FullAlphaByteIsTransparent)
{
	const AssColor color = ParseAssColor("&HFF000000");
	EXPECT_EQ(color.r, 0);
	EXPECT_EQ(color.g, 0);
	EXPECT_EQ(color.b, 0);
	EXPECT_FLOAT_EQ(color.a, 0.0F);
}

TEST(AssColor, AlphaRoundsToTwoDecimals)
{
	// 1 - 0x80 / 255 = 0.498...
	EXPECT_FLOAT_EQ(ParseAssColor("&H80FFFFFF").a, 0.5F);
	// 1 - 0x40 / 255 = 0.749...
	EXPECT_FLOAT_EQ(ParseAssColor("&H40FFFFFF").a, 0.75F);
}

TEST(AssColor, LowercaseHexDigits)
{
	const AssColor color = ParseAssColor("&H00ff8000");
	EXPECT_EQ(color.b, 0xFF);
	EXPECT_EQ(color.g, 0x80);
	EXPECT_EQ(color.r, 0x00);
}

TEST(AssColor, TrailingCharactersAreIgnored)
{
	EXPECT_EQ(ParseAssColor("&H000000FF&"), ParseAssColor("&H000000FF"));
}

TEST(AssColor, UndecodableIsOpaqueWhite)
{
	EXPECT_EQ(ParseAssColor("garbage"), DefaultAssColor);
	EXPECT_EQ(ParseAssColor(""), DefaultAssColor);
	EXPECT_EQ(ParseAssColor("000000FF"), DefaultAssColor) << "Prefix is required";
	EXPECT_EQ(ParseAssColor("&H0000FF"), DefaultAssColor) << "Six digit colors are not accepted";
	EXPECT_EQ(ParseAssColor("&H0000GGFF"), DefaultAssColor);
	EXPECT_EQ(DefaultAssColor, (AssColor { 255, 255, 255, 1.0F }));
}

TEST(AssColor, FormatCssRgba)
{
	EXPECT_EQ(FormatCssRgba(ParseAssColor("&H000000FF")), "rgba(255, 0, 0, 1.00)");
	EXPECT_EQ(FormatCssRgba(ParseAssColor("&H80FF0000")), "rgba(0, 0, 255, 0.50)");
	EXPECT_EQ(fmt::format("{}", DefaultAssColor), "rgba(255, 255, 255, 1.00)");
}

} // namespace assview
