#include "subtitles/ass_color.hpp"

#include <cctype>
#include <charconv>
#include <cmath>

namespace assview {

namespace {

constexpr std::string_view ColorPrefix = "&H";
constexpr size_t HexDigits = 8;

bool IsHexRun(std::string_view str)
{
	for (char c : str) {
		if (std::isxdigit(static_cast<unsigned char>(c)) == 0)
			return false;
	}
	return true;
}

uint8_t HexByte(std::string_view digits)
{
	uint8_t value = 0;
	std::from_chars(digits.data(), digits.data() + digits.size(), value, 16);
	return value;
}

} // namespace

AssColor ParseAssColor(std::string_view assColor)
{
	if (assColor.substr(0, ColorPrefix.size()) != ColorPrefix)
		return DefaultAssColor;

	// Use the first "&H" that is followed by a full run of hex digits.
	for (size_t pos = assColor.find(ColorPrefix); pos != std::string_view::npos; pos = assColor.find(ColorPrefix, pos + 1)) {
		const std::string_view digits = assColor.substr(pos + ColorPrefix.size(), HexDigits);
		if (digits.size() != HexDigits || !IsHexRun(digits))
			continue;

		const uint8_t alpha = HexByte(digits.substr(0, 2));
		AssColor color;
		color.b = HexByte(digits.substr(2, 2));
		color.g = HexByte(digits.substr(4, 2));
		color.r = HexByte(digits.substr(6, 2));
		color.a = static_cast<float>(std::round((1.0 - alpha / 255.0) * 100.0) / 100.0);
		return color;
	}

	return DefaultAssColor;
}

std::string FormatCssRgba(const AssColor &color)
{
	return fmt::format("rgba({}, {}, {}, {:.2f})", color.r, color.g, color.b, color.a);
}

} // namespace assview
