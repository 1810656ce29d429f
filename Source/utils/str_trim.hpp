#pragma once

#include <cstddef>
#include <string_view>

namespace assview {

constexpr std::string_view AsciiWhitespace = " \t\r\n\f\v";

[[nodiscard]] constexpr std::string_view TrimLeft(std::string_view str)
{
	const size_t first = str.find_first_not_of(AsciiWhitespace);
	return first == std::string_view::npos ? std::string_view {} : str.substr(first);
}

[[nodiscard]] constexpr std::string_view TrimRight(std::string_view str)
{
	const size_t last = str.find_last_not_of(AsciiWhitespace);
	return last == std::string_view::npos ? std::string_view {} : str.substr(0, last + 1);
}

[[nodiscard]] constexpr std::string_view TrimWhitespace(std::string_view str)
{
	return TrimRight(TrimLeft(str));
}

} // namespace assview
