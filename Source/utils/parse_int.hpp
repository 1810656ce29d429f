#pragma once

#include <charconv>
#include <cmath>
#include <limits>
#include <string_view>
#include <system_error>

#include <tl/expected.hpp>

namespace assview {

enum class ParseIntError {
	ParseError = 1,
	OutOfRange
};

template <typename IntT>
using ParseIntResult = tl::expected<IntT, ParseIntError>;

/**
 * @brief Parses the integer at the start of `str`.
 *
 * Trailing characters are not an error; pass `endOfParse` to find out where parsing stopped.
 */
template <typename IntT>
ParseIntResult<IntT> ParseInt(
    std::string_view str, IntT min = std::numeric_limits<IntT>::min(),
    IntT max = std::numeric_limits<IntT>::max(), const char **endOfParse = nullptr)
{
	IntT value;
	const std::from_chars_result result = std::from_chars(str.data(), str.data() + str.size(), value);
	if (endOfParse != nullptr) {
		*endOfParse = result.ptr;
	}
	if (result.ec == std::errc::invalid_argument)
		return tl::unexpected(ParseIntError::ParseError);
	if (result.ec == std::errc::result_out_of_range || value < min || value > max)
		return tl::unexpected(ParseIntError::OutOfRange);
	if (result.ec != std::errc())
		return tl::unexpected(ParseIntError::ParseError);
	return value;
}

/**
 * @brief Parses `str` as an integer, rejecting any trailing characters.
 */
template <typename IntT>
ParseIntResult<IntT> ParseWholeInt(std::string_view str)
{
	const char *end = nullptr;
	ParseIntResult<IntT> result = ParseInt<IntT>(str, std::numeric_limits<IntT>::min(), std::numeric_limits<IntT>::max(), &end);
	if (result.has_value() && end != str.data() + str.size())
		return tl::unexpected(ParseIntError::ParseError);
	return result;
}

/**
 * @brief Parses `str` as a decimal floating point number, rejecting any trailing characters.
 *
 * NaN and infinities are rejected.
 */
inline ParseIntResult<float> ParseFloat(std::string_view str)
{
	float value;
	const std::from_chars_result result = std::from_chars(str.data(), str.data() + str.size(), value);
	if (result.ec == std::errc::result_out_of_range)
		return tl::unexpected(ParseIntError::OutOfRange);
	if (result.ec != std::errc() || result.ptr != str.data() + str.size())
		return tl::unexpected(ParseIntError::ParseError);
	if (!std::isfinite(value))
		return tl::unexpected(ParseIntError::ParseError);
	return value;
}

} // namespace assview
