#include "subtitles/ass_time.hpp"

#include <algorithm>
#include <cctype>
#include <limits>

#include <fmt/format.h>

#include "utils/parse_int.hpp"

namespace assview {

namespace {

constexpr int64_t MsPerHour = 3600000;
constexpr int64_t MsPerMinute = 60000;
constexpr int64_t MsPerSecond = 1000;
constexpr int64_t MsPerCentisecond = 10;

bool IsAllDigits(std::string_view str)
{
	return !str.empty() && std::all_of(str.begin(), str.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
}

} // namespace

int64_t ParseAssTimestamp(std::string_view timestamp)
{
	// Everything after the hours is fixed width: ":MM:SS.CC"
	constexpr size_t TailLength = 9;
	if (timestamp.size() <= TailLength)
		return 0;

	const size_t hoursLength = timestamp.size() - TailLength;
	const std::string_view hours = timestamp.substr(0, hoursLength);
	const std::string_view tail = timestamp.substr(hoursLength);
	if (tail[0] != ':' || tail[3] != ':' || tail[6] != '.')
		return 0;

	const std::string_view minutes = tail.substr(1, 2);
	const std::string_view seconds = tail.substr(4, 2);
	const std::string_view centiseconds = tail.substr(7, 2);
	if (!IsAllDigits(hours) || !IsAllDigits(minutes) || !IsAllDigits(seconds) || !IsAllDigits(centiseconds))
		return 0;

	// Leave headroom so the sum below cannot overflow.
	constexpr int64_t MaxHours = std::numeric_limits<int64_t>::max() / MsPerHour - 1;
	const ParseIntResult<int64_t> h = ParseInt<int64_t>(hours, 0, MaxHours);
	if (!h.has_value())
		return 0;

	// Two digits each, cannot fail
	const int64_t m = ParseInt<int64_t>(minutes).value_or(0);
	const int64_t s = ParseInt<int64_t>(seconds).value_or(0);
	const int64_t cs = ParseInt<int64_t>(centiseconds).value_or(0);

	return *h * MsPerHour + m * MsPerMinute + s * MsPerSecond + cs * MsPerCentisecond;
}

std::string FormatAssTimestamp(int64_t timeMs)
{
	timeMs = std::max<int64_t>(timeMs, 0);
	const int64_t hours = timeMs / MsPerHour;
	const int64_t minutes = (timeMs % MsPerHour) / MsPerMinute;
	const int64_t seconds = (timeMs % MsPerMinute) / MsPerSecond;
	const int64_t centiseconds = (timeMs % MsPerSecond) / MsPerCentisecond;
	return fmt::format("{}:{:02}:{:02}.{:02}", hours, minutes, seconds, centiseconds);
}

} // namespace assview
