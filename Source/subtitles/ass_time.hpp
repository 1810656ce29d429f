#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace assview {

/**
 * @brief Parse ASS timestamp (H:MM:SS.CC) to milliseconds
 * @param timestamp Timestamp string, hours may have any number of digits
 * @return Time in milliseconds, or 0 if the string does not have the expected shape
 */
int64_t ParseAssTimestamp(std::string_view timestamp);

/**
 * @brief Format milliseconds as an ASS timestamp (H:MM:SS.CC)
 * @param timeMs Time in milliseconds, truncated to centiseconds; negative values clamp to zero
 */
std::string FormatAssTimestamp(int64_t timeMs);

} // namespace assview
