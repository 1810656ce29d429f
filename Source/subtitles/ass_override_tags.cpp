#include "subtitles/ass_override_tags.hpp"

#include <cctype>

#include "utils/log.hpp"
#include "utils/parse_int.hpp"
#include "utils/str_split.hpp"

namespace assview {

namespace {

constexpr std::string_view BlockStart = "{\\";

bool StartsWith(std::string_view str, std::string_view prefix)
{
	return str.substr(0, prefix.size()) == prefix;
}

std::optional<int> ParseTagArgument(std::string_view argument)
{
	const ParseIntResult<int> result = ParseInt<int>(argument);
	if (!result.has_value())
		return std::nullopt;
	return *result;
}

size_t CountDigits(std::string_view str)
{
	size_t count = 0;
	while (count < str.size() && std::isdigit(static_cast<unsigned char>(str[count])) != 0)
		++count;
	return count;
}

/**
 * @brief Finds "pos(<digits>,<digits>)" anywhere in the command.
 */
std::optional<AssPoint> ParsePosition(std::string_view command)
{
	constexpr std::string_view Open = "pos(";
	for (size_t pos = command.find(Open); pos != std::string_view::npos; pos = command.find(Open, pos + 1)) {
		std::string_view rest = command.substr(pos + Open.size());

		const size_t xDigits = CountDigits(rest);
		if (xDigits == 0 || xDigits >= rest.size() || rest[xDigits] != ',')
			continue;
		const std::string_view xText = rest.substr(0, xDigits);
		rest.remove_prefix(xDigits + 1);

		const size_t yDigits = CountDigits(rest);
		if (yDigits == 0 || yDigits >= rest.size() || rest[yDigits] != ')')
			continue;
		const std::string_view yText = rest.substr(0, yDigits);

		const ParseIntResult<int> x = ParseInt<int>(xText);
		const ParseIntResult<int> y = ParseInt<int>(yText);
		if (!x.has_value() || !y.has_value())
			continue;
		return AssPoint { *x, *y };
	}
	return std::nullopt;
}

} // namespace

bool ApplyOverrideCommand(std::string_view command, AssOverrides &overrides)
{
	if (StartsWith(command, "fs")) {
		const std::optional<int> size = ParseTagArgument(command.substr(2));
		if (!size)
			return false;
		overrides.fontSize = *size;
		return true;
	}

	if (command == "b1") {
		overrides.fontWeight = FontWeight::Bold;
		return true;
	}
	if (command == "b0") {
		overrides.fontWeight = FontWeight::Normal;
		return true;
	}
	if (command == "i1") {
		overrides.fontStyle = FontStyle::Italic;
		return true;
	}
	if (command == "i0") {
		overrides.fontStyle = FontStyle::Normal;
		return true;
	}
	if (command == "u1") {
		overrides.textDecoration = TextDecoration::Underline;
		return true;
	}
	if (command == "u0") {
		overrides.textDecoration = TextDecoration::None;
		return true;
	}

	if (StartsWith(command, "1c") || StartsWith(command, "c")) {
		const size_t colorStart = command.find("&H");
		if (colorStart != std::string_view::npos) {
			overrides.color = ParseAssColor(command.substr(colorStart));
			return true;
		}
	}

	if (StartsWith(command, "pos")) {
		if (const std::optional<AssPoint> position = ParsePosition(command)) {
			overrides.position = *position;
			return true;
		}
		return false;
	}

	if (StartsWith(command, "an")) {
		const std::optional<int> alignment = ParseTagArgument(command.substr(2));
		if (!alignment)
			return false;
		overrides.alignment = *alignment;
		return true;
	}

	return false;
}

DecodedDialogueText DecodeOverrideTags(std::string_view text)
{
	DecodedDialogueText result;
	result.displayText.reserve(text.size());

	size_t cursor = 0;
	while (cursor < text.size()) {
		const size_t blockStart = text.find(BlockStart, cursor);
		if (blockStart == std::string_view::npos)
			break;
		const size_t blockEnd = text.find('}', blockStart + BlockStart.size());
		if (blockEnd == std::string_view::npos)
			break; // Unterminated block stays in the text.

		result.displayText.append(text.substr(cursor, blockStart - cursor));

		const size_t contentStart = blockStart + BlockStart.size();
		const std::string_view content = text.substr(contentStart, blockEnd - contentStart);
		for (const std::string_view command : SplitByChar(content, '\\')) {
			if (command.empty())
				continue;
			if (!ApplyOverrideCommand(command, result.overrides))
				LogVerbose("Ignoring override \"\\{}\"", command);
		}

		cursor = blockEnd + 1;
	}

	if (cursor < text.size())
		result.displayText.append(text.substr(cursor));

	return result;
}

} // namespace assview
