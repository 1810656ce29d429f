#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "subtitles/ass_color.hpp"

namespace assview {

enum class FontWeight : uint8_t {
	Normal,
	Bold,
};

enum class FontStyle : uint8_t {
	Normal,
	Italic,
};

enum class TextDecoration : uint8_t {
	None,
	Underline,
};

struct AssPoint {
	int x;
	int y;

	bool operator==(const AssPoint &) const = default;
};

/**
 * @brief Inline overrides collected from the `{\...}` blocks of one dialogue line.
 *
 * Every slot is optional; an empty slot inherits from the dialogue's style.
 */
struct AssOverrides {
	std::optional<int> fontSize;
	std::optional<FontWeight> fontWeight;
	std::optional<FontStyle> fontStyle;
	std::optional<TextDecoration> textDecoration;
	std::optional<AssColor> color;
	std::optional<AssPoint> position;
	std::optional<int> alignment;

	[[nodiscard]] bool empty() const
	{
		return !fontSize && !fontWeight && !fontStyle && !textDecoration && !color && !position && !alignment;
	}

	bool operator==(const AssOverrides &) const = default;
};

struct DecodedDialogueText {
	std::string displayText;
	AssOverrides overrides;
};

/**
 * @brief Applies a single override command (the text between two backslashes) to `overrides`.
 * @return false if the command is not one we recognize or its argument could not be parsed
 */
bool ApplyOverrideCommand(std::string_view command, AssOverrides &overrides);

/**
 * @brief Strips all `{\...}` blocks from dialogue text and decodes the commands inside them.
 *
 * Blocks are not nested; text outside the blocks is kept verbatim. When a block sets a
 * value that an earlier block already set, the later one wins.
 */
DecodedDialogueText DecodeOverrideTags(std::string_view text);

} // namespace assview
