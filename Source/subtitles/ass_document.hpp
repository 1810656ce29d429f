/**
 * @file ass_document.hpp
 *
 * In-memory form of a parsed ASS script.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "subtitles/ass_color.hpp"
#include "subtitles/ass_override_tags.hpp"

namespace assview {

/**
 * @brief One `Style:` line of a [V4 Styles] or [V4+ Styles] section.
 *
 * Numeric attributes that were missing from a short row or could not be parsed are empty.
 */
struct AssStyle {
	std::string name;
	std::string fontName;
	std::optional<float> fontSize;
	AssColor primaryColor = DefaultAssColor;
	AssColor secondaryColor = DefaultAssColor;
	AssColor outlineColor = DefaultAssColor;
	AssColor backColor = DefaultAssColor;
	bool bold = false;
	bool italic = false;
	bool underline = false;
	bool strikeout = false;
	std::optional<float> scaleX;
	std::optional<float> scaleY;
	std::optional<float> spacing;
	std::optional<float> angle;
	std::optional<int> borderStyle;
	std::optional<float> outline;
	std::optional<float> shadow;
	std::optional<int> alignment;
	std::optional<int> marginL;
	std::optional<int> marginR;
	std::optional<int> marginV;
	std::optional<int> encoding;
};

/**
 * @brief One `Dialogue:` line of the [Events] section.
 */
struct AssDialogue {
	std::optional<int> layer;
	int64_t startMs = 0;
	int64_t endMs = 0;
	std::string style;
	std::string name;
	std::optional<int> marginL;
	std::optional<int> marginR;
	std::optional<int> marginV;
	std::string effect;
	std::string text;        // As written, override blocks included
	std::string displayText; // Override blocks removed
	AssOverrides overrides;
};

struct AssDocument {
	std::unordered_map<std::string, std::string> scriptInfo;
	std::unordered_map<std::string, AssStyle> styles;
	std::vector<AssDialogue> dialogues; // Source order

	/**
	 * @brief Look up a style by name.
	 * @return nullptr if the document has no style with that name
	 */
	[[nodiscard]] const AssStyle *FindStyle(std::string_view name) const
	{
		const auto it = styles.find(std::string(name));
		return it != styles.end() ? &it->second : nullptr;
	}
};

} // namespace assview
