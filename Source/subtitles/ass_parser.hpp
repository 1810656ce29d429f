#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "subtitles/ass_document.hpp"

namespace assview {

enum class AssSection : uint8_t {
	None,
	ScriptInfo,
	Styles,
	Events,
};

/**
 * @brief Maps a section header name (without brackets) to the section we parse.
 *
 * Unknown sections map to AssSection::None, whose lines are ignored.
 */
AssSection SectionFromHeader(std::string_view name);

/**
 * @brief Builds an AssStyle from the text after "Style:".
 *
 * Rows shorter than the 23 standard fields leave the missing attributes empty.
 */
AssStyle ParseStyleFields(std::string_view fields);

/**
 * @brief Builds an AssDialogue from the text after "Dialogue:".
 *
 * The first nine comma-separated fields are fixed; everything after the ninth comma is
 * the dialogue text, commas included.
 */
AssDialogue ParseDialogueFields(std::string_view fields);

/**
 * @brief Line-at-a-time ASS parser.
 *
 * Section headers switch the state; every state owns the rule for the lines it accepts.
 * Anything it does not understand is skipped.
 */
class AssDocumentParser {
public:
	void ParseLine(std::string_view line);

	[[nodiscard]] AssSection section() const
	{
		return section_;
	}

	[[nodiscard]] const AssDocument &document() const
	{
		return document_;
	}

	[[nodiscard]] size_t skippedLines() const
	{
		return skippedLines_;
	}

	AssDocument Finish() &&;

private:
	void ParseScriptInfoLine(std::string_view line);
	void ParseStylesLine(std::string_view line);
	void ParseEventsLine(std::string_view line);
	void Skip(std::string_view line);

	AssSection section_ = AssSection::None;
	AssDocument document_;
	size_t lineNumber_ = 0;
	size_t skippedLines_ = 0;
};

/**
 * @brief Parse the full text of an ASS script.
 *
 * Never fails: malformed lines are skipped and malformed fields are left empty.
 */
AssDocument ParseAssDocument(std::string_view content);

} // namespace assview
