#include "subtitles/ass_parser.hpp"

#include <optional>
#include <string>
#include <utility>

#include <magic_enum/magic_enum.hpp>

#include "subtitles/ass_override_tags.hpp"
#include "subtitles/ass_time.hpp"
#include "utils/log.hpp"
#include "utils/parse_int.hpp"
#include "utils/str_split.hpp"
#include "utils/str_trim.hpp"

namespace assview {

namespace {

constexpr std::string_view Utf8Bom = "\xEF\xBB\xBF";
constexpr std::string_view StylePrefix = "Style:";
constexpr std::string_view DialoguePrefix = "Dialogue:";

bool StartsWith(std::string_view str, std::string_view prefix)
{
	return str.substr(0, prefix.size()) == prefix;
}

/**
 * @brief Reads the comma-separated fields of one line in order.
 *
 * Reading past the last field leaves the output untouched, which is how short rows end up
 * with empty attributes.
 */
class FieldReader {
public:
	FieldReader(std::string_view fields, std::string_view lineKind)
	    : it_(SplitByCharIterator::begin(fields, ','))
	    , end_(SplitByCharIterator::end(fields, ','))
	    , lineKind_(lineKind)
	{
	}

	void readString(std::string_view name, std::string &out)
	{
		if (const std::optional<std::string_view> value = next(name))
			out = std::string(*value);
	}

	void readOptionalInt(std::string_view name, std::optional<int> &out)
	{
		const std::optional<std::string_view> value = next(name);
		if (!value || value->empty())
			return;
		const ParseIntResult<int> result = ParseWholeInt<int>(*value);
		if (!result.has_value()) {
			LogVerbose("{} field {} has unparseable value \"{}\"", lineKind_, name, *value);
			return;
		}
		out = *result;
	}

	void readOptionalFloat(std::string_view name, std::optional<float> &out)
	{
		const std::optional<std::string_view> value = next(name);
		if (!value || value->empty())
			return;
		const ParseIntResult<float> result = ParseFloat(*value);
		if (!result.has_value()) {
			LogVerbose("{} field {} has unparseable value \"{}\"", lineKind_, name, *value);
			return;
		}
		out = *result;
	}

	void readColor(std::string_view name, AssColor &out)
	{
		if (const std::optional<std::string_view> value = next(name))
			out = ParseAssColor(*value);
	}

	void readFlag(std::string_view name, bool &out)
	{
		if (const std::optional<std::string_view> value = next(name))
			out = *value == "-1";
	}

	void readTimestamp(std::string_view name, int64_t &out)
	{
		if (const std::optional<std::string_view> value = next(name))
			out = ParseAssTimestamp(*value);
	}

	/** @brief The untrimmed rest of the line, separators included. */
	[[nodiscard]] std::string_view remainder() const
	{
		return it_.remainder();
	}

private:
	std::optional<std::string_view> next(std::string_view name)
	{
		if (it_ == end_) {
			LogVerbose("{} line is missing field {}", lineKind_, name);
			return std::nullopt;
		}
		const std::string_view value = TrimWhitespace(*it_);
		++it_;
		return value;
	}

	SplitByCharIterator it_;
	SplitByCharIterator end_;
	std::string_view lineKind_;
};

} // namespace

AssSection SectionFromHeader(std::string_view name)
{
	if (name == "Script Info")
		return AssSection::ScriptInfo;
	if (name == "V4 Styles" || name == "V4+ Styles")
		return AssSection::Styles;
	if (name == "Events")
		return AssSection::Events;
	return AssSection::None;
}

AssStyle ParseStyleFields(std::string_view fields)
{
	AssStyle style;
	FieldReader reader { fields, "Style" };
	reader.readString("Name", style.name);
	reader.readString("Fontname", style.fontName);
	reader.readOptionalFloat("Fontsize", style.fontSize);
	reader.readColor("PrimaryColour", style.primaryColor);
	reader.readColor("SecondaryColour", style.secondaryColor);
	reader.readColor("OutlineColour", style.outlineColor);
	reader.readColor("BackColour", style.backColor);
	reader.readFlag("Bold", style.bold);
	reader.readFlag("Italic", style.italic);
	reader.readFlag("Underline", style.underline);
	reader.readFlag("StrikeOut", style.strikeout);
	reader.readOptionalFloat("ScaleX", style.scaleX);
	reader.readOptionalFloat("ScaleY", style.scaleY);
	reader.readOptionalFloat("Spacing", style.spacing);
	reader.readOptionalFloat("Angle", style.angle);
	reader.readOptionalInt("BorderStyle", style.borderStyle);
	reader.readOptionalFloat("Outline", style.outline);
	reader.readOptionalFloat("Shadow", style.shadow);
	reader.readOptionalInt("Alignment", style.alignment);
	reader.readOptionalInt("MarginL", style.marginL);
	reader.readOptionalInt("MarginR", style.marginR);
	reader.readOptionalInt("MarginV", style.marginV);
	reader.readOptionalInt("Encoding", style.encoding);
	return style;
}

AssDialogue ParseDialogueFields(std::string_view fields)
{
	AssDialogue dialogue;
	FieldReader reader { fields, "Dialogue" };
	reader.readOptionalInt("Layer", dialogue.layer);
	reader.readTimestamp("Start", dialogue.startMs);
	reader.readTimestamp("End", dialogue.endMs);
	reader.readString("Style", dialogue.style);
	reader.readString("Name", dialogue.name);
	reader.readOptionalInt("MarginL", dialogue.marginL);
	reader.readOptionalInt("MarginR", dialogue.marginR);
	reader.readOptionalInt("MarginV", dialogue.marginV);
	reader.readString("Effect", dialogue.effect);

	dialogue.text = std::string(reader.remainder());
	DecodedDialogueText decoded = DecodeOverrideTags(dialogue.text);
	dialogue.displayText = std::move(decoded.displayText);
	dialogue.overrides = decoded.overrides;
	return dialogue;
}

void AssDocumentParser::ParseLine(std::string_view line)
{
	++lineNumber_;
	if (lineNumber_ == 1 && StartsWith(line, Utf8Bom))
		line.remove_prefix(Utf8Bom.size());

	line = TrimWhitespace(line);

	if (line.size() >= 2 && line.front() == '[' && line.back() == ']') {
		section_ = SectionFromHeader(line.substr(1, line.size() - 2));
		LogVerbose("Line {}: {} starts section {}", lineNumber_, line, magic_enum::enum_name(section_));
		return;
	}

	if (line.empty() || line.front() == ';')
		return;

	switch (section_) {
	case AssSection::ScriptInfo:
		ParseScriptInfoLine(line);
		break;
	case AssSection::Styles:
		ParseStylesLine(line);
		break;
	case AssSection::Events:
		ParseEventsLine(line);
		break;
	case AssSection::None:
		Skip(line);
		break;
	}
}

void AssDocumentParser::ParseScriptInfoLine(std::string_view line)
{
	const size_t colon = line.find(':');
	if (colon == std::string_view::npos || colon == 0) {
		Skip(line);
		return;
	}
	const std::string_view key = TrimWhitespace(line.substr(0, colon));
	const std::string_view value = TrimWhitespace(line.substr(colon + 1));
	document_.scriptInfo[std::string(key)] = std::string(value);
}

void AssDocumentParser::ParseStylesLine(std::string_view line)
{
	if (!StartsWith(line, StylePrefix)) {
		Skip(line);
		return;
	}
	AssStyle style = ParseStyleFields(line.substr(StylePrefix.size()));
	std::string name = style.name;
	document_.styles.insert_or_assign(std::move(name), std::move(style));
}

void AssDocumentParser::ParseEventsLine(std::string_view line)
{
	if (!StartsWith(line, DialoguePrefix)) {
		Skip(line);
		return;
	}
	document_.dialogues.push_back(ParseDialogueFields(line.substr(DialoguePrefix.size())));
}

void AssDocumentParser::Skip(std::string_view line)
{
	++skippedLines_;
	LogVerbose("Line {}: skipping \"{}\" in section {}", lineNumber_, line, magic_enum::enum_name(section_));
}

AssDocument AssDocumentParser::Finish() &&
{
	LogVerbose("Parsed {} lines: {} script info entries, {} styles, {} dialogues, {} lines skipped",
	    lineNumber_, document_.scriptInfo.size(), document_.styles.size(), document_.dialogues.size(), skippedLines_);
	return std::move(document_);
}

AssDocument ParseAssDocument(std::string_view content)
{
	AssDocumentParser parser;
	for (const std::string_view line : SplitByChar(content, '\n')) {
		parser.ParseLine(line);
	}
	return std::move(parser).Finish();
}

} // namespace assview
