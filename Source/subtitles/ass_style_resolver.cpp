#include "subtitles/ass_style_resolver.hpp"

#include <optional>

#include "utils/log.hpp"

namespace assview {

namespace {

/**
 * @brief First value that is present and non-zero, else the fallback.
 *
 * A zero margin or size counts as "not set", which lets an event margin of 0000 defer to
 * its style.
 */
template <typename T>
T FirstNonZero(std::optional<T> first, std::optional<T> second, T fallback)
{
	if (first && *first != 0)
		return *first;
	if (second && *second != 0)
		return *second;
	return fallback;
}

AssTextStyle BaseTextStyle(const AssStyle *style, const AssRenderDefaults &defaults)
{
	AssTextStyle textStyle;
	textStyle.shadowOffsetX = defaults.shadowOffsetX;
	textStyle.shadowOffsetY = defaults.shadowOffsetY;
	textStyle.textAlign = TextAlign::Center;

	if (style == nullptr) {
		textStyle.color = defaults.textColor;
		textStyle.fontSize = defaults.fontSize;
		textStyle.fontWeight = FontWeight::Normal;
		textStyle.fontStyle = FontStyle::Normal;
		textStyle.textDecoration = TextDecoration::None;
		textStyle.letterSpacing = 0;
		textStyle.shadowColor = defaults.shadowColor;
		textStyle.shadowRadius = 0;
		return textStyle;
	}

	textStyle.color = style->primaryColor;
	textStyle.fontSize = FirstNonZero<float>(style->fontSize, std::nullopt, defaults.fontSize);
	textStyle.fontWeight = style->bold ? FontWeight::Bold : FontWeight::Normal;
	textStyle.fontStyle = style->italic ? FontStyle::Italic : FontStyle::Normal;
	textStyle.textDecoration = style->underline ? TextDecoration::Underline : TextDecoration::None;
	textStyle.letterSpacing = style->spacing.value_or(0);
	textStyle.shadowColor = style->outlineColor;
	textStyle.shadowRadius = style->shadow.value_or(0);
	return textStyle;
}

void ApplyOverrides(AssTextStyle &textStyle, const AssOverrides &overrides)
{
	if (overrides.fontWeight)
		textStyle.fontWeight = *overrides.fontWeight;
	if (overrides.fontStyle)
		textStyle.fontStyle = *overrides.fontStyle;
	if (overrides.textDecoration)
		textStyle.textDecoration = *overrides.textDecoration;
	if (overrides.fontSize && *overrides.fontSize != 0)
		textStyle.fontSize = static_cast<float>(*overrides.fontSize);
	if (overrides.color)
		textStyle.color = *overrides.color;
}

} // namespace

ResolvedAssStyle ResolveAssStyle(const AssDocument &document, const AssDialogue &dialogue, const AssRenderDefaults &defaults)
{
	const AssStyle *style = document.FindStyle(dialogue.style);
	if (style == nullptr)
		LogVerbose("Dialogue uses unknown style \"{}\", using defaults", dialogue.style);

	ResolvedAssStyle resolved;
	AssTextStyle &textStyle = resolved.textStyle;
	AssPosition &position = resolved.position;

	textStyle = BaseTextStyle(style, defaults);
	ApplyOverrides(textStyle, dialogue.overrides);

	const std::optional<int> styleAlignment = style != nullptr ? style->alignment : std::nullopt;
	const int alignment = FirstNonZero(dialogue.overrides.alignment, styleAlignment, defaults.alignment);

	// Numpad layout: 7-9 top row, 4-6 middle row, 1-3 bottom row.
	const std::optional<int> styleMarginV = style != nullptr ? style->marginV : std::nullopt;
	if (alignment >= 7) {
		position.vertical = VerticalAnchor::Top;
		position.marginVertical = FirstNonZero(dialogue.marginV, styleMarginV, defaults.margin);
	} else if (alignment >= 4) {
		position.vertical = VerticalAnchor::Middle;
		position.translateY = -textStyle.fontSize / 2;
	} else {
		position.vertical = VerticalAnchor::Bottom;
		position.marginVertical = FirstNonZero(dialogue.marginV, styleMarginV, defaults.margin);
	}

	// Left column is 1/4/7, right column is 3/6/9.
	if (alignment % 3 == 1) {
		const std::optional<int> styleMarginL = style != nullptr ? style->marginL : std::nullopt;
		position.horizontal = HorizontalAnchor::Left;
		position.marginHorizontal = FirstNonZero(dialogue.marginL, styleMarginL, defaults.margin);
		textStyle.textAlign = TextAlign::Left;
	} else if (alignment % 3 == 0) {
		const std::optional<int> styleMarginR = style != nullptr ? style->marginR : std::nullopt;
		position.horizontal = HorizontalAnchor::Right;
		position.marginHorizontal = FirstNonZero(dialogue.marginR, styleMarginR, defaults.margin);
		textStyle.textAlign = TextAlign::Right;
	} else {
		position.horizontal = HorizontalAnchor::Center;
		position.translateXPercent = -50;
		textStyle.textAlign = TextAlign::Center;
	}

	if (dialogue.overrides.position) {
		position = AssPosition {};
		position.absolute = true;
		position.x = dialogue.overrides.position->x;
		position.y = dialogue.overrides.position->y;
	}

	return resolved;
}

} // namespace assview
