/**
 * @file ass_style_resolver.hpp
 *
 * Merges a dialogue's style, inline overrides and alignment into a renderer-neutral
 * style descriptor.
 */
#pragma once

#include <cstdint>

#include "subtitles/ass_color.hpp"
#include "subtitles/ass_document.hpp"
#include "subtitles/ass_override_tags.hpp"

namespace assview {

enum class TextAlign : uint8_t {
	Left,
	Center,
	Right,
};

enum class VerticalAnchor : uint8_t {
	Top,
	Middle,
	Bottom,
};

enum class HorizontalAnchor : uint8_t {
	Left,
	Center,
	Right,
};

/**
 * @brief Fallback values used when neither the dialogue nor its style provides one.
 */
struct AssRenderDefaults {
	float fontSize = 24;
	int margin = 20;
	/** Numpad alignment, 2 is bottom center */
	int alignment = 2;
	AssColor textColor = DefaultAssColor;
	AssColor shadowColor { 0, 0, 0, 0.8F };
	float shadowOffsetX = 1;
	float shadowOffsetY = 1;
};

struct AssTextStyle {
	AssColor color;
	float fontSize;
	FontWeight fontWeight;
	FontStyle fontStyle;
	TextDecoration textDecoration;
	float letterSpacing;
	AssColor shadowColor;
	float shadowRadius;
	float shadowOffsetX;
	float shadowOffsetY;
	TextAlign textAlign;

	bool operator==(const AssTextStyle &) const = default;
};

/**
 * @brief Where to place the text box on screen.
 *
 * Edge-relative placement anchors the box to one vertical and one horizontal edge at the
 * given margins; a Middle or Center anchor puts the box's edge at 50% and shifts it back
 * by the translation. Absolute placement puts the box's top-left corner at (x, y).
 */
struct AssPosition {
	bool absolute = false;
	VerticalAnchor vertical = VerticalAnchor::Top;
	HorizontalAnchor horizontal = HorizontalAnchor::Left;
	int marginVertical = 0;
	int marginHorizontal = 0;
	float translateXPercent = 0; // Of the text box width
	float translateY = 0;        // Pixels
	int x = 0;
	int y = 0;

	bool operator==(const AssPosition &) const = default;
};

struct ResolvedAssStyle {
	AssTextStyle textStyle;
	AssPosition position;

	bool operator==(const ResolvedAssStyle &) const = default;
};

/**
 * @brief Resolves the final text style and screen position of a dialogue.
 *
 * The style named by the dialogue provides the base (or `defaults` if the document has no
 * such style), inline overrides replace individual attributes, alignment picks the
 * anchors and an explicit \pos override replaces the computed position entirely.
 */
ResolvedAssStyle ResolveAssStyle(const AssDocument &document, const AssDialogue &dialogue, const AssRenderDefaults &defaults = {});

} // namespace assview
