#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace assview {

/**
 * @brief A decoded ASS color.
 *
 * Channels are 0-255, alpha is opacity in [0, 1] rounded to two decimals.
 */
struct AssColor {
	uint8_t r;
	uint8_t g;
	uint8_t b;
	float a;

	bool operator==(const AssColor &) const = default;
};

/** Fallback for every color that cannot be decoded: opaque white. */
constexpr AssColor DefaultAssColor { 255, 255, 255, 1.0F };

/**
 * @brief Parse an ASS color (&HAABBGGRR)
 *
 * The byte groups are alpha, blue, green, red in that order. An alpha byte of 0x00
 * is fully opaque and 0xFF fully transparent.
 *
 * @param assColor Color string, must start with "&H"
 * @return The decoded color, or DefaultAssColor if the string cannot be decoded
 */
AssColor ParseAssColor(std::string_view assColor);

/**
 * @brief Format a color as "rgba(r, g, b, a)" with two alpha decimals
 */
std::string FormatCssRgba(const AssColor &color);

} // namespace assview

template <>
struct fmt::formatter<assview::AssColor> : fmt::formatter<std::string_view> {
	template <typename FormatContext>
	auto format(const assview::AssColor &color, FormatContext &ctx) const
	{
		return fmt::formatter<std::string_view>::format(assview::FormatCssRgba(color), ctx);
	}
};
