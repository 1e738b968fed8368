#pragma once

#include <cstdint>

#include <string_view>

namespace Kinetic {

struct Color {
	float r;
	float g;
	float b;
	float a;

	static constexpr Color from_rgb(float r, float g, float b, float a = 255.f) {
		return {r / 255.f, g / 255.f, b / 255.f, a / 255.f};
	}

	// 0xRRGGBBAA
	static constexpr Color from_rgba_uint(uint32_t rgba) {
		return from_rgb(static_cast<float>((rgba >> 24) & 0xFFu), static_cast<float>((rgba >> 16) & 0xFFu),
				static_cast<float>((rgba >> 8) & 0xFFu), static_cast<float>(rgba & 0xFFu));
	}

	// 0xRRGGBB, fully opaque
	static constexpr Color from_rgb_uint(uint32_t rgb) {
		return from_rgba_uint((rgb << 8) | 0xFFu);
	}

	/**
	 * Parses "#RRGGBB" or "#RRGGBBAA". Returns false and leaves `color` unchanged if `str` has another length
	 * or any character after the '#' is not a hex digit.
	 */
	[[nodiscard]] static constexpr bool from_hex_string(std::string_view str, Color& color) {
		if (str.empty() || str[0] != '#' || (str.size() != 7 && str.size() != 9)) {
			return false;
		}

		uint32_t value = 0;

		for (auto c : str.substr(1)) {
			uint32_t digit;

			if (c >= '0' && c <= '9') {
				digit = static_cast<uint32_t>(c - '0');
			}
			else if (c >= 'a' && c <= 'f') {
				digit = static_cast<uint32_t>(c - 'a' + 10);
			}
			else if (c >= 'A' && c <= 'F') {
				digit = static_cast<uint32_t>(c - 'A' + 10);
			}
			else {
				return false;
			}

			value = (value << 4) | digit;
		}

		color = str.size() == 7 ? from_rgb_uint(value) : from_rgba_uint(value);
		return true;
	}

	static constexpr uint32_t to_rgba(const Color& c) {
		return ((static_cast<uint32_t>(c.r * 255.f + 0.5f) & 0xFFu) << 24)
				| ((static_cast<uint32_t>(c.g * 255.f + 0.5f) & 0xFFu) << 16)
				| ((static_cast<uint32_t>(c.b * 255.f + 0.5f) & 0xFFu) << 8)
				| ((static_cast<uint32_t>(c.a * 255.f + 0.5f) & 0xFFu) << 0);
	}

	constexpr bool operator==(const Color&) const = default;
};

inline constexpr const Color COLOR_WHITE{1.f, 1.f, 1.f, 1.f};

}
