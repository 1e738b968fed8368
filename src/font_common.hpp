#pragma once

#include <cstdint>

namespace Kinetic {

enum class FontStyle : uint8_t {
	NORMAL = 0,
	ITALIC = 1,
	COUNT
};

enum class FontWeight : uint8_t {
	THIN,
	EXTRA_LIGHT,
	LIGHT,
	REGULAR,
	MEDIUM,
	SEMI_BOLD,
	BOLD,
	EXTRA_BOLD,
	BLACK,
	COUNT
};

using FamilyIndex_T = uint16_t;
using FaceIndex_T = uint16_t;

struct FontFamily {
	static constexpr const FamilyIndex_T INVALID_FAMILY = static_cast<FamilyIndex_T>(~0u);

	FamilyIndex_T handle{INVALID_FAMILY};

	constexpr bool operator==(const FontFamily& other) const {
		return handle == other.handle;
	}

	constexpr bool operator!=(const FontFamily& other) const {
		return !(*this == other);
	}

	constexpr bool valid() const {
		return handle != INVALID_FAMILY;
	}

	constexpr explicit operator bool() const {
		return valid();
	}
};

struct FaceDataHandle {
	static constexpr const FaceIndex_T INVALID_FACE = static_cast<FaceIndex_T>(~0u);

	FaceIndex_T handle{INVALID_FACE};

	constexpr bool operator==(const FaceDataHandle& other) const {
		return handle == other.handle;
	}

	constexpr bool operator!=(const FaceDataHandle& other) const {
		return !(*this == other);
	}

	constexpr bool valid() const {
		return handle != INVALID_FACE;
	}

	constexpr explicit operator bool() const {
		return valid();
	}
};

/**
 * Converts a CSS-style numeric weight (100, 200, ..., 900) to a `FontWeight`. Returns `FontWeight::COUNT`
 * if the value is not one of the nine named weights.
 */
constexpr FontWeight font_weight_from_css(int64_t weight) {
	if (weight < 100 || weight > 900 || weight % 100 != 0) {
		return FontWeight::COUNT;
	}

	return static_cast<FontWeight>((weight - 100) / 100);
}

}
