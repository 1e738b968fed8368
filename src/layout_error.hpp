#pragma once

#include <cstdint>

namespace Kinetic {

enum class LayoutError : uint8_t {
	NONE,
	// A segment has no font, or its font reports 0 units per em
	INVALID_FONT,
	// Font size is not a finite value greater than 0
	INVALID_FONT_SIZE,
	// Segment spacing is negative or not finite
	INVALID_SPACING,
};

const char* layout_error_to_string(LayoutError);

}
