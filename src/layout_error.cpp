#include "layout_error.hpp"

#include "common.hpp"

using namespace Kinetic;

const char* Kinetic::layout_error_to_string(LayoutError error) {
	switch (error) {
		case LayoutError::NONE:
			return "none";
		case LayoutError::INVALID_FONT:
			return "segment has no usable font";
		case LayoutError::INVALID_FONT_SIZE:
			return "font size must be finite and greater than 0";
		case LayoutError::INVALID_SPACING:
			return "segment spacing must be finite and not negative";
	}

	KINETIC_UNREACHABLE();
}
