#pragma once

#include <cstdint>

namespace Kinetic {

/**
 * The metric queries the layout engine needs from a resolved font. All values are in font design units;
 * the engine scales them by `fontSize / get_upem()`.
 *
 * Implementations must be safe to query concurrently once constructed, and are expected to resolve every
 * codepoint to some glyph (typically .notdef for unmapped codepoints).
 */
class FontMetrics {
	public:
		virtual ~FontMetrics() = default;

		virtual uint32_t get_upem() const = 0;

		// Distance from the baseline to the top of the face's vertical extent, positive upwards
		virtual float get_ascender() const = 0;
		// Distance from the baseline to the bottom of the face's vertical extent, conventionally negative
		virtual float get_descender() const = 0;

		virtual float get_advance(uint32_t codepoint) const = 0;

		/**
		 * Gets the horizontal adjustment applied between `left` and the `right` codepoint immediately
		 * following it. Returns 0 if the font has no kerning data for the pair.
		 */
		virtual float get_kerning(uint32_t left, uint32_t right) const = 0;
};

}
