#pragma once

#include "layout_error.hpp"

#include <cstdint>

#include <span>
#include <string_view>
#include <vector>

namespace Kinetic {

class FontMetrics;

struct RichTextSegment {
	std::string_view text;
	const FontMetrics* pFont;
	float fontSize;
};

/**
 * A character positioned in the coordinate space of the whole composition.
 */
struct LayoutChar {
	uint32_t codepoint;
	float xPosition;
	float width;
	// Position of the character within its segment
	uint32_t index;
	// Offset of the character's first code unit within its segment's text
	uint32_t byteOffset;
	uint32_t segmentIndex;
};

struct SegmentLayout {
	const FontMetrics* pFont;
	float fontSize;
	// Left edge of the segment
	float startX;
	float width;
	float baselineOffset;
	uint32_t segmentIndex;
	// Range of the segment's characters within `RichTextLayout::allChars`
	uint32_t charStartIndex;
	uint32_t charEndIndex;
};

/**
 * A single line of segments laid out left to right, each separated by `spacing`, with the whole line centered
 * around x = 0.
 */
struct RichTextLayout {
	std::vector<SegmentLayout> segments;
	std::vector<LayoutChar> allChars;
	float totalWidth{};
	float spacing{};

	void clear();

	std::span<const LayoutChar> get_segment_chars(size_t segmentIndex) const;

	float get_char_baseline_offset(size_t charIndex) const {
		return segments[allChars[charIndex].segmentIndex].baselineOffset;
	}
};

/**
 * Lays out each segment in its own font and size, then places the segments contiguously on one line with
 * `spacing` output units between neighbors. Kerning is never applied across a segment boundary.
 *
 * On error, `result` is left empty.
 */
[[nodiscard]] LayoutError build_rich_text_layout(RichTextLayout& result, const RichTextSegment* pSegments,
		size_t segmentCount, float spacing = 0.f);

}
