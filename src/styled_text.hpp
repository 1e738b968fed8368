#pragma once

#include "color.hpp"
#include "rich_text_layout.hpp"
#include "value_runs.hpp"

#include <functional>
#include <optional>

namespace Kinetic {

/**
 * Resolves the color of a character. `charIndex` is the character's position in the composition's
 * `allChars`, whitespace included, and `charCount` is the size of `allChars`.
 */
using CharColorFunction = std::function<Color(uint32_t codepoint, uint32_t charIndex, uint32_t charCount)>;

struct StyledSegment {
	std::string_view text;
	const FontMetrics* pFont;
	// Defaults to `StyledTextParams::defaultFontSize`
	std::optional<float> fontSize;
	// Defaults to `StyledTextParams::defaultColor`
	std::optional<Color> color;
	// Overrides the segment color for every character of the segment when set
	CharColorFunction charColor;
};

struct StyledTextParams {
	float defaultFontSize = 1.f;
	Color defaultColor = COLOR_WHITE;
	// Space between segments, in ems of `defaultFontSize`
	float segmentSpacing = 0.f;
};

// Maximal run of non-whitespace characters within a single segment
struct WordRange {
	uint32_t segmentIndex;
	uint32_t charStartIndex;
	uint32_t charEndIndex;
};

struct StyledTextLayout {
	RichTextLayout layout;
	std::vector<WordRange> words;
	// Resolved color of each character, indexed like `layout.allChars`
	ValueRuns<Color> colorRuns;

	void clear();

	const Color& get_char_color(size_t charIndex) const {
		return colorRuns.get_value(static_cast<int32_t>(charIndex));
	}
};

/**
 * Resolves segment styles against `params`, lays the segments out with `build_rich_text_layout` and groups
 * the resulting characters into words and color runs.
 *
 * On error, `result` is left empty.
 */
[[nodiscard]] LayoutError build_styled_text_layout(StyledTextLayout& result, const StyledSegment* pSegments,
		size_t segmentCount, const StyledTextParams& params);

}
