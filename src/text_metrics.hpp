#pragma once

#include "layout_error.hpp"

#include <cstdint>

#include <string_view>
#include <vector>

namespace Kinetic {

class FontMetrics;

struct CharMetric {
	uint32_t codepoint;
	// Horizontal center of the character's advance box. Kerning against the previous character is
	// reflected here rather than in `width`.
	float xPosition;
	float width;
	// Position of the character within its run
	uint32_t index;
	// Offset of the character's first code unit within the run's UTF-8 text
	uint32_t byteOffset;
};

/**
 * Horizontal metrics of a single run of text in a single font, in output units. Characters are centered
 * around 0, so that they span [-totalWidth / 2, totalWidth / 2].
 */
struct TextMetrics {
	std::vector<CharMetric> chars;
	float totalWidth{};
	// Amount to add to the vertical position of the run's visual center to place its baseline at that
	// position
	float baselineOffset{};

	void clear();
};

/**
 * Calculates the offset between the middle of the font's vertical extent and its baseline,
 * `(ascender + descender) / 2`, scaled to `fontSize`. Runs in different fonts line up on a common baseline
 * when each is positioned at `y + baselineOffset`.
 */
[[nodiscard]] float calc_baseline_offset(const FontMetrics& font, float fontSize);

/**
 * Lays out `text`, decoded as UTF-8, on a single line in `font` at `fontSize` output units per em. Each
 * character advances the pen by its advance width plus the kerning between it and the character that
 * follows. Ill-formed UTF-8 sequences are laid out as U+FFFD.
 *
 * On error, `result` is left empty.
 */
[[nodiscard]] LayoutError calc_text_metrics(TextMetrics& result, const FontMetrics& font, std::string_view text,
		float fontSize);

}
