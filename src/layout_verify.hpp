#pragma once

namespace Kinetic {

struct RichTextLayout;

inline constexpr const float LAYOUT_CENTER_TOLERANCE = 1e-4f;
// Two float ULPs per unit of line extent
inline constexpr const double LAYOUT_CENTER_RELATIVE_TOLERANCE = 2.0 * 1.1920928955078125e-7;
// Absorbs rounding and very small negative kerning, not the kerning of tight pairs at display sizes
inline constexpr const float LAYOUT_OVERLAP_TOLERANCE = 0.01f;

/**
 * Checks that the midpoint between the leftmost and rightmost character edges is within `tolerance` of 0,
 * widened by `LAYOUT_CENTER_RELATIVE_TOLERANCE` times the distance between those edges to cover the
 * rounding of float positions on long lines. A layout without characters is centered.
 */
[[nodiscard]] bool verify_layout_centered(const RichTextLayout& layout,
		float tolerance = LAYOUT_CENTER_TOLERANCE);

/**
 * Checks that, in order of position, no character's right edge extends past the next character's left edge
 * by more than `tolerance`.
 */
[[nodiscard]] bool verify_no_overlap(const RichTextLayout& layout, float tolerance = LAYOUT_OVERLAP_TOLERANCE);

/**
 * Checks that segments are placed left to right in the order they were given, taking that order from
 * each segment's `segmentIndex` rather than its position in `layout.segments`.
 */
[[nodiscard]] bool verify_segment_order(const RichTextLayout& layout);

}
