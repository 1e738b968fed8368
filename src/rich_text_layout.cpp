#include "rich_text_layout.hpp"

#include "text_metrics.hpp"

#include <cmath>
#include <vector>

using namespace Kinetic;

// RichTextLayout

void RichTextLayout::clear() {
	segments.clear();
	allChars.clear();
	totalWidth = 0.f;
	spacing = 0.f;
}

std::span<const LayoutChar> RichTextLayout::get_segment_chars(size_t segmentIndex) const {
	auto& segment = segments[segmentIndex];
	return std::span<const LayoutChar>(allChars.data() + segment.charStartIndex,
			segment.charEndIndex - segment.charStartIndex);
}

// Public Functions

LayoutError Kinetic::build_rich_text_layout(RichTextLayout& result, const RichTextSegment* pSegments,
		size_t segmentCount, float spacing) {
	result.clear();

	if (!std::isfinite(spacing) || spacing < 0.f) {
		return LayoutError::INVALID_SPACING;
	}

	result.segments.reserve(segmentCount);

	TextMetrics metrics;
	std::vector<double> centers;
	std::vector<double> segmentStarts;
	segmentStarts.reserve(segmentCount);
	double cursor = 0.0;

	for (size_t i = 0; i < segmentCount; ++i) {
		auto& segment = pSegments[i];

		if (!segment.pFont) {
			result.clear();
			return LayoutError::INVALID_FONT;
		}

		if (auto err = calc_text_metrics(metrics, *segment.pFont, segment.text, segment.fontSize);
				err != LayoutError::NONE) {
			result.clear();
			return err;
		}

		if (i > 0) {
			cursor += spacing;
		}

		auto segmentIndex = static_cast<uint32_t>(i);
		auto charStartIndex = static_cast<uint32_t>(result.allChars.size());
		auto halfWidth = static_cast<double>(metrics.totalWidth) * 0.5;

		for (auto& chr : metrics.chars) {
			centers.push_back(cursor + (chr.xPosition + halfWidth));
			result.allChars.push_back({
				.codepoint = chr.codepoint,
				.width = chr.width,
				.index = chr.index,
				.byteOffset = chr.byteOffset,
				.segmentIndex = segmentIndex,
			});
		}

		result.segments.push_back({
			.pFont = segment.pFont,
			.fontSize = segment.fontSize,
			.startX = 0.f,
			.width = metrics.totalWidth,
			.baselineOffset = metrics.baselineOffset,
			.segmentIndex = segmentIndex,
			.charStartIndex = charStartIndex,
			.charEndIndex = static_cast<uint32_t>(result.allChars.size()),
		});
		segmentStarts.push_back(cursor);

		cursor += metrics.totalWidth;
	}

	result.totalWidth = static_cast<float>(cursor);
	result.spacing = spacing;

	// Recenter in double and round once
	auto halfWidth = cursor * 0.5;

	for (size_t i = 0; i < result.allChars.size(); ++i) {
		result.allChars[i].xPosition = static_cast<float>(centers[i] - halfWidth);
	}

	for (size_t i = 0; i < result.segments.size(); ++i) {
		result.segments[i].startX = static_cast<float>(segmentStarts[i] - halfWidth);
	}

	return LayoutError::NONE;
}
