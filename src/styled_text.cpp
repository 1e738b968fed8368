#include "styled_text.hpp"

#include <unicode/uchar.h>

#include <cmath>

using namespace Kinetic;

static bool is_whitespace(uint32_t codepoint) {
	return u_isUWhiteSpace(static_cast<UChar32>(codepoint));
}

static void build_words(StyledTextLayout& result);
static void build_color_runs(StyledTextLayout& result, const StyledSegment* pSegments,
		const StyledTextParams& params);

// StyledTextLayout

void StyledTextLayout::clear() {
	layout.clear();
	words.clear();
	colorRuns.clear();
}

// Public Functions

LayoutError Kinetic::build_styled_text_layout(StyledTextLayout& result, const StyledSegment* pSegments,
		size_t segmentCount, const StyledTextParams& params) {
	result.clear();

	if (!std::isfinite(params.defaultFontSize) || params.defaultFontSize <= 0.f) {
		return LayoutError::INVALID_FONT_SIZE;
	}

	std::vector<RichTextSegment> segments;
	segments.reserve(segmentCount);

	for (size_t i = 0; i < segmentCount; ++i) {
		segments.push_back({
			.text = pSegments[i].text,
			.pFont = pSegments[i].pFont,
			.fontSize = pSegments[i].fontSize.value_or(params.defaultFontSize),
		});
	}

	if (auto err = build_rich_text_layout(result.layout, segments.data(), segments.size(),
			params.segmentSpacing * params.defaultFontSize); err != LayoutError::NONE) {
		result.clear();
		return err;
	}

	build_words(result);
	build_color_runs(result, pSegments, params);

	return LayoutError::NONE;
}

// Static Functions

static void build_words(StyledTextLayout& result) {
	for (auto& segment : result.layout.segments) {
		auto wordStart = segment.charStartIndex;

		for (auto i = segment.charStartIndex; i < segment.charEndIndex; ++i) {
			if (is_whitespace(result.layout.allChars[i].codepoint)) {
				if (wordStart < i) {
					result.words.push_back({segment.segmentIndex, wordStart, i});
				}

				wordStart = i + 1;
			}
		}

		if (wordStart < segment.charEndIndex) {
			result.words.push_back({segment.segmentIndex, wordStart, segment.charEndIndex});
		}
	}
}

static void build_color_runs(StyledTextLayout& result, const StyledSegment* pSegments,
		const StyledTextParams& params) {
	auto& allChars = result.layout.allChars;
	auto charCount = static_cast<uint32_t>(allChars.size());

	for (size_t i = 0; i < allChars.size(); ++i) {
		auto& chr = allChars[i];
		auto& segment = pSegments[chr.segmentIndex];
		auto color = segment.color.value_or(params.defaultColor);

		if (segment.charColor) {
			color = segment.charColor(chr.codepoint, static_cast<uint32_t>(i), charCount);
		}

		result.colorRuns.add_or_extend(static_cast<int32_t>(i + 1), color);
	}
}
