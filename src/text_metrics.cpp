#include "text_metrics.hpp"

#include "font_metrics.hpp"

#include <unicode/utf8.h>

#include <cmath>
#include <vector>

using namespace Kinetic;

static void decode_chars(std::vector<CharMetric>& chars, std::string_view text);

// TextMetrics

void TextMetrics::clear() {
	chars.clear();
	totalWidth = 0.f;
	baselineOffset = 0.f;
}

// Public Functions

float Kinetic::calc_baseline_offset(const FontMetrics& font, float fontSize) {
	auto scale = fontSize / static_cast<float>(font.get_upem());
	return (font.get_ascender() + font.get_descender()) * scale * 0.5f;
}

LayoutError Kinetic::calc_text_metrics(TextMetrics& result, const FontMetrics& font, std::string_view text,
		float fontSize) {
	result.clear();

	if (!std::isfinite(fontSize) || fontSize <= 0.f) {
		return LayoutError::INVALID_FONT_SIZE;
	}

	if (font.get_upem() == 0) {
		return LayoutError::INVALID_FONT;
	}

	auto scale = static_cast<double>(fontSize) / font.get_upem();

	decode_chars(result.chars, text);

	// Positions are accumulated in double and rounded once, so long runs stay centered
	std::vector<double> centers(result.chars.size());
	double cursor = 0.0;

	for (size_t i = 0; i < result.chars.size(); ++i) {
		auto& chr = result.chars[i];
		auto width = static_cast<double>(font.get_advance(chr.codepoint)) * scale;
		chr.width = static_cast<float>(width);
		centers[i] = cursor + width * 0.5;
		cursor += width;

		if (i + 1 < result.chars.size()) {
			cursor += static_cast<double>(font.get_kerning(chr.codepoint, result.chars[i + 1].codepoint)) * scale;
		}
	}

	result.totalWidth = static_cast<float>(cursor);
	result.baselineOffset = calc_baseline_offset(font, fontSize);

	auto halfWidth = cursor * 0.5;

	for (size_t i = 0; i < result.chars.size(); ++i) {
		result.chars[i].xPosition = static_cast<float>(centers[i] - halfWidth);
	}

	return LayoutError::NONE;
}

// Static Functions

static void decode_chars(std::vector<CharMetric>& chars, std::string_view text) {
	auto* data = reinterpret_cast<const uint8_t*>(text.data());
	auto length = static_cast<int32_t>(text.size());
	int32_t offset = 0;
	uint32_t index = 0;

	chars.reserve(text.size());

	while (offset < length) {
		auto byteOffset = offset;
		UChar32 c;
		U8_NEXT_OR_FFFD(data, offset, length, c);

		chars.push_back({
			.codepoint = static_cast<uint32_t>(c),
			.xPosition = 0.f,
			.width = 0.f,
			.index = index++,
			.byteOffset = static_cast<uint32_t>(byteOffset),
		});
	}
}
