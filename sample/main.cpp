#include "file_read_bytes.hpp"
#include "font_data.hpp"
#include "font_registry.hpp"
#include "layout_verify.hpp"
#include "styled_text.hpp"

#include <simdjson.h>

#include <cinttypes>
#include <cstdio>

#include <vector>

using namespace Kinetic;

struct LayoutRequest {
	StyledTextParams params;
	std::vector<StyledSegment> segments;
};

static bool parse_request(simdjson::ondemand::parser& parser, std::string_view fileData, LayoutRequest& request);
static bool parse_segment(simdjson::ondemand::object& segmentObject, StyledSegment& segment);

static void print_layout(const StyledTextLayout& styled);

int main(int argc, char** argv) {
	if (argc != 3) {
		std::fprintf(stderr, "Usage: %s <families-dir> <request.json>\n", argv[0]);
		return 1;
	}

	if (auto err = FontRegistry::register_families_from_path(argv[1]); err != FontRegistryError::NONE) {
		std::fprintf(stderr, "Failed to register families from '%s': %s\n", argv[1],
				font_registry_error_to_string(err));
		return 1;
	}

	auto fileData = file_read_bytes(argv[2], simdjson::SIMDJSON_PADDING);

	if (fileData.empty()) {
		std::fprintf(stderr, "File %s must be present!\n", argv[2]);
		return 1;
	}

	simdjson::ondemand::parser parser;
	LayoutRequest request;

	if (!parse_request(parser, std::string_view(fileData.data(), fileData.size()), request)) {
		std::fprintf(stderr, "Malformed layout request '%s'\n", argv[2]);
		return 1;
	}

	StyledTextLayout styled;

	if (auto err = build_styled_text_layout(styled, request.segments.data(), request.segments.size(),
			request.params); err != LayoutError::NONE) {
		std::fprintf(stderr, "Layout failed: %s\n", layout_error_to_string(err));
		return 1;
	}

	print_layout(styled);

	return 0;
}

static bool parse_request(simdjson::ondemand::parser& parser, std::string_view fileData, LayoutRequest& request) {
	simdjson::padded_string_view sv(fileData.data(), fileData.size() - simdjson::SIMDJSON_PADDING,
			fileData.size());
	auto d = parser.iterate(sv);

	simdjson::ondemand::object root;
	if (auto error = d.get(root); error != simdjson::SUCCESS) {
		std::puts(simdjson::error_message(error));
		return false;
	}

	double spacing = 0.0;
	if (auto error = root["spacing"].get(spacing); error != simdjson::SUCCESS && error != simdjson::NO_SUCH_FIELD) {
		return false;
	}

	double defaultFontSize = 1.0;
	if (auto error = root["defaultFontSize"].get(defaultFontSize);
			error != simdjson::SUCCESS && error != simdjson::NO_SUCH_FIELD) {
		return false;
	}

	request.params.segmentSpacing = static_cast<float>(spacing);
	request.params.defaultFontSize = static_cast<float>(defaultFontSize);

	simdjson::ondemand::array segmentArray;
	if (root["segments"].get(segmentArray) != simdjson::SUCCESS) {
		return false;
	}

	for (auto segmentValue : segmentArray) {
		simdjson::ondemand::object segmentObject;
		if (segmentValue.get(segmentObject) != simdjson::SUCCESS) {
			return false;
		}

		if (!parse_segment(segmentObject, request.segments.emplace_back())) {
			return false;
		}
	}

	return true;
}

static bool parse_segment(simdjson::ondemand::object& segmentObject, StyledSegment& segment) {
	if (segmentObject["text"].get(segment.text) != simdjson::SUCCESS) {
		return false;
	}

	std::string_view familyName;
	if (segmentObject["family"].get(familyName) != simdjson::SUCCESS) {
		return false;
	}

	int64_t weight = 400;
	if (auto error = segmentObject["weight"].get(weight);
			error != simdjson::SUCCESS && error != simdjson::NO_SUCH_FIELD) {
		return false;
	}

	std::string_view style = "normal";
	if (auto error = segmentObject["style"].get(style);
			error != simdjson::SUCCESS && error != simdjson::NO_SUCH_FIELD) {
		return false;
	}

	double fontSize;
	if (auto error = segmentObject["fontSize"].get(fontSize); error == simdjson::SUCCESS) {
		segment.fontSize = static_cast<float>(fontSize);
	}
	else if (error != simdjson::NO_SUCH_FIELD) {
		return false;
	}

	std::string_view colorString;
	if (auto error = segmentObject["color"].get(colorString); error == simdjson::SUCCESS) {
		Color color;

		if (!Color::from_hex_string(colorString, color)) {
			return false;
		}

		segment.color = color;
	}
	else if (error != simdjson::NO_SUCH_FIELD) {
		return false;
	}

	auto family = FontRegistry::get_family(familyName);

	if (!family) {
		std::fprintf(stderr, "Unknown font family '%.*s'\n", static_cast<int>(familyName.size()), familyName.data());
		return false;
	}

	auto fontWeight = font_weight_from_css(weight);

	if (fontWeight == FontWeight::COUNT || (style.compare("normal") != 0 && style.compare("italic") != 0)) {
		return false;
	}

	auto fontStyle = style.compare("italic") == 0 ? FontStyle::ITALIC : FontStyle::NORMAL;

	// A missing face leaves `pFont` null, which the layout reports
	segment.pFont = FontRegistry::get_font_data(Font(family, fontWeight, fontStyle));

	return true;
}

static void print_layout(const StyledTextLayout& styled) {
	auto& layout = styled.layout;

	for (size_t i = 0; i < layout.allChars.size(); ++i) {
		auto& chr = layout.allChars[i];
		std::printf("%" PRIu32 " %" PRIu32 " U+%04" PRIX32 " %.4f %.4f #%08" PRIX32 "\n", chr.segmentIndex,
				chr.index, chr.codepoint, chr.xPosition, chr.width, Color::to_rgba(styled.get_char_color(i)));
	}

	for (auto& segment : layout.segments) {
		std::printf("segment %" PRIu32 ": startX %.4f width %.4f baselineOffset %.4f chars [%" PRIu32 ", %" PRIu32
				")\n", segment.segmentIndex, segment.startX, segment.width, segment.baselineOffset,
				segment.charStartIndex, segment.charEndIndex);
	}

	std::printf("words %zu totalWidth %.4f spacing %.4f\n", styled.words.size(), layout.totalWidth,
			layout.spacing);
	std::printf("centered %s, no overlap %s, segment order %s\n",
			verify_layout_centered(layout) ? "yes" : "no",
			verify_no_overlap(layout) ? "yes" : "no",
			verify_segment_order(layout) ? "yes" : "no");
}
