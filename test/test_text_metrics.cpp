#include <catch2/catch_test_macros.hpp>

#include <text_metrics.hpp>

#include "test_fonts.hpp"

#include <cmath>
#include <limits>

using namespace Kinetic;

static void test_positions_increasing(const TextMetrics& metrics);

TEST_CASE("Widths", "[TextMetrics]") {
	TestFont font(1000, 800.f, -200.f, 500.f);
	TextMetrics metrics;

	SECTION("Uniform advances") {
		REQUIRE(calc_text_metrics(metrics, font, "abcd", 10.f) == LayoutError::NONE);
		REQUIRE(metrics.chars.size() == 4);
		REQUIRE(fabsf(metrics.totalWidth - 20.f) < 1e-5f);

		for (size_t i = 0; i < metrics.chars.size(); ++i) {
			REQUIRE(metrics.chars[i].index == i);
			REQUIRE(metrics.chars[i].byteOffset == i);
			REQUIRE(fabsf(metrics.chars[i].width - 5.f) < 1e-5f);
			REQUIRE(fabsf(metrics.chars[i].xPosition - (-7.5f + 5.f * static_cast<float>(i))) < 1e-5f);
		}
	}

	SECTION("Centered around 0") {
		auto sans = make_sans_font();
		REQUIRE(calc_text_metrics(metrics, sans, "Hello World", 24.f) == LayoutError::NONE);

		auto& first = metrics.chars.front();
		auto& last = metrics.chars.back();
		auto left = first.xPosition - first.width * 0.5f;
		auto right = last.xPosition + last.width * 0.5f;

		REQUIRE(fabsf(left + metrics.totalWidth * 0.5f) < 1e-4f);
		REQUIRE(fabsf(right - metrics.totalWidth * 0.5f) < 1e-4f);
	}

	SECTION("Linear in font size") {
		auto sans = make_sans_font();
		TextMetrics doubled;

		for (float size : {1.f, 12.f, 48.f, 300.f}) {
			REQUIRE(calc_text_metrics(metrics, sans, "AVTo lHo", size) == LayoutError::NONE);
			REQUIRE(calc_text_metrics(doubled, sans, "AVTo lHo", 2.f * size) == LayoutError::NONE);
			REQUIRE(fabsf(doubled.totalWidth - 2.f * metrics.totalWidth) < 1e-4f * doubled.totalWidth);
		}
	}

	SECTION("Whitespace only") {
		auto sans = make_sans_font();
		REQUIRE(calc_text_metrics(metrics, sans, "   ", 1.f) == LayoutError::NONE);
		REQUIRE(metrics.chars.size() == 3);
		REQUIRE(metrics.totalWidth > 0.f);
		REQUIRE(fabsf(metrics.totalWidth - 0.78f) < 1e-5f);
	}
}

TEST_CASE("Kerning", "[TextMetrics]") {
	auto font = make_sans_font();
	TextMetrics metrics;

	SECTION("Applied between the pair") {
		REQUIRE(calc_text_metrics(metrics, font, "AV", 1000.f) == LayoutError::NONE);
		REQUIRE(fabsf(metrics.totalWidth - (660.f + 650.f - 80.f)) < 1e-3f);

		// Kerning moves the second character, widths stay the advances
		REQUIRE(fabsf(metrics.chars[1].width - 650.f) < 1e-3f);
		auto gap = metrics.chars[1].xPosition - metrics.chars[0].xPosition;
		REQUIRE(fabsf(gap - (330.f - 80.f + 325.f)) < 1e-3f);
	}

	SECTION("Not applied after the last character") {
		REQUIRE(calc_text_metrics(metrics, font, "A", 1000.f) == LayoutError::NONE);
		REQUIRE(fabsf(metrics.totalWidth - 660.f) < 1e-3f);
	}

	SECTION("Direction matters") {
		REQUIRE(calc_text_metrics(metrics, font, "VA", 1000.f) == LayoutError::NONE);
		REQUIRE(fabsf(metrics.totalWidth - (660.f + 650.f)) < 1e-3f);
	}

	SECTION("Positions stay ordered") {
		REQUIRE(calc_text_metrics(metrics, font, "AVAVToTo", 16.f) == LayoutError::NONE);
		test_positions_increasing(metrics);
	}
}

TEST_CASE("Empty text", "[TextMetrics]") {
	auto font = make_sans_font();
	TextMetrics metrics;

	REQUIRE(calc_text_metrics(metrics, font, "", 32.f) == LayoutError::NONE);
	REQUIRE(metrics.chars.empty());
	REQUIRE(metrics.totalWidth == 0.f);
	REQUIRE(fabsf(metrics.baselineOffset - calc_baseline_offset(font, 32.f)) < 1e-6f);
}

TEST_CASE("Baseline offset", "[TextMetrics]") {
	auto sans = make_sans_font();
	auto serif = make_serif_font();

	SECTION("Formula") {
		REQUIRE(fabsf(calc_baseline_offset(sans, 40.f) - (900.f - 250.f) * (40.f / 1000.f) * 0.5f) < 1e-5f);
		REQUIRE(fabsf(calc_baseline_offset(serif, 40.f) - (1500.f - 500.f) * (40.f / 2048.f) * 0.5f) < 1e-5f);
	}

	SECTION("Differs between fonts") {
		REQUIRE(fabsf(calc_baseline_offset(sans, 40.f) - calc_baseline_offset(serif, 40.f)) > 1e-3f);
	}

	SECTION("Reported by the run") {
		TextMetrics metrics;
		REQUIRE(calc_text_metrics(metrics, serif, "iii", 12.f) == LayoutError::NONE);
		REQUIRE(metrics.baselineOffset == calc_baseline_offset(serif, 12.f));
	}

	SECTION("Aligns baselines at a shared center") {
		// A run's baseline lands at centerY + baselineOffset - (ascender + descender) * scale / 2 == centerY
		float centerY = 3.f;

		for (auto* font : {&sans, &serif}) {
			auto scale = 20.f / static_cast<float>(font->get_upem());
			auto runCenter = (font->get_ascender() + font->get_descender()) * scale * 0.5f;
			auto baselineY = centerY + calc_baseline_offset(*font, 20.f) - runCenter;
			REQUIRE(fabsf(baselineY - centerY) < 1e-5f);
		}
	}
}

TEST_CASE("UTF-8 decoding", "[TextMetrics]") {
	TestFont font(1000, 800.f, -200.f, 1000.f);
	TextMetrics metrics;

	SECTION("Multibyte sequences") {
		// "é", "€", "😀"
		REQUIRE(calc_text_metrics(metrics, font, "a\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80", 1.f) == LayoutError::NONE);
		REQUIRE(metrics.chars.size() == 4);
		REQUIRE(metrics.chars[1].codepoint == 0xE9u);
		REQUIRE(metrics.chars[2].codepoint == 0x20ACu);
		REQUIRE(metrics.chars[3].codepoint == 0x1F600u);
		REQUIRE(metrics.chars[1].byteOffset == 1);
		REQUIRE(metrics.chars[2].byteOffset == 3);
		REQUIRE(metrics.chars[3].byteOffset == 6);
		REQUIRE(metrics.chars[3].index == 3);
	}

	SECTION("Ill-formed sequences") {
		// Truncated 3-byte sequence, then a lone continuation byte
		REQUIRE(calc_text_metrics(metrics, font, "a\xE2\x82" "b\x80", 1.f) == LayoutError::NONE);
		REQUIRE(metrics.chars.size() == 4);
		REQUIRE(metrics.chars[0].codepoint == 'a');
		REQUIRE(metrics.chars[1].codepoint == 0xFFFDu);
		REQUIRE(metrics.chars[2].codepoint == 'b');
		REQUIRE(metrics.chars[2].byteOffset == 3);
		REQUIRE(metrics.chars[3].codepoint == 0xFFFDu);
	}
}

TEST_CASE("Invalid input", "[TextMetrics]") {
	auto font = make_sans_font();
	TextMetrics metrics;
	REQUIRE(calc_text_metrics(metrics, font, "abc", 1.f) == LayoutError::NONE);

	SECTION("Font size") {
		for (float size : {0.f, -1.f, std::numeric_limits<float>::infinity(),
				std::numeric_limits<float>::quiet_NaN()}) {
			REQUIRE(calc_text_metrics(metrics, font, "abc", size) == LayoutError::INVALID_FONT_SIZE);
			REQUIRE(metrics.chars.empty());
			REQUIRE(metrics.totalWidth == 0.f);
		}
	}

	SECTION("Zero units per em") {
		TestFont broken(0);
		REQUIRE(calc_text_metrics(metrics, broken, "abc", 1.f) == LayoutError::INVALID_FONT);
		REQUIRE(metrics.chars.empty());
	}
}

static void test_positions_increasing(const TextMetrics& metrics) {
	for (size_t i = 1; i < metrics.chars.size(); ++i) {
		REQUIRE(metrics.chars[i].xPosition > metrics.chars[i - 1].xPosition);
	}
}
