#include <catch2/catch_test_macros.hpp>

#include <file_mapping.hpp>
#include <font_data.hpp>
#include <font_registry.hpp>
#include <layout_verify.hpp>
#include <rich_text_layout.hpp>
#include <text_metrics.hpp>

#include <simdjson.h>

#include <string>

using namespace Kinetic;

static FontRegistryError register_json(std::string json);

TEST_CASE("Family validation", "[FontRegistry]") {
	SECTION("No faces") {
		FontFamilyCreateInfo info{.name = "Empty Family", .pFaces = nullptr, .faceCount = 0};
		REQUIRE(FontRegistry::register_family(info) == FontRegistryError::NO_FACES);
		REQUIRE_FALSE(FontRegistry::get_family("Empty Family"));
	}

	SECTION("Out of range weight") {
		FontFaceCreateInfo face{"Broken Face", "missing.ttf", FontWeight::COUNT, FontStyle::NORMAL};
		FontFamilyCreateInfo info{.name = "Broken Family", .pFaces = &face, .faceCount = 1};
		REQUIRE(FontRegistry::register_family(info) == FontRegistryError::INVALID_FACE);
		REQUIRE_FALSE(FontRegistry::get_family("Broken Family"));
	}
}

static int g_mapCalls = 0;
static std::string g_lastMappedFile;

static FileMapping map_file_counting(std::string_view fileName) {
	++g_mapCalls;
	g_lastMappedFile = fileName;
	return {};
}

static void unmap_file_counting(const FileMapping&) {}

TEST_CASE("Custom file mapping", "[FontRegistry]") {
	FontRegistry::set_file_mapping_functions({map_file_counting, unmap_file_counting});

	FontFaceCreateInfo face{"Archive Regular", "archive://fonts/Archive-Regular.ttf", FontWeight::REGULAR,
			FontStyle::NORMAL};
	FontFamilyCreateInfo info{.name = "Archive", .pFaces = &face, .faceCount = 1};
	auto err = FontRegistry::register_family(info);

	// Restore before any check can fail, later tests map real files
	FontRegistry::set_file_mapping_functions({map_file_default, unmap_file_default});

	REQUIRE(err == FontRegistryError::NONE);
	REQUIRE(g_mapCalls == 1);
	REQUIRE(g_lastMappedFile == "archive://fonts/Archive-Regular.ttf");

	auto family = FontRegistry::get_family("Archive");
	REQUIRE(family);
	REQUIRE(FontRegistry::get_face(Font(family)));
	REQUIRE(FontRegistry::get_font_data(Font(family)) == nullptr);
}

TEST_CASE("Face fallback", "[FontRegistry]") {
	FontFaceCreateInfo faces[] = {
		{"Fallback Bold", "does/not/exist/Fallback-Bold.ttf", FontWeight::BOLD, FontStyle::NORMAL},
		{"Fallback Light Italic", "does/not/exist/Fallback-LightItalic.ttf", FontWeight::LIGHT, FontStyle::ITALIC},
	};

	FontFamilyCreateInfo info{.name = "Fallback", .pFaces = faces, .faceCount = 2};
	REQUIRE(FontRegistry::register_family(info) == FontRegistryError::NONE);
	REQUIRE(FontRegistry::register_family(info) == FontRegistryError::ALREADY_LOADED);

	auto family = FontRegistry::get_family("Fallback");
	REQUIRE(family);

	auto bold = FontRegistry::get_face(Font(family, FontWeight::BOLD));
	auto lightItalic = FontRegistry::get_face(Font(family, FontWeight::LIGHT, FontStyle::ITALIC));
	REQUIRE(bold);
	REQUIRE(lightItalic);
	REQUIRE(bold != lightItalic);

	// No Regular/Normal face, so the first face fills the gaps
	REQUIRE(FontRegistry::get_face(Font(family)) == bold);
	REQUIRE(FontRegistry::get_face(Font(family, FontWeight::BLACK, FontStyle::ITALIC)) == bold);

	// Files that cannot be mapped never produce metrics
	REQUIRE(FontRegistry::get_font_data(Font(family)) == nullptr);
	REQUIRE(FontRegistry::get_font_data(Font(family)) == nullptr);

	REQUIRE_FALSE(FontRegistry::get_face(Font()));
	REQUIRE(FontRegistry::get_font_data(Font()) == nullptr);
}

TEST_CASE("JSON descriptors", "[FontRegistry]") {
	SECTION("Valid") {
		REQUIRE(register_json(R"({
			"name": "Json Sans",
			"faces": [
				{"name": "Json Sans Regular", "uri": "JsonSans-Regular.ttf", "weight": 400, "style": "normal"},
				{"name": "Json Sans Bold Italic", "uri": "JsonSans-BoldItalic.ttf", "weight": 700, "style": "italic"}
			]
		})") == FontRegistryError::NONE);

		auto family = FontRegistry::get_family("Json Sans");
		REQUIRE(family);
		REQUIRE(FontRegistry::get_face(Font(family, FontWeight::BOLD, FontStyle::ITALIC))
				!= FontRegistry::get_face(Font(family)));
		REQUIRE(FontRegistry::get_face(Font(family, FontWeight::THIN)) == FontRegistry::get_face(Font(family)));
	}

	SECTION("Malformed") {
		REQUIRE(register_json(R"({"name": "Json Malformed", "faces": [)") == FontRegistryError::INVALID_JSON);
		REQUIRE(register_json("[]") == FontRegistryError::INVALID_JSON);
		REQUIRE(register_json("") == FontRegistryError::INVALID_JSON);
	}

	SECTION("Missing fields") {
		REQUIRE(register_json(R"({"name": "Json No Faces"})") == FontRegistryError::INVALID_JSON);
		REQUIRE(register_json(R"({"name": "Json No Uri", "faces": [
			{"name": "Json No Uri Regular", "weight": 400, "style": "normal"}
		]})") == FontRegistryError::INVALID_JSON);
		REQUIRE_FALSE(FontRegistry::get_family("Json No Uri"));
	}

	SECTION("Invalid weight and style") {
		REQUIRE(register_json(R"({"name": "Json Weight", "faces": [
			{"name": "Json Weight 450", "uri": "a.ttf", "weight": 450, "style": "normal"}
		]})") == FontRegistryError::INVALID_JSON);
		REQUIRE(register_json(R"({"name": "Json Style", "faces": [
			{"name": "Json Style Oblique", "uri": "a.ttf", "weight": 400, "style": "oblique"}
		]})") == FontRegistryError::INVALID_JSON);
	}

	SECTION("Empty face list") {
		REQUIRE(register_json(R"({"name": "Json Empty", "faces": []})") == FontRegistryError::NO_FACES);
	}
}

TEST_CASE("Missing files", "[FontRegistry]") {
	REQUIRE(FontRegistry::register_family_from_json_file("does/not/exist.json") == FontRegistryError::FILE_ERROR);
	REQUIRE(FontRegistry::register_families_from_path("does/not/exist") == FontRegistryError::FILE_ERROR);
}

TEST_CASE("Noto Sans", "[.][fonts][FontRegistry]") {
	static FontRegistryError loadResult = FontRegistry::register_families_from_path("fonts/families");
	REQUIRE(loadResult == FontRegistryError::NONE);

	auto family = FontRegistry::get_family("Noto Sans");
	REQUIRE(family);

	auto* font = FontRegistry::get_font_data(Font(family));
	REQUIRE(font != nullptr);
	REQUIRE(font->get_upem() > 0);
	REQUIRE(font->get_ascender() > 0.f);
	REQUIRE(font->get_descender() < 0.f);
	REQUIRE(font->has_codepoint('H'));
	REQUIRE(font->get_advance('H') > 0.f);
	REQUIRE(font->get_advance('H') == font->get_glyph_advance_x(font->map_codepoint_to_glyph('H')));
	REQUIRE(font->get_kerning('H', 'H') == 0.f);

	SECTION("Pair kerning") {
		// The full pair adjustment, whether the font's lookup moves the advance or the offset
		REQUIRE(font->get_kerning('A', 'V') < 0.f);
		REQUIRE(font->get_kerning('T', 'o') < 0.f);
		REQUIRE(font->get_kerning('V', 'A') < 0.f);
		REQUIRE(font->get_kerning('A', 'V') > -static_cast<float>(font->get_upem()));

		TextMetrics pair;
		REQUIRE(calc_text_metrics(pair, *font, "AV", 1000.f) == LayoutError::NONE);
		auto scale = 1000.f / static_cast<float>(font->get_upem());
		auto unkerned = (font->get_advance('A') + font->get_advance('V')) * scale;
		REQUIRE(pair.totalWidth < unkerned);
	}

	RichTextSegment segments[] = {
		{"Hello", font, 1.f},
		{"World", font, 1.f},
	};

	RichTextLayout layout;
	REQUIRE(build_rich_text_layout(layout, segments, 2) == LayoutError::NONE);
	REQUIRE(verify_layout_centered(layout));
	REQUIRE(verify_no_overlap(layout));
	REQUIRE(verify_segment_order(layout));
}

static FontRegistryError register_json(std::string json) {
	json.append(simdjson::SIMDJSON_PADDING, '\0');
	return FontRegistry::register_family_from_json_data(json);
}
