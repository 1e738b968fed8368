#include "font_data.hpp"

#include <ft2build.h>
#include FT_FREETYPE_H

#include <hb.h>
#include <hb-ot.h>

#include <iterator>

using namespace Kinetic;

// Substitutions that would merge a pair into one glyph are disabled so that only positioning remains
static constexpr const hb_feature_t KERNING_FEATURES[] = {
	{HB_TAG('k', 'e', 'r', 'n'), 1, HB_FEATURE_GLOBAL_START, HB_FEATURE_GLOBAL_END},
	{HB_TAG('l', 'i', 'g', 'a'), 0, HB_FEATURE_GLOBAL_START, HB_FEATURE_GLOBAL_END},
	{HB_TAG('c', 'l', 'i', 'g'), 0, HB_FEATURE_GLOBAL_START, HB_FEATURE_GLOBAL_END},
	{HB_TAG('d', 'l', 'i', 'g'), 0, HB_FEATURE_GLOBAL_START, HB_FEATURE_GLOBAL_END},
	{HB_TAG('c', 'a', 'l', 't'), 0, HB_FEATURE_GLOBAL_START, HB_FEATURE_GLOBAL_END},
};

static hb_font_t* create_unscaled_hb_font(const void* fileData, size_t fileSize, int32_t faceIndex,
		uint32_t upem);

std::unique_ptr<FontData> FontData::create(FT_Library library, const void* fileData, size_t fileSize,
		int32_t faceIndex) {
	FT_Face ftFace;

	if (FT_New_Memory_Face(library, reinterpret_cast<const FT_Byte*>(fileData), static_cast<FT_Long>(fileSize),
			faceIndex, &ftFace) != 0) {
		return {};
	}

	if (!FT_IS_SCALABLE(ftFace) || ftFace->units_per_EM == 0) {
		FT_Done_Face(ftFace);
		return {};
	}

	auto upem = static_cast<uint32_t>(ftFace->units_per_EM);
	auto ascender = static_cast<int16_t>(ftFace->ascender);
	auto descender = static_cast<int16_t>(ftFace->descender);

	FT_Done_Face(ftFace);

	auto* hbFont = create_unscaled_hb_font(fileData, fileSize, faceIndex, upem);

	if (!hbFont) {
		return {};
	}

	return std::unique_ptr<FontData>(new FontData(hbFont, upem, ascender, descender));
}

FontData::FontData(hb_font_t* hbFont, uint32_t upem, int16_t ascender, int16_t descender)
		: m_hbFont(hbFont)
		, m_upem(upem)
		, m_ascender(ascender)
		, m_descender(descender) {}

FontData::~FontData() {
	hb_font_destroy(m_hbFont);
}

uint32_t FontData::get_upem() const {
	return m_upem;
}

float FontData::get_ascender() const {
	return static_cast<float>(m_ascender);
}

float FontData::get_descender() const {
	return static_cast<float>(m_descender);
}

float FontData::get_advance(uint32_t codepoint) const {
	return get_glyph_advance_x(map_codepoint_to_glyph(codepoint));
}

float FontData::get_kerning(uint32_t left, uint32_t right) const {
	auto* buffer = hb_buffer_create();

	const uint32_t pair[] = {left, right};
	hb_buffer_add_utf32(buffer, pair, 2, 0, 2);
	hb_buffer_set_direction(buffer, HB_DIRECTION_LTR);
	hb_buffer_guess_segment_properties(buffer);

	hb_shape(m_hbFont, buffer, KERNING_FEATURES, static_cast<unsigned>(std::size(KERNING_FEATURES)));

	float result = 0.f;
	unsigned glyphCount{};
	auto* glyphInfos = hb_buffer_get_glyph_infos(buffer, &glyphCount);
	auto* glyphPositions = hb_buffer_get_glyph_positions(buffer, nullptr);

	// Pair adjustments land on the first glyph's advance or, for some lookups, the second glyph's offset
	if (glyphCount == 2) {
		result = static_cast<float>(glyphPositions[0].x_advance + glyphPositions[1].x_offset)
				- get_glyph_advance_x(glyphInfos[0].codepoint);
	}

	hb_buffer_destroy(buffer);

	return result;
}

bool FontData::has_codepoint(uint32_t codepoint) const {
	hb_codepoint_t tmp;
	return hb_font_get_nominal_glyph(m_hbFont, codepoint, &tmp);
}

uint32_t FontData::map_codepoint_to_glyph(uint32_t codepoint) const {
	if (hb_codepoint_t result{}; hb_font_get_nominal_glyph(m_hbFont, codepoint, &result)) {
		return result;
	}

	return 0;
}

float FontData::get_glyph_advance_x(uint32_t glyph) const {
	return static_cast<float>(hb_font_get_glyph_h_advance(m_hbFont, glyph));
}

// Static Functions

static hb_font_t* create_unscaled_hb_font(const void* fileData, size_t fileSize, int32_t faceIndex,
		uint32_t upem) {
	auto* blob = hb_blob_create(reinterpret_cast<const char*>(fileData), static_cast<unsigned>(fileSize),
			HB_MEMORY_MODE_READONLY, nullptr, nullptr);
	auto* face = hb_face_create(blob, static_cast<unsigned>(faceIndex));
	hb_blob_destroy(blob);

	if (hb_face_get_glyph_count(face) == 0) {
		hb_face_destroy(face);
		return nullptr;
	}

	auto* font = hb_font_create(face);
	hb_face_destroy(face);

	hb_ot_font_set_funcs(font);
	hb_font_set_scale(font, static_cast<int>(upem), static_cast<int>(upem));
	hb_font_make_immutable(font);

	return font;
}
