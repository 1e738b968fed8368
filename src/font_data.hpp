#pragma once

#include "font_metrics.hpp"

#include <cstddef>

#include <memory>

struct FT_LibraryRec_;
struct hb_font_t;

namespace Kinetic {

/**
 * `FontMetrics` implementation backed by FreeType and HarfBuzz. FreeType validates the face and supplies
 * face-wide metrics when the object is created; every per-character query afterwards goes through a
 * HarfBuzz font at a scale of one unit per font design unit.
 *
 * The font file memory passed to `create` is referenced, not copied, and must outlive the object.
 */
class FontData final : public FontMetrics {
	public:
		/**
		 * Opens face `faceIndex` of the font file in `fileData`. Returns `nullptr` if FreeType cannot open
		 * the face or the face has no scalable outlines.
		 *
		 * @thread_safety Calls sharing a `library` must be externally synchronized.
		 */
		[[nodiscard]] static std::unique_ptr<FontData> create(FT_LibraryRec_* library, const void* fileData,
				size_t fileSize, int32_t faceIndex = 0);

		~FontData() override;

		FontData(FontData&&) = delete;
		void operator=(FontData&&) = delete;

		FontData(const FontData&) = delete;
		void operator=(const FontData&) = delete;

		uint32_t get_upem() const override;

		float get_ascender() const override;
		float get_descender() const override;

		float get_advance(uint32_t codepoint) const override;
		float get_kerning(uint32_t left, uint32_t right) const override;

		bool has_codepoint(uint32_t codepoint) const;
		uint32_t map_codepoint_to_glyph(uint32_t codepoint) const;

		float get_glyph_advance_x(uint32_t glyph) const;
	private:
		hb_font_t* m_hbFont;
		uint32_t m_upem;
		int16_t m_ascender;
		int16_t m_descender;

		explicit FontData(hb_font_t* hbFont, uint32_t upem, int16_t ascender, int16_t descender);
};

}
