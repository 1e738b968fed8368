#pragma once

#include "font_common.hpp"

namespace Kinetic {

/**
 * Lightweight handle naming a registered family at a specific weight and style. Sizes are not part of
 * the handle: layout sizes are continuous output units supplied per segment.
 */
class Font {
	public:
		constexpr Font() = default;
		constexpr explicit Font(FontFamily family, FontWeight weight = FontWeight::REGULAR,
					FontStyle style = FontStyle::NORMAL)
				: m_handle(make_handle(family, weight, style)) {}

		constexpr Font(Font&&) noexcept = default;
		constexpr Font& operator=(Font&&) noexcept = default;

		constexpr Font(const Font&) noexcept = default;
		constexpr Font& operator=(const Font&) noexcept = default;

		constexpr FontFamily get_family() const {
			return {static_cast<FamilyIndex_T>(m_handle >> 16)};
		}

		constexpr FontWeight get_weight() const {
			return static_cast<FontWeight>((m_handle >> 1) & 0xF);
		}

		constexpr FontStyle get_style() const {
			return static_cast<FontStyle>(m_handle & 1);
		}

		constexpr bool valid() const {
			return get_family().valid();
		}

		constexpr explicit operator bool() const {
			return valid();
		}

		constexpr bool operator==(const Font& other) const {
			return m_handle == other.m_handle;
		}
	private:
		uint32_t m_handle{make_handle(FontFamily{}, FontWeight::REGULAR, FontStyle::NORMAL)};

		static constexpr uint32_t make_handle(FontFamily family, FontWeight weight, FontStyle style) {
			return (static_cast<uint32_t>(family.handle) << 16) | (static_cast<uint32_t>(weight) << 1)
					| static_cast<uint32_t>(style);
		}
};

}
