#pragma once

#include "font.hpp"
#include "file_mapping.hpp"

#include <string_view>

namespace Kinetic {

class FontData;

struct FontFaceCreateInfo {
	std::string_view name;
	std::string_view uri;
	FontWeight weight;
	FontStyle style;
};

struct FontFamilyCreateInfo {
	std::string_view name;
	const FontFaceCreateInfo* pFaces;
	uint32_t faceCount;
};

enum class FontRegistryError {
	NONE,
	ALREADY_LOADED,
	NO_FACES,
	INVALID_FACE,
	INVALID_JSON,
	FILE_ERROR,
};

const char* font_registry_error_to_string(FontRegistryError);

}

namespace Kinetic::FontRegistry {

/**
 * Gets a handle for the font family with the given name. Returns an invalid handle if the family
 * does not exist.
 *
 * @thread_safety Thread safe, may block internally.
 */
[[nodiscard]] FontFamily get_family(std::string_view name);

/**
 * Gets the face registered for the font's weight and style. Weights and styles the family does not provide
 * resolve to the family's default face (Regular/Normal if present, otherwise the first face registered).
 * Returns an invalid handle if the font's family is not registered.
 *
 * @thread_safety Thread safe, may block internally.
 */
[[nodiscard]] FaceDataHandle get_face(Font font);

/**
 * Gets the metrics provider for the given font, opening the underlying face on first use. Returns `nullptr`
 * if the font is not registered or its file could not be loaded. Returned objects remain valid until
 * program termination and may be queried from any thread.
 *
 * @thread_safety Thread safe, may block internally.
 */
[[nodiscard]] const FontData* get_font_data(Font font);

/**
 * Registers a new font family based on the provided `FontFamilyCreateInfo`. If successfully loaded, font
 * families remain registered until program termination.
 *
 * `pFaces` *must* not be null and contain at least one face.
 * All faces must have a globally unique name across all families; a face name that is already registered
 * refers to the existing face.
 * Each face provided for a single family must have a unique weight and style.
 * Faces *may* share the same URI.
 * Every face must name one of the `FontWeight` and `FontStyle` values below `COUNT`.
 *
 * @thread_safety Thread safe, may block internally.
 */
[[nodiscard]] FontRegistryError register_family(const FontFamilyCreateInfo& familyInfo);

/**
 * Registers family data from JSON data in memory. Data is assumed to have `SIMDJSON_PADDING` extra padding
 * bytes reflected in its size (so fileData.size() - SIMDJSON_PADDING is the actual data size).
 */
[[nodiscard]] FontRegistryError register_family_from_json_data(std::string_view fileData);

/**
 * Registers family data from a JSON file located at `uri`.
 */
[[nodiscard]] FontRegistryError register_family_from_json_file(const char* uri);

/**
 * Registers family data from all JSON files located directly under `path`. Stops at the first file that
 * fails to register.
 */
[[nodiscard]] FontRegistryError register_families_from_path(const char* path);

/**
 * Sets the file mapping functions used to load font files internally. Faces are mapped when their family is
 * registered, so the functions apply to families registered afterwards. Registered views are released with
 * the functions set at program exit, so changing them while views from the previous functions are still
 * registered will result in undefined behavior.
 *
 * @thread_safety This function must be externally synchronized.
 * @see FileMapping
 */
void set_file_mapping_functions(const FileMappingFunctions& funcs);

}
