#include "font_registry.hpp"

#include "common.hpp"
#include "font_data.hpp"
#include "string_hash.hpp"

#include <ft2build.h>
#include FT_FREETYPE_H

#include <cstdio>

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

using namespace Kinetic;

static constexpr const size_t WEIGHT_COUNT = static_cast<size_t>(FontWeight::COUNT);
static constexpr const size_t STYLE_COUNT = static_cast<size_t>(FontStyle::COUNT);

namespace {

struct FaceData {
	std::string name;
	FileMapping mapping{};
	std::unique_ptr<FontData> fontData;
	bool loadAttempted{};

	FaceData() = default;
	FaceData(std::string&& nameIn, FileMapping mappingIn)
			: name(std::move(nameIn))
			, mapping(mappingIn) {}

	FaceData(FaceData&& other) noexcept {
		*this = std::move(other);
	}

	FaceData& operator=(FaceData&& other) noexcept {
		std::swap(name, other.name);
		std::swap(mapping, other.mapping);
		std::swap(fontData, other.fontData);
		std::swap(loadAttempted, other.loadAttempted);
		return *this;
	}

	FaceData(const FaceData&) = delete;
	void operator=(const FaceData&) = delete;

	~FaceData();
};

struct FamilyData {
	FaceDataHandle lookup[WEIGHT_COUNT][STYLE_COUNT]{};

	FaceDataHandle get_face(FontWeight weight, FontStyle style) const {
		return lookup[static_cast<size_t>(weight)][static_cast<size_t>(style)];
	}
};

struct FreeTypeContext {
	FT_Library lib{};

	FreeTypeContext() {
		if (FT_Init_FreeType(&lib) != 0) {
			std::fputs("[FontRegistry] Failed to initialize FreeType\n", stderr);
			lib = nullptr;
		}
	}

	~FreeTypeContext() {
		if (lib) {
			FT_Done_FreeType(lib);
		}
	}

	FreeTypeContext(const FreeTypeContext&) = delete;
	void operator=(const FreeTypeContext&) = delete;
};

}

static std::shared_mutex g_mutex;

static FreeTypeContext g_freeType;

static std::vector<FaceData> g_faces;
static std::unordered_map<std::string, FaceDataHandle, StringHash, std::equal_to<>> g_facesByName;

static std::vector<FamilyData> g_familyData;
static std::unordered_map<std::string, FontFamily, StringHash, std::equal_to<>> g_familiesByName;

static FileMappingFunctions g_fileFuncs {
	.pfnMapFile = map_file_default,
	.pfnUnmapFile = unmap_file_default,
};

static FaceDataHandle get_face_internal(Font font);
static FaceDataHandle get_or_add_face(const FontFaceCreateInfo& faceInfo);

// Public Functions

const char* Kinetic::font_registry_error_to_string(FontRegistryError error) {
	switch (error) {
		case FontRegistryError::NONE:
			return "none";
		case FontRegistryError::ALREADY_LOADED:
			return "family already loaded";
		case FontRegistryError::NO_FACES:
			return "family has no faces";
		case FontRegistryError::INVALID_FACE:
			return "face has an invalid weight or style";
		case FontRegistryError::INVALID_JSON:
			return "invalid family JSON";
		case FontRegistryError::FILE_ERROR:
			return "file could not be read";
	}

	KINETIC_UNREACHABLE();
}

FontFamily FontRegistry::get_family(std::string_view name) {
	std::shared_lock lock(g_mutex);

	if (auto it = g_familiesByName.find(name); it != g_familiesByName.end()) {
		return it->second;
	}

	return {};
}

FaceDataHandle FontRegistry::get_face(Font font) {
	std::shared_lock lock(g_mutex);
	return get_face_internal(font);
}

const FontData* FontRegistry::get_font_data(Font font) {
	FaceDataHandle face;

	{
		std::shared_lock lock(g_mutex);
		face = get_face_internal(font);

		if (!face) {
			return nullptr;
		}

		if (auto& faceData = g_faces[face.handle]; faceData.loadAttempted) {
			return faceData.fontData.get();
		}
	}

	std::unique_lock lock(g_mutex);
	auto& faceData = g_faces[face.handle];

	// Another thread may have loaded the face between releasing the shared lock and acquiring this one
	if (faceData.loadAttempted) {
		return faceData.fontData.get();
	}

	faceData.loadAttempted = true;

	if (!faceData.mapping || !g_freeType.lib) {
		std::fprintf(stderr, "[FontRegistry] Face '%s' has no font data\n", faceData.name.c_str());
		return nullptr;
	}

	faceData.fontData = FontData::create(g_freeType.lib, faceData.mapping.mapping, faceData.mapping.size);

	if (!faceData.fontData) {
		std::fprintf(stderr, "[FontRegistry] Failed to load scalable face '%s'\n", faceData.name.c_str());
	}

	return faceData.fontData.get();
}

FontRegistryError FontRegistry::register_family(const FontFamilyCreateInfo& familyInfo) {
	if (!familyInfo.pFaces || familyInfo.faceCount == 0) {
		return FontRegistryError::NO_FACES;
	}

	for (uint32_t i = 0; i < familyInfo.faceCount; ++i) {
		if (familyInfo.pFaces[i].weight >= FontWeight::COUNT || familyInfo.pFaces[i].style >= FontStyle::COUNT) {
			return FontRegistryError::INVALID_FACE;
		}
	}

	std::unique_lock lock(g_mutex);

	if (g_familiesByName.find(familyInfo.name) != g_familiesByName.end()) {
		return FontRegistryError::ALREADY_LOADED;
	}

	FontFamily family{static_cast<FamilyIndex_T>(g_familyData.size())};
	g_familiesByName.emplace(std::make_pair(std::string(familyInfo.name), family));
	auto& faceLookup = g_familyData.emplace_back().lookup;

	FaceDataHandle defaultFace{};

	for (uint32_t i = 0; i < familyInfo.faceCount; ++i) {
		auto& faceInfo = familyInfo.pFaces[i];
		auto face = get_or_add_face(faceInfo);
		faceLookup[static_cast<size_t>(faceInfo.weight)][static_cast<size_t>(faceInfo.style)] = face;

		// Prefer Regular/Normal as the default, otherwise the first face given
		if (!defaultFace || (faceInfo.weight == FontWeight::REGULAR && faceInfo.style == FontStyle::NORMAL)) {
			defaultFace = face;
		}
	}

	for (size_t weight = 0; weight < WEIGHT_COUNT; ++weight) {
		for (size_t style = 0; style < STYLE_COUNT; ++style) {
			if (!faceLookup[weight][style]) {
				faceLookup[weight][style] = defaultFace;
			}
		}
	}

	return FontRegistryError::NONE;
}

void FontRegistry::set_file_mapping_functions(const FileMappingFunctions& funcs) {
	g_fileFuncs = funcs;
}

// Static Functions

static FaceDataHandle get_face_internal(Font font) {
	if (!font.valid() || font.get_family().handle >= g_familyData.size()
			|| font.get_weight() >= FontWeight::COUNT || font.get_style() >= FontStyle::COUNT) {
		return {};
	}

	return g_familyData[font.get_family().handle].get_face(font.get_weight(), font.get_style());
}

static FaceDataHandle get_or_add_face(const FontFaceCreateInfo& faceInfo) {
	if (auto it = g_facesByName.find(faceInfo.name); it != g_facesByName.end()) {
		return it->second;
	}

	FaceDataHandle result{static_cast<FaceIndex_T>(g_faces.size())};
	g_facesByName.emplace(std::make_pair(std::string(faceInfo.name), result));

	auto mapping = g_fileFuncs.pfnMapFile(faceInfo.uri);

	if (!mapping) {
		std::fprintf(stderr, "[FontRegistry] Failed to map '%.*s' for face '%.*s'\n",
				static_cast<int>(faceInfo.uri.size()), faceInfo.uri.data(), static_cast<int>(faceInfo.name.size()),
				faceInfo.name.data());
	}

	g_faces.emplace_back(std::string(faceInfo.name), mapping);

	return result;
}

FaceData::~FaceData() {
	fontData.reset();

	if (mapping) {
		g_fileFuncs.pfnUnmapFile(mapping);
	}
}
