#include "font_registry.hpp"

#include "file_read_bytes.hpp"

#include <simdjson.h>

#include <cstdio>

#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

using namespace Kinetic;

static FontRegistryError register_family_from_json(std::string_view fileData,
		const std::filesystem::path& baseDirectory);

// Public Functions

FontRegistryError FontRegistry::register_families_from_path(const char* pathName) {
	std::error_code err;
	std::filesystem::directory_iterator it{pathName, err};

	if (err) {
		std::fprintf(stderr, "[FontRegistry] Cannot open family directory '%s': %s\n", pathName,
				err.message().c_str());
		return FontRegistryError::FILE_ERROR;
	}

	for (auto& entry : it) {
		if (entry.path().extension().compare(".json") == 0) {
			if (auto res = FontRegistry::register_family_from_json_file(entry.path().string().c_str());
					res != FontRegistryError::NONE) {
				return res;
			}
		}
	}

	return FontRegistryError::NONE;
}

FontRegistryError FontRegistry::register_family_from_json_file(const char* uri) {
	auto fileData = file_read_bytes(uri, simdjson::SIMDJSON_PADDING);

	if (fileData.empty()) {
		std::fprintf(stderr, "[FontRegistry] Cannot read family file '%s'\n", uri);
		return FontRegistryError::FILE_ERROR;
	}

	auto result = register_family_from_json(std::string_view(fileData.data(), fileData.size()),
			std::filesystem::path(uri).parent_path());

	if (result == FontRegistryError::INVALID_JSON) {
		std::fprintf(stderr, "[FontRegistry] Malformed family file '%s'\n", uri);
	}

	return result;
}

FontRegistryError FontRegistry::register_family_from_json_data(std::string_view fileData) {
	return register_family_from_json(fileData, {});
}

// Static Functions

static FontRegistryError register_family_from_json(std::string_view fileData,
		const std::filesystem::path& baseDirectory) {
	if (fileData.size() < simdjson::SIMDJSON_PADDING) {
		return FontRegistryError::INVALID_JSON;
	}

	simdjson::padded_string_view sv(fileData.data(), fileData.size() - simdjson::SIMDJSON_PADDING,
			fileData.size());
	simdjson::ondemand::parser parser;
	auto d = parser.iterate(sv);

	simdjson::ondemand::object root;
	if (auto error = d.get(root); error != simdjson::SUCCESS) {
		std::puts(simdjson::error_message(error));
		return FontRegistryError::INVALID_JSON;
	}

	std::string_view familyName;
	if (root["name"].get(familyName) != simdjson::SUCCESS) {
		return FontRegistryError::INVALID_JSON;
	}

	simdjson::ondemand::array faceArray;
	if (root["faces"].get(faceArray) != simdjson::SUCCESS) {
		return FontRegistryError::INVALID_JSON;
	}

	std::vector<FontFaceCreateInfo> faces;
	// Face URIs resolved against the descriptor's directory; reserved up front so views into it stay valid
	std::vector<std::string> resolvedUris;

	for (auto faceValue : faceArray) {
		simdjson::ondemand::object faceObject;
		if (faceValue.get(faceObject) != simdjson::SUCCESS) {
			return FontRegistryError::INVALID_JSON;
		}

		auto& face = faces.emplace_back();

		if (faceObject["name"].get(face.name) != simdjson::SUCCESS) {
			return FontRegistryError::INVALID_JSON;
		}

		if (faceObject["uri"].get(face.uri) != simdjson::SUCCESS) {
			return FontRegistryError::INVALID_JSON;
		}

		int64_t weight;
		if (faceObject["weight"].get(weight) != simdjson::SUCCESS) {
			return FontRegistryError::INVALID_JSON;
		}

		face.weight = font_weight_from_css(weight);

		if (face.weight == FontWeight::COUNT) {
			return FontRegistryError::INVALID_JSON;
		}

		std::string_view style;
		if (faceObject["style"].get(style) != simdjson::SUCCESS) {
			return FontRegistryError::INVALID_JSON;
		}

		if (style.compare("normal") != 0 && style.compare("italic") != 0) {
			return FontRegistryError::INVALID_JSON;
		}

		face.style = style.compare("italic") == 0 ? FontStyle::ITALIC : FontStyle::NORMAL;
	}

	if (!baseDirectory.empty()) {
		resolvedUris.reserve(faces.size());

		for (auto& face : faces) {
			std::filesystem::path uri(face.uri);

			if (uri.is_relative()) {
				face.uri = resolvedUris.emplace_back((baseDirectory / uri).string());
			}
		}
	}

	FontFamilyCreateInfo familyInfo{
		.name = familyName,
		.pFaces = faces.data(),
		.faceCount = static_cast<uint32_t>(faces.size()),
	};

	return FontRegistry::register_family(familyInfo);
}
