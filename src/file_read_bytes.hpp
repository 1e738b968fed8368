#pragma once

#include <cstddef>
#include <cstdio>

#include <vector>

namespace Kinetic {

/**
 * Reads the whole file into memory, followed by `paddingSize` zeroed bytes that are not counted as file
 * contents by the caller. Returns an empty vector if the file cannot be read.
 */
inline std::vector<char> file_read_bytes(const char* fileName, size_t paddingSize = 0) {
	FILE* file = std::fopen(fileName, "rb");

	if (!file) {
		return {};
	}

	std::fseek(file, 0, SEEK_END);
	auto fileSize = std::ftell(file);
	std::rewind(file);

	if (fileSize < 0) {
		std::fclose(file);
		return {};
	}

	std::vector<char> result(static_cast<size_t>(fileSize) + paddingSize);
	auto readSize = std::fread(result.data(), 1, static_cast<size_t>(fileSize), file);
	std::fclose(file);

	if (readSize != static_cast<size_t>(fileSize)) {
		return {};
	}

	return result;
}

}
