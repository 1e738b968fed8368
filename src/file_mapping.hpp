#pragma once

#include <cstddef>

#include <string_view>

namespace Kinetic {

/**
 * A read-only view of a file's bytes. `mapping` is `nullptr` if the file could not be opened.
 */
struct FileMapping {
	const void* mapping;
	size_t size;

	constexpr bool valid() const {
		return mapping != nullptr;
	}

	constexpr explicit operator bool() const {
		return valid();
	}
};

/**
 * Functions the `FontRegistry` uses to access font files, replaceable to serve fonts from archives or
 * embedded resources.
 */
struct FileMappingFunctions {
	FileMapping (*pfnMapFile)(std::string_view fileName);
	void (*pfnUnmapFile)(const FileMapping& mapping);
};

/**
 * @brief Maps the file into memory with `mmap` where available, otherwise reads it into a heap buffer.
 */
[[nodiscard]] FileMapping map_file_default(std::string_view fileName);
/**
 * @brief Releases a view returned by `map_file_default`. Must not be called with an invalid view.
 */
void unmap_file_default(const FileMapping& mapping);

}
