#include "file_mapping.hpp"

#include "common.hpp"

#include <string>

using namespace Kinetic;

#if defined(KINETIC_OPERATING_SYSTEM_LINUX)

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

FileMapping Kinetic::map_file_default(std::string_view fileName) {
	int fd = open(std::string(fileName).c_str(), O_RDONLY | O_CLOEXEC);

	if (fd == -1) {
		return {};
	}

	struct stat sb;

	if (fstat(fd, &sb) == -1 || sb.st_size <= 0) {
		close(fd);
		return {};
	}

	auto fileSize = static_cast<size_t>(sb.st_size);
	void* mapping = mmap(nullptr, fileSize, PROT_READ, MAP_PRIVATE, fd, 0);

	// The mapping keeps its own reference to the file
	close(fd);

	if (mapping == MAP_FAILED) {
		return {};
	}

	return {mapping, fileSize};
}

void Kinetic::unmap_file_default(const FileMapping& mapping) {
	munmap(const_cast<void*>(mapping.mapping), mapping.size);
}

#else

#include <cstdio>
#include <cstdlib>

FileMapping Kinetic::map_file_default(std::string_view fileName) {
	FILE* file = std::fopen(std::string(fileName).c_str(), "rb");

	if (!file) {
		return {};
	}

	std::fseek(file, 0, SEEK_END);
	auto fileSize = std::ftell(file);
	std::rewind(file);

	if (fileSize <= 0) {
		std::fclose(file);
		return {};
	}

	auto* mapping = std::malloc(static_cast<size_t>(fileSize));

	if (!mapping) {
		std::fclose(file);
		return {};
	}

	auto readSize = std::fread(mapping, 1, static_cast<size_t>(fileSize), file);
	std::fclose(file);

	if (readSize != static_cast<size_t>(fileSize)) {
		std::free(mapping);
		return {};
	}

	return {mapping, static_cast<size_t>(fileSize)};
}

void Kinetic::unmap_file_default(const FileMapping& mapping) {
	std::free(const_cast<void*>(mapping.mapping));
}

#endif
