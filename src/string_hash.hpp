#pragma once

#include <cstddef>

#include <functional>
#include <string_view>

namespace Kinetic {

// Allows `std::string`-keyed maps to be queried with `std::string_view` without allocating
struct StringHash {
	using is_transparent = void;

	[[nodiscard]] size_t operator()(std::string_view str) const {
		return std::hash<std::string_view>{}(str);
	}
};

}
