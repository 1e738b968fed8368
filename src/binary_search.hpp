#pragma once

#include <cstddef>

namespace Kinetic {

/**
 * Returns the first index in `[first, first + count)` for which `cond` is false, assuming `cond` is true
 * for a prefix of the range and false for the remainder.
 */
template <typename Condition>
constexpr size_t binary_search(size_t first, size_t count, Condition&& cond) {
	while (count > 0) {
		auto step = count / 2;
		auto i = first + step;

		if (cond(i)) {
			first = i + 1;
			count -= step + 1;
		}
		else {
			count = step;
		}
	}

	return first;
}

}
