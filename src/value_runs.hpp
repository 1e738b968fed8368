#pragma once

#include "binary_search.hpp"

#include <cstdint>

#include <concepts>
#include <utility>
#include <vector>

namespace Kinetic {

/**
 * Run-length encoding of a value over a range of indices. Run `i` covers the indices
 * `[get_run_limit(i - 1), get_run_limit(i))`, with the first run starting at 0.
 */
template <typename T>
class ValueRuns {
	public:
		using value_type = T;

		template <typename... Args>
		void add(int32_t limit, Args&&... args) {
			m_values.emplace_back(std::forward<Args>(args)...);
			m_limits.emplace_back(limit);
		}

		/**
		 * Extends the last run up to `limit` if it holds `value`, otherwise adds a new run.
		 */
		void add_or_extend(int32_t limit, const T& value) requires std::equality_comparable<T> {
			if (!m_values.empty() && m_values.back() == value) {
				m_limits.back() = limit;
			}
			else {
				add(limit, value);
			}
		}

		template <typename Functor>
		void for_each_run(Functor&& func) const {
			for (size_t i = 0; i < m_values.size(); ++i) {
				func(m_limits[i], m_values[i]);
			}
		}

		size_t get_run_containing_index(int32_t index) const {
			return binary_search(0, m_limits.size(), [&](auto i) {
				return m_limits[i] <= index;
			});
		}

		const T& get_value(int32_t index) const {
			return m_values[get_run_containing_index(index)];
		}

		const T& get_run_value(size_t runIndex) const {
			return m_values[runIndex];
		}

		int32_t get_run_limit(size_t runIndex) const {
			return m_limits[runIndex];
		}

		void clear() {
			m_values.clear();
			m_limits.clear();
		}

		bool empty() const {
			return m_values.empty();
		}

		size_t get_run_count() const {
			return m_limits.size();
		}

		int32_t get_limit() const {
			return m_limits.empty() ? 0 : m_limits.back();
		}
	private:
		std::vector<T> m_values;
		std::vector<int32_t> m_limits;
};

}
