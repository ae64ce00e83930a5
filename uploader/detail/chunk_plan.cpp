#include "uploader/detail/chunk_plan.hpp"
#include <algorithm>

namespace s3drop {
	namespace uploader {
		namespace detail {
			chunk_plan::chunk_plan(std::uint64_t file_size, std::uint64_t requested_chunk_size)
				: m_file_size(file_size),
				m_chunk_size(std::max<std::uint64_t>(requested_chunk_size, 1u)){
				auto smallest_allowed = m_file_size / max_part_count + (m_file_size % max_part_count ? 1 : 0);
				if (m_chunk_size < smallest_allowed)
					m_chunk_size = smallest_allowed;
				m_part_count = static_cast<std::uint32_t>(m_file_size / m_chunk_size + (m_file_size % m_chunk_size ? 1 : 0));
				// an empty file is still one (empty) part
				if (m_part_count == 0u)
					m_part_count = 1u;
			}

			std::uint64_t chunk_plan::chunk_size() const {
				return m_chunk_size;
			}

			std::uint32_t chunk_plan::part_count() const {
				return m_part_count;
			}

			std::pair<std::uint64_t, std::uint64_t> chunk_plan::part_extent(std::uint32_t part_number) const {
				if (part_number == 0u or part_number > m_part_count)
					return {m_file_size, 0u};
				auto offset = static_cast<std::uint64_t>(part_number - 1u) * m_chunk_size;
				return {offset, std::min(m_chunk_size, m_file_size - offset)};
			}
		}
	}
}
