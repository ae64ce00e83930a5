#pragma once
#ifndef S3DROP_UPLOADER_DETAIL_CHUNK_PLAN_HPP_
#define S3DROP_UPLOADER_DETAIL_CHUNK_PLAN_HPP_

#include <cstdint>
#include <utility>

namespace s3drop {
	namespace uploader {
		namespace detail {
			// S3 refuses to assemble more parts than this
			constexpr std::uint32_t max_part_count = 10000u;

			// Fixed size chunks over a file, numbered from 1, only the last one may be short.
			class chunk_plan {
				std::uint64_t	m_file_size = 0u;
				std::uint64_t	m_chunk_size = 0u;
				std::uint32_t	m_part_count = 0u;
			public:
				chunk_plan(std::uint64_t file_size, std::uint64_t requested_chunk_size);

				// requested size, raised when the part limit demands it
				std::uint64_t chunk_size() const;
				std::uint32_t part_count() const;
				// {offset, length} of a part, part_number in [1, part_count()]
				[[nodiscard]] std::pair<std::uint64_t, std::uint64_t> part_extent(std::uint32_t part_number) const;
			};
		}
	}
}

#endif
