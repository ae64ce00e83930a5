#pragma once
#ifndef S3DROP_UPLOADER_DETAIL_OBJECT_KEY_HPP_
#define S3DROP_UPLOADER_DETAIL_OBJECT_KEY_HPP_

#include "api_binder.hpp"
#include <chrono>
#include <string>

namespace s3drop {
	namespace uploader {
		namespace detail {
			// UTF-8 in, ASCII out for every code point the table knows, others pass through
			std::string transliterate(api::string_view utf8_text);
			// only [A-Za-z0-9._-] survives, anything else becomes '_'
			std::string sanitize_file_name(api::string_view utf8_name);

			// YYYY-MM-DD/<stem>_<8 hex digits>.<ext>, UTC date
			std::string derive_destination_key(const api::fs::path& source,
				std::chrono::system_clock::time_point now, std::uint32_t disambiguator);
			std::string derive_destination_key(const api::fs::path& source);

			std::string guess_content_type(const std::string& key_or_path);
		}
	}
}

#endif
