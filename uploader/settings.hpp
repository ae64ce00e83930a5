#pragma once
#ifndef S3DROP_UPLOADER_SETTINGS_HPP_
#define S3DROP_UPLOADER_SETTINGS_HPP_

#include "uploader/adi.hpp"
#include <iosfwd>
#include <stdexcept>

namespace s3drop {
	namespace uploader {
		class settings_error : public std::runtime_error {
		public:
			using std::runtime_error::runtime_error;
		};

		// [storage], [advanced] and [retry] sections of an INI file, missing keys keep their defaults
		settings load_settings(const api::fs::path& ini_file);
		settings parse_settings(std::istream& ini_stream);
		void validate(const settings& cfg);
	}
}

#endif
