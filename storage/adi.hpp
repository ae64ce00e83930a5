// ADI is short for Application Data Interface
#pragma once
#ifndef S3DROP_STORAGE_ADI_HPP_
#define S3DROP_STORAGE_ADI_HPP_

#include "api_binder.hpp"
#include <functional>
#include <string>
#include <vector>

namespace s3drop {
	namespace storage {
		using object_key = std::string;
		using etag = std::string;
		using upload_id = std::string;

		// value of calls answering with nothing but success
		struct nothing{};

		struct completed_part{
			std::uint32_t	part_number;
			etag			tag;
		};

		// already decrypted by whoever owns the secrets
		struct credentials{
			std::string		access_key;
			std::string		secret_key;
		};

		struct endpoint_config{
			std::string		endpoint;
			std::string		bucket;
			std::string		region;
		};
	}
}

#endif
