#pragma once
#ifndef S3DROP_STORAGE_DETAIL_REQUEST_SIGNER_HPP_
#define S3DROP_STORAGE_DETAIL_REQUEST_SIGNER_HPP_

#include "storage/adi.hpp"
#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace s3drop {
	namespace storage {
		namespace detail {
			using query_parameters = std::vector<std::pair<std::string, std::string>>;

			std::string hex_encode(api::const_blob_span bytes);
			std::string sha256_hex(api::const_blob_span bytes);
			std::string sha256_hex(api::string_view text);
			std::vector<std::uint8_t> hmac_sha256(api::const_blob_span key, api::string_view data);
			std::vector<std::uint8_t> derive_signing_key(const std::string& secret_key,
				const std::string& date, const std::string& region, const std::string& service);

			// RFC 3986 unreserved characters stay, everything else is %XX encoded
			std::string uri_encode(api::string_view text, bool keep_slash);
			std::string canonical_query(query_parameters params);

			// AWS Signature Version 4, header based
			class request_signer {
				credentials		m_credentials;
				std::string		m_region;
				std::string		m_service;
			public:
				struct signing_input{
					std::string								method;
					std::string								canonical_uri;
					query_parameters						query;
					std::string								host;
					std::string								payload_hash;
					std::chrono::system_clock::time_point	when;
				};

				struct signature_headers{
					std::string		amz_date;
					std::string		content_sha256;
					std::string		authorization;
				};

				request_signer(credentials creds, std::string region, std::string service = "s3");

				signature_headers sign(const signing_input& input) const;
				std::string canonical_request(const signing_input& input, const std::string& amz_date) const;
				std::string string_to_sign(const std::string& amz_date, const std::string& canonical_req) const;
			};
		}
	}
}

#endif
