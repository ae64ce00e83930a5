#pragma once
#ifndef S3DROP_STORAGE_DETAIL_XML_DOCUMENT_HPP_
#define S3DROP_STORAGE_DETAIL_XML_DOCUMENT_HPP_

#include "storage/adi.hpp"
#include <string>
#include <vector>

namespace s3drop {
	namespace storage {
		namespace detail {
			struct error_document{
				std::string		code;
				std::string		message;
			};

			// InitiateMultipartUploadResult/UploadId
			api::optional<upload_id> parse_upload_id(const std::string& body);
			// Error/Code and Error/Message, nullopt when the body is no error document
			api::optional<error_document> parse_error_document(const std::string& body);
			std::string make_complete_multipart_body(const std::vector<completed_part>& parts);
		}
	}
}

#endif
