#pragma once
#ifndef S3DROP_STORAGE_ERROR_HPP_
#define S3DROP_STORAGE_ERROR_HPP_

#include "api_binder.hpp"
#include "boost/system/error_code.hpp"
#include <string>
#include <system_error>

namespace s3drop {
	namespace storage {
		enum class errc {
			network_failure = 1,
			server_error,
			throttled,
			request_timeout,
			client_error,
			access_denied,
			no_such_upload,
			malformed_response
		};

		enum class error_class {
			transient,
			permanent
		};

		const std::error_category& storage_category() noexcept;
		std::error_code make_error_code(errc e) noexcept;

		// anything that is neither ours nor cancellation is permanent
		error_class classify(const std::error_code& ec) noexcept;

		struct error {
			std::error_code		code;
			unsigned			http_status = 0u;
			// S3 <Code> of the error document, when the service sent one
			std::string			service_code;
			std::string			message;

			explicit operator bool() const noexcept;
			error_class classification() const noexcept;
			bool cancelled() const noexcept;
			std::string describe() const;
		};

		error make_http_error(unsigned http_status, std::string service_code, std::string message);
		error make_transport_error(const boost::system::error_code& ec, const char* stage);
		error make_local_error(std::error_code ec, std::string message);
		error make_cancelled_error();
	}
}

namespace std {
	template<>
	struct is_error_code_enum<s3drop::storage::errc> : true_type {};
}

#endif
