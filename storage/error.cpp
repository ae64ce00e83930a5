#include "storage/error.hpp"

namespace s3drop {
	namespace storage {
		namespace {
			class storage_error_category : public std::error_category {
			public:
				const char* name() const noexcept override {
					return "s3drop.storage";
				}

				std::string message(int ev) const override {
					switch (static_cast<errc>(ev)) {
					case errc::network_failure:
						return "network failure";
					case errc::server_error:
						return "storage service error";
					case errc::throttled:
						return "request throttled by the storage service";
					case errc::request_timeout:
						return "storage service timed out reading the request";
					case errc::client_error:
						return "request rejected by the storage service";
					case errc::access_denied:
						return "access denied";
					case errc::no_such_upload:
						return "multipart upload does not exist";
					case errc::malformed_response:
						return "malformed response from the storage service";
					}
					return "unknown storage error";
				}
			};

			errc errc_from_service_code(const std::string& service_code, unsigned http_status){
				if (service_code == "SlowDown")
					return errc::throttled;
				if (service_code == "RequestTimeout")
					return errc::request_timeout;
				if (service_code == "InternalError" or service_code == "ServiceUnavailable")
					return errc::server_error;
				if (service_code == "NoSuchUpload")
					return errc::no_such_upload;
				if (service_code == "AccessDenied" or service_code == "SignatureDoesNotMatch" or
					service_code == "InvalidAccessKeyId" or service_code == "ExpiredToken")
					return errc::access_denied;

				if (http_status == 429u)
					return errc::throttled;
				if (http_status >= 500u)
					return errc::server_error;
				if (http_status == 401u or http_status == 403u)
					return errc::access_denied;
				if (http_status >= 300u and http_status < 500u)
					return errc::client_error;
				return errc::malformed_response;
			}
		}

		const std::error_category& storage_category() noexcept {
			static storage_error_category the_category;
			return the_category;
		}

		std::error_code make_error_code(errc e) noexcept {
			return {static_cast<int>(e), storage_category()};
		}

		error_class classify(const std::error_code& ec) noexcept {
			if (ec.category() == storage_category()) {
				switch (static_cast<errc>(ec.value())) {
				case errc::network_failure:
				case errc::server_error:
				case errc::throttled:
				case errc::request_timeout:
					return error_class::transient;
				default:
					break;
				}
			}
			return error_class::permanent;
		}

		error::operator bool() const noexcept {
			return static_cast<bool>(code);
		}

		error_class error::classification() const noexcept {
			return classify(code);
		}

		bool error::cancelled() const noexcept {
			return code == std::make_error_code(std::errc::operation_canceled);
		}

		std::string error::describe() const {
			auto text = code.message();
			if (http_status != 0u) {
				text += " (HTTP " + std::to_string(http_status);
				if (not service_code.empty())
					text += ' ' + service_code;
				text += ')';
			}
			if (not message.empty())
				text += ": " + message;
			return text;
		}

		error make_http_error(unsigned http_status, std::string service_code, std::string message) {
			auto err = error{};
			err.code = make_error_code(errc_from_service_code(service_code, http_status));
			err.http_status = http_status;
			err.service_code = std::move(service_code);
			err.message = std::move(message);
			return err;
		}

		error make_transport_error(const boost::system::error_code& ec, const char* stage) {
			auto err = error{};
			err.code = make_error_code(errc::network_failure);
			err.message = std::string{stage} + ": " + ec.message();
			return err;
		}

		error make_local_error(std::error_code ec, std::string message) {
			auto err = error{};
			err.code = ec;
			err.message = std::move(message);
			return err;
		}

		error make_cancelled_error() {
			auto err = error{};
			err.code = std::make_error_code(std::errc::operation_canceled);
			return err;
		}
	}
}
