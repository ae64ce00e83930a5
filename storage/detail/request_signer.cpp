#include "storage/detail/request_signer.hpp"

#include "openssl/evp.h"
#include "openssl/hmac.h"
#include "openssl/sha.h"
#include <algorithm>
#include <ctime>

namespace s3drop {
	namespace storage {
		namespace detail {
			namespace {
				constexpr auto algorithm = "AWS4-HMAC-SHA256";
				constexpr auto signed_header_names = "host;x-amz-content-sha256;x-amz-date";

				api::const_blob_span as_bytes(api::string_view text){
					return {reinterpret_cast<const std::uint8_t*>(text.data()), text.size()};
				}

				std::tm to_utc_tm(std::chrono::system_clock::time_point tp){
					auto tt = std::chrono::system_clock::to_time_t(tp);
					auto utc = std::tm{};
#ifdef _WIN32
					gmtime_s(&utc, &tt);
#else
					gmtime_r(&tt, &utc);
#endif
					return utc;
				}

				std::string format_utc(std::chrono::system_clock::time_point tp, const char* fmt){
					auto utc = to_utc_tm(tp);
					char buf[32] = {};
					auto len = std::strftime(buf, sizeof(buf), fmt, &utc);
					return std::string{buf, len};
				}
			}

			std::string hex_encode(api::const_blob_span bytes){
				static constexpr char digits[] = "0123456789abcdef";
				auto out = std::string{};
				out.reserve(bytes.size() * 2);
				for (auto b : bytes){
					out.push_back(digits[b >> 4]);
					out.push_back(digits[b & 0x0f]);
				}
				return out;
			}

			std::string sha256_hex(api::const_blob_span bytes){
				unsigned char digest[SHA256_DIGEST_LENGTH];
				SHA256(bytes.data(), bytes.size(), digest);
				return hex_encode({digest, SHA256_DIGEST_LENGTH});
			}

			std::string sha256_hex(api::string_view text){
				return sha256_hex(as_bytes(text));
			}

			std::vector<std::uint8_t> hmac_sha256(api::const_blob_span key, api::string_view data){
				auto mac = std::vector<std::uint8_t>(EVP_MAX_MD_SIZE);
				auto mac_len = 0u;
				HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
					reinterpret_cast<const unsigned char*>(data.data()), data.size(),
					mac.data(), &mac_len);
				mac.resize(mac_len);
				return mac;
			}

			std::vector<std::uint8_t> derive_signing_key(const std::string& secret_key,
				const std::string& date, const std::string& region, const std::string& service){
				auto seed = "AWS4" + secret_key;
				auto k_date = hmac_sha256(as_bytes(seed), date);
				auto k_region = hmac_sha256(k_date, region);
				auto k_service = hmac_sha256(k_region, service);
				return hmac_sha256(k_service, "aws4_request");
			}

			std::string uri_encode(api::string_view text, bool keep_slash){
				static constexpr char digits[] = "0123456789ABCDEF";
				auto out = std::string{};
				out.reserve(text.size());
				for (auto ch : text){
					auto c = static_cast<unsigned char>(ch);
					auto unreserved = (c >= 'A' and c <= 'Z') or (c >= 'a' and c <= 'z') or
						(c >= '0' and c <= '9') or c == '-' or c == '_' or c == '.' or c == '~';
					if (unreserved or (keep_slash and c == '/'))
						out.push_back(ch);
					else{
						out.push_back('%');
						out.push_back(digits[c >> 4]);
						out.push_back(digits[c & 0x0f]);
					}
				}
				return out;
			}

			std::string canonical_query(query_parameters params){
				for (auto& [name, value] : params){
					name = uri_encode(name, false);
					value = uri_encode(value, false);
				}
				std::sort(params.begin(), params.end());
				auto out = std::string{};
				for (auto& [name, value] : params){
					if (not out.empty())
						out.push_back('&');
					out += name;
					out.push_back('=');
					out += value;
				}
				return out;
			}

			request_signer::request_signer(credentials creds, std::string region, std::string service)
				: m_credentials(std::move(creds)), m_region(std::move(region)), m_service(std::move(service)){}

			std::string request_signer::canonical_request(const signing_input& input, const std::string& amz_date) const {
				auto req = input.method + '\n';
				req += input.canonical_uri + '\n';
				req += canonical_query(input.query) + '\n';
				req += "host:" + input.host + '\n';
				req += "x-amz-content-sha256:" + input.payload_hash + '\n';
				req += "x-amz-date:" + amz_date + '\n';
				req += '\n';
				req += signed_header_names;
				req += '\n';
				req += input.payload_hash;
				return req;
			}

			std::string request_signer::string_to_sign(const std::string& amz_date, const std::string& canonical_req) const {
				auto date = amz_date.substr(0, 8);
				auto scope = date + '/' + m_region + '/' + m_service + "/aws4_request";
				return std::string{algorithm} + '\n' + amz_date + '\n' + scope + '\n' + sha256_hex(canonical_req);
			}

			request_signer::signature_headers request_signer::sign(const signing_input& input) const {
				auto amz_date = format_utc(input.when, "%Y%m%dT%H%M%SZ");
				auto date = amz_date.substr(0, 8);
				auto to_sign = string_to_sign(amz_date, canonical_request(input, amz_date));
				auto signing_key = derive_signing_key(m_credentials.secret_key, date, m_region, m_service);
				auto signature = hex_encode(hmac_sha256(signing_key, to_sign));

				auto headers = signature_headers{};
				headers.amz_date = amz_date;
				headers.content_sha256 = input.payload_hash;
				headers.authorization = std::string{algorithm} + " Credential=" + m_credentials.access_key + '/' +
					date + '/' + m_region + '/' + m_service + "/aws4_request, SignedHeaders=" +
					signed_header_names + ", Signature=" + signature;
				return headers;
			}
		}
	}
}
