#include "uploader/settings.hpp"
#include "detail/logger.hpp"
#include "storage/detail/http_client.hpp"
#include "boost/property_tree/ini_parser.hpp"
#include "boost/property_tree/ptree.hpp"
#include <fstream>

namespace s3drop {
	namespace uploader {
		namespace {
			namespace pt = boost::property_tree;

			std::string unquote(std::string value){
				if (value.size() >= 2u and (value.front() == '"' or value.front() == '\'') and value.back() == value.front())
					return value.substr(1u, value.size() - 2u);
				return value;
			}

			std::string read_text(const pt::ptree& tree, const char* path, const std::string& fallback){
				auto value = tree.get_optional<std::string>(path);
				return value ? unquote(*value) : fallback;
			}

			template<typename T>
			T read_number(const pt::ptree& tree, const char* path, T fallback){
				auto text = tree.get_optional<std::string>(path);
				if (not text)
					return fallback;
				auto value = unquote(*text);
				try{
					auto pos = std::size_t{0};
					auto parsed = std::stoull(value, &pos);
					if (pos != value.size() or value.front() == '-')
						throw settings_error(std::string{path} + " is not a non negative integer: " + value);
					return static_cast<T>(parsed);
				}
				catch (const std::logic_error&){
					throw settings_error(std::string{path} + " is not a non negative integer: " + value);
				}
			}
		}

		settings load_settings(const api::fs::path& ini_file){
			auto ini_stream = std::ifstream(ini_file);
			if (not ini_stream.is_open())
				throw settings_error("cannot open settings file " + to_u8string(ini_file));
			return parse_settings(ini_stream);
		}

		settings parse_settings(std::istream& ini_stream){
			auto tree = pt::ptree{};
			try{
				pt::read_ini(ini_stream, tree);
			}
			catch (const pt::ini_parser_error& e){
				throw settings_error(std::string{"malformed settings: "} + e.what());
			}

			auto cfg = settings{};
			cfg.endpoint = read_text(tree, "storage.endpoint", cfg.endpoint);
			cfg.bucket = read_text(tree, "storage.bucket", cfg.bucket);
			cfg.region = read_text(tree, "storage.region", cfg.region);

			cfg.parallel_uploads = read_number(tree, "advanced.parallel_uploads", cfg.parallel_uploads);
			cfg.multipart_threshold = read_number(tree, "advanced.multipart_threshold_mb", cfg.multipart_threshold / Mega) * Mega;
			cfg.multipart_chunk_size = read_number(tree, "advanced.multipart_chunk_mb", cfg.multipart_chunk_size / Mega) * Mega;
			cfg.parts_in_flight = read_number(tree, "advanced.parts_in_flight", cfg.parts_in_flight);

			cfg.max_attempts = read_number(tree, "retry.max_attempts", cfg.max_attempts);
			cfg.base_delay = std::chrono::milliseconds(read_number(tree, "retry.base_delay_ms", cfg.base_delay.count()));
			cfg.max_delay = std::chrono::milliseconds(read_number(tree, "retry.max_delay_ms", cfg.max_delay.count()));

			validate(cfg);
			return cfg;
		}

		void validate(const settings& cfg){
			if (cfg.endpoint.empty())
				throw settings_error("storage endpoint is not set");
			if (cfg.endpoint.rfind("http://", 0) != 0 and cfg.endpoint.rfind("https://", 0) != 0)
				throw settings_error("storage endpoint must start with http:// or https://: " + cfg.endpoint);
			if (not storage::detail::parse_endpoint(cfg.endpoint))
				throw settings_error("storage endpoint has no usable host: " + cfg.endpoint);
			if (cfg.bucket.empty())
				throw settings_error("bucket is not set");
			if (cfg.parallel_uploads == 0u)
				throw settings_error("parallel_uploads must be at least 1");
			if (cfg.parts_in_flight == 0u)
				throw settings_error("parts_in_flight must be at least 1");
			if (cfg.multipart_threshold == 0u)
				throw settings_error("multipart threshold must be positive");
			if (cfg.multipart_chunk_size == 0u)
				throw settings_error("multipart chunk size must be positive");
			if (cfg.max_attempts == 0u)
				throw settings_error("max_attempts must be at least 1");
			if (cfg.max_delay < cfg.base_delay)
				throw settings_error("max_delay_ms is shorter than base_delay_ms");
			if (cfg.multipart_chunk_size < 5u * Mega)
				log::get().warn("multipart chunk size {} is below the 5 MiB S3 minimum, "
					"most endpoints will refuse all but the last part", cfg.multipart_chunk_size);
		}
	}
}
