#include "detail/logger.hpp"
#include "spdlog/sinks/stdout_color_sinks.h"

namespace s3drop {
	namespace log {
		namespace {
			constexpr auto logger_name = "s3drop";

			std::shared_ptr<spdlog::logger> create_logger(){
				auto existing = spdlog::get(logger_name);
				if (existing)
					return existing;
				auto lg = spdlog::stdout_color_mt(logger_name);
				lg->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v");
				lg->set_level(spdlog::level::info);
				return lg;
			}
		}

		spdlog::logger& get(){
			static auto the_logger = create_logger();
			return *the_logger;
		}

		void set_level(spdlog::level::level_enum lvl){
			get().set_level(lvl);
		}
	}
}
