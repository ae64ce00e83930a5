#pragma once
#ifndef S3DROP_DETAIL_LOGGER_HPP_
#define S3DROP_DETAIL_LOGGER_HPP_

#include "spdlog/spdlog.h"
#include <memory>

namespace s3drop {
	namespace log {
		// the library wide "s3drop" logger, created on first use
		spdlog::logger& get();
		void set_level(spdlog::level::level_enum lvl);
	}
}

#endif
