#pragma once
#ifndef S3DROP_HPP_
#define S3DROP_HPP_

#include "uploader/manager.hpp"
#include "uploader/settings.hpp"
#include "spdlog/common.h"

namespace s3drop {
	// upper bound of network and disk threads, hardware concurrency when empty
	void set_max_threads_count(api::optional<std::size_t> mtc);
	void set_log_level(spdlog::level::level_enum lvl);
}

#endif
