#include "s3drop.hpp"
#include "detail/core.hpp"
#include "detail/logger.hpp"

namespace s3drop {
	void set_max_threads_count(api::optional<std::size_t> mtc){
		core::detail::execution_unit::set_max_thread_count(mtc);
	}

	void set_log_level(spdlog::level::level_enum lvl){
		log::set_level(lvl);
	}
}
