#include "nelder-mead/utils/logging.hpp"

#ifndef NELDERMEAD_NO_LOGGING
#include <spdlog/sinks/stdout_color_sinks.h>

namespace neldermead::utils {

std::shared_ptr<spdlog::logger> Logging::logger_;

void Logging::init(spdlog::level::level_enum level) {
	if (!logger_) {
		logger_ = spdlog::get("nelder-mead");
		if (!logger_) {
			logger_ = spdlog::stdout_color_mt("nelder-mead");
		}
	}
	logger_->set_level(level);
	logger_->flush_on(level);
}

std::shared_ptr<spdlog::logger> &Logging::getLogger() {
	if (!logger_) {
		init();
	}
	return logger_;
}

} // namespace neldermead::utils

#endif // NELDERMEAD_NO_LOGGING
