#pragma once

#ifndef NELDERMEAD_NO_LOGGING
#include <spdlog/spdlog.h>
#include <memory>

namespace neldermead::utils {

/**
 * @class Logging
 * @brief Provides a singleton interface to the spdlog logging library.
 *
 * A single "nelder-mead" logger is shared by the whole library. It is created
 * lazily at info level, so trace and debug diagnostics stay silent until the
 * application lowers the level with init().
 */
class Logging {
public:
	/**
	 * @brief Gets the singleton logger instance.
	 * @return A shared pointer to the spdlog logger.
	 */
	static std::shared_ptr<spdlog::logger> &getLogger();

	/**
	 * @brief Initializes the logger with a specific logging level.
	 * @param level The minimum level of messages to log.
	 */
	static void init(spdlog::level::level_enum level = spdlog::level::info);

private:
	Logging() = default;

	static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace neldermead::utils

// --- Logger Macros for convenient access ---
#define NELDERMEAD_TRACE(...)    neldermead::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define NELDERMEAD_DEBUG(...)    neldermead::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define NELDERMEAD_INFO(...)     neldermead::utils::Logging::getLogger()->info(__VA_ARGS__)
#define NELDERMEAD_WARN(...)     neldermead::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define NELDERMEAD_ERROR(...)    neldermead::utils::Logging::getLogger()->error(__VA_ARGS__)
#define NELDERMEAD_CRITICAL(...) neldermead::utils::Logging::getLogger()->critical(__VA_ARGS__)

#else
// No-op logging when spdlog is not available

namespace neldermead::utils {

class Logging {
public:
	static void init() {}
};

} // namespace neldermead::utils

#define NELDERMEAD_TRACE(...)    do {} while(0)
#define NELDERMEAD_DEBUG(...)    do {} while(0)
#define NELDERMEAD_INFO(...)     do {} while(0)
#define NELDERMEAD_WARN(...)     do {} while(0)
#define NELDERMEAD_ERROR(...)    do {} while(0)
#define NELDERMEAD_CRITICAL(...) do {} while(0)

#endif // NELDERMEAD_NO_LOGGING
