#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace kwhflow::utils {

/**
 * @class Logging
 * @brief Provides a singleton interface to the spdlog logging library.
 *
 * Every pipeline stage logs through the same "kwhflow" logger, which can be
 * configured once at startup by the host.
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

} // namespace kwhflow::utils

// --- Logger Macros for convenient access ---
#define KWHFLOW_TRACE(...)    kwhflow::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define KWHFLOW_DEBUG(...)    kwhflow::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define KWHFLOW_INFO(...)     kwhflow::utils::Logging::getLogger()->info(__VA_ARGS__)
#define KWHFLOW_WARN(...)     kwhflow::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define KWHFLOW_ERROR(...)    kwhflow::utils::Logging::getLogger()->error(__VA_ARGS__)
#define KWHFLOW_CRITICAL(...) kwhflow::utils::Logging::getLogger()->critical(__VA_ARGS__)
