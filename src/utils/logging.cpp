#include "kwhflow/utils/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

namespace kwhflow::utils {

namespace {
std::mutex &loggerMutex() {
	static std::mutex mutex;
	return mutex;
}

// Caller holds loggerMutex().
std::shared_ptr<spdlog::logger> attachLogger() {
	auto logger = spdlog::get("kwhflow");
	if (!logger) {
		logger = spdlog::stdout_color_mt("kwhflow");
	}
	return logger;
}
} // namespace

std::shared_ptr<spdlog::logger> Logging::logger_;

void Logging::init(spdlog::level::level_enum level) {
	std::lock_guard<std::mutex> lock(loggerMutex());
	if (!logger_) {
		logger_ = attachLogger();
	}
	logger_->set_level(level);
	logger_->flush_on(level);
}

std::shared_ptr<spdlog::logger> &Logging::getLogger() {
	std::lock_guard<std::mutex> lock(loggerMutex());
	if (!logger_) {
		// Default level until the host calls init().
		logger_ = attachLogger();
		logger_->set_level(spdlog::level::info);
		logger_->flush_on(spdlog::level::info);
	}
	return logger_;
}

} // namespace kwhflow::utils
