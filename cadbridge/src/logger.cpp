#include "logger.hpp"

#include <filesystem>
#include <system_error>

#include <log4cplus/configurator.h>
#include <log4cplus/helpers/loglog.h>

namespace cadbridge {

log4cplus::Logger& core_logger() {
	static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("cadbridge"));
	return logger;
}

log4cplus::Logger& server_logger() {
	static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("cadbridge.server"));
	return logger;
}

log4cplus::Logger& client_logger() {
	static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("cadbridge.client"));
	return logger;
}

log4cplus::Logger& host_logger() {
	static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("cadbridge.host"));
	return logger;
}

static std::filesystem::path resolve_config_path(const std::string& config_path) {
	std::filesystem::path path(config_path);
	if (path.is_absolute()) {
		return path;
	}

	return std::filesystem::current_path() / path;
}

void init_logging(const std::string& config_path) {
	if (!config_path.empty()) {
		std::error_code ec;
		auto resolved = resolve_config_path(config_path);
		if (std::filesystem::exists(resolved, ec)) {
			std::filesystem::create_directories("logs", ec);
			if (ec) {
				log4cplus::helpers::LogLog::getLogLog()->error(
				    LOG4CPLUS_TEXT("Failed to create logs directory: ") + LOG4CPLUS_STRING_TO_TSTRING(ec.message()));
			}
			log4cplus::PropertyConfigurator::doConfigure(LOG4CPLUS_STRING_TO_TSTRING(resolved.string()));
			return;
		}
		log4cplus::helpers::LogLog::getLogLog()->warn(
		    LOG4CPLUS_TEXT("Logging config not found, using console: ") + LOG4CPLUS_STRING_TO_TSTRING(resolved.string()));
	}

	log4cplus::BasicConfigurator fallback;
	fallback.configure();
	log4cplus::Logger::getRoot().setLogLevel(log4cplus::INFO_LOG_LEVEL);
}

} // namespace cadbridge
