#include "logger.hpp"

#include <filesystem>

#include <log4cplus/configurator.h>
#include <log4cplus/helpers/loglog.h>

log4cplus::Logger& harness_logger() {
	static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("rpcprobe"));
	return logger;
}

log4cplus::Logger& transport_logger() {
	static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("rpcprobe.transport"));
	return logger;
}

log4cplus::Logger& suite_logger() {
	static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("rpcprobe.suite"));
	return logger;
}

log4cplus::Logger& build_logger() {
	static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("rpcprobe.build"));
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
	try {
		auto resolved = resolve_config_path(config_path);
		if (std::filesystem::exists(resolved)) {
			std::filesystem::create_directories("logs");
			log4cplus::PropertyConfigurator::doConfigure(LOG4CPLUS_STRING_TO_TSTRING(resolved.string()));
			return;
		}
	} catch (const std::exception& exc) {
		log4cplus::helpers::LogLog::getLogLog()->error(
			LOG4CPLUS_TEXT("Failed to load logging config: ") + LOG4CPLUS_STRING_TO_TSTRING(std::string(exc.what())));
	}

	// The report goes to stdout; keep the fallback appender quiet unless something is wrong.
	log4cplus::BasicConfigurator fallback;
	fallback.configure();
	log4cplus::Logger::getRoot().setLogLevel(log4cplus::WARN_LOG_LEVEL);
}
