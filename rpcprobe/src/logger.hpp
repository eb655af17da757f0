#pragma once

#include <string>
#include <log4cplus/logger.h>

log4cplus::Logger& harness_logger();
log4cplus::Logger& transport_logger();
log4cplus::Logger& suite_logger();
log4cplus::Logger& build_logger();
void init_logging(const std::string& config_path);
