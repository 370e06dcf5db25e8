#include "gnmireverse/common/logger.h"
#include "gnmireverse/core/error.h"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>

namespace gnmireverse {
namespace common {

void Logger::Init() {
    try {
        auto console = spdlog::get("console");
        if (!console) {
            console = spdlog::stdout_color_mt("console");
        }
        spdlog::set_default_logger(console);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [thread %t] %v");
        spdlog::set_level(spdlog::level::info);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

void Logger::SetLevel(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

spdlog::level::level_enum Logger::ParseLevel(const std::string& name) {
    // from_str answers off for anything it does not know
    auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") {
        throw core::ConfigError("unknown log level: " + name);
    }
    return level;
}

} // namespace common
} // namespace gnmireverse
