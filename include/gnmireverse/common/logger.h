#ifndef GNMIREVERSE_COMMON_LOGGER_H_
#define GNMIREVERSE_COMMON_LOGGER_H_

#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>

namespace gnmireverse {
namespace common {

class Logger {
public:
    static void Init();
    static void SetLevel(spdlog::level::level_enum level);

    /**
     * @brief Map a spdlog level name (trace, debug, info, warning or warn, error or err, critical, off)
     * @throws core::ConfigError for an unknown name
     */
    static spdlog::level::level_enum ParseLevel(const std::string& name);
};

} // namespace common
} // namespace gnmireverse

// Macros for convenient logging
#define GNMIREVERSE_TRACE(...) spdlog::trace(__VA_ARGS__)
#define GNMIREVERSE_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define GNMIREVERSE_INFO(...)  spdlog::info(__VA_ARGS__)
#define GNMIREVERSE_WARN(...)  spdlog::warn(__VA_ARGS__)
#define GNMIREVERSE_ERROR(...) spdlog::error(__VA_ARGS__)
#define GNMIREVERSE_CRITICAL(...) spdlog::critical(__VA_ARGS__)

#endif // GNMIREVERSE_COMMON_LOGGER_H_
