#pragma once

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <mutex>
#include <string>
#include <utility>

namespace fetchy {

class Logger {
public:
    static Logger& instance();

    // Console sink always; a rotating file sink when log_file is non-empty.
    void initialize(const std::string& log_file = {},
                    spdlog::level::level_enum level = spdlog::level::info);

    void setLevel(spdlog::level::level_enum level);

    template<typename... Args>
    void trace(fmt::format_string<Args...> format, Args&&... args) {
        logger()->trace(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(fmt::format_string<Args...> format, Args&&... args) {
        logger()->debug(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(fmt::format_string<Args...> format, Args&&... args) {
        logger()->info(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(fmt::format_string<Args...> format, Args&&... args) {
        logger()->warn(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(fmt::format_string<Args...> format, Args&&... args) {
        logger()->error(format, std::forward<Args>(args)...);
    }

private:
    Logger() = default;

    std::shared_ptr<spdlog::logger> logger();

    std::mutex mutex_;
    std::shared_ptr<spdlog::logger> logger_;
};

[[nodiscard]] spdlog::level::level_enum parseLogLevel(const std::string& name);

#define FETCHY_TRACE(...) ::fetchy::Logger::instance().trace(__VA_ARGS__)
#define FETCHY_DEBUG(...) ::fetchy::Logger::instance().debug(__VA_ARGS__)
#define FETCHY_INFO(...) ::fetchy::Logger::instance().info(__VA_ARGS__)
#define FETCHY_WARN(...) ::fetchy::Logger::instance().warn(__VA_ARGS__)
#define FETCHY_ERROR(...) ::fetchy::Logger::instance().error(__VA_ARGS__)

} // namespace fetchy
