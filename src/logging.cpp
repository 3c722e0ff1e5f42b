#include "fetchy/logging.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace fetchy {

namespace {

constexpr std::size_t kMaxLogFileSize = 5 * 1024 * 1024;
constexpr std::size_t kMaxLogFiles = 3;

std::shared_ptr<spdlog::logger> makeConsoleLogger() {
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_pattern("[%H:%M:%S] [%^%l%$] [%t] %v");
    return std::make_shared<spdlog::logger>("fetchy", console_sink);
}

} // namespace

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& log_file, spdlog::level::level_enum level) {
    std::shared_ptr<spdlog::logger> created;
    try {
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_pattern("[%H:%M:%S] [%^%l%$] [%t] %v");

        std::vector<spdlog::sink_ptr> sinks{console_sink};
        if (!log_file.empty()) {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file, kMaxLogFileSize, kMaxLogFiles);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
            sinks.push_back(std::move(file_sink));
        }
        created = std::make_shared<spdlog::logger>("fetchy", sinks.begin(), sinks.end());
    } catch (const spdlog::spdlog_ex& ex) {
        created = makeConsoleLogger();
        created->error("Logger initialization failed, using console only: {}", ex.what());
    }

    created->set_level(level);
    created->flush_on(spdlog::level::warn);

    std::lock_guard<std::mutex> lock(mutex_);
    logger_ = std::move(created);
}

void Logger::setLevel(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

std::shared_ptr<spdlog::logger> Logger::logger() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!logger_) {
        logger_ = makeConsoleLogger();
    }
    return logger_;
}

spdlog::level::level_enum parseLogLevel(const std::string& name) {
    return spdlog::level::from_str(name);
}

} // namespace fetchy
