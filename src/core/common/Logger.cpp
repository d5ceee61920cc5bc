#include "Logger.hpp"
#include <spdlog/pattern_formatter.h>

namespace Evalbox {

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& logFilePath, Level level) {
    try {
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logFilePath, 1024 * 1024 * 5, 3); // 5MB, 3 files

        console_sink->set_pattern("[%H:%M:%S] [%^%l%$] [%t] %v");
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%f] [%l] [%t] %v");

        auto logger = std::make_shared<spdlog::logger>("evalbox",
            spdlog::sinks_init_list{console_sink, file_sink});

        spdlog::drop("evalbox");
        spdlog::register_logger(logger);
        std::atomic_store(&logger_, logger);

        setLevel(level);

        EVALBOX_INFO("Logger initialized with file: {}", logFilePath);

    } catch (const spdlog::spdlog_ex& ex) {
        // Fallback to console only
        auto fallback = spdlog::get("evalbox_fallback");
        if (!fallback) {
            fallback = spdlog::stderr_color_mt("evalbox_fallback");
        }
        std::atomic_store(&logger_, fallback);
        setLevel(level);
        fallback->error("Logger initialization failed: {}", ex.what());
    }
}

void Logger::setLevel(Level level) {
    get()->set_level(static_cast<spdlog::level::level_enum>(level));
}

Logger::Level Logger::level() const {
    auto logger = std::atomic_load(&logger_);
    if (!logger) {
        return Level::Info;
    }
    return static_cast<Level>(logger->level());
}

bool Logger::isEnabled(Level level) const {
    return static_cast<int>(level) >= static_cast<int>(this->level());
}

std::shared_ptr<spdlog::logger> Logger::get() {
    auto logger = std::atomic_load(&logger_);
    if (logger) {
        return logger;
    }

    std::call_once(fallbackOnce_, [this]() {
        auto console = spdlog::get("evalbox_console");
        if (!console) {
            console = spdlog::stderr_color_mt("evalbox_console");
            console->set_pattern("[%H:%M:%S] [%^%l%$] [%t] %v");
        }
        std::shared_ptr<spdlog::logger> expected;
        std::atomic_compare_exchange_strong(&logger_, &expected, console);
    });
    return std::atomic_load(&logger_);
}

} // namespace Evalbox
