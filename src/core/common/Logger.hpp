#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fmt/core.h>
#include <memory>
#include <mutex>
#include <string>

namespace Evalbox {

class Logger {
public:
    enum class Level {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warn = 3,
        Error = 4,
        Critical = 5
    };

    static Logger& instance();

    void initialize(const std::string& logFilePath = "evalbox.log",
                   Level level = Level::Info);

    void setLevel(Level level);
    Level level() const;
    bool isEnabled(Level level) const;

    template<typename... Args>
    void trace(fmt::format_string<Args...> format, Args&&... args) {
        get()->trace(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(fmt::format_string<Args...> format, Args&&... args) {
        get()->debug(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(fmt::format_string<Args...> format, Args&&... args) {
        get()->info(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(fmt::format_string<Args...> format, Args&&... args) {
        get()->warn(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(fmt::format_string<Args...> format, Args&&... args) {
        get()->error(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void critical(fmt::format_string<Args...> format, Args&&... args) {
        get()->critical(format, std::forward<Args>(args)...);
    }

private:
    Logger() = default;

    // Falls back to a console logger when initialize() was never called
    std::shared_ptr<spdlog::logger> get();

    std::once_flag fallbackOnce_;
    std::shared_ptr<spdlog::logger> logger_;
};

// Convenience macros
#define EVALBOX_TRACE(...) Evalbox::Logger::instance().trace(__VA_ARGS__)
#define EVALBOX_DEBUG(...) Evalbox::Logger::instance().debug(__VA_ARGS__)
#define EVALBOX_INFO(...) Evalbox::Logger::instance().info(__VA_ARGS__)
#define EVALBOX_WARN(...) Evalbox::Logger::instance().warn(__VA_ARGS__)
#define EVALBOX_ERROR(...) Evalbox::Logger::instance().error(__VA_ARGS__)
#define EVALBOX_CRITICAL(...) Evalbox::Logger::instance().critical(__VA_ARGS__)

} // namespace Evalbox
