#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fmt/core.h>
#include <memory>
#include <string>

namespace MomentNav {

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
    
    void initialize(const std::string& logFilePath = "momentnav.log", 
                   Level level = Level::Info);
    
    // Console only, used by tests and before the data directory is known
    void initializeConsole(Level level = Level::Info);
    
    void setLevel(Level level);
    Level level() const { return level_; }
    
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
    
    // Lazily falls back to a console logger so that library code can log
    // before the application has called initialize().
    spdlog::logger* get();
    
    std::shared_ptr<spdlog::logger> logger_;
    Level level_ = Level::Info;
};

// Convenience macros
#define MOMENTNAV_TRACE(...) MomentNav::Logger::instance().trace(__VA_ARGS__)
#define MOMENTNAV_DEBUG(...) MomentNav::Logger::instance().debug(__VA_ARGS__)
#define MOMENTNAV_INFO(...) MomentNav::Logger::instance().info(__VA_ARGS__)
#define MOMENTNAV_WARN(...) MomentNav::Logger::instance().warn(__VA_ARGS__)
#define MOMENTNAV_ERROR(...) MomentNav::Logger::instance().error(__VA_ARGS__)
#define MOMENTNAV_CRITICAL(...) MomentNav::Logger::instance().critical(__VA_ARGS__)

} // namespace MomentNav
