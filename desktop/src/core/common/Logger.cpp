#include "Logger.hpp"
#include <spdlog/pattern_formatter.h>

namespace MomentNav {

namespace {
const char* const kLoggerName = "momentnav";
const char* const kConsoleLoggerName = "momentnav_console";
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& logFilePath, Level level) {
    try {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logFilePath, 1024 * 1024 * 5, 3); // 5MB, 3 files
        
        console_sink->set_pattern("[%H:%M:%S] [%^%l%$] %v");
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%f] [%l] [%t] %v");
        
        spdlog::drop(kLoggerName);
        logger_ = std::make_shared<spdlog::logger>(kLoggerName, 
            spdlog::sinks_init_list{console_sink, file_sink});
        
        setLevel(level);
        spdlog::register_logger(logger_);
        
        MOMENTNAV_INFO("Logger initialized with file: {}", logFilePath);
        
    } catch (const spdlog::spdlog_ex& ex) {
        initializeConsole(level);
        logger_->error("Logger initialization failed: {}", ex.what());
    }
}

void Logger::initializeConsole(Level level) {
    logger_ = spdlog::get(kConsoleLoggerName);
    if (!logger_) {
        logger_ = spdlog::stdout_color_mt(kConsoleLoggerName);
        logger_->set_pattern("[%H:%M:%S] [%^%l%$] %v");
    }
    setLevel(level);
}

void Logger::setLevel(Level level) {
    level_ = level;
    if (logger_) {
        logger_->set_level(static_cast<spdlog::level::level_enum>(level));
    }
}

spdlog::logger* Logger::get() {
    if (!logger_) {
        initializeConsole(level_);
    }
    return logger_.get();
}

} // namespace MomentNav
