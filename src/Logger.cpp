#include "stlmeta/Logger.hpp"
#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace stlmeta {

    namespace {
        std::atomic<LogLevel> minimumLevel{LogLevel::Info};

        std::string timestamp() {
            auto now = std::chrono::system_clock::now();
            auto in_time = std::chrono::system_clock::to_time_t(now);
            std::ostringstream ss;
            ss << std::put_time(std::localtime(&in_time), "%Y-%m-%d %H:%M:%S");
            return ss.str();
        }

        void log(LogLevel level, const std::string& label, const std::string& message) {
            if (level < minimumLevel.load()) {
                return;
            }
            std::cerr << "[" << timestamp() << "] [" << label << "] " << message << std::endl;
        }
    }

    void Logger::debug(const std::string& message) {
        log(LogLevel::Debug, "DEBUG", message);
    }

    void Logger::info(const std::string& message) {
        log(LogLevel::Info, "INFO", message);
    }

    void Logger::warn(const std::string& message) {
        log(LogLevel::Warn, "WARN", message);
    }

    void Logger::error(const std::string& message) {
        log(LogLevel::Error, "ERROR", message);
    }

    void Logger::setLevel(LogLevel level) {
        minimumLevel.store(level);
    }

    LogLevel Logger::parseLevel(const std::string& name) {
        if (name == "debug") return LogLevel::Debug;
        if (name == "info") return LogLevel::Info;
        if (name == "warn") return LogLevel::Warn;
        if (name == "error") return LogLevel::Error;
        throw std::runtime_error("Unknown log level: " + name);
    }

} // namespace stlmeta
