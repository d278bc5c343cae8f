#pragma once
#include <string>

namespace stlmeta {

    enum class LogLevel { Debug = 0, Info, Warn, Error };

    class Logger {
    public:
        static void debug(const std::string& message);
        static void info(const std::string& message);
        static void warn(const std::string& message);
        static void error(const std::string& message);

        static void setLevel(LogLevel level);

        // "debug", "info", "warn" or "error"; throws std::runtime_error otherwise
        static LogLevel parseLevel(const std::string& name);
    };

} // namespace stlmeta
