#pragma once
#include "stlmeta/Logger.hpp"
#include <string>

namespace stlmeta {

    enum class ReportFormat { Text, Json };

    class EnvironmentHandler {
    public:
        static EnvironmentHandler& instance();

        // Reads STLMETA_LOG_LEVEL and STLMETA_REPORT_FORMAT; unset means default
        void init();

        LogLevel getLogLevel() const;
        ReportFormat getReportFormat() const;

    private:
        EnvironmentHandler() = default;

        LogLevel logLevel = LogLevel::Info;
        ReportFormat reportFormat = ReportFormat::Text;
    };

} // namespace stlmeta
