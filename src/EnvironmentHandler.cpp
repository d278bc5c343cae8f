#include "stlmeta/EnvironmentHandler.hpp"
#include <cstdlib>
#include <stdexcept>

namespace stlmeta {

    EnvironmentHandler& EnvironmentHandler::instance() {
        static EnvironmentHandler instance;
        return instance;
    }

    void EnvironmentHandler::init() {
        const char* level = std::getenv("STLMETA_LOG_LEVEL");
        const char* format = std::getenv("STLMETA_REPORT_FORMAT");

        logLevel = level ? Logger::parseLevel(level) : LogLevel::Info;

        if (!format || std::string(format) == "text") {
            reportFormat = ReportFormat::Text;
        } else if (std::string(format) == "json") {
            reportFormat = ReportFormat::Json;
        } else {
            throw std::runtime_error("Unknown report format: " + std::string(format));
        }
    }

    LogLevel EnvironmentHandler::getLogLevel() const {
        return logLevel;
    }

    ReportFormat EnvironmentHandler::getReportFormat() const {
        return reportFormat;
    }

} // namespace stlmeta
