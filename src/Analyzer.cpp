#include "stlmeta/Analyzer.hpp"
#include "stlmeta/Surface.hpp"
#include "stlmeta/Report.hpp"
#include "stlmeta/Hasher.hpp"
#include "stlmeta/Logger.hpp"

#include <chrono>
#include <filesystem>
#include <sstream>

namespace fs = std::filesystem;

namespace stlmeta {

    std::string Analyzer::run(const std::string& stl_path, ReportFormat format) {
        auto start_time = std::chrono::high_resolution_clock::now();

        Logger::info("Start analysis for STL file: " + stl_path);
        if (fs::exists(stl_path)) {
            Logger::info("STL file size: " + std::to_string(fs::file_size(stl_path) / 1024) + " KB");
        }

        // Parse STL
        auto parse_start = std::chrono::high_resolution_clock::now();
        Surface surface;
        Hasher digest;
        surface.load(stl_path, format == ReportFormat::Json ? &digest : nullptr);
        auto parse_end = std::chrono::high_resolution_clock::now();
        auto parse_ms = std::chrono::duration_cast<std::chrono::milliseconds>(parse_end - parse_start).count();
        Logger::info("STL Parsed " + std::to_string(surface.facets().size()) + " facets in " + std::to_string(parse_ms) + "ms");

        std::string rendered;
        if (format == ReportFormat::Json) {
            std::string hash = digest.hexdigest();
            Logger::debug("Source SHA-256: " + hash);
            rendered = Report::toJson(surface, hash).dump(2) + "\n";
        } else {
            std::ostringstream out;
            Report::writeText(surface, out);
            rendered = out.str();
        }

        auto end_time = std::chrono::high_resolution_clock::now();
        auto total_ms = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();
        Logger::info("Completed analysis: area = " + surface.area() + " in " + std::to_string(total_ms) + "ms");

        return rendered;
    }

} // namespace stlmeta
