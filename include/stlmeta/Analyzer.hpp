#pragma once
#include "stlmeta/EnvironmentHandler.hpp"
#include <string>

namespace stlmeta {

    class Analyzer {
    public:
        // Loads the STL file and renders its summary in the requested format
        static std::string run(const std::string& stl_path, ReportFormat format);
    };

} // namespace stlmeta
