#pragma once
#include "stlmeta/Surface.hpp"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace stlmeta {

    class Report {
    public:
        // Human-readable summary: triangle count, area, box corners, box volume
        static void writeText(const Surface& surface, std::ostream& out);

        // sha256 is omitted from the document when empty
        static nlohmann::json toJson(const Surface& surface, const std::string& sha256 = "");
    };

} // namespace stlmeta
