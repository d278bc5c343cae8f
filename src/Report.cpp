#include "stlmeta/Report.hpp"

using json = nlohmann::json;

namespace stlmeta {

    void Report::writeText(const Surface& surface, std::ostream& out) {
        out << "Number of Triangles: " << surface.facets().size() << "\n";
        out << "Surface Area: " << surface.area() << "\n";
        out << "Bounding Box:\n";
        for (const auto& corner : surface.findBounds()) {
            out << corner << "\n";
        }
        out << "Bounding box volume:" << formatNumber(surface.boundingBoxVolume()) << "\n";
    }

    json Report::toJson(const Surface& surface, const std::string& sha256) {
        json corners = json::array();
        for (const auto& corner : surface.findBounds()) {
            corners.push_back(json::array({corner.x, corner.y, corner.z}));
        }

        const Dimensions dims = surface.findDims();

        json doc = {
                {"name", surface.name() ? json(*surface.name()) : json(nullptr)},
                {"triangles", surface.facets().size()},
                {"surface_area", surface.area()},
                {"dimensions", json::array({dims.x, dims.y, dims.z})},
                {"bounding_box", corners},
                {"bounding_box_volume", surface.boundingBoxVolume()}
        };
        if (!sha256.empty()) {
            doc["sha256"] = sha256;
        }
        return doc;
    }

} // namespace stlmeta
