#pragma once
#include "stlmeta/Facet.hpp"
#include "stlmeta/Hasher.hpp"
#include "stlmeta/STLParser.hpp"
#include <array>
#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace stlmeta {

    // Running min/max, seeded at 0 rather than at the first observed point
    struct Extents {
        double min_x = 0.0, max_x = 0.0;
        double min_y = 0.0, max_y = 0.0;
        double min_z = 0.0, max_z = 0.0;

        void include(const Point& p);
    };

    struct Totals {
        double area = 0.0;
        Extents extents;
    };

    // Adds the facet area and widens the extents by the facet's first vertex only
    Totals accumulate(const Totals& totals, const Facet& facet);

    struct Dimensions {
        double x = 0.0;
        double y = 0.0;
        double z = 0.0;
    };

    // Facet under construction while a facet block is being read
    struct PendingFacet {
        Point normal;
        std::vector<Point> vertices;
    };

    class Surface {
    public:
        // Throws std::runtime_error if the file cannot be opened. When digest
        // is given it receives the raw bytes that were parsed.
        void load(const std::string& path, Hasher* digest = nullptr);
        void load(std::istream& in);

        // Applies one parsed line to the pending facet, completing it on endfacet
        void apply(const ParsedLine& line, PendingFacet& pending);

        void addFacet(const Facet& facet);

        void setName(const std::string& name) { name_ = name; }
        const std::optional<std::string>& name() const { return name_; }

        const std::vector<Facet>& facets() const { return facets_; }
        const Extents& extents() const { return totals_.extents; }
        double totalArea() const { return totals_.area; }

        // Total area as fixed-point text with 6 decimals
        std::string area() const;

        // Facets touching exactly this vertex, in parse order; empty if unknown
        std::vector<Facet> findFacets(const Point& vertex) const;

        Dimensions findDims() const;

        // Corners of a box anchored at the origin with size findDims()
        std::array<Point, 8> findBounds() const;

        double boundingBoxVolume() const;

    private:
        void finishLoad(const PendingFacet& pending, const std::string& origin);

        std::optional<std::string> name_;
        Totals totals_;
        std::vector<Facet> facets_;
        std::unordered_map<Point, std::vector<std::size_t>, PointHash> vertexIndex_;
    };

} // namespace stlmeta
