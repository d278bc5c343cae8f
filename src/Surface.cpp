#include "stlmeta/Surface.hpp"
#include "stlmeta/Logger.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <type_traits>

namespace stlmeta {

    void Extents::include(const Point& p) {
        min_x = std::min(min_x, p.x);
        max_x = std::max(max_x, p.x);
        min_y = std::min(min_y, p.y);
        max_y = std::max(max_y, p.y);
        min_z = std::min(min_z, p.z);
        max_z = std::max(max_z, p.z);
    }

    Totals accumulate(const Totals& totals, const Facet& facet) {
        Totals next = totals;
        next.area += facet.area();
        next.extents.include(facet.vertices()[0]);
        return next;
    }

    void Surface::load(const std::string& path, Hasher* digest) {
        Logger::info("Loading STL surface from " + path);

        LineSource source(path);
        if (digest) {
            digest->update(source.contents());
        }

        PendingFacet pending;
        std::string_view line;
        while (source.next(line)) {
            apply(parseLine(line), pending);
        }
        finishLoad(pending, path);
    }

    void Surface::load(std::istream& in) {
        Logger::info("Loading STL surface from stream");

        PendingFacet pending;
        std::string line;
        while (std::getline(in, line)) {
            apply(parseLine(line), pending);
        }
        if (in.bad()) {
            throw std::runtime_error("Failed to read STL stream");
        }
        finishLoad(pending, "stream");
    }

    void Surface::finishLoad(const PendingFacet& pending, const std::string& origin) {
        if (!pending.vertices.empty()) {
            Logger::warn("Dropping unterminated facet with " + std::to_string(pending.vertices.size()) +
                         " vertices at end of " + origin);
        }
        Logger::debug("Loaded " + std::to_string(facets_.size()) + " facets from " + origin);
    }

    void Surface::apply(const ParsedLine& line, PendingFacet& pending) {
        std::visit([this, &pending](const auto& token) {
            using T = std::decay_t<decltype(token)>;
            if constexpr (std::is_same_v<T, SolidLine>) {
                setName(token.name);
            } else if constexpr (std::is_same_v<T, FacetStartLine>) {
                pending.normal = token.normal;
                pending.vertices.clear();
            } else if constexpr (std::is_same_v<T, VertexLine>) {
                pending.vertices.push_back(token.point);
            } else if constexpr (std::is_same_v<T, FacetEndLine>) {
                addFacet(Facet(pending.normal, pending.vertices));
                pending = PendingFacet{};
            }
        }, line);
    }

    void Surface::addFacet(const Facet& facet) {
        totals_ = accumulate(totals_, facet);

        const std::size_t position = facets_.size();
        facets_.push_back(facet);
        for (const auto& vertex : facet.vertices()) {
            vertexIndex_[vertex].push_back(position);
        }
    }

    std::string Surface::area() const {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(6) << totals_.area;
        return oss.str();
    }

    std::vector<Facet> Surface::findFacets(const Point& vertex) const {
        std::vector<Facet> result;
        auto it = vertexIndex_.find(vertex);
        if (it == vertexIndex_.end()) {
            return result;
        }

        result.reserve(it->second.size());
        for (std::size_t position : it->second) {
            result.push_back(facets_[position]);
        }
        return result;
    }

    Dimensions Surface::findDims() const {
        const Extents& e = totals_.extents;
        return Dimensions{e.max_x - e.min_x, e.max_y - e.min_y, e.max_z - e.min_z};
    }

    std::array<Point, 8> Surface::findBounds() const {
        const Dimensions d = findDims();
        return {{
                Point(0, 0, 0), Point(0, 0, d.z), Point(0, d.y, 0), Point(0, d.y, d.z),
                Point(d.x, 0, 0), Point(d.x, 0, d.z), Point(d.x, d.y, 0), Point(d.x, d.y, d.z)
        }};
    }

    double Surface::boundingBoxVolume() const {
        const Dimensions d = findDims();
        return d.x * d.y * d.z;
    }

} // namespace stlmeta
