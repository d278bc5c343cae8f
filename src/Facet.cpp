#include "stlmeta/Facet.hpp"
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <sstream>
#include <functional>
#include <stdexcept>
#include <string>

namespace stlmeta {

    namespace {
        double distance(const Point& p1, const Point& p2) {
            const double dx = p2.x - p1.x;
            const double dy = p2.y - p1.y;
            const double dz = p2.z - p1.z;
            return std::sqrt(dx * dx + dy * dy + dz * dz);
        }

        void hashCombine(std::size_t& seed, double value) {
            // -0.0 == 0.0, so they must share a hash
            if (value == 0.0) value = 0.0;
            seed ^= std::hash<double>{}(value) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
        }
    }

    std::size_t PointHash::operator()(const Point& p) const {
        std::size_t seed = 0;
        hashCombine(seed, p.x);
        hashCombine(seed, p.y);
        hashCombine(seed, p.z);
        return seed;
    }

    std::string formatNumber(double value) {
        std::ostringstream oss;
        for (int precision = 15; precision < std::numeric_limits<double>::max_digits10; ++precision) {
            oss.str("");
            oss << std::setprecision(precision) << value;
            if (std::strtod(oss.str().c_str(), nullptr) == value) {
                return oss.str();
            }
        }
        oss.str("");
        oss << std::setprecision(std::numeric_limits<double>::max_digits10) << value;
        return oss.str();
    }

    std::ostream& operator<<(std::ostream& os, const Point& p) {
        return os << "(" << formatNumber(p.x) << ", " << formatNumber(p.y) << ", " << formatNumber(p.z) << ")";
    }

    double heronArea(const Point& a, const Point& b, const Point& c) {
        const double ab = distance(a, b);
        const double bc = distance(b, c);
        const double ca = distance(c, a);
        const double s = 0.5 * (ab + bc + ca); // semi-perimeter

        const double radicand = s * (s - ab) * (s - bc) * (s - ca);
        if (!(radicand > 0.0)) {
            return 0.0;
        }
        return std::sqrt(radicand);
    }

    Facet::Facet(const Point& normal, const std::vector<Point>& vertices)
            : normal_(normal) {
        if (vertices.size() != 3) {
            throw std::invalid_argument("Facet requires exactly 3 vertices, got " +
                                        std::to_string(vertices.size()));
        }
        vertices_ = {vertices[0], vertices[1], vertices[2]};
        area_ = heronArea(vertices_[0], vertices_[1], vertices_[2]);
    }

    std::ostream& operator<<(std::ostream& os, const Facet& facet) {
        const auto& v = facet.vertices();
        return os << "N: " << facet.normal()
                  << ", A: " << v[0] << " B: " << v[1] << " C: " << v[2];
    }

} // namespace stlmeta
