#pragma once
#include <array>
#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace stlmeta {

    struct Point {
        double x = 0.0;
        double y = 0.0;
        double z = 0.0;

        Point() = default;
        Point(double x_, double y_, double z_) : x(x_), y(y_), z(z_) {}

        bool operator==(const Point& other) const {
            return x == other.x && y == other.y && z == other.z;
        }
        bool operator!=(const Point& other) const { return !(*this == other); }
    };

    // Exact-value hash, consistent with operator== (0.0 and -0.0 collide)
    struct PointHash {
        std::size_t operator()(const Point& p) const;
    };

    // Shortest decimal text that parses back to the same double
    std::string formatNumber(double value);

    std::ostream& operator<<(std::ostream& os, const Point& p);

    // Heron's formula; a negative radicand (near-degenerate triangle) yields 0
    double heronArea(const Point& a, const Point& b, const Point& c);

    class Facet {
    public:
        // Throws std::invalid_argument unless exactly 3 vertices are given
        Facet(const Point& normal, const std::vector<Point>& vertices);

        const Point& normal() const { return normal_; }
        const std::array<Point, 3>& vertices() const { return vertices_; }
        double area() const { return area_; }

    private:
        Point normal_;
        std::array<Point, 3> vertices_;
        double area_;
    };

    std::ostream& operator<<(std::ostream& os, const Facet& facet);

} // namespace stlmeta
