#pragma once
#include "stlmeta/Facet.hpp"
#include <cstddef>
#include <string>
#include <string_view>
#include <variant>

namespace stlmeta {

    // One line of an ASCII STL file, classified by its first word
    struct SolidLine {
        std::string name;
    };

    struct FacetStartLine {
        Point normal;
    };

    struct VertexLine {
        Point point;
    };

    struct FacetEndLine {};

    // outer, endloop, endsolid, blank lines and unknown keywords
    struct IgnoredLine {};

    using ParsedLine = std::variant<SolidLine, FacetStartLine, VertexLine, FacetEndLine, IgnoredLine>;

    // Throws std::runtime_error on missing arguments and
    // std::invalid_argument on a field that is not a decimal number
    ParsedLine parseLine(std::string_view line);

    // Forward-only line reader over a read-only memory mapping of a file
    class LineSource {
    public:
        explicit LineSource(const std::string& path);
        ~LineSource();

        LineSource(const LineSource&) = delete;
        LineSource& operator=(const LineSource&) = delete;

        // Returns false once the end of the file has been reached
        bool next(std::string_view& line);

        // Entire mapped file, independent of the read position
        std::string_view contents() const { return std::string_view(data_, size_); }

    private:
        const char* data_ = nullptr;
        std::size_t size_ = 0;
        std::size_t offset_ = 0;

#ifdef _WIN32
        void* fileHandle_ = nullptr;
        void* mappingHandle_ = nullptr;
#else
        int fd_ = -1;
#endif
    };

} // namespace stlmeta
