#include "stlmeta/STLParser.hpp"
#include "stlmeta/Logger.hpp"
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <vector>

// Platform-specific includes per memory mapping
#ifdef _WIN32
#include <windows.h>
#else
#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#endif

namespace stlmeta {

    namespace {
        std::vector<std::string_view> splitWords(std::string_view line) {
            std::vector<std::string_view> words;
            std::size_t i = 0;
            while (i < line.size()) {
                while (i < line.size() && std::isspace(static_cast<unsigned char>(line[i]))) ++i;
                std::size_t start = i;
                while (i < line.size() && !std::isspace(static_cast<unsigned char>(line[i]))) ++i;
                if (i > start) {
                    words.push_back(line.substr(start, i - start));
                }
            }
            return words;
        }

        // Whole word must be a decimal literal; underflow and overflow keep
        // strtod's result (subnormal or +-HUGE_VAL) instead of failing
        double toDouble(std::string_view word) {
            const std::string text(word);
            if (text.find_first_of("xX") != std::string::npos) {
                throw std::invalid_argument("Invalid number: " + text);
            }

            char* end = nullptr;
            const double value = std::strtod(text.c_str(), &end);
            if (end == text.c_str() || *end != '\0') {
                throw std::invalid_argument("Invalid number: " + text);
            }
            return value;
        }

        Point toPoint(const std::vector<std::string_view>& words, std::size_t first) {
            return Point(toDouble(words[first]), toDouble(words[first + 1]), toDouble(words[first + 2]));
        }
    }

    ParsedLine parseLine(std::string_view line) {
        const auto words = splitWords(line);
        if (words.empty()) {
            return IgnoredLine{};
        }

        const std::string_view kind = words[0];
        if (kind == "solid") {
            std::string name;
            for (std::size_t i = 1; i < words.size(); ++i) {
                if (i > 1) name += ' ';
                name.append(words[i].data(), words[i].size());
            }
            return SolidLine{name};
        }
        if (kind == "facet") {
            // facet normal nx ny nz
            if (words.size() < 5) {
                throw std::runtime_error("Malformed facet line");
            }
            return FacetStartLine{toPoint(words, 2)};
        }
        if (kind == "vertex") {
            if (words.size() < 4) {
                throw std::runtime_error("Malformed vertex line");
            }
            return VertexLine{toPoint(words, 1)};
        }
        if (kind == "endfacet") {
            return FacetEndLine{};
        }
        return IgnoredLine{};
    }

    LineSource::LineSource(const std::string& path) {
#ifdef _WIN32
        HANDLE file = CreateFileA(path.c_str(), GENERIC_READ, FILE_SHARE_READ,
                                  nullptr, OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);
        if (file == INVALID_HANDLE_VALUE) {
            throw std::runtime_error("Failed to open file: " + path);
        }
        fileHandle_ = file;

        LARGE_INTEGER fileSize;
        if (!GetFileSizeEx(file, &fileSize)) {
            CloseHandle(file);
            throw std::runtime_error("Failed to get file size");
        }
        size_ = static_cast<std::size_t>(fileSize.QuadPart);
        if (size_ == 0) {
            return;
        }

        HANDLE mapping = CreateFileMappingA(file, nullptr, PAGE_READONLY, 0, 0, nullptr);
        if (!mapping) {
            CloseHandle(file);
            throw std::runtime_error("Failed to create file mapping");
        }
        mappingHandle_ = mapping;

        data_ = static_cast<const char*>(MapViewOfFile(mapping, FILE_MAP_READ, 0, 0, 0));
        if (!data_) {
            CloseHandle(mapping);
            CloseHandle(file);
            throw std::runtime_error("Failed to map file");
        }
#else
        fd_ = open(path.c_str(), O_RDONLY);
        if (fd_ == -1) {
            throw std::runtime_error("Failed to open file: " + path);
        }

        struct stat sb;
        if (fstat(fd_, &sb) == -1) {
            close(fd_);
            throw std::runtime_error("Failed to get file size");
        }
        size_ = static_cast<std::size_t>(sb.st_size);
        // mmap rifiuta una lunghezza zero
        if (size_ == 0) {
            return;
        }

        void* mapped = mmap(nullptr, size_, PROT_READ, MAP_PRIVATE, fd_, 0);
        if (mapped == MAP_FAILED) {
            close(fd_);
            throw std::runtime_error("Failed to map file");
        }
        data_ = static_cast<const char*>(mapped);

        // Hint al kernel per lettura sequenziale
        madvise(mapped, size_, MADV_SEQUENTIAL);
#endif
        Logger::debug("Mapped " + std::to_string(size_) + " bytes from " + path);
    }

    LineSource::~LineSource() {
#ifdef _WIN32
        if (data_) UnmapViewOfFile(data_);
        if (mappingHandle_) CloseHandle(mappingHandle_);
        if (fileHandle_) CloseHandle(fileHandle_);
#else
        if (data_) munmap(const_cast<char*>(data_), size_);
        if (fd_ != -1) close(fd_);
#endif
    }

    bool LineSource::next(std::string_view& line) {
        if (offset_ >= size_) {
            return false;
        }

        std::size_t end = offset_;
        while (end < size_ && data_[end] != '\n') ++end;

        std::size_t length = end - offset_;
        if (length > 0 && data_[offset_ + length - 1] == '\r') --length;

        line = std::string_view(data_ + offset_, length);
        offset_ = end + 1;
        return true;
    }

} // namespace stlmeta
