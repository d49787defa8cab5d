/**
 * File Format Helpers - Implementation
 */

#include "file_parsers.hpp"
#include <fstream>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <climits>
#include <sys/stat.h>
#include <zlib.h>

namespace pzde {

// ============================================================================
// Utility Functions
// ============================================================================

static bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::vector<std::string> split_whitespace(const std::string& line, size_t max_tokens) {
    std::vector<std::string> result;
    size_t pos = 0;
    const size_t n = line.size();

    while (pos < n) {
        while (pos < n && is_space(line[pos])) ++pos;
        if (pos >= n) break;

        if (max_tokens > 0 && result.size() + 1 == max_tokens) {
            // Remainder goes into the last token
            size_t end = n;
            while (end > pos && is_space(line[end - 1])) --end;
            result.emplace_back(line, pos, end - pos);
            break;
        }

        size_t start = pos;
        while (pos < n && !is_space(line[pos])) ++pos;
        result.emplace_back(line, start, pos - start);
    }

    return result;
}

std::string trim(const std::string& str) {
    size_t start = 0;
    size_t end = str.size();
    while (start < end && is_space(str[start])) ++start;
    while (end > start && is_space(str[end - 1])) --end;
    return str.substr(start, end - start);
}

bool parse_int(const std::string& token, int& value) {
    if (token.empty()) return false;

    const char* begin = token.c_str();
    char* end = nullptr;
    errno = 0;
    long parsed = std::strtol(begin, &end, 10);

    if (end == begin || *end != '\0') return false;
    if (errno == ERANGE || parsed < INT_MIN || parsed > INT_MAX) return false;

    value = static_cast<int>(parsed);
    return true;
}

bool parse_double(const std::string& token, double& value) {
    if (token.empty()) return false;

    // strtod also takes hexadecimal floats; domain tables never contain them
    if (token.find_first_of("xX") != std::string::npos) return false;

    const char* begin = token.c_str();
    char* end = nullptr;
    double parsed = std::strtod(begin, &end);

    // Overflow gives +/-inf and underflow gives 0, both acceptable here
    if (end == begin || *end != '\0') return false;

    value = parsed;
    return true;
}

bool file_exists(const std::string& path) {
    struct stat buffer;
    return (stat(path.c_str(), &buffer) == 0);
}

bool is_directory(const std::string& path) {
    struct stat buffer;
    if (stat(path.c_str(), &buffer) != 0) return false;
    return S_ISDIR(buffer.st_mode);
}

// ============================================================================
// LineReader Implementation
// ============================================================================

struct LineReader::Impl {
    gzFile gz = nullptr;
    std::ifstream file;
    bool gzipped = false;
    bool open = false;
    bool error = false;
    size_t line_number = 0;
    char buffer[65536];

    ~Impl() {
        if (gz) gzclose(gz);
    }

    bool read_gz_line(std::string& line) {
        line.clear();
        bool got_data = false;

        while (gzgets(gz, buffer, sizeof(buffer)) != nullptr) {
            got_data = true;
            line += buffer;
            if (!line.empty() && line.back() == '\n') break;
        }

        if (!got_data) {
            int errnum = Z_OK;
            gzerror(gz, &errnum);
            if (errnum != Z_OK && errnum != Z_STREAM_END) {
                error = true;
            }
            return false;
        }

        while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
            line.pop_back();
        }
        return true;
    }

    bool read_plain_line(std::string& line) {
        if (!std::getline(file, line)) {
            if (file.bad()) error = true;
            return false;
        }
        while (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        return true;
    }
};

LineReader::LineReader(const std::string& path)
    : pimpl_(std::make_unique<Impl>()), path_(path) {

    // A directory opens fine with fopen() on Linux but cannot be read
    if (path.empty() || is_directory(path)) {
        return;
    }

    if (ends_with_gz(path)) {
        pimpl_->gzipped = true;
        pimpl_->gz = gzopen(path.c_str(), "rb");
        pimpl_->open = (pimpl_->gz != nullptr);
    } else {
        pimpl_->file.open(path);
        pimpl_->open = pimpl_->file.is_open();
    }
}

LineReader::~LineReader() = default;

bool LineReader::is_open() const {
    return pimpl_->open;
}

bool LineReader::read_line(std::string& line) {
    if (!pimpl_->open || pimpl_->error) return false;

    bool ok = pimpl_->gzipped ? pimpl_->read_gz_line(line) : pimpl_->read_plain_line(line);
    if (ok) pimpl_->line_number++;
    return ok;
}

bool LineReader::has_error() const {
    return pimpl_->error;
}

size_t LineReader::line_number() const {
    return pimpl_->line_number;
}

} // namespace pzde
