/**
 * File Format Helpers
 *
 * Utilities shared by the domain table parser and annotation loader:
 * - LineReader: line-at-a-time reading of plain or gzip-compressed text
 * - Whitespace tokenizing and strict numeric conversion
 * - Small path helpers
 */

#ifndef FILE_PARSERS_HPP
#define FILE_PARSERS_HPP

#include <string>
#include <vector>
#include <memory>

namespace pzde {

// ============================================================================
// Tokenizing
// ============================================================================

/**
 * Split a line on runs of whitespace, ignoring leading/trailing whitespace.
 * @param max_tokens If non-zero, at most this many tokens are produced; the
 *                   last one holds the rest of the line (trailing whitespace
 *                   removed)
 */
std::vector<std::string> split_whitespace(const std::string& line, size_t max_tokens = 0);

/**
 * Remove leading and trailing whitespace
 */
std::string trim(const std::string& str);

/**
 * Parse a base-10 integer; the whole token must be consumed
 */
bool parse_int(const std::string& token, int& value);

/**
 * Parse a floating point value; the whole token must be consumed
 */
bool parse_double(const std::string& token, double& value);

// ============================================================================
// Paths
// ============================================================================

bool file_exists(const std::string& path);

bool is_directory(const std::string& path);

// Helper to check if path ends with .gz
inline bool ends_with_gz(const std::string& path) {
    return path.size() > 3 && path.compare(path.size() - 3, 3, ".gz") == 0;
}

// ============================================================================
// Line Reader
// ============================================================================

/**
 * Reads text files line by line. Files ending in .gz are decompressed
 * with zlib. Line terminators (\n, \r\n) are stripped.
 */
class LineReader {
public:
    explicit LineReader(const std::string& path);

    ~LineReader();

    // Prevent copying
    LineReader(const LineReader&) = delete;
    LineReader& operator=(const LineReader&) = delete;

    /**
     * Check if the file was opened
     */
    bool is_open() const;

    /**
     * Read the next line
     * @return false at end of file or on a read error
     */
    bool read_line(std::string& line);

    /**
     * True if reading stopped because of an I/O error rather than EOF
     */
    bool has_error() const;

    /**
     * Number of lines returned so far
     */
    size_t line_number() const;

    std::string get_path() const { return path_; }

private:
    struct Impl;
    std::unique_ptr<Impl> pimpl_;
    std::string path_;
};

} // namespace pzde

#endif // FILE_PARSERS_HPP
