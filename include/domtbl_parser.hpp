/**
 * Domain Table Parser
 *
 * Reads hmmsearch --domtblout output. Columns are whitespace separated;
 * the final column (target description) may itself contain spaces.
 *
 *   0 target name    1 accession   2 tlen        3 query name
 *   4 accession      5 qlen        6 E-value     7 score
 *   8 bias           9 #          10 of         11 c-Evalue
 *  12 i-Evalue      13 score      14 bias       15 hmm from
 *  16 hmm to        17 ali from   18 ali to     19 env from
 *  20 env to        21 acc        22 description of target
 */

#ifndef DOMTBL_PARSER_HPP
#define DOMTBL_PARSER_HPP

#include "pzde_hmm.hpp"
#include <string>
#include <vector>
#include <optional>

namespace pzde {

/**
 * Minimum number of columns in a data line
 */
constexpr size_t DOMTBL_MIN_FIELDS = 22;

/**
 * Tokenizer cap; the description column is kept as one token
 */
constexpr size_t DOMTBL_MAX_FIELDS = 23;

/**
 * Column positions used by the parser
 */
namespace domtbl_col {
constexpr size_t TARGET = 0;
constexpr size_t TARGET_LENGTH = 2;
constexpr size_t QUERY = 3;
constexpr size_t QUERY_LENGTH = 5;
constexpr size_t FULL_EVALUE = 6;
constexpr size_t FULL_SCORE = 7;
constexpr size_t HMM_FROM = 15;
constexpr size_t HMM_TO = 16;
constexpr size_t ALI_FROM = 17;
constexpr size_t ALI_TO = 18;
}

/**
 * Outcome of parsing one line
 */
enum class LineStatus {
    RECORD,         // Parsed into a HitRecord
    BLANK,          // Empty or whitespace only
    COMMENT,        // Starts with '#'
    TOO_FEW_FIELDS, // Fewer than DOMTBL_MIN_FIELDS columns
    BAD_NUMBER      // Numeric column failed to convert, or non-positive length
};

std::string line_status_to_string(LineStatus status);

/**
 * Counters for a parse run
 */
struct ParseStats {
    size_t total_lines = 0;
    size_t blank_lines = 0;
    size_t comment_lines = 0;
    size_t short_lines = 0;
    size_t invalid_lines = 0;
    size_t records = 0;

    void add(LineStatus status);

    /**
     * Lines dropped as malformed (short or non-numeric)
     */
    size_t skipped() const { return short_lines + invalid_lines; }

    std::string to_string() const;
};

/**
 * Parse a single domain table line
 * @param status Optional out-parameter receiving the line outcome
 * @return The hit, or nullopt for blank, comment and malformed lines
 */
std::optional<HitRecord> parse_domtbl_line(const std::string& line, LineStatus* status = nullptr);

/**
 * Parse a sequence of domain table lines, preserving order
 */
std::vector<HitRecord> parse_domtbl(const std::vector<std::string>& lines, ParseStats* stats = nullptr);

/**
 * Parse a domain table file (plain or .gz)
 * @throws std::runtime_error if the file cannot be opened or read
 */
std::vector<HitRecord> parse_domtbl_file(const std::string& path, ParseStats* stats = nullptr);

} // namespace pzde

#endif // DOMTBL_PARSER_HPP
