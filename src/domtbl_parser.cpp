/**
 * Domain Table Parser - Implementation
 */

#include "domtbl_parser.hpp"
#include "file_parsers.hpp"
#include <sstream>
#include <stdexcept>

namespace pzde {

std::string line_status_to_string(LineStatus status) {
    switch (status) {
        case LineStatus::RECORD: return "record";
        case LineStatus::BLANK: return "blank";
        case LineStatus::COMMENT: return "comment";
        case LineStatus::TOO_FEW_FIELDS: return "too_few_fields";
        case LineStatus::BAD_NUMBER: return "bad_number";
        default: return "unknown";
    }
}

void ParseStats::add(LineStatus status) {
    total_lines++;
    switch (status) {
        case LineStatus::RECORD: records++; break;
        case LineStatus::BLANK: blank_lines++; break;
        case LineStatus::COMMENT: comment_lines++; break;
        case LineStatus::TOO_FEW_FIELDS: short_lines++; break;
        case LineStatus::BAD_NUMBER: invalid_lines++; break;
    }
}

std::string ParseStats::to_string() const {
    std::ostringstream oss;
    oss << "lines=" << total_lines
        << " records=" << records
        << " comments=" << comment_lines
        << " blank=" << blank_lines
        << " short=" << short_lines
        << " invalid=" << invalid_lines;
    return oss.str();
}

std::optional<HitRecord> parse_domtbl_line(const std::string& line, LineStatus* status) {
    auto set_status = [status](LineStatus s) {
        if (status) *status = s;
    };

    std::string trimmed = trim(line);
    if (trimmed.empty()) {
        set_status(LineStatus::BLANK);
        return std::nullopt;
    }
    if (trimmed[0] == '#') {
        set_status(LineStatus::COMMENT);
        return std::nullopt;
    }

    auto fields = split_whitespace(trimmed, DOMTBL_MAX_FIELDS);
    if (fields.size() < DOMTBL_MIN_FIELDS) {
        set_status(LineStatus::TOO_FEW_FIELDS);
        return std::nullopt;
    }

    HitRecord hit;
    hit.target = fields[domtbl_col::TARGET];
    hit.query = fields[domtbl_col::QUERY];

    bool ok = parse_int(fields[domtbl_col::TARGET_LENGTH], hit.target_length) &&
              parse_int(fields[domtbl_col::QUERY_LENGTH], hit.query_length) &&
              parse_double(fields[domtbl_col::FULL_EVALUE], hit.full_evalue) &&
              parse_double(fields[domtbl_col::FULL_SCORE], hit.full_score) &&
              parse_int(fields[domtbl_col::HMM_FROM], hit.hmm_from) &&
              parse_int(fields[domtbl_col::HMM_TO], hit.hmm_to) &&
              parse_int(fields[domtbl_col::ALI_FROM], hit.ali_from) &&
              parse_int(fields[domtbl_col::ALI_TO], hit.ali_to);

    // Coverage divides by both lengths
    if (!ok || hit.target_length <= 0 || hit.query_length <= 0) {
        set_status(LineStatus::BAD_NUMBER);
        return std::nullopt;
    }

    hit.compute_coverage();
    set_status(LineStatus::RECORD);
    return hit;
}

std::vector<HitRecord> parse_domtbl(const std::vector<std::string>& lines, ParseStats* stats) {
    std::vector<HitRecord> hits;

    for (const auto& line : lines) {
        LineStatus status;
        auto hit = parse_domtbl_line(line, &status);
        if (stats) stats->add(status);
        if (hit) {
            hits.push_back(std::move(*hit));
        }
    }

    return hits;
}

std::vector<HitRecord> parse_domtbl_file(const std::string& path, ParseStats* stats) {
    LineReader reader(path);
    if (!reader.is_open()) {
        throw std::runtime_error("failed to read " + path);
    }

    std::vector<HitRecord> hits;
    std::string line;

    while (reader.read_line(line)) {
        LineStatus status;
        auto hit = parse_domtbl_line(line, &status);
        if (stats) stats->add(status);

        if (hit) {
            hits.push_back(std::move(*hit));
        } else if (status == LineStatus::TOO_FEW_FIELDS || status == LineStatus::BAD_NUMBER) {
            log(LogLevel::DEBUG, "Skipping domain table line " + std::to_string(reader.line_number()) +
                " (" + line_status_to_string(status) + ")");
        }
    }

    if (reader.has_error()) {
        throw std::runtime_error("failed to read " + path + " (I/O error near line " +
                                 std::to_string(reader.line_number() + 1) + ")");
    }

    return hits;
}

} // namespace pzde
