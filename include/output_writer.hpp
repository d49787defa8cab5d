/**
 * Output Writer - Report Formats
 *
 * Writes filtered hits joined with their KO and symbol annotations.
 * Supports CSV (default), TSV and JSON. Paths ending in .gz, or the
 * compress flag, produce gzip output.
 *
 * Files are written to "<path>.tmp" and renamed on finish(), so a failed
 * run leaves no partial report under the final name.
 */

#ifndef OUTPUT_WRITER_HPP
#define OUTPUT_WRITER_HPP

#include "pzde_hmm.hpp"
#include "annotation_map.hpp"
#include "file_parsers.hpp"
#include <string>
#include <vector>
#include <memory>
#include <fstream>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <cctype>
#include <cstdio>
#include <zlib.h>

namespace pzde {

/**
 * Output format types
 */
enum class OutputFormat {
    CSV,    // Comma-separated values (default)
    TSV,    // Tab-separated values
    JSON    // JSON array of objects
};

/**
 * Parse output format from string
 */
inline OutputFormat parse_output_format(const std::string& format) {
    std::string lower = format;
    for (size_t i = 0; i < lower.size(); ++i) {
        lower[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(lower[i])));
    }

    if (lower == "tsv") return OutputFormat::TSV;
    if (lower == "json") return OutputFormat::JSON;
    return OutputFormat::CSV;
}

/**
 * File extension for a format, including the dot
 */
inline std::string output_extension(OutputFormat format) {
    switch (format) {
        case OutputFormat::TSV: return ".tsv";
        case OutputFormat::JSON: return ".json";
        default: return ".csv";
    }
}

/**
 * Report column names, in output order
 */
inline const std::vector<std::string>& report_columns() {
    static const std::vector<std::string> columns = {
        "target", "query", "full_evalue", "full_score",
        "modelcov", "seqcov", "KO", "symbol"
    };
    return columns;
}

// ============================================================================
// Field formatting
// ============================================================================

inline std::string format_double(const char* fmt, double value) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), fmt, value);
    return buf;
}

// Scientific notation, 2 decimals: 1.23e-10
inline std::string format_evalue(double value) {
    return format_double("%.2e", value);
}

// Fixed, 2 decimals: 45.30
inline std::string format_score(double value) {
    return format_double("%.2f", value);
}

// Fixed, 4 decimals: 0.9800. Exact ties round to even (0.03125 -> 0.0312)
inline std::string format_coverage(double value) {
    return format_double("%.4f", value);
}

/**
 * One report line, already formatted
 */
struct ReportRow {
    std::string target;
    std::string query;
    std::string full_evalue;
    std::string full_score;
    std::string model_coverage;
    std::string seq_coverage;
    std::string ko;
    std::string symbol;

    bool has_ko = false;
    bool has_symbol = false;

    std::vector<std::string> fields() const {
        return {target, query, full_evalue, full_score,
                model_coverage, seq_coverage, ko, symbol};
    }
};

/**
 * Join a hit with both annotation maps
 */
inline ReportRow make_report_row(const HitRecord& hit,
                                 const AnnotationMap& ko_map,
                                 const AnnotationMap& symbol_map) {
    ReportRow row;
    row.target = hit.target;
    row.query = hit.query;
    row.full_evalue = format_evalue(hit.full_evalue);
    row.full_score = format_score(hit.full_score);
    row.model_coverage = format_coverage(hit.model_coverage);
    row.seq_coverage = format_coverage(hit.seq_coverage);

    auto ko = ko_map.find(hit.query);
    row.has_ko = ko.has_value();
    row.ko = ko ? *ko : MISSING_ANNOTATION;

    auto symbol = symbol_map.find(hit.query);
    row.has_symbol = symbol.has_value();
    row.symbol = symbol ? *symbol : MISSING_ANNOTATION;

    return row;
}

/**
 * Statistics collector for the report summary
 */
struct ReportStats {
    int rows = 0;
    int ko_annotated = 0;
    int symbol_annotated = 0;
    std::map<std::string, int> query_counts;

    void add(const ReportRow& row) {
        rows++;
        if (row.has_ko) ko_annotated++;
        if (row.has_symbol) symbol_annotated++;
        query_counts[row.query]++;
    }

    std::string to_string() const {
        std::ostringstream oss;
        oss << "=== Report Statistics ===\n";
        oss << "Candidate hits: " << rows << "\n";
        oss << "With KO annotation: " << ko_annotated << "\n";
        oss << "With symbol annotation: " << symbol_annotated << "\n";
        if (!query_counts.empty()) {
            oss << "\nHits per profile:\n";
            for (const auto& pair : query_counts) {
                oss << "  " << pair.first << ": " << pair.second << "\n";
            }
        }
        return oss.str();
    }
};

/**
 * Abstract base class for report writers.
 * Owns the destination (file, gzip file or stdout).
 */
class ReportWriter {
public:
    explicit ReportWriter(const std::string& output_path, bool compress = false)
        : output_path_(output_path), compress_(compress), gz_file_(nullptr),
          use_stdout_(output_path.empty() || output_path == "-" || output_path == "STDOUT") {

        if (use_stdout_) {
            compress_ = false;  // Cannot compress stdout
            return;
        }

        temp_path_ = output_path_ + ".tmp";
        if (compress_ || ends_with_gz(output_path_)) {
            compress_ = true;
            gz_file_ = gzopen(temp_path_.c_str(), "wb");
            if (!gz_file_) {
                throw std::runtime_error("could not write output file: " + output_path_);
            }
        } else {
            output_.open(temp_path_);
            if (!output_.is_open()) {
                throw std::runtime_error("could not write output file: " + output_path_);
            }
        }
    }

    virtual ~ReportWriter() {
        if (!finished_) {
            discard();
        }
    }

    ReportWriter(const ReportWriter&) = delete;
    ReportWriter& operator=(const ReportWriter&) = delete;

    virtual void write_header() = 0;
    virtual void write_row(const ReportRow& row) = 0;
    virtual void write_footer() {}

    /**
     * Join and write every hit, in order
     */
    void write_hits(const std::vector<HitRecord>& hits,
                    const AnnotationMap& ko_map,
                    const AnnotationMap& symbol_map) {
        for (const auto& hit : hits) {
            write_row(make_report_row(hit, ko_map, symbol_map));
        }
    }

    /**
     * Close the destination and move the report into place
     * @throws std::runtime_error on a write, close or rename failure
     */
    void finish() {
        if (finished_) return;

        if (use_stdout_) {
            std::cout.flush();
            finished_ = true;
            return;
        }

        bool ok = true;
        if (gz_file_) {
            ok = (gzclose(gz_file_) == Z_OK);
            gz_file_ = nullptr;
        }
        if (output_.is_open()) {
            output_.close();
            ok = ok && !output_.fail();
        }

        if (!ok || std::rename(temp_path_.c_str(), output_path_.c_str()) != 0) {
            std::remove(temp_path_.c_str());
            finished_ = true;
            throw std::runtime_error("could not write output file: " + output_path_);
        }
        finished_ = true;
    }

    const ReportStats& get_stats() const { return stats_; }
    const std::string& get_path() const { return output_path_; }
    bool is_compressed() const { return compress_; }

protected:
    ReportStats stats_;

    void write_string(const std::string& s) {
        if (use_stdout_) {
            std::cout << s;
        } else if (compress_ && gz_file_) {
            if (!s.empty() &&
                gzwrite(gz_file_, s.c_str(), static_cast<unsigned int>(s.size())) == 0) {
                throw std::runtime_error("could not write output file: " + output_path_);
            }
        } else {
            output_ << s;
            if (!output_) {
                throw std::runtime_error("could not write output file: " + output_path_);
            }
        }
    }

private:
    std::string output_path_;
    std::string temp_path_;
    bool compress_;
    std::ofstream output_;
    gzFile gz_file_;
    bool use_stdout_;
    bool finished_ = false;

    void discard() {
        if (gz_file_) {
            gzclose(gz_file_);
            gz_file_ = nullptr;
        }
        if (output_.is_open()) {
            output_.close();
        }
        if (!temp_path_.empty()) {
            std::remove(temp_path_.c_str());
        }
    }
};

/**
 * Delimited text writer (CSV, TSV). Values are written verbatim.
 */
class DelimitedWriter : public ReportWriter {
public:
    DelimitedWriter(const std::string& output_path, char delimiter, bool compress = false)
        : ReportWriter(output_path, compress), delimiter_(delimiter) {}

    void write_header() override {
        write_string(join(report_columns()));
    }

    void write_row(const ReportRow& row) override {
        stats_.add(row);
        write_string(join(row.fields()));
    }

private:
    char delimiter_;

    std::string join(const std::vector<std::string>& values) const {
        std::string line;
        for (size_t i = 0; i < values.size(); ++i) {
            if (i > 0) line += delimiter_;
            line += values[i];
        }
        line += "\n";
        return line;
    }
};

/**
 * CSV output writer (default format)
 */
class CSVWriter : public DelimitedWriter {
public:
    explicit CSVWriter(const std::string& output_path, bool compress = false)
        : DelimitedWriter(output_path, ',', compress) {}
};

/**
 * TSV output writer
 */
class TSVWriter : public DelimitedWriter {
public:
    explicit TSVWriter(const std::string& output_path, bool compress = false)
        : DelimitedWriter(output_path, '\t', compress) {}
};

/**
 * JSON output writer - one object per hit inside a top-level array
 */
class JSONWriter : public ReportWriter {
public:
    explicit JSONWriter(const std::string& output_path, bool compress = false)
        : ReportWriter(output_path, compress) {}

    void write_header() override {
        write_string("[");
    }

    void write_row(const ReportRow& row) override {
        stats_.add(row);

        const auto& columns = report_columns();
        auto values = row.fields();

        std::ostringstream json;
        json << (first_row_ ? "\n" : ",\n") << "  {";
        for (size_t i = 0; i < columns.size(); ++i) {
            if (i > 0) json << ", ";
            json << "\"" << escape_json(columns[i]) << "\": ";
            bool numeric = (i >= 2 && i <= 5);
            if (numeric && is_json_number(values[i])) {
                json << values[i];
            } else {
                json << "\"" << escape_json(values[i]) << "\"";
            }
        }
        json << "}";

        write_string(json.str());
        first_row_ = false;
    }

    void write_footer() override {
        write_string("\n]\n");
    }

    static std::string escape_json(const std::string& s) {
        std::string result;
        result.reserve(s.size());
        for (char c : s) {
            switch (c) {
                case '"': result += "\\\""; break;
                case '\\': result += "\\\\"; break;
                case '\b': result += "\\b"; break;
                case '\f': result += "\\f"; break;
                case '\n': result += "\\n"; break;
                case '\r': result += "\\r"; break;
                case '\t': result += "\\t"; break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        char buf[8];
                        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                        result += buf;
                    } else {
                        result += c;
                    }
                    break;
            }
        }
        return result;
    }

    // inf and nan have no JSON number form
    static bool is_json_number(const std::string& s) {
        size_t i = (!s.empty() && s[0] == '-') ? 1 : 0;
        return i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]));
    }

private:
    bool first_row_ = true;
};

/**
 * Factory function to create appropriate writer
 */
inline std::unique_ptr<ReportWriter> create_report_writer(
    const std::string& output_path,
    OutputFormat format,
    bool compress = false) {

    if (format == OutputFormat::JSON) {
        return std::make_unique<JSONWriter>(output_path, compress);
    } else if (format == OutputFormat::TSV) {
        return std::make_unique<TSVWriter>(output_path, compress);
    } else {
        return std::make_unique<CSVWriter>(output_path, compress);
    }
}

} // namespace pzde

#endif // OUTPUT_WRITER_HPP
