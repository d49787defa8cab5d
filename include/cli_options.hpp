/**
 * Command Line Options
 *
 * Parses pzde_hmm arguments into RunOptions and derives the pipeline and
 * hmmsearch settings from them.
 */

#ifndef CLI_OPTIONS_HPP
#define CLI_OPTIONS_HPP

#include "pipeline.hpp"
#include "table_source.hpp"
#include <string>
#include <optional>

namespace pzde {

struct RunOptions {
    std::string input_faa;
    std::string output_prefix;
    std::string hmm_db = "data/PzDE-HMM.hmm";
    double evalue = 1e-5;
    std::optional<double> min_score;
    std::optional<double> min_model_coverage;
    std::optional<double> min_seq_coverage;
    int nproc = 4;
    std::string ko_map = "data/hmm_label-KO.txt";
    std::string symbol_map = "data/hmm_label-symbol.txt";

    std::string domtblout;      // Existing table; skips hmmsearch when set
    OutputFormat format = OutputFormat::CSV;
    bool compress = false;
    int timeout_seconds = 0;
    bool debug = false;

    bool runs_hmmsearch() const { return domtblout.empty(); }

    /**
     * <prefix>.domtblout, or the --domtblout path
     */
    std::string domtblout_path() const;

    /**
     * <prefix>.filtered.csv (.tsv / .json, plus .gz when compressed)
     */
    std::string report_path() const;

    PipelineConfig to_pipeline_config() const;
    HmmsearchOptions to_hmmsearch_options() const;
};

enum class ParseStatus { OK, HELP, ERROR };

/**
 * Parse argv into options
 * @param error Receives a message when ERROR is returned
 */
ParseStatus parse_cli_args(int argc, char* argv[], RunOptions& options, std::string& error);

/**
 * Check required options and input files
 * @return Empty string if valid, otherwise the error message
 */
std::string validate_options(const RunOptions& options);

void print_usage(const char* program_name);

} // namespace pzde

#endif // CLI_OPTIONS_HPP
