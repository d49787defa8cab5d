/**
 * Command Line Options - Implementation
 */

#include "cli_options.hpp"
#include "file_parsers.hpp"
#include <iostream>

namespace pzde {

std::string RunOptions::domtblout_path() const {
    if (!domtblout.empty()) return domtblout;
    return output_prefix + ".domtblout";
}

std::string RunOptions::report_path() const {
    std::string path = output_prefix + ".filtered" + output_extension(format);
    if (compress) path += ".gz";
    return path;
}

PipelineConfig RunOptions::to_pipeline_config() const {
    PipelineConfig config;
    config.filter.min_score = min_score;
    config.filter.min_model_coverage = min_model_coverage;
    config.filter.min_seq_coverage = min_seq_coverage;
    config.filter.evalue = evalue;
    config.ko_map_path = ko_map;
    config.symbol_map_path = symbol_map;
    config.output_path = report_path();
    config.format = format;
    config.compress = compress;
    return config;
}

HmmsearchOptions RunOptions::to_hmmsearch_options() const {
    HmmsearchOptions hmm;
    hmm.input_faa = input_faa;
    hmm.hmm_db = hmm_db;
    hmm.domtblout = domtblout_path();
    hmm.evalue = evalue;
    hmm.cpus = nproc;
    hmm.timeout_seconds = timeout_seconds;
    return hmm;
}

void print_usage(const char* program_name) {
    std::cout << "PzDE-HMM - Detect plasticizer-degrading enzyme genes using HMMER\n"
              << "==================================================================\n\n"
              << "Usage: " << program_name << " -i INPUT.faa -o PREFIX [OPTIONS]\n\n"
              << "Required:\n"
              << "  -i, --input FILE         Input protein FASTA file (e.g., ORFs.faa)\n"
              << "  -o, --output PREFIX      Output prefix (e.g., results)\n\n"
              << "Search Options:\n"
              << "  -db, --hmm-db FILE       Path to HMM database [default: data/PzDE-HMM.hmm]\n"
              << "  --evalue VALUE           E-value threshold [default: 1e-5]\n"
              << "  -n, --nproc N            Number of CPUs [default: 4]\n"
              << "  --timeout SEC            Abort hmmsearch after SEC seconds [default: none]\n"
              << "  --domtblout FILE         Use an existing domain table instead of running hmmsearch\n\n"
              << "Filter Options:\n"
              << "  --min-score VALUE        Minimum bit score (e.g., 50)\n"
              << "  --min-modelcov VALUE     Minimum model coverage (e.g., 0.7)\n"
              << "  --min-seqcov VALUE       Minimum sequence coverage (e.g., 0.7)\n\n"
              << "Annotation:\n"
              << "  --ko-map FILE            KO mapping file [default: data/hmm_label-KO.txt]\n"
              << "  --symbol-map FILE        Gene symbol mapping file [default: data/hmm_label-symbol.txt]\n\n"
              << "Output Options:\n"
              << "  --format FORMAT          csv, tsv or json [default: csv]\n"
              << "  --compress               gzip the report\n\n"
              << "Other Options:\n"
              << "  -h, --help               Show this help message\n"
              << "  --debug                  Enable debug logging\n\n"
              << "Outputs:\n"
              << "  PREFIX.domtblout         hmmsearch domain table\n"
              << "  PREFIX.filtered.csv      Filtered hits with KO and symbol annotations\n\n"
              << "Example:\n"
              << "  " << program_name << " -i ORFs.faa -o results --min-score 50 \\\n"
              << "      --min-modelcov 0.7 --min-seqcov 0.7 -n 8\n"
              << std::endl;
}

ParseStatus parse_cli_args(int argc, char* argv[], RunOptions& options, std::string& error) {
    auto parse_number = [&error](const std::string& arg, const std::string& value, double& out) {
        if (!parse_double(value, out)) {
            error = "Invalid value for " + arg + ": " + value;
            return false;
        }
        return true;
    };

    auto parse_count = [&error](const std::string& arg, const std::string& value, int& out) {
        if (!parse_int(value, out)) {
            error = "Invalid value for " + arg + ": " + value;
            return false;
        }
        return true;
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            return ParseStatus::HELP;
        } else if (arg == "--debug") {
            options.debug = true;
            continue;
        } else if (arg == "--compress") {
            options.compress = true;
            continue;
        }

        // Everything below takes a value
        bool known = (arg == "-i" || arg == "--input" ||
                      arg == "-o" || arg == "--output" ||
                      arg == "-db" || arg == "--hmm-db" ||
                      arg == "--evalue" || arg == "--min-score" ||
                      arg == "--min-modelcov" || arg == "--min-seqcov" ||
                      arg == "-n" || arg == "--nproc" ||
                      arg == "--ko-map" || arg == "--symbol-map" ||
                      arg == "--domtblout" || arg == "--format" ||
                      arg == "--timeout");
        if (!known) {
            error = "Unknown option: " + arg;
            return ParseStatus::ERROR;
        }
        if (i + 1 >= argc) {
            error = "Option " + arg + " requires a value";
            return ParseStatus::ERROR;
        }
        std::string value = argv[++i];

        if (arg == "-i" || arg == "--input") {
            options.input_faa = value;
        } else if (arg == "-o" || arg == "--output") {
            options.output_prefix = value;
        } else if (arg == "-db" || arg == "--hmm-db") {
            options.hmm_db = value;
        } else if (arg == "--evalue") {
            if (!parse_number(arg, value, options.evalue)) return ParseStatus::ERROR;
        } else if (arg == "--min-score") {
            double v;
            if (!parse_number(arg, value, v)) return ParseStatus::ERROR;
            options.min_score = v;
        } else if (arg == "--min-modelcov") {
            double v;
            if (!parse_number(arg, value, v)) return ParseStatus::ERROR;
            options.min_model_coverage = v;
        } else if (arg == "--min-seqcov") {
            double v;
            if (!parse_number(arg, value, v)) return ParseStatus::ERROR;
            options.min_seq_coverage = v;
        } else if (arg == "-n" || arg == "--nproc") {
            if (!parse_count(arg, value, options.nproc)) return ParseStatus::ERROR;
        } else if (arg == "--ko-map") {
            options.ko_map = value;
        } else if (arg == "--symbol-map") {
            options.symbol_map = value;
        } else if (arg == "--domtblout") {
            options.domtblout = value;
        } else if (arg == "--format") {
            if (value != "csv" && value != "tsv" && value != "json") {
                error = "Invalid value for --format: " + value + " (expected csv, tsv or json)";
                return ParseStatus::ERROR;
            }
            options.format = parse_output_format(value);
        } else if (arg == "--timeout") {
            if (!parse_count(arg, value, options.timeout_seconds)) return ParseStatus::ERROR;
        }
    }

    return ParseStatus::OK;
}

std::string validate_options(const RunOptions& options) {
    if (options.output_prefix.empty()) {
        return "Output prefix (-o) is required.";
    }
    if (options.nproc < 1) {
        return "Number of CPUs (-n) must be at least 1.";
    }
    if (options.timeout_seconds < 0) {
        return "Timeout must not be negative.";
    }
    if (!(options.evalue > 0)) {
        return "E-value threshold must be positive.";
    }

    if (!options.runs_hmmsearch()) {
        if (!file_exists(options.domtblout)) {
            return "Domain table not found: " + options.domtblout;
        }
        return "";
    }

    if (options.input_faa.empty()) {
        return "Input FASTA (-i) is required.";
    }
    if (!file_exists(options.input_faa)) {
        return "Input FASTA not found: " + options.input_faa;
    }
    if (!file_exists(options.hmm_db)) {
        return "HMM database not found: " + options.hmm_db;
    }
    return "";
}

} // namespace pzde
