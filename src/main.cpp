/**
 * PzDE-HMM - Main Entry Point
 *
 * Runs hmmsearch against the PzDE profile database, then filters and
 * annotates the resulting domain hits.
 */

#include "cli_options.hpp"
#include "pipeline.hpp"
#include "table_source.hpp"
#include <iostream>
#include <memory>
#include <stdexcept>

int main(int argc, char* argv[]) {
    pzde::RunOptions options;
    std::string error;

    pzde::ParseStatus status = pzde::parse_cli_args(argc, argv, options, error);
    if (status == pzde::ParseStatus::HELP) {
        pzde::print_usage(argv[0]);
        return 0;
    }
    if (status == pzde::ParseStatus::ERROR) {
        std::cerr << "Error: " << error << "\n" << std::endl;
        pzde::print_usage(argv[0]);
        return 1;
    }

    // Set log level
    if (options.debug) {
        pzde::set_log_level(pzde::LogLevel::DEBUG);
    }

    error = pzde::validate_options(options);
    if (!error.empty()) {
        std::cerr << "Error: " << error << std::endl;
        return 1;
    }

    std::unique_ptr<pzde::DomainTableSource> source;
    if (options.runs_hmmsearch()) {
        source = std::make_unique<pzde::HmmsearchSource>(options.to_hmmsearch_options());
    } else {
        source = std::make_unique<pzde::ExistingTableSource>(options.domtblout);
    }

    try {
        pzde::run_pipeline(options.to_pipeline_config(), *source);
    } catch (const std::exception& e) {
        pzde::log(pzde::LogLevel::ERROR, e.what());
        return 1;
    }

    return 0;
}
