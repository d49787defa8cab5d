/**
 * Detection Pipeline - Implementation
 */

#include "pipeline.hpp"
#include <stdexcept>

namespace pzde {

ReportStats write_report(
    const std::vector<HitRecord>& hits,
    const AnnotationMap& ko_map,
    const AnnotationMap& symbol_map,
    const std::string& output_path,
    OutputFormat format,
    bool compress)
{
    auto writer = create_report_writer(output_path, format, compress);
    writer->write_header();
    writer->write_hits(hits, ko_map, symbol_map);
    writer->write_footer();
    writer->finish();
    return writer->get_stats();
}

PipelineSummary run_pipeline(const PipelineConfig& config, DomainTableSource& source) {
    PipelineSummary summary;
    summary.output_path = config.output_path;

    TableResult table = source.fetch();
    if (!table.ok) {
        throw std::runtime_error(table.error);
    }
    summary.table_path = table.path;

    log(LogLevel::INFO, "Parsing and filtering HMM hits...");
    auto hits = parse_domtbl_file(table.path, &summary.parse);
    log(LogLevel::DEBUG, "Domain table: " + summary.parse.to_string());
    if (summary.parse.skipped() > 0) {
        log(LogLevel::INFO, "Skipped " + std::to_string(summary.parse.skipped()) +
            " malformed domain table lines");
    }

    auto filtered = filter_hits(hits, config.filter, &summary.filter);
    log(LogLevel::INFO, summary.filter.to_string());

    AnnotationMap ko_map = AnnotationMap::load(config.ko_map_path, "KO");
    AnnotationMap symbol_map = AnnotationMap::load(config.symbol_map_path, "symbol");
    summary.ko_entries = ko_map.size();
    summary.symbol_entries = symbol_map.size();

    summary.report = write_report(filtered, ko_map, symbol_map,
                                  config.output_path, config.format, config.compress);
    log(LogLevel::DEBUG, summary.report.to_string());
    log(LogLevel::INFO, "Done! Results saved to " + config.output_path);

    return summary;
}

} // namespace pzde
