/**
 * Detection Pipeline
 *
 * domain table -> parse -> filter -> join KO/symbol maps -> report
 */

#ifndef PIPELINE_HPP
#define PIPELINE_HPP

#include "pzde_hmm.hpp"
#include "domtbl_parser.hpp"
#include "hit_filter.hpp"
#include "annotation_map.hpp"
#include "output_writer.hpp"
#include "table_source.hpp"
#include <string>
#include <vector>

namespace pzde {

/**
 * Everything the pipeline needs besides the table source
 */
struct PipelineConfig {
    FilterConfig filter;
    std::string ko_map_path;
    std::string symbol_map_path;
    std::string output_path;
    OutputFormat format = OutputFormat::CSV;
    bool compress = false;
};

/**
 * What a run did
 */
struct PipelineSummary {
    std::string table_path;
    std::string output_path;
    ParseStats parse;
    FilterStats filter;
    ReportStats report;
    size_t ko_entries = 0;
    size_t symbol_entries = 0;
};

/**
 * Write the report for already-filtered hits
 * @throws std::runtime_error if the output cannot be written
 */
ReportStats write_report(
    const std::vector<HitRecord>& hits,
    const AnnotationMap& ko_map,
    const AnnotationMap& symbol_map,
    const std::string& output_path,
    OutputFormat format = OutputFormat::CSV,
    bool compress = false
);

/**
 * Run the full pipeline
 * @throws std::runtime_error if the table source fails, the table cannot
 *         be read, or the report cannot be written
 */
PipelineSummary run_pipeline(const PipelineConfig& config, DomainTableSource& source);

} // namespace pzde

#endif // PIPELINE_HPP
