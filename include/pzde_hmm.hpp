/**
 * PzDE-HMM - Plasticizer-Degrading Enzyme Detector
 *
 * Post-processes hmmsearch domain tables (--domtblout) to find candidate
 * plasticizer-degrading enzyme genes. Hits are filtered by bit score and
 * model/sequence coverage, then joined against KO and gene symbol tables.
 *
 * Core types shared by the parser, filter and report writer, plus the
 * logging facility used throughout.
 */

#ifndef PZDE_HMM_HPP
#define PZDE_HMM_HPP

#include <string>
#include <vector>

namespace pzde {

/**
 * Placeholder written when a query has no KO or symbol annotation
 */
constexpr const char* MISSING_ANNOTATION = "NA";

/**
 * One domain hit from an hmmsearch domain table.
 * Positions are 1-based and inclusive.
 */
struct HitRecord {
    std::string target;             // Searched sequence (ORF) id
    std::string query;              // HMM profile name
    int target_length = 0;
    int query_length = 0;
    double full_evalue = 0.0;       // Full-sequence E-value
    double full_score = 0.0;        // Full-sequence bit score

    int hmm_from = 0;
    int hmm_to = 0;
    int ali_from = 0;
    int ali_to = 0;

    // Derived ratios in (0, 1], unrounded; the report prints 4 decimals
    double model_coverage = 0.0;
    double seq_coverage = 0.0;

    /**
     * Fill model_coverage and seq_coverage from the spans and lengths
     */
    void compute_coverage();
};

/**
 * Fraction of a sequence of the given length spanned by [from, to]
 */
double span_coverage(int from, int to, int length);

/**
 * Logging utilities
 */
enum class LogLevel { DEBUG, INFO, WARNING, ERROR };
void set_log_level(LogLevel level);
void log(LogLevel level, const std::string& message);

} // namespace pzde

#endif // PZDE_HMM_HPP
