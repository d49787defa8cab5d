/**
 * Hit Filter
 *
 * Score and coverage thresholds for domain hits. Each threshold is
 * optional; an unset minimum score never rejects a hit. The E-value cut is
 * applied upstream by hmmsearch (-E) and is not re-checked here.
 */

#ifndef HIT_FILTER_HPP
#define HIT_FILTER_HPP

#include "pzde_hmm.hpp"
#include <string>
#include <vector>
#include <optional>
#include <sstream>
#include <limits>

namespace pzde {

/**
 * Filter configuration
 */
struct FilterConfig {
    // Numeric filters (inclusive minimums)
    std::optional<double> min_score;
    std::optional<double> min_model_coverage;
    std::optional<double> min_seq_coverage;

    // Passed to hmmsearch -E; carried for reporting only
    double evalue = 1e-5;

    /**
     * Minimum score actually compared against; -inf when unset
     */
    double effective_min_score() const {
        return min_score ? *min_score : -std::numeric_limits<double>::infinity();
    }

    bool has_any_filter() const {
        return min_score.has_value() ||
               min_model_coverage.has_value() ||
               min_seq_coverage.has_value();
    }
};

/**
 * Result of checking a hit; the first failing threshold wins
 */
enum class FilterResult {
    PASS,
    LOW_SCORE,
    LOW_MODEL_COVERAGE,
    LOW_SEQ_COVERAGE
};

inline std::string filter_result_to_string(FilterResult result) {
    switch (result) {
        case FilterResult::PASS: return "pass";
        case FilterResult::LOW_SCORE: return "low_score";
        case FilterResult::LOW_MODEL_COVERAGE: return "low_model_coverage";
        case FilterResult::LOW_SEQ_COVERAGE: return "low_seq_coverage";
        default: return "unknown";
    }
}

/**
 * Check a hit against all enabled thresholds, in order:
 * score, model coverage, sequence coverage
 */
inline FilterResult check_hit(const HitRecord& hit, const FilterConfig& config) {
    if (hit.full_score < config.effective_min_score()) {
        return FilterResult::LOW_SCORE;
    }
    if (config.min_model_coverage && hit.model_coverage < *config.min_model_coverage) {
        return FilterResult::LOW_MODEL_COVERAGE;
    }
    if (config.min_seq_coverage && hit.seq_coverage < *config.min_seq_coverage) {
        return FilterResult::LOW_SEQ_COVERAGE;
    }
    return FilterResult::PASS;
}

/**
 * Apply all filter conditions
 */
inline bool apply_filter(const HitRecord& hit, const FilterConfig& config) {
    return check_hit(hit, config) == FilterResult::PASS;
}

/**
 * Per-threshold rejection counts
 */
struct FilterStats {
    size_t examined = 0;
    size_t passed = 0;
    size_t low_score = 0;
    size_t low_model_coverage = 0;
    size_t low_seq_coverage = 0;

    void add(FilterResult result) {
        examined++;
        switch (result) {
            case FilterResult::PASS: passed++; break;
            case FilterResult::LOW_SCORE: low_score++; break;
            case FilterResult::LOW_MODEL_COVERAGE: low_model_coverage++; break;
            case FilterResult::LOW_SEQ_COVERAGE: low_seq_coverage++; break;
        }
    }

    size_t rejected() const { return examined - passed; }

    std::string to_string() const {
        std::ostringstream oss;
        oss << "Kept " << passed << " of " << examined << " hits";
        if (rejected() > 0) {
            oss << " (score: " << low_score
                << ", model coverage: " << low_model_coverage
                << ", sequence coverage: " << low_seq_coverage << " rejected)";
        }
        return oss.str();
    }
};

/**
 * Stable filter over a hit list; order is preserved and nothing is merged
 */
inline std::vector<HitRecord> filter_hits(
    const std::vector<HitRecord>& hits,
    const FilterConfig& config,
    FilterStats* stats = nullptr)
{
    std::vector<HitRecord> result;
    result.reserve(hits.size());

    for (const auto& hit : hits) {
        FilterResult outcome = check_hit(hit, config);
        if (stats) stats->add(outcome);
        if (outcome == FilterResult::PASS) {
            result.push_back(hit);
        }
    }

    return result;
}

} // namespace pzde

#endif // HIT_FILTER_HPP
