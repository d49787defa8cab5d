/**
 * PzDE-HMM - core record helpers and logging
 */

#include "pzde_hmm.hpp"
#include <iostream>
#include <iomanip>
#include <chrono>
#include <ctime>

namespace pzde {

// ============================================================================
// Logging
// ============================================================================

static LogLevel g_log_level = LogLevel::INFO;

void set_log_level(LogLevel level) {
    g_log_level = level;
}

void log(LogLevel level, const std::string& message) {
    if (level < g_log_level) return;

    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    const char* level_str;
    switch (level) {
        case LogLevel::DEBUG:   level_str = "DEBUG"; break;
        case LogLevel::INFO:    level_str = "INFO"; break;
        case LogLevel::WARNING: level_str = "WARNING"; break;
        case LogLevel::ERROR:   level_str = "ERROR"; break;
        default:                level_str = "UNKNOWN"; break;
    }

    std::cerr << std::put_time(std::localtime(&time_t_now), "%Y-%m-%d %H:%M:%S")
              << " - " << level_str << " - " << message << std::endl;
}

// ============================================================================
// HitRecord
// ============================================================================

double span_coverage(int from, int to, int length) {
    return static_cast<double>(to - from + 1) / length;
}

void HitRecord::compute_coverage() {
    model_coverage = span_coverage(hmm_from, hmm_to, query_length);
    seq_coverage = span_coverage(ali_from, ali_to, target_length);
}

} // namespace pzde
