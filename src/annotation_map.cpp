/**
 * Annotation Maps - Implementation
 */

#include "annotation_map.hpp"
#include "file_parsers.hpp"
#include "pzde_hmm.hpp"

namespace pzde {

bool parse_annotation_line(const std::string& line, std::string& key, std::string& value) {
    std::string trimmed = trim(line);
    if (trimmed.empty() || trimmed[0] == '#') return false;

    auto fields = split_whitespace(trimmed, 2);
    if (fields.size() < 2) return false;

    key = fields[0];
    value = fields[1];
    return true;
}

AnnotationMap AnnotationMap::load(const std::string& path, const std::string& label) {
    AnnotationMap map(label);

    if (path.empty() || !file_exists(path)) {
        log(LogLevel::DEBUG, label + " map not found, all " + label + " values will be " +
            MISSING_ANNOTATION + ": " + path);
        return map;
    }

    LineReader reader(path);
    if (!reader.is_open()) {
        log(LogLevel::WARNING, "could not read " + label + " map file: " + path);
        return map;
    }

    std::string line;
    std::string key;
    std::string value;
    size_t skipped = 0;

    while (reader.read_line(line)) {
        if (parse_annotation_line(line, key, value)) {
            map.set(key, value);
        } else {
            skipped++;
        }
    }

    if (reader.has_error()) {
        log(LogLevel::WARNING, "could not read " + label + " map file: " + path);
        return AnnotationMap(label);
    }

    log(LogLevel::INFO, "Loaded " + std::to_string(map.size()) + " " + label +
        " annotations from: " + path);
    if (skipped > 0) {
        log(LogLevel::DEBUG, label + " map: skipped " + std::to_string(skipped) +
            " blank, comment or single-column lines");
    }

    return map;
}

std::string AnnotationMap::lookup(const std::string& key) const {
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        return it->second;
    }
    return MISSING_ANNOTATION;
}

std::optional<std::string> AnnotationMap::find(const std::string& key) const {
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        return it->second;
    }
    return std::nullopt;
}

} // namespace pzde
