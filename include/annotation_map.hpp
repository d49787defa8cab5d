/**
 * Annotation Maps
 *
 * Two-column lookup tables keyed by HMM profile name:
 *   hmm_label-KO.txt      profile -> KEGG Orthology id
 *   hmm_label-symbol.txt  profile -> gene symbol
 *
 * The value is everything after the first run of whitespace and may
 * contain spaces. A missing or unreadable file gives an empty map.
 */

#ifndef ANNOTATION_MAP_HPP
#define ANNOTATION_MAP_HPP

#include <string>
#include <unordered_map>
#include <optional>

namespace pzde {

/**
 * Split an annotation line into key and value
 * @return false for blank, comment and single-column lines
 */
bool parse_annotation_line(const std::string& line, std::string& key, std::string& value);

/**
 * Profile name -> annotation lookup
 */
class AnnotationMap {
public:
    AnnotationMap() = default;
    explicit AnnotationMap(const std::string& label) : label_(label) {}

    /**
     * Load a two-column annotation file (plain or .gz).
     * Never throws for file problems: a missing path yields an empty map
     * silently, an unreadable one yields an empty map with a warning.
     * @param label Name used in log messages (e.g. "KO", "symbol")
     */
    static AnnotationMap load(const std::string& path, const std::string& label);

    /**
     * Value for a key, or MISSING_ANNOTATION ("NA")
     */
    std::string lookup(const std::string& key) const;

    std::optional<std::string> find(const std::string& key) const;

    bool contains(const std::string& key) const {
        return entries_.count(key) > 0;
    }

    /**
     * Insert or replace; later values override earlier ones
     */
    void set(const std::string& key, const std::string& value) {
        entries_[key] = value;
    }

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    const std::string& label() const { return label_; }

private:
    std::string label_;
    std::unordered_map<std::string, std::string> entries_;
};

} // namespace pzde

#endif // ANNOTATION_MAP_HPP
