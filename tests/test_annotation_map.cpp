/**
 * Tests for annotation map loading and lookup.
 */

#include <gtest/gtest.h>
#include "annotation_map.hpp"
#include "pzde_hmm.hpp"
#include "test_helpers.hpp"

using namespace pzde;
using namespace pzde_test;

// ============================================================================
// 1. Line parsing - parse_annotation_line()
// ============================================================================

TEST(ParseAnnotationLine, KeyAndValue) {
    std::string key, value;
    ASSERT_TRUE(parse_annotation_line("PETase\tK21104", key, value));
    EXPECT_EQ(key, "PETase");
    EXPECT_EQ(value, "K21104");
}

TEST(ParseAnnotationLine, ValueKeepsInnerWhitespace) {
    std::string key, value;
    ASSERT_TRUE(parse_annotation_line("  tphA2   terephthalate 1,2-dioxygenase  subunit  \n", key, value));
    EXPECT_EQ(key, "tphA2");
    EXPECT_EQ(value, "terephthalate 1,2-dioxygenase  subunit");
}

TEST(ParseAnnotationLine, SkipsBlankCommentAndSingleColumn) {
    std::string key, value;
    EXPECT_FALSE(parse_annotation_line("", key, value));
    EXPECT_FALSE(parse_annotation_line("   ", key, value));
    EXPECT_FALSE(parse_annotation_line("# hmm_label\tKO", key, value));
    EXPECT_FALSE(parse_annotation_line("  # indented comment", key, value));
    EXPECT_FALSE(parse_annotation_line("lonely_key", key, value));
    EXPECT_FALSE(parse_annotation_line("lonely_key   \t", key, value));
}

// ============================================================================
// 2. Lookup
// ============================================================================

TEST(AnnotationMap, LookupMissingIsNA) {
    AnnotationMap map("KO");
    EXPECT_EQ(map.lookup("PETase"), MISSING_ANNOTATION);
    EXPECT_EQ(map.lookup("PETase"), "NA");
    EXPECT_FALSE(map.find("PETase").has_value());
    EXPECT_FALSE(map.contains("PETase"));
    EXPECT_TRUE(map.empty());
}

TEST(AnnotationMap, SetAndLookup) {
    AnnotationMap map("symbol");
    map.set("PETase", "pet");
    EXPECT_EQ(map.lookup("PETase"), "pet");
    ASSERT_TRUE(map.find("PETase").has_value());
    EXPECT_EQ(*map.find("PETase"), "pet");
    EXPECT_EQ(map.size(), 1u);
    EXPECT_EQ(map.label(), "symbol");
}

TEST(AnnotationMap, LaterValueWins) {
    AnnotationMap map;
    map.set("PETase", "first");
    map.set("PETase", "second");
    EXPECT_EQ(map.lookup("PETase"), "second");
    EXPECT_EQ(map.size(), 1u);
}

// ============================================================================
// 3. Loading
// ============================================================================

TEST(AnnotationMapLoad, PlainFile) {
    TempFile tmp(".txt");
    write_file(tmp.path(),
               "# hmm_label\tKO\n"
               "PETase\tK21104\n"
               "\n"
               "MHETase\tK21105\n"
               "orphan\n"
               "PETase\tK99999\n");

    auto map = AnnotationMap::load(tmp.path(), "KO");
    EXPECT_EQ(map.size(), 2u);
    EXPECT_EQ(map.lookup("PETase"), "K99999");
    EXPECT_EQ(map.lookup("MHETase"), "K21105");
    EXPECT_EQ(map.lookup("orphan"), "NA");
    EXPECT_EQ(map.label(), "KO");
}

TEST(AnnotationMapLoad, ValueWithSpaces) {
    TempFile tmp(".txt");
    write_file(tmp.path(), "tphA1  terephthalate dioxygenase large subunit\r\n");
    auto map = AnnotationMap::load(tmp.path(), "symbol");
    EXPECT_EQ(map.lookup("tphA1"), "terephthalate dioxygenase large subunit");
}

TEST(AnnotationMapLoad, GzippedFile) {
    TempFile tmp(".txt.gz");
    write_gz_file(tmp.path(), "PETase\tpetA\nMHETase\tmhetA\n");
    auto map = AnnotationMap::load(tmp.path(), "symbol");
    EXPECT_EQ(map.size(), 2u);
    EXPECT_EQ(map.lookup("MHETase"), "mhetA");
}

TEST(AnnotationMapLoad, MissingFileGivesEmptyMap) {
    auto map = AnnotationMap::load("/nonexistent/hmm_label-KO.txt", "KO");
    EXPECT_TRUE(map.empty());
    EXPECT_EQ(map.lookup("anything"), "NA");
}

TEST(AnnotationMapLoad, EmptyPathGivesEmptyMap) {
    auto map = AnnotationMap::load("", "KO");
    EXPECT_TRUE(map.empty());
}

TEST(AnnotationMapLoad, UnreadablePathGivesEmptyMap) {
    TempDir dir;
    auto map = AnnotationMap::load(dir.path(), "KO");
    EXPECT_TRUE(map.empty());
}

TEST(AnnotationMapLoad, CorruptGzipGivesEmptyMap) {
    TempFile tmp(".txt.gz");
    std::string good;
    {
        TempFile src(".txt.gz");
        std::string content;
        for (int i = 0; i < 2000; ++i) {
            content += "profile_" + std::to_string(i) + "\tK" + std::to_string(10000 + i) + "\n";
        }
        write_gz_file(src.path(), content);
        good = read_file(src.path());
    }
    // Truncated stream: header intact, body cut short
    write_file(tmp.path(), good.substr(0, good.size() / 2));

    auto map = AnnotationMap::load(tmp.path(), "KO");
    EXPECT_TRUE(map.empty());
}

TEST(AnnotationMapLoad, IndependentMaps) {
    TempFile ko(".txt");
    TempFile sym(".txt");
    write_file(ko.path(), "PETase\tK21104\n");
    write_file(sym.path(), "MHETase\tmhetA\n");

    auto ko_map = AnnotationMap::load(ko.path(), "KO");
    auto symbol_map = AnnotationMap::load(sym.path(), "symbol");

    EXPECT_EQ(ko_map.lookup("PETase"), "K21104");
    EXPECT_EQ(ko_map.lookup("MHETase"), "NA");
    EXPECT_EQ(symbol_map.lookup("PETase"), "NA");
    EXPECT_EQ(symbol_map.lookup("MHETase"), "mhetA");
}
