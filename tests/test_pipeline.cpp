/**
 * End-to-end tests for the detection pipeline using a stand-in table source.
 */

#include <gtest/gtest.h>
#include "pipeline.hpp"
#include "test_helpers.hpp"

#include <filesystem>
#include <stdexcept>

using namespace pzde;
using namespace pzde_test;

// ============================================================================
// Helper: table source returning a fixed result
// ============================================================================

class FixedTableSource : public DomainTableSource {
public:
    explicit FixedTableSource(TableResult result) : result_(std::move(result)) {}

    std::string name() const override { return "fixed"; }

    TableResult fetch() override {
        ++calls;
        return result_;
    }

    int calls = 0;

private:
    TableResult result_;
};

static const char* CSV_HEADER = "target,query,full_evalue,full_score,modelcov,seqcov,KO,symbol\n";

class PipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        write_file(table.path(), domtbl_header() + join_lines({
            make_domtbl_line("orf_1", 100, "PETase", 50, "1e-20", "45.0", 1, 50, 1, 100),
            "orf_bad - 100 PETase - 50 1e-20 45.0 0.1 1",
            make_domtbl_line("orf_2", 100, "MHETase", 50, "1e-08", "25.0", 1, 25, 1, 50),
        }) + "# [ok]\n");
        write_file(ko.path(), "PETase\tK21104\nMHETase\tK21105\n");
        write_file(symbol.path(), "PETase\tpetA\n");

        config.ko_map_path = ko.path();
        config.symbol_map_path = symbol.path();
        config.output_path = out.path();
    }

    TempFile table{".domtblout"};
    TempFile ko{".txt"};
    TempFile symbol{".txt"};
    TempFile out{".filtered.csv"};
    PipelineConfig config;
};

// ============================================================================
// 1. run_pipeline()
// ============================================================================

TEST_F(PipelineTest, NoThresholdsKeepsAllParsedHits) {
    FixedTableSource source(TableResult::success(table.path()));
    PipelineSummary summary = run_pipeline(config, source);

    EXPECT_EQ(source.calls, 1);
    EXPECT_EQ(read_file(out.path()), std::string(CSV_HEADER) +
              "orf_1,PETase,1.00e-20,45.00,1.0000,1.0000,K21104,petA\n"
              "orf_2,MHETase,1.00e-08,25.00,0.5000,0.5000,K21105,NA\n");

    EXPECT_EQ(summary.table_path, table.path());
    EXPECT_EQ(summary.output_path, out.path());
    EXPECT_EQ(summary.parse.records, 2u);
    EXPECT_EQ(summary.parse.short_lines, 1u);
    EXPECT_EQ(summary.filter.passed, 2u);
    EXPECT_EQ(summary.report.rows, 2);
    EXPECT_EQ(summary.ko_entries, 2u);
    EXPECT_EQ(summary.symbol_entries, 1u);
}

TEST_F(PipelineTest, MinScoreDropsWeakHit) {
    config.filter.min_score = 30;
    FixedTableSource source(TableResult::success(table.path()));
    PipelineSummary summary = run_pipeline(config, source);

    EXPECT_EQ(read_file(out.path()), std::string(CSV_HEADER) +
              "orf_1,PETase,1.00e-20,45.00,1.0000,1.0000,K21104,petA\n");
    EXPECT_EQ(summary.filter.low_score, 1u);
}

TEST_F(PipelineTest, CoverageThresholds) {
    config.filter.min_model_coverage = 0.5;
    config.filter.min_seq_coverage = 0.51;
    FixedTableSource source(TableResult::success(table.path()));
    run_pipeline(config, source);

    EXPECT_EQ(read_file(out.path()), std::string(CSV_HEADER) +
              "orf_1,PETase,1.00e-20,45.00,1.0000,1.0000,K21104,petA\n");
}

TEST_F(PipelineTest, CoverageThresholdUsesUnroundedRatio) {
    write_file(table.path(), join_lines({
        make_domtbl_line("orf_5", 64, "PETase", 100000, "1e-30", "90.0", 1, 69996, 1, 2),
    }));
    FixedTableSource source(TableResult::success(table.path()));

    run_pipeline(config, source);
    EXPECT_EQ(read_file(out.path()), std::string(CSV_HEADER) +
              "orf_5,PETase,1.00e-30,90.00,0.7000,0.0312,K21104,petA\n");

    config.filter.min_model_coverage = 0.7;
    PipelineSummary summary = run_pipeline(config, source);
    EXPECT_EQ(read_file(out.path()), CSV_HEADER);
    EXPECT_EQ(summary.filter.low_model_coverage, 1u);
}

TEST_F(PipelineTest, RerunIsByteIdentical) {
    FixedTableSource source(TableResult::success(table.path()));
    run_pipeline(config, source);
    std::string first = read_file(out.path());
    run_pipeline(config, source);
    EXPECT_EQ(read_file(out.path()), first);
}

TEST_F(PipelineTest, MissingMapsGiveNA) {
    config.ko_map_path = "/nonexistent/hmm_label-KO.txt";
    config.symbol_map_path = "";
    FixedTableSource source(TableResult::success(table.path()));
    run_pipeline(config, source);

    EXPECT_EQ(read_file(out.path()), std::string(CSV_HEADER) +
              "orf_1,PETase,1.00e-20,45.00,1.0000,1.0000,NA,NA\n"
              "orf_2,MHETase,1.00e-08,25.00,0.5000,0.5000,NA,NA\n");
}

TEST_F(PipelineTest, EmptyTableWritesHeaderOnly) {
    write_file(table.path(), domtbl_header());
    FixedTableSource source(TableResult::success(table.path()));
    PipelineSummary summary = run_pipeline(config, source);

    EXPECT_EQ(read_file(out.path()), CSV_HEADER);
    EXPECT_EQ(summary.report.rows, 0);
}

TEST_F(PipelineTest, SourceFailureThrows) {
    FixedTableSource source(TableResult::failure("hmmsearch failed. Is HMMER installed and in your PATH?"));
    try {
        run_pipeline(config, source);
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "hmmsearch failed. Is HMMER installed and in your PATH?");
    }
    EXPECT_FALSE(std::filesystem::exists(out.path()));
}

TEST_F(PipelineTest, UnreadableTableThrows) {
    FixedTableSource source(TableResult::success("/nonexistent/results.domtblout"));
    EXPECT_THROW(run_pipeline(config, source), std::runtime_error);
    EXPECT_FALSE(std::filesystem::exists(out.path()));
}

TEST_F(PipelineTest, UnwritableOutputThrows) {
    config.output_path = "/nonexistent/dir/results.filtered.csv";
    FixedTableSource source(TableResult::success(table.path()));
    EXPECT_THROW(run_pipeline(config, source), std::runtime_error);
}

TEST_F(PipelineTest, ExistingTableSource) {
    ExistingTableSource source(table.path());
    PipelineSummary summary = run_pipeline(config, source);
    EXPECT_EQ(summary.report.rows, 2);
}

TEST_F(PipelineTest, GzippedTable) {
    TempFile gz_table(".domtblout.gz");
    write_gz_file(gz_table.path(), read_file(table.path()));
    FixedTableSource source(TableResult::success(gz_table.path()));
    PipelineSummary summary = run_pipeline(config, source);
    EXPECT_EQ(summary.parse.records, 2u);
}

// ============================================================================
// 2. Output formats
// ============================================================================

TEST_F(PipelineTest, TSVOutput) {
    TempFile tsv(".filtered.tsv");
    config.output_path = tsv.path();
    config.format = OutputFormat::TSV;
    FixedTableSource source(TableResult::success(table.path()));
    run_pipeline(config, source);

    std::string content = read_file(tsv.path());
    EXPECT_EQ(content.substr(0, content.find('\n')),
              "target\tquery\tfull_evalue\tfull_score\tmodelcov\tseqcov\tKO\tsymbol");
    EXPECT_NE(content.find("orf_2\tMHETase\t1.00e-08\t25.00\t0.5000\t0.5000\tK21105\tNA\n"),
              std::string::npos);
}

TEST_F(PipelineTest, CompressedJSONOutput) {
    TempFile json(".filtered.json.gz");
    config.output_path = json.path();
    config.format = OutputFormat::JSON;
    config.compress = true;
    FixedTableSource source(TableResult::success(table.path()));
    run_pipeline(config, source);

    std::string content = read_gz_file(json.path());
    EXPECT_EQ(content.substr(0, 2), "[\n");
    EXPECT_NE(content.find("\"target\": \"orf_1\""), std::string::npos);
    EXPECT_NE(content.find("\"symbol\": \"NA\""), std::string::npos);
    EXPECT_EQ(content.substr(content.size() - 3), "\n]\n");
}

// ============================================================================
// 3. write_report()
// ============================================================================

TEST(WriteReport, ReturnsStats) {
    TempFile out(".csv");
    HitRecord hit;
    hit.target = "orf_7";
    hit.query = "PETase";
    hit.target_length = 200;
    hit.query_length = 100;
    hit.full_evalue = 2e-30;
    hit.full_score = 99.5;
    hit.hmm_from = 1;
    hit.hmm_to = 100;
    hit.ali_from = 1;
    hit.ali_to = 100;
    hit.compute_coverage();

    AnnotationMap ko("KO");
    ko.set("PETase", "K21104");
    ReportStats stats = write_report({hit}, ko, AnnotationMap(), out.path());

    EXPECT_EQ(stats.rows, 1);
    EXPECT_EQ(stats.ko_annotated, 1);
    EXPECT_EQ(stats.symbol_annotated, 0);
    EXPECT_EQ(read_file(out.path()), std::string(CSV_HEADER) +
              "orf_7,PETase,2.00e-30,99.50,1.0000,0.5000,K21104,NA\n");
}
