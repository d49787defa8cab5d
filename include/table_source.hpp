/**
 * Domain Table Sources
 *
 * Where the domain table comes from: a fresh hmmsearch run, or a table
 * produced earlier. fetch() reports failure through TableResult instead of
 * throwing, so callers (and tests) can substitute their own source.
 */

#ifndef TABLE_SOURCE_HPP
#define TABLE_SOURCE_HPP

#include <string>
#include <vector>

namespace pzde {

/**
 * Result of producing a domain table
 */
struct TableResult {
    bool ok = false;
    std::string path;   // Domain table path when ok
    std::string error;  // Description when !ok

    static TableResult success(const std::string& table_path) {
        TableResult r;
        r.ok = true;
        r.path = table_path;
        return r;
    }

    static TableResult failure(const std::string& message) {
        TableResult r;
        r.error = message;
        return r;
    }
};

/**
 * Abstract producer of a domain table
 */
class DomainTableSource {
public:
    virtual ~DomainTableSource() = default;

    /**
     * Short name for log messages
     */
    virtual std::string name() const = 0;

    /**
     * Produce the table. Blocks until done.
     */
    virtual TableResult fetch() = 0;
};

/**
 * Outcome of running a child process
 */
struct ProcessResult {
    bool launched = false;      // exec succeeded
    bool timed_out = false;     // killed after timeout
    int exit_code = -1;         // valid if exited normally
    int signal = 0;             // terminating signal, 0 if none
    std::string error;          // launch failure description

    bool succeeded() const {
        return launched && !timed_out && signal == 0 && exit_code == 0;
    }
};

/**
 * Run a command (argv[0] looked up in PATH) with stdout and stderr sent
 * to /dev/null, and wait for it.
 * @param timeout_seconds Kill the child after this many seconds; 0 waits forever
 */
ProcessResult run_command(const std::vector<std::string>& argv, int timeout_seconds = 0);

/**
 * hmmsearch invocation parameters
 */
struct HmmsearchOptions {
    std::string executable = "hmmsearch";
    std::string input_faa;      // Protein FASTA to search
    std::string hmm_db;         // HMM profile database
    std::string domtblout;      // Domain table to produce
    double evalue = 1e-5;       // -E
    int cpus = 4;               // --cpu
    int timeout_seconds = 0;
};

/**
 * Format a number the way it is passed on the command line (1e-05, 0.001),
 * using the shortest form that parses back to the same double
 */
std::string format_evalue_arg(double evalue);

/**
 * Build: hmmsearch --domtblout OUT -E EVALUE --cpu N HMM_DB INPUT
 */
std::vector<std::string> build_hmmsearch_command(const HmmsearchOptions& options);

/**
 * Runs hmmsearch to produce the domain table
 */
class HmmsearchSource : public DomainTableSource {
public:
    explicit HmmsearchSource(const HmmsearchOptions& options) : options_(options) {}

    std::string name() const override { return "hmmsearch"; }

    TableResult fetch() override;

private:
    HmmsearchOptions options_;
};

/**
 * A domain table that already exists on disk
 */
class ExistingTableSource : public DomainTableSource {
public:
    explicit ExistingTableSource(const std::string& path) : path_(path) {}

    std::string name() const override { return "domtblout"; }

    TableResult fetch() override;

private:
    std::string path_;
};

} // namespace pzde

#endif // TABLE_SOURCE_HPP
