/**
 * Domain Table Sources - Implementation
 */

#include "table_source.hpp"
#include "file_parsers.hpp"
#include "pzde_hmm.hpp"
#include <chrono>
#include <thread>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace pzde {

// ============================================================================
// Child process
// ============================================================================

static void record_wait_status(int status, ProcessResult& result) {
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signal = WTERMSIG(status);
    }
}

static pid_t wait_child(pid_t pid, int* status, int options) {
    pid_t ws;
    while ((ws = waitpid(pid, status, options)) < 0 && errno == EINTR) {
    }
    return ws;
}

ProcessResult run_command(const std::vector<std::string>& argv, int timeout_seconds) {
    ProcessResult result;

    if (argv.empty()) {
        result.error = "empty command";
        return result;
    }

    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    // The child writes errno here if exec fails; EOF means exec succeeded
    int status_pipe[2];
    if (pipe(status_pipe) < 0) {
        result.error = std::string("failed to create status pipe: ") + std::strerror(errno);
        return result;
    }
    fcntl(status_pipe[1], F_SETFD, fcntl(status_pipe[1], F_GETFD, 0) | FD_CLOEXEC);

    pid_t pid = fork();
    if (pid < 0) {
        int errcode = errno;
        close(status_pipe[0]);
        close(status_pipe[1]);
        result.error = std::string("fork failed: ") + std::strerror(errcode);
        return result;
    }

    if (pid == 0) {
        close(status_pipe[0]);

        int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDOUT_FILENO);
            dup2(devnull, STDERR_FILENO);
            if (devnull > STDERR_FILENO) close(devnull);
        }

        execvp(c_argv[0], c_argv.data());

        int errcode = errno;
        ssize_t written = write(status_pipe[1], &errcode, sizeof(errcode));
        _exit(written == static_cast<ssize_t>(sizeof(errcode)) ? 127 : 126);
    }

    close(status_pipe[1]);

    ssize_t n;
    int errcode = 0;
    while ((n = read(status_pipe[0], &errcode, sizeof(errcode))) < 0) {
        if (errno != EINTR) break;
    }
    close(status_pipe[0]);

    if (n > 0) {
        // Child could not run
        wait_child(pid, nullptr, 0);
        result.error = "cannot execute " + argv[0] + ": " + std::strerror(errcode);
        return result;
    }
    result.launched = true;

    int status = 0;
    if (timeout_seconds <= 0) {
        if (wait_child(pid, &status, 0) < 0) {
            result.error = std::string("waitpid failed: ") + std::strerror(errno);
            return result;
        }
        record_wait_status(status, result);
        return result;
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_seconds);
    while (true) {
        pid_t ws = wait_child(pid, &status, WNOHANG);
        if (ws == pid) {
            record_wait_status(status, result);
            return result;
        }
        if (ws < 0) {
            result.error = std::string("waitpid failed: ") + std::strerror(errno);
            return result;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            kill(pid, SIGKILL);
            wait_child(pid, &status, 0);
            result.timed_out = true;
            record_wait_status(status, result);
            return result;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
}

// ============================================================================
// hmmsearch
// ============================================================================

std::string format_evalue_arg(double evalue) {
    // Fewest significant digits that read back as the same value
    char buf[40];
    for (int precision = 1; precision <= 17; ++precision) {
        std::snprintf(buf, sizeof(buf), "%.*g", precision, evalue);
        if (std::strtod(buf, nullptr) == evalue) break;
    }
    return buf;
}

std::vector<std::string> build_hmmsearch_command(const HmmsearchOptions& options) {
    return {
        options.executable,
        "--domtblout", options.domtblout,
        "-E", format_evalue_arg(options.evalue),
        "--cpu", std::to_string(options.cpus),
        options.hmm_db,
        options.input_faa
    };
}

TableResult HmmsearchSource::fetch() {
    log(LogLevel::INFO, "Running hmmsearch on " + options_.input_faa + "...");

    auto command = build_hmmsearch_command(options_);
    std::string command_line;
    for (size_t i = 0; i < command.size(); ++i) {
        if (i > 0) command_line += " ";
        command_line += command[i];
    }
    log(LogLevel::DEBUG, "Command: " + command_line);

    ProcessResult run = run_command(command, options_.timeout_seconds);

    if (run.timed_out) {
        return TableResult::failure("hmmsearch timed out after " +
                                    std::to_string(options_.timeout_seconds) + " seconds");
    }
    if (!run.succeeded()) {
        if (!run.error.empty()) {
            log(LogLevel::DEBUG, run.error);
        } else if (run.signal != 0) {
            log(LogLevel::DEBUG, "hmmsearch killed by signal " + std::to_string(run.signal));
        } else {
            log(LogLevel::DEBUG, "hmmsearch exited with status " + std::to_string(run.exit_code));
        }
        return TableResult::failure("hmmsearch failed. Is HMMER installed and in your PATH?");
    }

    if (!file_exists(options_.domtblout)) {
        return TableResult::failure("hmmsearch did not produce " + options_.domtblout);
    }

    return TableResult::success(options_.domtblout);
}

// ============================================================================
// Existing table
// ============================================================================

TableResult ExistingTableSource::fetch() {
    if (!file_exists(path_) || is_directory(path_)) {
        return TableResult::failure("Domain table not found: " + path_);
    }
    log(LogLevel::INFO, "Using existing domain table: " + path_);
    return TableResult::success(path_);
}

} // namespace pzde
