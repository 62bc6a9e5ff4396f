//! # Process Runner Interface
//!
//! Every external tool kmake drives (cargo, rustc, rustup, git, the binary
//! utilities, the digest helper) is invoked through `ProcessRunner`, so the
//! whole pipeline can be exercised against a scripted runner.
//!
//! ## Output Handling
//!
//! | StdoutMode | Child stdout                          |
//! |------------|---------------------------------------|
//! | `Inherit`  | Goes straight to kmake's stdout       |
//! | `Capture`  | Collected into `ProcessResult::stdout_output` |
//! | `File`     | Redirected into `Command::stdout_file` (truncated) |

#ifndef KMAKE_PROCESS_RUNNER_HPP
#define KMAKE_PROCESS_RUNNER_HPP

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace kmake::process {

enum class StdoutMode { Inherit, Capture, File };

/// A single external command invocation.
struct Command {
    std::string program;
    std::vector<std::string> args;

    /// Extra environment variables set in the child (added to the inherited ones).
    std::vector<std::pair<std::string, std::string>> env;

    /// Working directory of the child (empty = inherit).
    fs::path cwd;

    StdoutMode stdout_mode = StdoutMode::Inherit;
    fs::path stdout_file;

    /// Collect stderr into the result instead of passing it through.
    bool capture_stderr = false;

    [[nodiscard]] static auto capture(std::string program, std::vector<std::string> args)
        -> Command {
        Command cmd;
        cmd.program = std::move(program);
        cmd.args = std::move(args);
        cmd.stdout_mode = StdoutMode::Capture;
        cmd.capture_stderr = true;
        return cmd;
    }

    [[nodiscard]] static auto passthrough(std::string program, std::vector<std::string> args)
        -> Command {
        Command cmd;
        cmd.program = std::move(program);
        cmd.args = std::move(args);
        return cmd;
    }
};

/// Outcome of a command. A child killed by a signal reports 128 + signo.
/// A program that cannot be executed, or a working directory that cannot be
/// entered, reports 127 like a shell does. -1 means the child was never
/// started because a pipe, fork or the stdout file failed.
struct ProcessResult {
    int exit_code = -1;
    std::string stdout_output;
    std::string stderr_output;

    bool success() const {
        return exit_code == 0;
    }
};

/// Narrow subprocess interface.
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    /// Runs `cmd` to completion, blocking the caller.
    virtual auto run(const Command& cmd) -> ProcessResult = 0;
};

/// POSIX implementation using fork/execvp/pipe/poll/waitpid.
class SystemProcessRunner : public ProcessRunner {
public:
    auto run(const Command& cmd) -> ProcessResult override;
};

/// Renders `cmd` as a shell-like line for logs, e.g.
/// `RUSTFLAGS='-C linker=rust-lld' cargo build --release`.
std::string format_command(const Command& cmd);

} // namespace kmake::process

#endif // KMAKE_PROCESS_RUNNER_HPP
