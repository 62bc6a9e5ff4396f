//! # System Process Runner
//!
//! Spawns external tools with fork()/execvp(). Captured streams are drained
//! with poll() so a chatty stderr cannot block a child writing to stdout.
//!
//! ## Child Setup Order
//!
//! 1. Redirect stdout (pipe or file) and stderr (pipe) as requested
//! 2. Apply extra environment variables with setenv()
//! 3. chdir() into the requested working directory
//! 4. execvp() the program; on failure print to stderr and `_exit(127)`

#include "process/process_runner.hpp"

#include "log/log.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace kmake::process {

/// Quotes an argument for display if it contains shell-significant characters.
static std::string quote_arg(const std::string& arg) {
    if (arg.empty())
        return "''";
    if (arg.find_first_of(" \t\"'$\\*?;&|<>()") == std::string::npos)
        return arg;

    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

std::string format_command(const Command& cmd) {
    std::string line;
    if (!cmd.cwd.empty()) {
        line += "cd " + quote_arg(cmd.cwd.string()) + " && ";
    }
    for (const auto& [key, value] : cmd.env) {
        line += key + "=" + quote_arg(value) + " ";
    }
    line += quote_arg(cmd.program);
    for (const auto& arg : cmd.args) {
        line += " " + quote_arg(arg);
    }
    if (cmd.stdout_mode == StdoutMode::File) {
        line += " > " + quote_arg(cmd.stdout_file.string());
    }
    return line;
}

static void close_pair(int fds[2]) {
    if (fds[0] >= 0)
        close(fds[0]);
    if (fds[1] >= 0)
        close(fds[1]);
    fds[0] = fds[1] = -1;
}

/// Drains both read ends until EOF on each.
static void drain_pipes(int out_fd, int err_fd, std::string& out, std::string& err) {
    struct pollfd fds[2];
    int nfds = 0;
    int out_idx = -1;

    if (out_fd >= 0) {
        out_idx = nfds;
        fds[nfds++] = {out_fd, POLLIN, 0};
    }
    if (err_fd >= 0) {
        fds[nfds++] = {err_fd, POLLIN, 0};
    }

    int open_count = nfds;
    char buffer[4096];

    while (open_count > 0) {
        int ready = poll(fds, static_cast<nfds_t>(nfds), -1);
        if (ready < 0) {
            if (errno == EINTR)
                continue;
            break;
        }

        for (int i = 0; i < nfds; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0)
                continue;

            ssize_t n = read(fds[i].fd, buffer, sizeof(buffer));
            if (n > 0) {
                (i == out_idx ? out : err).append(buffer, static_cast<size_t>(n));
            } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                fds[i].fd = -1;
                --open_count;
            }
        }
    }
}

auto SystemProcessRunner::run(const Command& cmd) -> ProcessResult {
    ProcessResult result;

    KMAKE_LOG_TRACE("process", "spawn: " << format_command(cmd));

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int file_fd = -1;

    if (cmd.stdout_mode == StdoutMode::Capture && pipe(out_pipe) != 0) {
        result.stderr_output = std::string("failed to create stdout pipe: ") + strerror(errno);
        return result;
    }

    if (cmd.capture_stderr && pipe(err_pipe) != 0) {
        close_pair(out_pipe);
        result.stderr_output = std::string("failed to create stderr pipe: ") + strerror(errno);
        return result;
    }

    if (cmd.stdout_mode == StdoutMode::File) {
        file_fd = open(cmd.stdout_file.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
        if (file_fd < 0) {
            close_pair(err_pipe);
            result.stderr_output =
                "cannot open " + cmd.stdout_file.string() + ": " + strerror(errno);
            return result;
        }
    }

    // argv must outlive the fork; it points into cmd.
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(cmd.program.c_str()));
    for (const auto& arg : cmd.args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    std::cout.flush();
    std::cerr.flush();

    pid_t pid = fork();

    if (pid < 0) {
        close_pair(out_pipe);
        close_pair(err_pipe);
        if (file_fd >= 0)
            close(file_fd);
        result.stderr_output = std::string("failed to fork: ") + strerror(errno);
        return result;
    }

    if (pid == 0) {
        if (out_pipe[1] >= 0) {
            dup2(out_pipe[1], STDOUT_FILENO);
        } else if (file_fd >= 0) {
            dup2(file_fd, STDOUT_FILENO);
        }
        if (err_pipe[1] >= 0) {
            dup2(err_pipe[1], STDERR_FILENO);
        }
        close_pair(out_pipe);
        close_pair(err_pipe);
        if (file_fd >= 0)
            close(file_fd);

        for (const auto& [key, value] : cmd.env) {
            setenv(key.c_str(), value.c_str(), 1);
        }

        if (!cmd.cwd.empty() && chdir(cmd.cwd.c_str()) != 0) {
            dprintf(STDERR_FILENO, "cannot enter %s: %s\n", cmd.cwd.c_str(), strerror(errno));
            _exit(127);
        }

        execvp(argv[0], argv.data());

        dprintf(STDERR_FILENO, "failed to execute %s: %s\n", argv[0], strerror(errno));
        _exit(127);
    }

    // Parent
    if (out_pipe[1] >= 0) {
        close(out_pipe[1]);
        out_pipe[1] = -1;
    }
    if (err_pipe[1] >= 0) {
        close(err_pipe[1]);
        err_pipe[1] = -1;
    }
    if (file_fd >= 0)
        close(file_fd);

    drain_pipes(out_pipe[0], err_pipe[0], result.stdout_output, result.stderr_output);
    close_pair(out_pipe);
    close_pair(err_pipe);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            result.exit_code = -1;
            result.stderr_output += std::string("failed to wait for child: ") + strerror(errno);
            return result;
        }
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    } else {
        result.exit_code = -1;
    }

    KMAKE_LOG_TRACE("process", cmd.program << " exited with " << result.exit_code);
    return result;
}

} // namespace kmake::process
