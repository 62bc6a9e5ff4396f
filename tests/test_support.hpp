//! # Test Support
//!
//! Scripted stand-ins for the pipeline's injected seams, plus a scratch
//! directory helper.
//!
//! | Helper              | Replaces                          |
//! |---------------------|-----------------------------------|
//! | `FakeProcessRunner` | `process::ProcessRunner`          |
//! | `FakeFileSearch`    | `toolchain::FileSearch`           |
//! | `TempDir`           | A throwaway board/kernel tree     |

#pragma once

#include "config/build_config.hpp"
#include "log/log.hpp"
#include "process/process_runner.hpp"
#include "toolchain/toolchain.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unistd.h>
#include <vector>

namespace kmake::testing {

namespace fs = std::filesystem;

// ============================================================================
// FakeProcessRunner
// ============================================================================

/// Records every command and answers from a script.
///
/// A rule matches when the rendered command line ("program arg1 arg2 ...")
/// starts with its prefix. Later rules win over earlier ones, so a test can
/// install broad defaults and then override single commands. Unmatched
/// commands succeed with empty output.
///
/// For `StdoutMode::File` commands the scripted stdout is written into the
/// target file, the way a real redirect would.
class FakeProcessRunner : public process::ProcessRunner {
public:
    using Effect = std::function<void(const process::Command&)>;
    using Handler = std::function<process::ProcessResult(const process::Command&)>;

    static process::ProcessResult ok(std::string out = "") {
        process::ProcessResult r;
        r.exit_code = 0;
        r.stdout_output = std::move(out);
        return r;
    }

    static process::ProcessResult fail(int code, std::string err = "") {
        process::ProcessResult r;
        r.exit_code = code;
        r.stderr_output = std::move(err);
        return r;
    }

    /// Answers every matching command with `result`.
    void on(std::string prefix, process::ProcessResult result, Effect effect = {}) {
        rules_.push_back({std::move(prefix), std::move(result), std::move(effect), {}, -1});
    }

    /// Answers the next matching command only.
    void once(std::string prefix, process::ProcessResult result, Effect effect = {}) {
        rules_.push_back({std::move(prefix), std::move(result), std::move(effect), {}, 1});
    }

    /// Computes the answer for every matching command when it runs.
    void respond(std::string prefix, Handler handler) {
        rules_.push_back({std::move(prefix), {}, {}, std::move(handler), -1});
    }

    auto run(const process::Command& cmd) -> process::ProcessResult override {
        commands.push_back(cmd);
        std::string line = render(cmd);
        lines.push_back(line);

        for (auto it = rules_.rbegin(); it != rules_.rend(); ++it) {
            if (it->remaining == 0 || !line.starts_with(it->prefix))
                continue;
            if (it->remaining > 0)
                --it->remaining;
            if (it->effect)
                it->effect(cmd);
            auto result = it->handler ? it->handler(cmd) : it->result;
            deliver(cmd, result);
            return result;
        }

        auto result = ok();
        deliver(cmd, result);
        return result;
    }

    /// Number of recorded commands whose line starts with `prefix`.
    size_t count(const std::string& prefix) const {
        size_t n = 0;
        for (const auto& l : lines) {
            if (l.starts_with(prefix))
                ++n;
        }
        return n;
    }

    bool ran(const std::string& prefix) const {
        return count(prefix) > 0;
    }

    /// Index of the first recorded line starting with `prefix`, or -1.
    int index_of(const std::string& prefix) const {
        for (size_t i = 0; i < lines.size(); ++i) {
            if (lines[i].starts_with(prefix))
                return static_cast<int>(i);
        }
        return -1;
    }

    /// The first recorded command whose line starts with `prefix`.
    const process::Command* find(const std::string& prefix) const {
        int i = index_of(prefix);
        return i < 0 ? nullptr : &commands[static_cast<size_t>(i)];
    }

    static std::string render(const process::Command& cmd) {
        std::string line = cmd.program;
        for (const auto& arg : cmd.args) {
            line += ' ';
            line += arg;
        }
        return line;
    }

    /// Value of `name` in the command's extra environment, if set.
    static std::optional<std::string> env_of(const process::Command& cmd, const std::string& name) {
        for (const auto& [key, value] : cmd.env) {
            if (key == name)
                return value;
        }
        return std::nullopt;
    }

    std::vector<process::Command> commands;
    std::vector<std::string> lines;

private:
    struct Rule {
        std::string prefix;
        process::ProcessResult result;
        Effect effect;
        Handler handler;
        int remaining;
    };

    std::vector<Rule> rules_;

    static void deliver(const process::Command& cmd, const process::ProcessResult& result) {
        if (cmd.stdout_mode == process::StdoutMode::File && !cmd.stdout_file.empty()) {
            std::ofstream out(cmd.stdout_file, std::ios::binary | std::ios::trunc);
            out << result.stdout_output;
        }
    }
};

// ============================================================================
// FakeFileSearch
// ============================================================================

class FakeFileSearch : public toolchain::FileSearch {
public:
    auto find(const fs::path& root, const std::string& name) -> std::optional<fs::path> override {
        queries.emplace_back(root, name);
        return result;
    }

    std::optional<fs::path> result;
    std::vector<std::pair<fs::path, std::string>> queries;
};

// ============================================================================
// Log Capture
// ============================================================================

/// Routes every log record into memory for the lifetime of the object.
/// The global logger gets a plain console sink at Warn afterwards.
class LogCapture {
public:
    struct Entry {
        log::LogLevel level;
        std::string module;
        std::string message;
    };

    LogCapture() {
        auto sink = std::make_unique<Sink>(entries_);
        auto& logger = log::Logger::instance();
        logger.clear_sinks();
        logger.add_sink(std::move(sink));
        logger.set_level(log::LogLevel::Trace);
    }

    ~LogCapture() {
        auto& logger = log::Logger::instance();
        logger.clear_sinks();
        logger.add_sink(std::make_unique<log::ConsoleSink>(false));
        logger.set_level(log::LogLevel::Warn);
    }

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    const std::vector<Entry>& entries() const {
        return entries_;
    }

    /// Number of records at `level` whose message contains `needle`.
    size_t count(log::LogLevel level, const std::string& needle) const {
        size_t n = 0;
        for (const auto& e : entries_) {
            if (e.level == level && e.message.find(needle) != std::string::npos)
                ++n;
        }
        return n;
    }

private:
    class Sink : public log::LogSink {
    public:
        explicit Sink(std::vector<Entry>& out) : out_(out) {}
        void write(const log::LogRecord& record) override {
            out_.push_back({record.level, std::string(record.module), record.message});
        }
        void flush() override {}

    private:
        std::vector<Entry>& out_;
    };

    std::vector<Entry> entries_;
};

// ============================================================================
// Files
// ============================================================================

/// A fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    explicit TempDir(const std::string& tag = "kmake") {
        static std::atomic<int> counter{0};
        path_ = fs::temp_directory_path() /
                (tag + "_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
        fs::remove_all(path_);
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const {
        return path_;
    }

private:
    fs::path path_;
};

inline void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

/// Moves a file's modification time `offset` away from now.
inline void set_age(const fs::path& path, std::chrono::seconds offset) {
    fs::last_write_time(path, fs::file_time_type::clock::now() + offset);
}

// ============================================================================
// Configuration
// ============================================================================

/// EnvLookup over a fixed map.
inline config::EnvLookup map_env(std::map<std::string, std::string> vars) {
    return [vars = std::move(vars)](const std::string& name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end())
            return std::nullopt;
        return it->second;
    };
}

/// A complete configuration for board "imix" rooted at `root`.
inline config::BuildConfig make_config(const fs::path& root) {
    config::BuildConfig cfg;
    cfg.platform = "imix";
    cfg.target = "thumbv7em-none-eabi";
    cfg.root_dir = root;
    cfg.board_dir = root / "boards" / "imix";
    cfg.digest_source_dir = root / "tools" / "sha256sum";
    cfg.digest_tool = root / "tools" / "sha256sum" / "target" / "debug" / "sha256sum";
    return cfg;
}

} // namespace kmake::testing
