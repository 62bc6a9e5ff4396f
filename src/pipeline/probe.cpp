#include "pipeline/probe.hpp"

#include "log/log.hpp"

#include <thread>

namespace kmake::pipeline {

Sleeper real_sleeper() {
    return [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
}

VersionInfo probe_kernel_version(const config::BuildConfig& cfg, process::ProcessRunner& runner) {
    auto cmd = process::Command::capture("git", {"describe", "--tags", "--always"});
    cmd.cwd = cfg.root_dir;

    auto result = runner.run(cmd);
    std::string tag = trim(result.stdout_output);

    if (!result.success() || tag.empty()) {
        KMAKE_LOG_DEBUG("probe", "git describe unavailable (exit " << result.exit_code
                                                                   << "), using "
                                                                   << FALLBACK_KERNEL_VERSION);
        return {FALLBACK_KERNEL_VERSION};
    }

    // describe prints a single line; keep only the first in case of noise.
    if (auto nl = tag.find('\n'); nl != std::string::npos) {
        tag = trim(tag.substr(0, nl));
    }

    KMAKE_LOG_DEBUG("probe", "kernel version " << tag);
    return {tag};
}

ManagerCheck check_manager_version(const config::BuildConfig& cfg, process::ProcessRunner& runner,
                                   const Sleeper& sleep) {
    ManagerCheck check;

    auto minimum = toolchain::SemVer::parse(cfg.minimum_rustup_version);
    if (!minimum) {
        KMAKE_LOG_WARN("probe", "ignoring unparsable minimum version \""
                                    << cfg.minimum_rustup_version << "\"");
        return check;
    }
    check.minimum = *minimum;

    auto result = runner.run(process::Command::capture(cfg.rustup, {"--version"}));
    if (result.success()) {
        check.installed = toolchain::parse_tool_version(result.stdout_output);
    }
    if (!check.installed) {
        KMAKE_LOG_WARN("probe", "could not determine the version of \"" << cfg.rustup << "\"");
        return check;
    }

    if (!(*check.installed < check.minimum)) {
        KMAKE_LOG_DEBUG("probe", cfg.rustup << " " << check.installed->to_string() << " >= "
                                            << check.minimum.to_string());
        return check;
    }

    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(cfg.update_delay).count();
    KMAKE_LOG_WARN("probe", "Required tool \"" << cfg.rustup << "\" is out-of-date.");
    KMAKE_LOG_WARN("probe", "Running \"" << cfg.rustup << " update\" in " << seconds
                                         << " seconds (ctrl-c to cancel)");
    sleep(cfg.update_delay);

    check.update_triggered = true;
    auto update = runner.run(process::Command::passthrough(cfg.rustup, {"update"}));
    check.update_succeeded = update.success();
    if (!check.update_succeeded) {
        KMAKE_LOG_WARN("probe", "\"" << cfg.rustup << " update\" exited with " << update.exit_code
                                     << "; continuing with the installed version");
    }

    return check;
}

} // namespace kmake::pipeline
