//! # Environment Probing
//!
//! Two checks run once per invocation before any component is installed:
//!
//! - **Version tag**: `git describe --tags --always` in the kernel root,
//!   falling back to `FALLBACK_KERNEL_VERSION` outside a repository. The tag
//!   reaches the kernel through an environment variable on the cargo call.
//! - **Manager version gate**: if `rustup --version` is older than the
//!   configured minimum, warn, wait, and run `rustup update`. The gate never
//!   fails the build.

#ifndef KMAKE_PIPELINE_PROBE_HPP
#define KMAKE_PIPELINE_PROBE_HPP

#include "config/build_config.hpp"
#include "process/process_runner.hpp"
#include "toolchain/semver.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace kmake::pipeline {

/// Version string used when version-control metadata is unavailable.
constexpr const char* FALLBACK_KERNEL_VERSION = "1.4+";

struct VersionInfo {
    std::string kernel_version;
};

/// Blocks for the given duration. Injected so tests do not sleep.
using Sleeper = std::function<void(std::chrono::milliseconds)>;

/// Sleeper backed by std::this_thread::sleep_for.
Sleeper real_sleeper();

/// Computes the kernel version tag; never fails.
VersionInfo probe_kernel_version(const config::BuildConfig& cfg, process::ProcessRunner& runner);

/// What the manager version gate observed and did.
struct ManagerCheck {
    std::optional<toolchain::SemVer> installed; ///< nullopt if the query failed
    toolchain::SemVer minimum;
    bool update_triggered = false;
    bool update_succeeded = false;
};

/// Enforces the minimum rustup version. Outdated managers are updated after
/// a warning and `cfg.update_delay`; the result is not re-verified.
ManagerCheck check_manager_version(const config::BuildConfig& cfg, process::ProcessRunner& runner,
                                   const Sleeper& sleep);

} // namespace kmake::pipeline

#endif // KMAKE_PIPELINE_PROBE_HPP
