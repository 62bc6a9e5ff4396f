//! # Toolchain Component Installer
//!
//! Makes sure the rustup add-ons the kernel build relies on are present
//! before cargo is ever invoked: the configured components (LLVM tools and
//! standard-library sources by default) and the target's standard library.
//!
//! ## Detection
//!
//! `rustup component list` and `rustup target list` print one entry per line
//! and mark installed ones with ` (installed)`:
//!
//! ```text
//! rust-src (installed)
//! llvm-tools-x86_64-unknown-linux-gnu (installed)
//! thumbv7em-none-eabi (installed)
//! ```
//!
//! An entry may carry the host triple as a suffix. Components that rustup
//! renamed when they left preview (`llvm-tools-preview` is now
//! `llvm-tools`) are listed under the new name, so `X-preview` also matches
//! an installed `X`.

#ifndef KMAKE_TOOLCHAIN_COMPONENTS_HPP
#define KMAKE_TOOLCHAIN_COMPONENTS_HPP

#include "common.hpp"
#include "process/process_runner.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace kmake::toolchain {

/// What kind of rustup add-on an entry is; selects list/add subcommands.
enum class AddOnKind { Component, Target };

struct AddOn {
    AddOnKind kind;
    std::string name;
};

/// Outcome of one ensure_installed() call, for reporting and tests.
struct InstallReport {
    std::vector<std::string> already_installed;
    std::vector<std::string> newly_installed;
};

/// Returns true if `listing` has a line for `name` marked "(installed)".
/// Component lines may carry a host-triple suffix after the name.
bool listing_shows_installed(std::string_view listing, std::string_view name);

class ComponentInstaller {
public:
    ComponentInstaller(process::ProcessRunner& runner, std::string rustup);

    /// Installs every add-on that is missing, in order. Stops at the first
    /// failed install with a Subprocess error carrying rustup's exit code.
    BuildResult<InstallReport> ensure_installed(const std::vector<AddOn>& addons);

    /// The default add-on set: every configured component, then the target.
    static std::vector<AddOn> required_addons(const std::vector<std::string>& components,
                                              const std::string& target);

private:
    process::ProcessRunner& runner_;
    std::string rustup_;

    bool is_installed(const AddOn& addon);
    BuildResult<Unit> install(const AddOn& addon);
};

} // namespace kmake::toolchain

#endif // KMAKE_TOOLCHAIN_COMPONENTS_HPP
