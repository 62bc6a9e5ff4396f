//! # Build Configuration
//!
//! `BuildConfig` is the single immutable description of one kmake run. It is
//! assembled once, from built-in defaults, the board manifest and the process
//! environment (later sources win), and then passed by const reference to
//! every pipeline stage.
//!
//! ## Environment Variables
//!
//! | Variable    | Effect                                         |
//! |-------------|------------------------------------------------|
//! | `PLATFORM`  | Board/platform name (required)                 |
//! | `TARGET`    | Target triple (required)                       |
//! | `TOOLCHAIN` | Toolchain family selector (`llvm` = auto)      |
//! | `CARGO`, `RUSTUP`, `RUSTC` | Tool names or paths             |
//! | `SIZE`, `OBJCOPY`, `OBJDUMP` | Binary-utility overrides      |
//! | `CI`        | Non-empty: treat warnings as errors            |
//! | `V`         | Non-empty: verbose cargo and command echo      |

#ifndef KMAKE_CONFIG_BUILD_CONFIG_HPP
#define KMAKE_CONFIG_BUILD_CONFIG_HPP

#include "common.hpp"
#include "config/manifest.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace kmake::config {

/// Looks up an environment variable. Returns nullopt when unset.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

/// EnvLookup backed by the real process environment.
EnvLookup system_env();

/// Caller-supplied tool paths that bypass family derivation. Empty = derive.
struct ToolOverrides {
    std::string size;
    std::string objcopy;
    std::string objdump;
};

struct BuildConfig {
    // Required parameters; may be empty here, the validator rejects that.
    std::string platform;
    std::string target;

    // Tool selection
    std::string toolchain_family = "llvm";
    std::string rustc = "rustc";
    std::string cargo = "cargo";
    std::string rustup = "rustup";
    ToolOverrides overrides;

    // Locations (absolute)
    fs::path board_dir;
    fs::path root_dir;

    // Flag inputs
    std::string linker_script = "layout.ld";
    std::string linker = "rust-lld";
    std::string linker_flavor = "ld.lld";
    std::string relocation_model = "dynamic-no-pic";
    int64_t max_page_size = 512;
    std::string version_env = "TOCK_KERNEL_VERSION";
    std::vector<std::string> extra_rustflags;

    // Toolchain manager policy
    std::string minimum_rustup_version = "1.11.0";
    std::chrono::milliseconds update_delay{3000};
    std::vector<std::string> components = {"llvm-tools-preview", "rust-src"};

    // Content-digest helper
    fs::path digest_source_dir;
    fs::path digest_tool;

    // Environment toggles
    bool ci = false;
    bool verbose = false;

    /// Assemble a configuration for the board in `board_dir`.
    ///
    /// `manifest_path` may be empty, in which case `<board_dir>/kmake.toml` is
    /// used if it exists. An explicitly named manifest must exist.
    static BuildResult<BuildConfig> load(const fs::path& board_dir, const fs::path& manifest_path,
                                         const EnvLookup& env);

    /// Build a configuration from an already-parsed manifest.
    static BuildConfig from_manifest(const Manifest& manifest, const fs::path& board_dir,
                                     const fs::path& manifest_dir, const EnvLookup& env);
};

} // namespace kmake::config

#endif // KMAKE_CONFIG_BUILD_CONFIG_HPP
