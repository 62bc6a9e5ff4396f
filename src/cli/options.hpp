//! # Command-Line Options
//!
//! `kmake [options] [target]`
//!
//! | Target        | Action                                   |
//! |---------------|------------------------------------------|
//! | `all`         | Same as `release` (default)              |
//! | `release`     | Release build, binary and digest         |
//! | `debug`       | Debug build, binary and digest           |
//! | `lst`         | `release` plus a disassembly listing     |
//! | `debug-lst`   | `debug` plus a disassembly listing       |
//! | `check`       | `cargo check` for the target             |
//! | `doc`         | `cargo doc` for the target               |
//! | `clean`       | `cargo clean`                            |
//! | `show-target` | Print the target triple                  |

#pragma once

#include "common.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

namespace kmake::cli {

enum class Target { All, Release, Debug, Lst, DebugLst, Check, Doc, Clean, ShowTarget };

/// Maps a target name to its enum value; nullopt for unknown names.
std::optional<Target> parse_target(std::string_view name);

const char* target_name(Target target);

struct CliOptions {
    Target target = Target::All;
    fs::path board_dir;     ///< Empty = current directory
    fs::path manifest_path; ///< Empty = <board_dir>/kmake.toml if present
    bool show_help = false;
    bool show_version = false;
};

/// Parses argv. Logging options are skipped here; parse_log_options()
/// consumes them. Unknown options, a missing option value, an unknown
/// target or a second target are configuration errors.
BuildResult<CliOptions> parse_cli_args(int argc, char* argv[]);

} // namespace kmake::cli
