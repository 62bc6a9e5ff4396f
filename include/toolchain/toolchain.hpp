//! # Toolchain Resolution
//!
//! Derives the three binary utilities the build driver needs (size reporter,
//! object copier, disassembler) from a toolchain family selector.
//!
//! ## Families
//!
//! | Selector        | Resolution                                           |
//! |-----------------|------------------------------------------------------|
//! | `llvm`          | Ask `rustc --print sysroot`, find `llvm-size` in it, |
//! |                 | use `<its directory>/llvm` as the prefix             |
//! | anything else   | Used verbatim as the prefix (`arm-none-eabi`, ...)   |
//!
//! Tools are then `<prefix>-size`, `<prefix>-objcopy`, `<prefix>-objdump`,
//! except where an override is configured; overrides are used verbatim.

#ifndef KMAKE_TOOLCHAIN_TOOLCHAIN_HPP
#define KMAKE_TOOLCHAIN_TOOLCHAIN_HPP

#include "common.hpp"
#include "config/build_config.hpp"
#include "process/process_runner.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace fs = std::filesystem;

namespace kmake::toolchain {

/// Selector value that requests auto-detection from the active rustc.
constexpr const char* AUTO_FAMILY = "llvm";

/// Tool searched for under the compiler's sysroot in auto-detect mode.
constexpr const char* MARKER_TOOL = "llvm-size";

// ============================================================================
// File Search
// ============================================================================

/// Locates a file by name below a root directory.
class FileSearch {
public:
    virtual ~FileSearch() = default;

    /// Returns the first match for `name` under `root`, or nullopt.
    virtual auto find(const fs::path& root, const std::string& name) -> std::optional<fs::path> = 0;
};

/// Recursive directory walk. When several files match, the lexicographically
/// smallest path wins so the result does not depend on directory order.
class SystemFileSearch : public FileSearch {
public:
    auto find(const fs::path& root, const std::string& name) -> std::optional<fs::path> override;
};

// ============================================================================
// Toolchain Configuration
// ============================================================================

struct ToolchainFamily {
    enum class Kind { AutoLlvm, Prefix };

    Kind kind = Kind::AutoLlvm;
    std::string prefix; ///< Only meaningful for Kind::Prefix

    /// `llvm` (or empty) selects auto-detection; anything else is a prefix.
    static ToolchainFamily parse(const std::string& selector);

    bool operator==(const ToolchainFamily&) const = default;
};

/// Resolved tool invocation names for the rest of the run.
struct ToolchainConfig {
    ToolchainFamily family;
    std::string size;
    std::string objcopy;
    std::string objdump;

    bool operator==(const ToolchainConfig&) const = default;
};

/// Resolves the binary utilities for `cfg`.
///
/// Auto-detect mode runs `<rustc> --print sysroot` through `runner` and looks
/// for MARKER_TOOL through `search`; it fails with a ToolchainDiscovery error
/// if either step comes up empty. No query is made when all three tools are
/// overridden.
BuildResult<ToolchainConfig> resolve_toolchain(const config::BuildConfig& cfg,
                                               process::ProcessRunner& runner, FileSearch& search);

} // namespace kmake::toolchain

#endif // KMAKE_TOOLCHAIN_TOOLCHAIN_HPP
