//! # Toolchain Resolution
//!
//! Auto-detection mirrors what rustup users do by hand: the LLVM tools
//! component ships `llvm-size` and friends inside the toolchain sysroot,
//! under `lib/rustlib/<host>/bin/`, which is not on PATH.

#include "toolchain/toolchain.hpp"

#include "log/log.hpp"

#include <system_error>

namespace kmake::toolchain {

// ============================================================================
// SystemFileSearch
// ============================================================================

auto SystemFileSearch::find(const fs::path& root, const std::string& name)
    -> std::optional<fs::path> {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return std::nullopt;
    }

    std::optional<fs::path> best;
    auto it = fs::recursive_directory_iterator(
        root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return std::nullopt;
    }

    for (const auto end = fs::recursive_directory_iterator(); it != end; it.increment(ec)) {
        if (ec) {
            KMAKE_LOG_DEBUG("toolchain", "search under " << root.string() << " stopped: "
                                                         << ec.message());
            break;
        }
        if (it->path().filename() != name)
            continue;
        if (!it->is_regular_file(ec))
            continue;
        if (!best || it->path() < *best) {
            best = it->path();
        }
    }
    return best;
}

// ============================================================================
// Resolution
// ============================================================================

ToolchainFamily ToolchainFamily::parse(const std::string& selector) {
    if (selector.empty() || selector == AUTO_FAMILY) {
        return {Kind::AutoLlvm, ""};
    }
    return {Kind::Prefix, selector};
}

/// Finds the prefix for auto mode: `<dir of llvm-size>/llvm`.
static BuildResult<std::string> discover_llvm_prefix(const config::BuildConfig& cfg,
                                                     process::ProcessRunner& runner,
                                                     FileSearch& search) {
    auto cmd = process::Command::capture(cfg.rustc, {"--print", "sysroot"});
    KMAKE_LOG_DEBUG("toolchain", process::format_command(cmd));
    auto result = runner.run(cmd);

    std::string sysroot = trim(result.stdout_output);
    if (!result.success() || sysroot.empty()) {
        std::string detail = trim(result.stderr_output);
        return BuildError::discovery("cannot query " + cfg.rustc + " for its sysroot" +
                                     (detail.empty() ? std::string() : ": " + detail));
    }

    auto marker = search.find(sysroot, MARKER_TOOL);
    if (!marker) {
        return BuildError::discovery(std::string("no ") + MARKER_TOOL + " found under " +
                                     sysroot);
    }

    KMAKE_LOG_DEBUG("toolchain", "Found " << MARKER_TOOL << " at " << marker->string());
    return (marker->parent_path() / "llvm").string();
}

BuildResult<ToolchainConfig> resolve_toolchain(const config::BuildConfig& cfg,
                                               process::ProcessRunner& runner, FileSearch& search) {
    ToolchainConfig tc;
    tc.family = ToolchainFamily::parse(cfg.toolchain_family);

    const auto& ov = cfg.overrides;
    bool needs_prefix = ov.size.empty() || ov.objcopy.empty() || ov.objdump.empty();

    std::string prefix;
    if (needs_prefix) {
        if (tc.family.kind == ToolchainFamily::Kind::AutoLlvm) {
            auto discovered = discover_llvm_prefix(cfg, runner, search);
            if (is_err(discovered)) {
                return unwrap_err(discovered);
            }
            prefix = unwrap(discovered);
        } else {
            prefix = tc.family.prefix;
        }
    }

    tc.size = ov.size.empty() ? prefix + "-size" : ov.size;
    tc.objcopy = ov.objcopy.empty() ? prefix + "-objcopy" : ov.objcopy;
    tc.objdump = ov.objdump.empty() ? prefix + "-objdump" : ov.objdump;

    KMAKE_LOG_INFO("toolchain", "size=" << tc.size << " objcopy=" << tc.objcopy
                                        << " objdump=" << tc.objdump);
    return tc;
}

} // namespace kmake::toolchain
