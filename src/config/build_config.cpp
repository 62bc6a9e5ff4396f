//! # Build Configuration Loading
//!
//! Merges defaults < manifest < environment into a `BuildConfig`.

#include "config/build_config.hpp"

#include "log/log.hpp"

#include <cstdlib>

namespace kmake::config {

EnvLookup system_env() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (!value)
            return std::nullopt;
        return std::string(value);
    };
}

/// Applies a non-empty environment value over `slot`.
static void overlay(const EnvLookup& env, const char* name, std::string& slot) {
    auto value = env(name);
    if (value && !value->empty()) {
        KMAKE_LOG_DEBUG("config", name << " overridden from environment: " << *value);
        slot = *value;
    }
}

static bool env_flag(const EnvLookup& env, const char* name) {
    auto value = env(name);
    return value && !value->empty();
}

/// Resolves `p` against `base` and normalizes it without touching the disk.
static fs::path anchor(const fs::path& p, const fs::path& base) {
    fs::path joined = (p.is_absolute() ? p : base / p).lexically_normal();
    // "a/b/.." normalizes to "a/"; drop the empty trailing element.
    if (!joined.has_filename() && joined != joined.root_path()) {
        joined = joined.parent_path();
    }
    return joined;
}

BuildConfig BuildConfig::from_manifest(const Manifest& manifest, const fs::path& board_dir,
                                       const fs::path& manifest_dir, const EnvLookup& env) {
    BuildConfig cfg;

    cfg.platform = manifest.board.platform;
    cfg.target = manifest.board.target;

    cfg.toolchain_family = manifest.toolchain.family;
    cfg.rustc = manifest.toolchain.rustc;
    cfg.cargo = manifest.toolchain.cargo;
    cfg.rustup = manifest.toolchain.rustup;
    cfg.overrides.size = manifest.toolchain.size;
    cfg.overrides.objcopy = manifest.toolchain.objcopy;
    cfg.overrides.objdump = manifest.toolchain.objdump;

    cfg.board_dir = anchor(board_dir, fs::path());
    cfg.root_dir = anchor(manifest.build.root, manifest_dir);

    cfg.linker_script = manifest.build.linker_script;
    cfg.linker = manifest.build.linker;
    cfg.linker_flavor = manifest.build.linker_flavor;
    cfg.relocation_model = manifest.build.relocation_model;
    cfg.max_page_size = manifest.build.max_page_size;
    cfg.version_env = manifest.build.version_env;
    cfg.extra_rustflags = manifest.build.extra_rustflags;

    cfg.minimum_rustup_version = manifest.rustup.minimum_version;
    cfg.update_delay = std::chrono::milliseconds(manifest.rustup.update_delay_ms);
    cfg.components = manifest.rustup.components;

    cfg.digest_source_dir = anchor(manifest.digest.source_dir, cfg.root_dir);
    cfg.digest_tool = anchor(manifest.digest.tool, cfg.root_dir);

    // Environment wins over the manifest, like `?=` in a board Makefile.
    overlay(env, "PLATFORM", cfg.platform);
    overlay(env, "TARGET", cfg.target);
    overlay(env, "TOOLCHAIN", cfg.toolchain_family);
    overlay(env, "RUSTC", cfg.rustc);
    overlay(env, "CARGO", cfg.cargo);
    overlay(env, "RUSTUP", cfg.rustup);
    overlay(env, "SIZE", cfg.overrides.size);
    overlay(env, "OBJCOPY", cfg.overrides.objcopy);
    overlay(env, "OBJDUMP", cfg.overrides.objdump);

    cfg.ci = env_flag(env, "CI");
    cfg.verbose = env_flag(env, "V");

    return cfg;
}

BuildResult<BuildConfig> BuildConfig::load(const fs::path& board_dir,
                                           const fs::path& manifest_path, const EnvLookup& env) {
    std::error_code ec;
    fs::path board = fs::absolute(board_dir, ec);
    if (ec) {
        return BuildError::io("cannot resolve board directory " + board_dir.string() + ": " +
                              ec.message());
    }

    fs::path path = manifest_path;
    bool explicit_manifest = !path.empty();
    if (!explicit_manifest) {
        path = board / "kmake.toml";
    } else {
        path = anchor(path, board);
    }

    Manifest manifest;
    if (fs::exists(path, ec)) {
        auto loaded = Manifest::load(path);
        if (is_err(loaded)) {
            return unwrap_err(loaded);
        }
        manifest = std::move(unwrap(loaded));
    } else if (explicit_manifest) {
        return BuildError::configuration("manifest not found: " + path.string());
    } else {
        KMAKE_LOG_DEBUG("config", "No kmake.toml in " << board.string() << ", using defaults");
    }

    return from_manifest(manifest, board, path.parent_path(), env);
}

} // namespace kmake::config
