//! # CLI Target Dispatcher
//!
//! This file implements the entry point of the kmake binary.
//!
//! ## Architecture
//!
//! ```text
//! kmake_main()
//!   ├─ --help, -h     → print_usage()
//!   ├─ --version, -V  → print_version()
//!   └─ run_target()
//!        ├─ show-target          → validate_parameters()
//!        ├─ all, release         → BuildPipeline::build(Release)
//!        ├─ debug                → BuildPipeline::build(Debug)
//!        ├─ lst, debug-lst       → BuildPipeline::build(..., listing)
//!        └─ check, doc, clean    → BuildPipeline::check/doc/clean()
//! ```
//!
//! ## Return Codes
//!
//! | Code | Meaning                                           |
//! |------|---------------------------------------------------|
//! | 0    | Success                                           |
//! | 1    | Toolchain discovery, I/O or internal failure      |
//! | 2    | Configuration error                               |
//! | N    | Exit status of the failing tool                   |

#include "cli/driver.hpp"
#include "cli/options.hpp"
#include "cli/utils.hpp"
#include "log/log.hpp"
#include "pipeline/params.hpp"
#include "pipeline/pipeline.hpp"

#include <iostream>
#include <system_error>

namespace kmake::cli {

BuildResult<Unit> run_target(Target target, const config::BuildConfig& cfg,
                             process::ProcessRunner& runner, toolchain::FileSearch& search,
                             pipeline::Sleeper sleep) {
    using pipeline::Variant;

    if (target == Target::ShowTarget) {
        auto params = pipeline::validate_parameters(cfg);
        if (is_err(params)) {
            return unwrap_err(params);
        }
        std::cout << unwrap(params).target << "\n";
        return Unit{};
    }

    pipeline::BuildPipeline pipe(cfg, runner, search, std::move(sleep));
    KMAKE_LOG_DEBUG("cli", "running target " << target_name(target));

    switch (target) {
    case Target::All:
    case Target::Release:
        return pipe.build(Variant::Release, false);
    case Target::Debug:
        return pipe.build(Variant::Debug, false);
    case Target::Lst:
        return pipe.build(Variant::Release, true);
    case Target::DebugLst:
        return pipe.build(Variant::Debug, true);
    case Target::Check:
        return pipe.check();
    case Target::Doc:
        return pipe.doc();
    case Target::Clean:
        return pipe.clean();
    case Target::ShowTarget:
        break;
    }
    return Unit{};
}

/// Reports `err` and returns the exit code it carries.
static int fail(const BuildError& err) {
    KMAKE_LOG_ERROR("cli", err.message);
    log::Logger::instance().flush();
    return err.exit_code;
}

} // namespace kmake::cli

int kmake_main(int argc, char* argv[]) {
    using namespace kmake;

    auto log_config = log::parse_log_options(argc, argv);
    log::Logger::init(log_config);

    auto parsed = cli::parse_cli_args(argc, argv);
    if (is_err(parsed)) {
        return cli::fail(unwrap_err(parsed));
    }
    const auto& opts = unwrap(parsed);

    if (opts.show_help) {
        cli::print_usage();
        return 0;
    }
    if (opts.show_version) {
        cli::print_version();
        return 0;
    }

    std::error_code ec;
    fs::path board_dir = opts.board_dir.empty() ? fs::current_path(ec) : opts.board_dir;
    if (!ec) {
        board_dir = fs::absolute(board_dir, ec);
    }
    if (ec) {
        return cli::fail(BuildError::io("cannot resolve board directory: " + ec.message()));
    }

    auto loaded = config::BuildConfig::load(board_dir, opts.manifest_path, config::system_env());
    if (is_err(loaded)) {
        return cli::fail(unwrap_err(loaded));
    }
    const auto& cfg = unwrap(loaded);

    if (cfg.verbose && !log_config.explicit_level) {
        log::Logger::instance().set_level(log::LogLevel::Info);
    }

    process::SystemProcessRunner runner;
    toolchain::SystemFileSearch search;

    auto result = cli::run_target(opts.target, cfg, runner, search);
    if (is_err(result)) {
        return cli::fail(unwrap_err(result));
    }

    log::Logger::instance().flush();
    return 0;
}
