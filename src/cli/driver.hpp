//! # Build Driver Interface
//!
//! This header defines the entry point of the kmake binary and the target
//! runner it dispatches to.
//!
//! ## Entry Point
//!
//! `kmake_main()` parses the command line, initializes logging, loads the
//! board configuration and runs one target.

#pragma once

#include "cli/options.hpp"
#include "common.hpp"
#include "config/build_config.hpp"
#include "pipeline/probe.hpp"
#include "process/process_runner.hpp"
#include "toolchain/toolchain.hpp"

namespace kmake::cli {

/// Runs `target` for the board described by `cfg`.
BuildResult<Unit> run_target(Target target, const config::BuildConfig& cfg,
                             process::ProcessRunner& runner, toolchain::FileSearch& search,
                             pipeline::Sleeper sleep = pipeline::real_sleeper());

} // namespace kmake::cli

// Main driver entry point
int kmake_main(int argc, char* argv[]);
