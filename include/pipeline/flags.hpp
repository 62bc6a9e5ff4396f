//! # Flag Assembly
//!
//! Builds the rustc flag sequence shared by every cargo invocation in a run,
//! and the objdump flag sequence used for listings.
//!
//! ## Base Sequence (fixed order)
//!
//! ```text
//! -C link-arg=-Tlayout.ld
//! -C linker=rust-lld
//! -C linker-flavor=ld.lld
//! -C relocation-model=dynamic-no-pic
//! -C link-arg=-zmax-page-size=512
//! --remap-path-prefix=<kernel root>=
//! ```
//!
//! CI runs append `-D warnings`; manifest `extra_rustflags` come last.

#ifndef KMAKE_PIPELINE_FLAGS_HPP
#define KMAKE_PIPELINE_FLAGS_HPP

#include "config/build_config.hpp"
#include "pipeline/params.hpp"

#include <string>
#include <vector>

namespace kmake::pipeline {

/// Ordered flag tokens. Order is significant to the linker.
using FlagSet = std::vector<std::string>;

/// Flags every build gets, in their required order.
FlagSet base_rustc_flags(const config::BuildConfig& cfg);

/// Base flags, then `-D warnings` when `cfg.ci`, then `cfg.extra_rustflags`.
FlagSet assemble_rustc_flags(const config::BuildConfig& cfg);

/// `--disassemble-all --source --section-headers`, plus `--arch-name=thumb`
/// for thumb targets.
FlagSet objdump_flags(const BuildParameters& params);

/// Space-joins a flag set for the RUSTFLAGS environment variable.
std::string join_flags(const FlagSet& flags);

} // namespace kmake::pipeline

#endif // KMAKE_PIPELINE_FLAGS_HPP
