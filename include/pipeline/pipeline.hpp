//! # Build Pipeline
//!
//! Drives one build variant through an explicit state machine. Each stage
//! method checks that the pipeline is in the state it expects, does its work
//! through the injected `ProcessRunner` and `FileSearch`, and either advances
//! the state or moves it to `Aborted`.
//!
//! ## States
//!
//! ```text
//! Unvalidated
//!   -> ParametersOK        validate()             PLATFORM/TARGET present
//!   -> ToolchainResolved   resolve_environment()  tools, version tag, rustup gate
//!   -> ComponentsReady     install_components()   rustup add-ons present
//!   -> FlagsAssembled      assemble_flags()       RUSTFLAGS fixed for the run
//!   -> Linked              link(variant)          cargo build + size report
//!   -> BinaryExtracted     extract_binary()       <elf>.bin up to date
//!   -> DigestComputed      compute_digest()       only if .bin was rebuilt
//!   -> Disassembled        disassemble()          <elf>.lst up to date
//!
//! any stage failure    -> Aborted (terminal)
//! ```

#ifndef KMAKE_PIPELINE_PIPELINE_HPP
#define KMAKE_PIPELINE_PIPELINE_HPP

#include "common.hpp"
#include "config/build_config.hpp"
#include "pipeline/artifacts.hpp"
#include "pipeline/flags.hpp"
#include "pipeline/params.hpp"
#include "pipeline/probe.hpp"
#include "process/process_runner.hpp"
#include "toolchain/toolchain.hpp"

#include <optional>
#include <string>
#include <vector>

namespace kmake::pipeline {

enum class PipelineState {
    Unvalidated,
    ParametersOK,
    ToolchainResolved,
    ComponentsReady,
    FlagsAssembled,
    Linked,
    BinaryExtracted,
    DigestComputed,
    Disassembled,
    Aborted
};

const char* state_name(PipelineState state);

/// True if the state machine allows moving from `from` to `to`.
bool is_valid_transition(PipelineState from, PipelineState to);

class BuildPipeline {
public:
    BuildPipeline(const config::BuildConfig& cfg, process::ProcessRunner& runner,
                  toolchain::FileSearch& search, Sleeper sleep = real_sleeper());

    BuildPipeline(const BuildPipeline&) = delete;
    BuildPipeline& operator=(const BuildPipeline&) = delete;

    // ------------------------------------------------------------------------
    // Stages
    // ------------------------------------------------------------------------

    BuildResult<Unit> validate();
    BuildResult<Unit> resolve_environment();
    BuildResult<Unit> install_components();
    BuildResult<Unit> assemble_flags();

    /// Runs validate() through assemble_flags().
    BuildResult<Unit> prepare();

    BuildResult<Unit> link(Variant variant);

    /// Regenerates the raw binary if it is missing or older than the ELF.
    BuildResult<Unit> extract_binary();

    /// Prints the digest of a freshly extracted binary. A no-op when
    /// extract_binary() found the binary up to date.
    BuildResult<Unit> compute_digest();

    BuildResult<Unit> disassemble();

    // ------------------------------------------------------------------------
    // Targets
    // ------------------------------------------------------------------------

    /// prepare, link, extract, digest and, when `listing`, disassemble.
    BuildResult<Unit> build(Variant variant, bool listing);

    /// `cargo check` for the target without producing a binary.
    BuildResult<Unit> check();

    /// `cargo doc` for the target.
    BuildResult<Unit> doc();

    /// `cargo clean`.
    BuildResult<Unit> clean();

    // ------------------------------------------------------------------------
    // Inspection
    // ------------------------------------------------------------------------

    PipelineState state() const {
        return state_;
    }

    /// Every state entered so far, starting with Unvalidated.
    const std::vector<PipelineState>& history() const {
        return history_;
    }

    const std::optional<BuildParameters>& params() const {
        return params_;
    }

    const std::optional<toolchain::ToolchainConfig>& toolchain() const {
        return toolchain_;
    }

    const std::optional<VersionInfo>& version() const {
        return version_;
    }

    const FlagSet& rustc_flags() const {
        return rustc_flags_;
    }

    const std::optional<ArtifactPaths>& artifacts() const {
        return artifacts_;
    }

    /// Digest helper output for the binary extracted in this run, if any.
    const std::optional<std::string>& digest() const {
        return digest_;
    }

    /// True if extract_binary() regenerated the binary in this run.
    bool binary_fresh() const {
        return binary_fresh_;
    }

private:
    const config::BuildConfig& cfg_;
    process::ProcessRunner& runner_;
    toolchain::FileSearch& search_;
    Sleeper sleep_;

    PipelineState state_ = PipelineState::Unvalidated;
    std::vector<PipelineState> history_;

    std::optional<BuildParameters> params_;
    std::optional<toolchain::ToolchainConfig> toolchain_;
    std::optional<VersionInfo> version_;
    FlagSet rustc_flags_;
    std::optional<ArtifactPaths> artifacts_;
    std::optional<std::string> digest_;
    bool binary_fresh_ = false;

    BuildResult<Unit> require(PipelineState expected, const char* stage) const;
    BuildResult<Unit> advance(PipelineState to);
    BuildError abort(BuildError err);

    BuildResult<toolchain::ToolchainConfig> resolve_toolchain_with_repair();

    /// Runs `cmd`; a non-zero exit becomes a Subprocess error naming `what`.
    BuildResult<process::ProcessResult> run_checked(const process::Command& cmd,
                                                    const std::string& what);

    /// A cargo invocation in the board directory with RUSTFLAGS and the
    /// kernel version in its environment.
    process::Command cargo_command(const std::string& subcommand,
                                   std::vector<std::string> args) const;

    BuildResult<Unit> ensure_digest_tool();
    BuildResult<Unit> run_cargo_target(const std::string& subcommand,
                                       std::vector<std::string> args);
};

} // namespace kmake::pipeline

#endif // KMAKE_PIPELINE_PIPELINE_HPP
