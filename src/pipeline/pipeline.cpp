//! # Build Pipeline Implementation
//!
//! Every stage follows the same shape: `require()` the expected state, do the
//! work, then `advance()` on success or `abort()` on failure. A failed tool's
//! own output is the diagnostic; the pipeline adds one line naming the step.
//!
//! Partial outputs are removed when the step producing them fails, so the
//! next run regenerates them instead of trusting a truncated file.

#include "pipeline/pipeline.hpp"

#include "log/log.hpp"
#include "toolchain/components.hpp"

#include <algorithm>
#include <iostream>
#include <iterator>
#include <system_error>

namespace kmake::pipeline {

// ============================================================================
// State Machine
// ============================================================================

const char* state_name(PipelineState state) {
    switch (state) {
    case PipelineState::Unvalidated:
        return "Unvalidated";
    case PipelineState::ParametersOK:
        return "ParametersOK";
    case PipelineState::ToolchainResolved:
        return "ToolchainResolved";
    case PipelineState::ComponentsReady:
        return "ComponentsReady";
    case PipelineState::FlagsAssembled:
        return "FlagsAssembled";
    case PipelineState::Linked:
        return "Linked";
    case PipelineState::BinaryExtracted:
        return "BinaryExtracted";
    case PipelineState::DigestComputed:
        return "DigestComputed";
    case PipelineState::Disassembled:
        return "Disassembled";
    case PipelineState::Aborted:
        return "Aborted";
    }
    return "Unknown";
}

bool is_valid_transition(PipelineState from, PipelineState to) {
    using S = PipelineState;

    if (from == S::Aborted)
        return false;
    if (to == S::Aborted)
        return true;

    switch (from) {
    case S::Unvalidated:
        return to == S::ParametersOK;
    case S::ParametersOK:
        return to == S::ToolchainResolved;
    case S::ToolchainResolved:
        return to == S::ComponentsReady;
    case S::ComponentsReady:
        return to == S::FlagsAssembled;
    case S::FlagsAssembled:
        return to == S::Linked;
    case S::Linked:
        return to == S::BinaryExtracted;
    case S::BinaryExtracted:
        return to == S::DigestComputed || to == S::Disassembled;
    case S::DigestComputed:
        return to == S::Disassembled;
    case S::Disassembled:
    case S::Aborted:
        return false;
    }
    return false;
}

// ============================================================================
// BuildPipeline
// ============================================================================

BuildPipeline::BuildPipeline(const config::BuildConfig& cfg, process::ProcessRunner& runner,
                             toolchain::FileSearch& search, Sleeper sleep)
    : cfg_(cfg), runner_(runner), search_(search), sleep_(std::move(sleep)) {
    history_.push_back(state_);
}

BuildResult<Unit> BuildPipeline::require(PipelineState expected, const char* stage) const {
    if (state_ == PipelineState::Aborted) {
        return BuildError::invalid_state(std::string(stage) +
                                         " not run: the pipeline has already aborted");
    }
    if (state_ != expected) {
        return BuildError::invalid_state(std::string(stage) + " requires state " +
                                         state_name(expected) + ", pipeline is " +
                                         state_name(state_));
    }
    return Unit{};
}

BuildResult<Unit> BuildPipeline::advance(PipelineState to) {
    if (!is_valid_transition(state_, to)) {
        return BuildError::invalid_state(std::string("illegal transition ") +
                                         state_name(state_) + " -> " + state_name(to));
    }
    KMAKE_LOG_DEBUG("build", state_name(state_) << " -> " << state_name(to));
    state_ = to;
    history_.push_back(to);
    return Unit{};
}

BuildError BuildPipeline::abort(BuildError err) {
    KMAKE_LOG_DEBUG("build", state_name(state_) << " -> Aborted: " << err.message);
    state_ = PipelineState::Aborted;
    history_.push_back(state_);
    return err;
}

BuildResult<process::ProcessResult> BuildPipeline::run_checked(const process::Command& cmd,
                                                               const std::string& what) {
    if (cfg_.verbose) {
        KMAKE_LOG_INFO("build", process::format_command(cmd));
    } else {
        KMAKE_LOG_DEBUG("build", process::format_command(cmd));
    }

    auto result = runner_.run(cmd);
    if (!result.success()) {
        std::string message = what + " failed (exit " + std::to_string(result.exit_code) + ")";
        // Spawn failures never reach the tool, so the only diagnostic is ours.
        if (result.exit_code < 0 && !result.stderr_output.empty()) {
            message += ": " + trim(result.stderr_output);
        }
        return BuildError::subprocess(message, result.exit_code);
    }
    return result;
}

process::Command BuildPipeline::cargo_command(const std::string& subcommand,
                                              std::vector<std::string> args) const {
    auto cmd = process::Command::passthrough(cfg_.cargo, {subcommand});
    if (cfg_.verbose) {
        cmd.args.push_back("-v");
    }
    cmd.args.insert(cmd.args.end(), std::make_move_iterator(args.begin()),
                    std::make_move_iterator(args.end()));

    cmd.env.emplace_back("RUSTFLAGS", join_flags(rustc_flags_));
    if (version_ && !cfg_.version_env.empty()) {
        cmd.env.emplace_back(cfg_.version_env, version_->kernel_version);
    }
    cmd.cwd = cfg_.board_dir;
    return cmd;
}

// ----------------------------------------------------------------------------
// Preparation stages
// ----------------------------------------------------------------------------

BuildResult<Unit> BuildPipeline::validate() {
    if (auto ok = require(PipelineState::Unvalidated, "validate"); is_err(ok))
        return ok;

    auto params = validate_parameters(cfg_);
    if (is_err(params)) {
        return abort(unwrap_err(params));
    }
    params_ = unwrap(params);
    return advance(PipelineState::ParametersOK);
}

BuildResult<toolchain::ToolchainConfig> BuildPipeline::resolve_toolchain_with_repair() {
    auto resolved = toolchain::resolve_toolchain(cfg_, runner_, search_);
    if (is_ok(resolved) || unwrap_err(resolved).kind != ErrorKind::ToolchainDiscovery) {
        return resolved;
    }

    // The marker tool ships with the LLVM tools component; on a fresh
    // toolchain it is simply not installed yet.
    auto family = toolchain::ToolchainFamily::parse(cfg_.toolchain_family);
    auto llvm_tools = std::find_if(cfg_.components.begin(), cfg_.components.end(),
                                   [](const std::string& c) { return c.starts_with("llvm-tools"); });
    if (family.kind != toolchain::ToolchainFamily::Kind::AutoLlvm ||
        llvm_tools == cfg_.components.end()) {
        return resolved;
    }

    KMAKE_LOG_INFO("toolchain", unwrap_err(resolved).message << "; ensuring " << *llvm_tools
                                                             << " is installed");
    toolchain::ComponentInstaller installer(runner_, cfg_.rustup);
    auto installed =
        installer.ensure_installed({{toolchain::AddOnKind::Component, *llvm_tools}});
    if (is_err(installed) || unwrap(installed).newly_installed.empty()) {
        return resolved;
    }

    return toolchain::resolve_toolchain(cfg_, runner_, search_);
}

BuildResult<Unit> BuildPipeline::resolve_environment() {
    if (auto ok = require(PipelineState::ParametersOK, "resolve_environment"); is_err(ok))
        return ok;

    check_manager_version(cfg_, runner_, sleep_);
    version_ = probe_kernel_version(cfg_, runner_);

    auto tc = resolve_toolchain_with_repair();
    if (is_err(tc)) {
        return abort(unwrap_err(tc));
    }
    toolchain_ = unwrap(tc);
    return advance(PipelineState::ToolchainResolved);
}

BuildResult<Unit> BuildPipeline::install_components() {
    if (auto ok = require(PipelineState::ToolchainResolved, "install_components"); is_err(ok))
        return ok;

    toolchain::ComponentInstaller installer(runner_, cfg_.rustup);
    auto report = installer.ensure_installed(
        toolchain::ComponentInstaller::required_addons(cfg_.components, params_->target));
    if (is_err(report)) {
        return abort(unwrap_err(report));
    }

    for (const auto& name : unwrap(report).newly_installed) {
        KMAKE_LOG_INFO("components", "installed " << name);
    }
    return advance(PipelineState::ComponentsReady);
}

BuildResult<Unit> BuildPipeline::assemble_flags() {
    if (auto ok = require(PipelineState::ComponentsReady, "assemble_flags"); is_err(ok))
        return ok;

    rustc_flags_ = assemble_rustc_flags(cfg_);
    return advance(PipelineState::FlagsAssembled);
}

BuildResult<Unit> BuildPipeline::prepare() {
    if (auto r = validate(); is_err(r))
        return r;
    if (auto r = resolve_environment(); is_err(r))
        return r;
    if (auto r = install_components(); is_err(r))
        return r;
    return assemble_flags();
}

// ----------------------------------------------------------------------------
// Build stages
// ----------------------------------------------------------------------------

BuildResult<Unit> BuildPipeline::link(Variant variant) {
    if (auto ok = require(PipelineState::FlagsAssembled, "link"); is_err(ok))
        return ok;

    artifacts_ = ArtifactPaths::for_variant(cfg_, *params_, variant);

    std::vector<std::string> args = {"--target=" + params_->target};
    if (variant == Variant::Release) {
        args.push_back("--release");
    }

    auto built = run_checked(cargo_command("build", std::move(args)), "cargo build");
    if (is_err(built)) {
        return abort(unwrap_err(built));
    }

    std::error_code ec;
    if (!fs::exists(artifacts_->elf, ec)) {
        return abort(BuildError::io("cargo build did not produce " + artifacts_->elf.string()));
    }

    auto size = process::Command::passthrough(toolchain_->size, {artifacts_->elf.string()});
    auto sized = run_checked(size, toolchain_->size);
    if (is_err(sized)) {
        return abort(unwrap_err(sized));
    }

    return advance(PipelineState::Linked);
}

BuildResult<Unit> BuildPipeline::extract_binary() {
    if (auto ok = require(PipelineState::Linked, "extract_binary"); is_err(ok))
        return ok;

    const auto& paths = *artifacts_;
    binary_fresh_ = false;

    if (!needs_rebuild(paths.bin, paths.elf)) {
        KMAKE_LOG_DEBUG("build", paths.bin.string() << " is up to date");
        return advance(PipelineState::BinaryExtracted);
    }

    auto cmd = process::Command::passthrough(
        toolchain_->objcopy, {"--output-target=binary", paths.elf.string(), paths.bin.string()});
    auto copied = run_checked(cmd, toolchain_->objcopy);
    if (is_err(copied)) {
        std::error_code ec;
        fs::remove(paths.bin, ec);
        return abort(unwrap_err(copied));
    }

    binary_fresh_ = true;
    return advance(PipelineState::BinaryExtracted);
}

BuildResult<Unit> BuildPipeline::ensure_digest_tool() {
    std::error_code ec;
    if (fs::exists(cfg_.digest_tool, ec)) {
        return Unit{};
    }

    KMAKE_LOG_INFO("build", "Building digest helper in " << cfg_.digest_source_dir.string());
    auto cmd = process::Command::passthrough(cfg_.cargo, {"build"});
    if (cfg_.verbose) {
        cmd.args.push_back("-v");
    }
    cmd.cwd = cfg_.digest_source_dir;

    auto built = run_checked(cmd, "building digest helper");
    if (is_err(built)) {
        return unwrap_err(built);
    }

    if (!fs::exists(cfg_.digest_tool, ec)) {
        return BuildError::io("digest helper build did not produce " +
                              cfg_.digest_tool.string());
    }
    return Unit{};
}

BuildResult<Unit> BuildPipeline::compute_digest() {
    if (auto ok = require(PipelineState::BinaryExtracted, "compute_digest"); is_err(ok))
        return ok;

    if (!binary_fresh_) {
        return Unit{};
    }

    const auto& bin = artifacts_->bin;

    // Without a digest the fresh binary is incomplete; drop it so the next
    // run extracts and hashes it again.
    auto discard_binary = [&bin]() {
        std::error_code ec;
        fs::remove(bin, ec);
    };

    if (auto tool = ensure_digest_tool(); is_err(tool)) {
        discard_binary();
        return abort(unwrap_err(tool));
    }

    process::Command cmd;
    cmd.program = cfg_.digest_tool.string();
    cmd.args = {bin.string()};
    cmd.stdout_mode = process::StdoutMode::Capture;

    auto hashed = run_checked(cmd, "digest helper");
    if (is_err(hashed)) {
        discard_binary();
        return abort(unwrap_err(hashed));
    }

    digest_ = trim(unwrap(hashed).stdout_output);
    std::cout << *digest_ << "\n";
    std::cout.flush();

    return advance(PipelineState::DigestComputed);
}

BuildResult<Unit> BuildPipeline::disassemble() {
    // The digest stage is skipped when the binary was already up to date.
    if (state_ != PipelineState::DigestComputed) {
        if (auto ok = require(PipelineState::BinaryExtracted, "disassemble"); is_err(ok))
            return ok;
    }

    const auto& paths = *artifacts_;
    if (!needs_rebuild(paths.lst, paths.elf)) {
        KMAKE_LOG_DEBUG("build", paths.lst.string() << " is up to date");
        return advance(PipelineState::Disassembled);
    }

    auto cmd = process::Command::passthrough(toolchain_->objdump, objdump_flags(*params_));
    cmd.args.push_back(paths.elf.string());
    cmd.stdout_mode = process::StdoutMode::File;
    cmd.stdout_file = paths.lst;

    auto dumped = run_checked(cmd, toolchain_->objdump);
    if (is_err(dumped)) {
        std::error_code ec;
        fs::remove(paths.lst, ec);
        return abort(unwrap_err(dumped));
    }

    return advance(PipelineState::Disassembled);
}

// ----------------------------------------------------------------------------
// Targets
// ----------------------------------------------------------------------------

BuildResult<Unit> BuildPipeline::build(Variant variant, bool listing) {
    if (auto r = prepare(); is_err(r))
        return r;
    if (auto r = link(variant); is_err(r))
        return r;
    if (auto r = extract_binary(); is_err(r))
        return r;
    if (auto r = compute_digest(); is_err(r))
        return r;
    if (listing) {
        return disassemble();
    }
    return Unit{};
}

BuildResult<Unit> BuildPipeline::run_cargo_target(const std::string& subcommand,
                                                  std::vector<std::string> args) {
    if (auto r = prepare(); is_err(r))
        return r;

    auto ran = run_checked(cargo_command(subcommand, std::move(args)), "cargo " + subcommand);
    if (is_err(ran)) {
        return abort(unwrap_err(ran));
    }
    return Unit{};
}

BuildResult<Unit> BuildPipeline::check() {
    return run_cargo_target("check", {"--target=" + cfg_.target, "--release"});
}

BuildResult<Unit> BuildPipeline::doc() {
    return run_cargo_target("doc", {"--release", "--target=" + cfg_.target});
}

BuildResult<Unit> BuildPipeline::clean() {
    return run_cargo_target("clean", {});
}

} // namespace kmake::pipeline
