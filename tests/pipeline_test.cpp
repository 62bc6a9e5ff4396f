//! # Build Pipeline Tests
//!
//! Drives `BuildPipeline` end to end against a scripted process runner and
//! a scratch kernel tree. Cargo, the binary utilities and the digest helper
//! are simulated by rules that create the files the real tools would.

#include "pipeline/pipeline.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <gtest/gtest.h>

using namespace kmake;
using namespace kmake::pipeline;
using kmake::testing::FakeFileSearch;
using kmake::testing::FakeProcessRunner;
using kmake::testing::LogCapture;
using kmake::testing::make_config;
using kmake::testing::read_file;
using kmake::testing::set_age;
using kmake::testing::TempDir;
using kmake::testing::write_file;
using S = PipelineState;

namespace {

constexpr const char* LLVM_SIZE = "/sysroot/lib/rustlib/x86_64-unknown-linux-gnu/bin/llvm-size";
constexpr const char* LLVM_PREFIX = "/sysroot/lib/rustlib/x86_64-unknown-linux-gnu/bin/llvm";
constexpr const char* DIGEST = "9f86d081884c7d659a2feaa0c55ad015a3bf4f1b2b0b822cd15d6c15b0f00a08";

} // namespace

class PipelineTest : public ::testing::Test {
protected:
    TempDir root{"kmake_pipeline"};
    config::BuildConfig cfg = make_config(root.path());
    FakeProcessRunner runner;
    FakeFileSearch search;
    std::vector<std::chrono::milliseconds> sleeps;
    Sleeper sleeper = [this](std::chrono::milliseconds d) { sleeps.push_back(d); };

    std::string size_tool = std::string(LLVM_PREFIX) + "-size";
    std::string objcopy_tool = std::string(LLVM_PREFIX) + "-objcopy";
    std::string objdump_tool = std::string(LLVM_PREFIX) + "-objdump";

    void SetUp() override {
        fs::create_directories(cfg.board_dir);
        write_file(cfg.digest_tool, "#!/bin/sh\n");

        runner.on("rustup --version",
                  FakeProcessRunner::ok("rustup 1.27.1 (54dd3d00f 2024-04-24)\n"));
        runner.on("git describe", FakeProcessRunner::ok("release-2.1-42-gdeadbee\n"));
        runner.on("rustc --print sysroot", FakeProcessRunner::ok("/sysroot\n"));
        search.result = fs::path(LLVM_SIZE);
        runner.on("rustup component list",
                  FakeProcessRunner::ok("llvm-tools-x86_64-unknown-linux-gnu (installed)\n"
                                        "llvm-tools-preview-x86_64-unknown-linux-gnu (installed)\n"
                                        "rust-src (installed)\n"));
        runner.on("rustup target list", FakeProcessRunner::ok("thumbv7em-none-eabi (installed)\n"));

        // cargo leaves an existing, unchanged ELF alone.
        runner.on("cargo build", FakeProcessRunner::ok(), [this](const process::Command& cmd) {
            if (cmd.cwd == cfg.digest_source_dir) {
                write_file(cfg.digest_tool, "#!/bin/sh\n");
                return;
            }
            auto elf = elf_path(cmd);
            if (!fs::exists(elf))
                write_file(elf, "\x7f" "ELF");
        });
        runner.on(size_tool, FakeProcessRunner::ok());
        runner.on(objcopy_tool, FakeProcessRunner::ok(),
                  [](const process::Command& cmd) { write_file(cmd.args.back(), "raw image"); });
        runner.on(cfg.digest_tool.string(),
                  FakeProcessRunner::ok(std::string(DIGEST) + "  imix.bin\n"));
        runner.on(objdump_tool, FakeProcessRunner::ok("imix:\tfile format elf32-littlearm\n"));
    }

    fs::path elf_path(const process::Command& cmd) const {
        bool release = std::find(cmd.args.begin(), cmd.args.end(), "--release") != cmd.args.end();
        return cfg.board_dir / "target" / cfg.target / (release ? "release" : "debug") /
               cfg.platform;
    }

    ArtifactPaths release_paths() const {
        return ArtifactPaths::for_variant(cfg, {cfg.platform, cfg.target}, Variant::Release);
    }

    BuildResult<Unit> build(Variant variant = Variant::Release, bool listing = false) {
        BuildPipeline pipe(cfg, runner, search, sleeper);
        auto result = pipe.build(variant, listing);
        last_history = pipe.history();
        last_digest = pipe.digest();
        last_fresh = pipe.binary_fresh();
        return result;
    }

    std::vector<PipelineState> last_history;
    std::optional<std::string> last_digest;
    bool last_fresh = false;
};

// ============================================================================
// Successful builds
// ============================================================================

TEST_F(PipelineTest, ReleaseBuildWalksEveryState) {
    BuildPipeline pipe(cfg, runner, search, sleeper);
    auto result = pipe.build(Variant::Release, false);
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).message;

    EXPECT_EQ(pipe.state(), S::DigestComputed);
    EXPECT_EQ(pipe.history(),
              (std::vector<S>{S::Unvalidated, S::ParametersOK, S::ToolchainResolved,
                              S::ComponentsReady, S::FlagsAssembled, S::Linked,
                              S::BinaryExtracted, S::DigestComputed}));

    ASSERT_TRUE(pipe.version().has_value());
    EXPECT_EQ(pipe.version()->kernel_version, "release-2.1-42-gdeadbee");
    ASSERT_TRUE(pipe.toolchain().has_value());
    EXPECT_EQ(pipe.toolchain()->objcopy, objcopy_tool);
    ASSERT_TRUE(pipe.digest().has_value());
    EXPECT_EQ(*pipe.digest(), std::string(DIGEST) + "  imix.bin");
    EXPECT_TRUE(pipe.binary_fresh());

    auto paths = release_paths();
    EXPECT_TRUE(fs::exists(paths.elf));
    EXPECT_EQ(read_file(paths.bin), "raw image");
    EXPECT_FALSE(fs::exists(paths.lst));
}

TEST_F(PipelineTest, CargoInvocationCarriesFlagsAndVersion) {
    ASSERT_TRUE(is_ok(build()));

    const auto* cargo = runner.find("cargo build --target=");
    ASSERT_NE(cargo, nullptr);
    EXPECT_EQ(cargo->args,
              (std::vector<std::string>{"build", "--target=thumbv7em-none-eabi", "--release"}));
    EXPECT_EQ(cargo->cwd, cfg.board_dir);
    EXPECT_EQ(cargo->stdout_mode, process::StdoutMode::Inherit);

    auto rustflags = FakeProcessRunner::env_of(*cargo, "RUSTFLAGS");
    ASSERT_TRUE(rustflags.has_value());
    EXPECT_EQ(*rustflags, join_flags(assemble_rustc_flags(cfg)));
    EXPECT_EQ(FakeProcessRunner::env_of(*cargo, "TOCK_KERNEL_VERSION"), "release-2.1-42-gdeadbee");
}

TEST_F(PipelineTest, StepsRunInOrder) {
    ASSERT_TRUE(is_ok(build()));

    int gate = runner.index_of("rustup --version");
    int version = runner.index_of("git describe");
    int sysroot = runner.index_of("rustc --print sysroot");
    int components = runner.index_of("rustup component list");
    int cargo = runner.index_of("cargo build");
    int size = runner.index_of(size_tool);
    int objcopy = runner.index_of(objcopy_tool);
    int digest = runner.index_of(cfg.digest_tool.string());

    EXPECT_LT(gate, version);
    EXPECT_LT(version, sysroot);
    EXPECT_LT(sysroot, components);
    EXPECT_LT(components, cargo);
    EXPECT_LT(cargo, size);
    EXPECT_LT(size, objcopy);
    EXPECT_LT(objcopy, digest);

    const auto* objcopy_cmd = runner.find(objcopy_tool);
    auto paths = release_paths();
    EXPECT_EQ(objcopy_cmd->args, (std::vector<std::string>{"--output-target=binary",
                                                           paths.elf.string(), paths.bin.string()}));
    EXPECT_EQ(runner.find(size_tool)->args, std::vector<std::string>{paths.elf.string()});
    EXPECT_EQ(runner.find(cfg.digest_tool.string())->args,
              std::vector<std::string>{paths.bin.string()});
}

TEST_F(PipelineTest, ListingForThumbTarget) {
    ASSERT_TRUE(is_ok(build(Variant::Release, true)));
    EXPECT_EQ(last_history.back(), S::Disassembled);

    const auto* objdump = runner.find(objdump_tool);
    ASSERT_NE(objdump, nullptr);
    auto paths = release_paths();
    EXPECT_EQ(objdump->args,
              (std::vector<std::string>{"--disassemble-all", "--source", "--section-headers",
                                        "--arch-name=thumb", paths.elf.string()}));
    EXPECT_EQ(objdump->stdout_mode, process::StdoutMode::File);
    EXPECT_EQ(objdump->stdout_file, paths.lst);
    EXPECT_EQ(read_file(paths.lst), "imix:\tfile format elf32-littlearm\n");
}

TEST_F(PipelineTest, DebugVariant) {
    ASSERT_TRUE(is_ok(build(Variant::Debug, false)));

    const auto* cargo = runner.find("cargo build --target=");
    ASSERT_NE(cargo, nullptr);
    EXPECT_EQ(cargo->args, (std::vector<std::string>{"build", "--target=thumbv7em-none-eabi"}));
    EXPECT_TRUE(fs::exists(cfg.board_dir / "target/thumbv7em-none-eabi/debug/imix.bin"));
    EXPECT_FALSE(fs::exists(release_paths().bin));
}

TEST_F(PipelineTest, VerboseAndCi) {
    cfg.verbose = true;
    cfg.ci = true;
    LogCapture capture;

    ASSERT_TRUE(is_ok(build()));

    const auto* cargo = runner.find("cargo build");
    ASSERT_NE(cargo, nullptr);
    EXPECT_EQ(cargo->args[1], "-v");
    EXPECT_NE(FakeProcessRunner::env_of(*cargo, "RUSTFLAGS")->find("-D warnings"),
              std::string::npos);
    EXPECT_GE(capture.count(log::LogLevel::Info, "cargo build -v"), 1u);
}

TEST_F(PipelineTest, PrefixFamilySkipsSysrootQuery) {
    cfg.toolchain_family = "arm-none-eabi";
    runner.on("arm-none-eabi-objcopy", FakeProcessRunner::ok(),
              [](const process::Command& cmd) { write_file(cmd.args.back(), "raw image"); });

    ASSERT_TRUE(is_ok(build()));
    EXPECT_FALSE(runner.ran("rustc"));
    EXPECT_TRUE(runner.ran("arm-none-eabi-size"));
    EXPECT_TRUE(runner.ran("arm-none-eabi-objcopy"));
}

TEST_F(PipelineTest, OutdatedRustupUpdatesThenBuilds) {
    runner.on("rustup --version", FakeProcessRunner::ok("rustup 1.9.0 (2017-12-01)"));
    runner.on("rustup update", FakeProcessRunner::fail(1));

    ASSERT_TRUE(is_ok(build()));
    EXPECT_EQ(runner.count("rustup update"), 1u);
    ASSERT_EQ(sleeps.size(), 1u);
    EXPECT_EQ(sleeps[0], cfg.update_delay);
    EXPECT_LT(runner.index_of("rustup update"), runner.index_of("cargo build"));
}

TEST_F(PipelineTest, MissingVersionControlUsesFallback) {
    runner.on("git describe", FakeProcessRunner::fail(128, "fatal: not a git repository"));

    ASSERT_TRUE(is_ok(build()));
    EXPECT_EQ(FakeProcessRunner::env_of(*runner.find("cargo build"), "TOCK_KERNEL_VERSION"),
              "1.4+");
}

TEST_F(PipelineTest, InstallsMissingAddOnsBeforeCargo) {
    runner.on("rustup component list", FakeProcessRunner::ok("llvm-tools-preview (installed)\n"));
    runner.on("rustup target list", FakeProcessRunner::ok("thumbv6m-none-eabi (installed)\n"));

    ASSERT_TRUE(is_ok(build()));
    EXPECT_EQ(runner.count("rustup component add rust-src"), 1u);
    EXPECT_EQ(runner.count("rustup target add thumbv7em-none-eabi"), 1u);
    EXPECT_FALSE(runner.ran("rustup component add llvm-tools-preview"));
    EXPECT_LT(runner.index_of("rustup target add"), runner.index_of("cargo build"));
}

// ============================================================================
// Freshness
// ============================================================================

TEST_F(PipelineTest, UpToDateBinarySkipsCopyAndDigest) {
    ASSERT_TRUE(is_ok(build()));
    auto paths = release_paths();
    set_age(paths.elf, std::chrono::seconds(-60));

    ASSERT_TRUE(is_ok(build()));
    EXPECT_EQ(runner.count(objcopy_tool), 1u);
    EXPECT_EQ(runner.count(cfg.digest_tool.string()), 1u);
    EXPECT_EQ(runner.count("cargo build"), 2u);
    EXPECT_FALSE(last_fresh);
    EXPECT_FALSE(last_digest.has_value());
    EXPECT_EQ(last_history.back(), S::BinaryExtracted);
}

TEST_F(PipelineTest, NewerElfRegeneratesBinaryAndDigest) {
    ASSERT_TRUE(is_ok(build()));
    auto paths = release_paths();
    set_age(paths.bin, std::chrono::seconds(-60));

    ASSERT_TRUE(is_ok(build()));
    EXPECT_EQ(runner.count(objcopy_tool), 2u);
    EXPECT_EQ(runner.count(cfg.digest_tool.string()), 2u);
    EXPECT_TRUE(last_fresh);
}

TEST_F(PipelineTest, UpToDateListingIsKept) {
    ASSERT_TRUE(is_ok(build(Variant::Release, true)));
    auto paths = release_paths();
    set_age(paths.elf, std::chrono::seconds(-60));

    ASSERT_TRUE(is_ok(build(Variant::Release, true)));
    EXPECT_EQ(runner.count(objdump_tool), 1u);
    EXPECT_EQ(last_history.back(), S::Disassembled);
}

// ============================================================================
// Failures
// ============================================================================

TEST_F(PipelineTest, MissingTargetRunsNothing) {
    cfg.target.clear();
    BuildPipeline pipe(cfg, runner, search, sleeper);

    auto result = pipe.build(Variant::Release, false);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).message, "Undefined variable \"TARGET\"");
    EXPECT_EQ(unwrap_err(result).exit_code, EXIT_CONFIG_ERROR);
    EXPECT_TRUE(runner.commands.empty());
    EXPECT_EQ(pipe.state(), S::Aborted);
    EXPECT_EQ(pipe.history(), (std::vector<S>{S::Unvalidated, S::Aborted}));
}

TEST_F(PipelineTest, CargoFailurePropagatesExitCode) {
    runner.on("cargo build", FakeProcessRunner::fail(101));
    BuildPipeline pipe(cfg, runner, search, sleeper);

    auto result = pipe.build(Variant::Release, true);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::Subprocess);
    EXPECT_EQ(unwrap_err(result).exit_code, 101);
    EXPECT_EQ(pipe.state(), S::Aborted);
    EXPECT_FALSE(runner.ran(size_tool));
    EXPECT_FALSE(runner.ran(objcopy_tool));
    EXPECT_FALSE(runner.ran(objdump_tool));
}

TEST_F(PipelineTest, CargoSuccessWithoutElfIsIoError) {
    runner.on("cargo build", FakeProcessRunner::ok());

    auto result = build();
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::Io);
    EXPECT_FALSE(runner.ran(size_tool));
}

TEST_F(PipelineTest, SizeFailureStopsBeforeObjcopy) {
    runner.on(size_tool, FakeProcessRunner::fail(1));

    auto result = build();
    ASSERT_TRUE(is_err(result));
    EXPECT_FALSE(runner.ran(objcopy_tool));
    EXPECT_EQ(last_history.back(), S::Aborted);
}

TEST_F(PipelineTest, ObjcopyFailureRemovesPartialBinary) {
    runner.on(objcopy_tool, FakeProcessRunner::fail(2), [](const process::Command& cmd) {
        write_file(cmd.args.back(), "truncated");
    });

    auto result = build();
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).exit_code, 2);
    EXPECT_FALSE(fs::exists(release_paths().bin));
    EXPECT_FALSE(runner.ran(cfg.digest_tool.string()));
}

TEST_F(PipelineTest, DigestFailureDiscardsBinarySoNextRunRetries) {
    runner.once(cfg.digest_tool.string(), FakeProcessRunner::fail(3));

    auto failed = build();
    ASSERT_TRUE(is_err(failed));
    EXPECT_EQ(unwrap_err(failed).exit_code, 3);
    EXPECT_FALSE(fs::exists(release_paths().bin));

    ASSERT_TRUE(is_ok(build()));
    EXPECT_EQ(runner.count(objcopy_tool), 2u);
    EXPECT_TRUE(last_digest.has_value());
}

TEST_F(PipelineTest, ObjdumpFailureRemovesListing) {
    runner.on(objdump_tool, FakeProcessRunner::fail(1, ""));

    auto result = build(Variant::Release, true);
    ASSERT_TRUE(is_err(result));
    EXPECT_FALSE(fs::exists(release_paths().lst));
    EXPECT_TRUE(fs::exists(release_paths().bin));
}

TEST_F(PipelineTest, ComponentInstallFailureAborts) {
    runner.on("rustup target list", FakeProcessRunner::ok(""));
    runner.on("rustup target add", FakeProcessRunner::fail(1));

    auto result = build();
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::Subprocess);
    EXPECT_FALSE(runner.ran("cargo"));
    EXPECT_EQ(last_history.back(), S::Aborted);
}

// ============================================================================
// Toolchain discovery
// ============================================================================

TEST_F(PipelineTest, DiscoveryInstallsLlvmToolsAndRetries) {
    search.result.reset();
    bool llvm_tools = false;
    runner.respond("rustup component list", [&llvm_tools](const process::Command&) {
        std::string listing = llvm_tools ? "llvm-tools-preview (installed)\n" : "llvm-tools-preview\n";
        return FakeProcessRunner::ok(listing + "rust-src (installed)\n");
    });
    runner.on("rustup component add llvm-tools-preview", FakeProcessRunner::ok(),
              [this, &llvm_tools](const process::Command&) {
                  llvm_tools = true;
                  search.result = fs::path(LLVM_SIZE);
              });

    auto result = build();
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).message;
    EXPECT_EQ(runner.count("rustup component add llvm-tools-preview"), 1u);
    EXPECT_EQ(search.queries.size(), 2u);
}

TEST_F(PipelineTest, DiscoveryFailureIsFatal) {
    search.result.reset();

    BuildPipeline pipe(cfg, runner, search, sleeper);
    auto result = pipe.build(Variant::Release, false);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::ToolchainDiscovery);
    EXPECT_EQ(unwrap_err(result).exit_code, EXIT_FAILURE_GENERIC);
    EXPECT_EQ(pipe.state(), S::Aborted);
    EXPECT_FALSE(runner.ran("rustup component add"));
    EXPECT_FALSE(runner.ran("cargo"));
}

// ============================================================================
// Digest helper bootstrap
// ============================================================================

TEST_F(PipelineTest, DigestHelperBuiltOnceWhenMissing) {
    fs::remove(cfg.digest_tool);

    ASSERT_TRUE(is_ok(build()));
    set_age(release_paths().bin, std::chrono::seconds(-60));
    ASSERT_TRUE(is_ok(build()));

    std::vector<const process::Command*> helper_builds;
    for (const auto& cmd : runner.commands) {
        if (cmd.program == "cargo" && cmd.cwd == cfg.digest_source_dir)
            helper_builds.push_back(&cmd);
    }
    ASSERT_EQ(helper_builds.size(), 1u);
    EXPECT_EQ(helper_builds[0]->args, std::vector<std::string>{"build"});
    EXPECT_FALSE(FakeProcessRunner::env_of(*helper_builds[0], "RUSTFLAGS").has_value());
    EXPECT_EQ(runner.count(cfg.digest_tool.string()), 2u);
}

TEST_F(PipelineTest, DigestHelperThatNeverAppears) {
    fs::remove(cfg.digest_tool);
    runner.on("cargo build", FakeProcessRunner::ok(), [this](const process::Command& cmd) {
        if (cmd.cwd != cfg.digest_source_dir)
            write_file(elf_path(cmd), "\x7f" "ELF");
    });

    auto result = build();
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::Io);
    EXPECT_FALSE(fs::exists(release_paths().bin));
}

// ============================================================================
// Other targets
// ============================================================================

TEST_F(PipelineTest, CheckDocClean) {
    {
        BuildPipeline pipe(cfg, runner, search, sleeper);
        ASSERT_TRUE(is_ok(pipe.check()));
        EXPECT_EQ(pipe.state(), S::FlagsAssembled);
    }
    {
        BuildPipeline pipe(cfg, runner, search, sleeper);
        ASSERT_TRUE(is_ok(pipe.doc()));
    }
    {
        BuildPipeline pipe(cfg, runner, search, sleeper);
        ASSERT_TRUE(is_ok(pipe.clean()));
    }

    EXPECT_EQ(runner.find("cargo check")->args,
              (std::vector<std::string>{"check", "--target=thumbv7em-none-eabi", "--release"}));
    EXPECT_EQ(runner.find("cargo doc")->args,
              (std::vector<std::string>{"doc", "--release", "--target=thumbv7em-none-eabi"}));
    EXPECT_EQ(runner.find("cargo clean")->args, std::vector<std::string>{"clean"});
    EXPECT_TRUE(FakeProcessRunner::env_of(*runner.find("cargo check"), "RUSTFLAGS").has_value());
    EXPECT_FALSE(runner.ran(objcopy_tool));
}

TEST_F(PipelineTest, CheckFailureAborts) {
    runner.on("cargo check", FakeProcessRunner::fail(101));

    BuildPipeline pipe(cfg, runner, search, sleeper);
    auto result = pipe.check();
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).exit_code, 101);
    EXPECT_EQ(pipe.state(), S::Aborted);
}

// ============================================================================
// State machine
// ============================================================================

TEST_F(PipelineTest, OutOfOrderStageIsRejected) {
    BuildPipeline pipe(cfg, runner, search, sleeper);

    auto result = pipe.link(Variant::Release);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::InvalidState);
    EXPECT_EQ(pipe.state(), S::Unvalidated);
    EXPECT_TRUE(runner.commands.empty());

    EXPECT_TRUE(is_err(pipe.compute_digest()));
    EXPECT_TRUE(is_err(pipe.disassemble()));
    EXPECT_TRUE(is_ok(pipe.validate()));
    EXPECT_TRUE(is_err(pipe.validate()));
}

TEST_F(PipelineTest, AbortedPipelineRefusesWork) {
    cfg.platform.clear();
    BuildPipeline pipe(cfg, runner, search, sleeper);
    ASSERT_TRUE(is_err(pipe.validate()));

    auto again = pipe.validate();
    ASSERT_TRUE(is_err(again));
    EXPECT_EQ(unwrap_err(again).kind, ErrorKind::InvalidState);
    EXPECT_EQ(pipe.history().size(), 2u);
}

TEST_F(PipelineTest, ListingAfterSkippedDigest) {
    BuildPipeline pipe(cfg, runner, search, sleeper);
    ASSERT_TRUE(is_ok(pipe.prepare()));
    ASSERT_TRUE(is_ok(pipe.link(Variant::Release)));
    ASSERT_TRUE(is_ok(pipe.extract_binary()));
    ASSERT_TRUE(is_ok(pipe.disassemble()));
    EXPECT_EQ(pipe.state(), S::Disassembled);
    EXPECT_FALSE(runner.ran(cfg.digest_tool.string()));
}

TEST(PipelineStateTest, TransitionTable) {
    EXPECT_TRUE(is_valid_transition(S::Unvalidated, S::ParametersOK));
    EXPECT_TRUE(is_valid_transition(S::FlagsAssembled, S::Linked));
    EXPECT_TRUE(is_valid_transition(S::BinaryExtracted, S::DigestComputed));
    EXPECT_TRUE(is_valid_transition(S::BinaryExtracted, S::Disassembled));
    EXPECT_TRUE(is_valid_transition(S::DigestComputed, S::Disassembled));
    EXPECT_TRUE(is_valid_transition(S::Linked, S::Aborted));
    EXPECT_TRUE(is_valid_transition(S::Disassembled, S::Aborted));

    EXPECT_FALSE(is_valid_transition(S::Unvalidated, S::Linked));
    EXPECT_FALSE(is_valid_transition(S::ParametersOK, S::Unvalidated));
    EXPECT_FALSE(is_valid_transition(S::Linked, S::DigestComputed));
    EXPECT_FALSE(is_valid_transition(S::Aborted, S::Aborted));
    EXPECT_FALSE(is_valid_transition(S::Aborted, S::ParametersOK));
}

TEST(PipelineStateTest, Names) {
    EXPECT_STREQ(state_name(S::ComponentsReady), "ComponentsReady");
    EXPECT_STREQ(state_name(S::Aborted), "Aborted");
}
