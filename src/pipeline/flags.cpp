#include "pipeline/flags.hpp"

#include "log/log.hpp"

namespace kmake::pipeline {

FlagSet base_rustc_flags(const config::BuildConfig& cfg) {
    // Paths embedded in panic messages and debug info become root-relative.
    std::string root = cfg.root_dir.string();
    if (root.empty() || root.back() != '/')
        root += '/';

    return {
        "-C", "link-arg=-T" + cfg.linker_script,
        "-C", "linker=" + cfg.linker,
        "-C", "linker-flavor=" + cfg.linker_flavor,
        "-C", "relocation-model=" + cfg.relocation_model,
        "-C", "link-arg=-zmax-page-size=" + std::to_string(cfg.max_page_size),
        "--remap-path-prefix=" + root + "=",
    };
}

FlagSet assemble_rustc_flags(const config::BuildConfig& cfg) {
    FlagSet flags = base_rustc_flags(cfg);

    if (cfg.ci) {
        flags.push_back("-D");
        flags.push_back("warnings");
    }

    flags.insert(flags.end(), cfg.extra_rustflags.begin(), cfg.extra_rustflags.end());

    KMAKE_LOG_DEBUG("flags", "RUSTFLAGS=" << join_flags(flags));
    return flags;
}

FlagSet objdump_flags(const BuildParameters& params) {
    FlagSet flags = {"--disassemble-all", "--source", "--section-headers"};
    if (params.is_thumb()) {
        // objdump cannot tell thumb code from ARM code on its own.
        flags.push_back("--arch-name=thumb");
    }
    return flags;
}

std::string join_flags(const FlagSet& flags) {
    std::string joined;
    for (const auto& flag : flags) {
        if (!joined.empty())
            joined += ' ';
        joined += flag;
    }
    return joined;
}

} // namespace kmake::pipeline
