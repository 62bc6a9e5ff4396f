//! # Build Artifacts
//!
//! Output locations for one build variant and the freshness rule that decides
//! whether a derived artifact has to be regenerated.
//!
//! ```text
//! <board>/target/<TARGET>/<release|debug>/<PLATFORM>       linked ELF image
//! <board>/target/<TARGET>/<release|debug>/<PLATFORM>.bin   raw binary image
//! <board>/target/<TARGET>/<release|debug>/<PLATFORM>.lst   disassembly listing
//! ```

#ifndef KMAKE_PIPELINE_ARTIFACTS_HPP
#define KMAKE_PIPELINE_ARTIFACTS_HPP

#include "config/build_config.hpp"
#include "pipeline/params.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace kmake::pipeline {

enum class Variant { Release, Debug };

inline const char* variant_name(Variant variant) {
    return variant == Variant::Release ? "release" : "debug";
}

struct ArtifactPaths {
    fs::path elf;
    fs::path bin;
    fs::path lst;

    static ArtifactPaths for_variant(const config::BuildConfig& cfg, const BuildParameters& params,
                                     Variant variant);
};

/// True if `output` is missing or older than `input`.
bool needs_rebuild(const fs::path& output, const fs::path& input);

} // namespace kmake::pipeline

#endif // KMAKE_PIPELINE_ARTIFACTS_HPP
