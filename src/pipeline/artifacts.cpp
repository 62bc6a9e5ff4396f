#include "pipeline/artifacts.hpp"

#include <system_error>

namespace kmake::pipeline {

ArtifactPaths ArtifactPaths::for_variant(const config::BuildConfig& cfg,
                                         const BuildParameters& params, Variant variant) {
    fs::path dir = cfg.board_dir / "target" / params.target / variant_name(variant);

    ArtifactPaths paths;
    paths.elf = dir / params.platform;
    paths.bin = dir / (params.platform + ".bin");
    paths.lst = dir / (params.platform + ".lst");
    return paths;
}

bool needs_rebuild(const fs::path& output, const fs::path& input) {
    std::error_code ec;
    auto out_time = fs::last_write_time(output, ec);
    if (ec)
        return true;

    auto in_time = fs::last_write_time(input, ec);
    if (ec)
        return true;

    return in_time > out_time;
}

} // namespace kmake::pipeline
