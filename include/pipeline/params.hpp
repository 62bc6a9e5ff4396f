//! # Build Parameters
//!
//! The platform name and target triple every stage depends on.

#ifndef KMAKE_PIPELINE_PARAMS_HPP
#define KMAKE_PIPELINE_PARAMS_HPP

#include "common.hpp"
#include "config/build_config.hpp"

#include <string>

namespace kmake::pipeline {

/// Validated, immutable build parameters. Both fields are non-empty.
struct BuildParameters {
    std::string platform;
    std::string target;

    [[nodiscard]] auto is_thumb() const -> bool {
        return target.find("thumb") != std::string::npos;
    }
};

/// Checks PLATFORM, then TARGET. Fails on the first empty one with a
/// configuration error naming it: `Undefined variable "TARGET"`.
BuildResult<BuildParameters> validate_parameters(const config::BuildConfig& cfg);

} // namespace kmake::pipeline

#endif // KMAKE_PIPELINE_PARAMS_HPP
