//! # Semantic Version Ordering
//!
//! Numeric major/minor/patch comparison for toolchain version gates:
//! `1.9.0 < 1.11.0`, which a string comparison gets wrong.

#ifndef KMAKE_TOOLCHAIN_SEMVER_HPP
#define KMAKE_TOOLCHAIN_SEMVER_HPP

#include <compare>
#include <optional>
#include <string>
#include <string_view>

namespace kmake::toolchain {

struct SemVer {
    unsigned long major = 0;
    unsigned long minor = 0;
    unsigned long patch = 0;

    /// Parses "MAJOR[.MINOR[.PATCH]]". Missing components are 0; a trailing
    /// pre-release or build suffix ("1.26.0-beta.1", "1.2.3+abc") is ignored.
    /// Returns nullopt if the major component is not a number.
    static std::optional<SemVer> parse(std::string_view text);

    std::string to_string() const;

    auto operator<=>(const SemVer&) const = default;
};

/// Extracts the version word from `<tool> --version` output such as
/// "rustup 1.11.0 (e751ff9f8 2018-02-13)". Returns nullopt if absent.
std::optional<SemVer> parse_tool_version(std::string_view output);

} // namespace kmake::toolchain

#endif // KMAKE_TOOLCHAIN_SEMVER_HPP
