//! # Board Manifest Interface
//!
//! This header defines `kmake.toml` parsing. A board directory may carry a
//! manifest naming its platform and target and tuning the toolchain; every
//! key is optional.
//!
//! ## Manifest Sections
//!
//! | Section       | Type               | Description                        |
//! |---------------|--------------------|------------------------------------|
//! | `[board]`     | `BoardSection`     | Platform name and target triple    |
//! | `[toolchain]` | `ToolchainSection` | Family selector, tool overrides    |
//! | `[build]`     | `BuildSection`     | Linker layout and flag inputs      |
//! | `[rustup]`    | `RustupSection`    | Version gate and add-on components |
//! | `[digest]`    | `DigestSection`    | Content-digest helper location     |
//!
//! ## TOML Parser
//!
//! `ManifestParser` handles the subset of TOML the manifest needs: sections,
//! strings, integers, booleans, string arrays and `#` comments.

#ifndef KMAKE_CONFIG_MANIFEST_HPP
#define KMAKE_CONFIG_MANIFEST_HPP

#include "common.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace fs = std::filesystem;

namespace kmake::config {

struct BoardSection {
    std::string platform;
    std::string target;
};

struct ToolchainSection {
    std::string family = "llvm";
    std::string rustc = "rustc";
    std::string cargo = "cargo";
    std::string rustup = "rustup";
    std::string size;
    std::string objcopy;
    std::string objdump;
};

struct BuildSection {
    std::string root = ".";
    std::string linker_script = "layout.ld";
    std::string linker = "rust-lld";
    std::string linker_flavor = "ld.lld";
    std::string relocation_model = "dynamic-no-pic";
    int64_t max_page_size = 512;
    std::string version_env = "TOCK_KERNEL_VERSION";
    std::vector<std::string> extra_rustflags;
};

struct RustupSection {
    std::string minimum_version = "1.11.0";
    int64_t update_delay_ms = 3000;
    std::vector<std::string> components = {"llvm-tools-preview", "rust-src"};
};

struct DigestSection {
    std::string source_dir = "tools/sha256sum";
    std::string tool = "tools/sha256sum/target/debug/sha256sum";
};

/// Complete manifest. Absent keys keep the defaults above.
struct Manifest {
    BoardSection board;
    ToolchainSection toolchain;
    BuildSection build;
    RustupSection rustup;
    DigestSection digest;

    /// Load a manifest from disk.
    static BuildResult<Manifest> load(const fs::path& path);

    /// Parse manifest text; `origin` names the source in error messages.
    static BuildResult<Manifest> parse(const std::string& content,
                                       const std::string& origin = "kmake.toml");
};

/// A single TOML value of the supported subset.
using TomlValue = std::variant<std::string, int64_t, bool, std::vector<std::string>>;

/// Section name -> key -> value. Keys before any header live in section "".
using TomlTable = std::map<std::string, std::map<std::string, TomlValue>>;

/// Line-oriented parser for the TOML subset.
class ManifestParser {
public:
    explicit ManifestParser(std::string content);

    /// Parse the whole document into a table.
    BuildResult<TomlTable> parse();

private:
    std::string content_;
    size_t pos_ = 0;
    int line_ = 1;

    bool is_eof() const {
        return pos_ >= content_.size();
    }
    char peek() const {
        return is_eof() ? '\0' : content_[pos_];
    }
    char advance();

    void skip_inline_whitespace();
    void skip_comment();
    bool at_line_end();
    void skip_blank_lines();

    BuildError error(const std::string& what) const;

    BuildResult<std::string> parse_key();
    BuildResult<std::string> parse_string();
    BuildResult<TomlValue> parse_value();
    BuildResult<std::vector<std::string>> parse_array();
};

} // namespace kmake::config

#endif // KMAKE_CONFIG_MANIFEST_HPP
