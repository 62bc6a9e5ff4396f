#include "toolchain/components.hpp"

#include "log/log.hpp"

namespace kmake::toolchain {

static const char* subcommand(AddOnKind kind) {
    return kind == AddOnKind::Target ? "target" : "component";
}

/// True if `entry` names `name`, either exactly or with a host triple suffix
/// ("llvm-tools-x86_64-unknown-linux-gnu" for "llvm-tools").
static bool entry_matches(std::string_view entry, std::string_view name) {
    if (entry == name)
        return true;
    return entry.size() > name.size() && entry.starts_with(name) && entry[name.size()] == '-';
}

bool listing_shows_installed(std::string_view listing, std::string_view name) {
    constexpr std::string_view marker = " (installed)";
    constexpr std::string_view preview = "-preview";

    // rustup lists renamed "-preview" components under their stable name.
    std::string_view stable = name;
    if (stable.size() > preview.size() && stable.ends_with(preview))
        stable.remove_suffix(preview.size());

    size_t pos = 0;
    while (pos <= listing.size()) {
        size_t eol = listing.find('\n', pos);
        if (eol == std::string_view::npos)
            eol = listing.size();
        std::string_view line = listing.substr(pos, eol - pos);
        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);
        pos = eol + 1;

        if (!line.ends_with(marker))
            continue;
        std::string_view entry = line.substr(0, line.size() - marker.size());
        if (entry_matches(entry, name) || entry_matches(entry, stable))
            return true;
    }
    return false;
}

ComponentInstaller::ComponentInstaller(process::ProcessRunner& runner, std::string rustup)
    : runner_(runner), rustup_(std::move(rustup)) {}

std::vector<AddOn> ComponentInstaller::required_addons(const std::vector<std::string>& components,
                                                       const std::string& target) {
    std::vector<AddOn> addons;
    for (const auto& name : components) {
        addons.push_back({AddOnKind::Component, name});
    }
    addons.push_back({AddOnKind::Target, target});
    return addons;
}

bool ComponentInstaller::is_installed(const AddOn& addon) {
    auto cmd = process::Command::capture(rustup_, {subcommand(addon.kind), "list"});
    auto result = runner_.run(cmd);
    if (!result.success()) {
        // Treat as absent; the install attempt reports the real problem.
        KMAKE_LOG_DEBUG("components", process::format_command(cmd)
                                          << " exited with " << result.exit_code);
        return false;
    }
    return listing_shows_installed(result.stdout_output, addon.name);
}

BuildResult<Unit> ComponentInstaller::install(const AddOn& addon) {
    auto cmd = process::Command::passthrough(rustup_, {subcommand(addon.kind), "add", addon.name});
    KMAKE_LOG_INFO("components", process::format_command(cmd));
    auto result = runner_.run(cmd);
    if (!result.success()) {
        return BuildError::subprocess("failed to install " + std::string(subcommand(addon.kind)) +
                                          " " + addon.name,
                                      result.exit_code);
    }
    return Unit{};
}

BuildResult<InstallReport> ComponentInstaller::ensure_installed(const std::vector<AddOn>& addons) {
    InstallReport report;

    for (const auto& addon : addons) {
        if (is_installed(addon)) {
            KMAKE_LOG_DEBUG("components", addon.name << " already installed");
            report.already_installed.push_back(addon.name);
            continue;
        }

        auto installed = install(addon);
        if (is_err(installed)) {
            return unwrap_err(installed);
        }
        report.newly_installed.push_back(addon.name);
    }

    return report;
}

} // namespace kmake::toolchain
