#include "cli/options.hpp"

#include "log/log.hpp"

#include <array>
#include <utility>

namespace kmake::cli {

namespace {

constexpr std::array<std::pair<std::string_view, Target>, 9> TARGETS = {{
    {"all", Target::All},
    {"release", Target::Release},
    {"debug", Target::Debug},
    {"lst", Target::Lst},
    {"debug-lst", Target::DebugLst},
    {"check", Target::Check},
    {"doc", Target::Doc},
    {"clean", Target::Clean},
    {"show-target", Target::ShowTarget},
}};

} // namespace

std::optional<Target> parse_target(std::string_view name) {
    for (const auto& [text, target] : TARGETS) {
        if (text == name)
            return target;
    }
    return std::nullopt;
}

const char* target_name(Target target) {
    for (const auto& [text, t] : TARGETS) {
        if (t == target)
            return text.data();
    }
    return "unknown";
}

BuildResult<CliOptions> parse_cli_args(int argc, char* argv[]) {
    CliOptions opts;
    bool have_target = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            opts.show_help = true;
        } else if (arg == "-V" || arg == "--version") {
            opts.show_version = true;
        } else if (arg == "-C" || arg == "--manifest") {
            if (i + 1 >= argc) {
                return BuildError::configuration("option " + arg + " requires a value");
            }
            fs::path value = argv[++i];
            if (arg == "-C") {
                opts.board_dir = value;
            } else {
                opts.manifest_path = value;
            }
        } else if (arg.starts_with("--manifest=")) {
            opts.manifest_path = arg.substr(11);
        } else if (log::is_log_option(arg)) {
            continue;
        } else if (arg.starts_with("-")) {
            return BuildError::configuration("unknown option '" + arg + "'");
        } else {
            auto target = parse_target(arg);
            if (!target) {
                return BuildError::configuration("unknown target '" + arg + "'");
            }
            if (have_target) {
                return BuildError::configuration("only one target may be given (got '" +
                                                 std::string(target_name(opts.target)) +
                                                 "' and '" + arg + "')");
            }
            opts.target = *target;
            have_target = true;
        }
    }

    return opts;
}

} // namespace kmake::cli
