#include "cli/utils.hpp"

#include "common.hpp"

#include <iostream>

namespace kmake::cli {

void print_usage() {
    std::cout << "kmake " << VERSION << "\n\n";
    std::cout << "Usage: kmake [options] [target]\n\n";
    std::cout << "Targets:\n";
    std::cout << "  all           Same as release (default)\n";
    std::cout << "  release       Build the release kernel, binary image and digest\n";
    std::cout << "  debug         Build the debug kernel, binary image and digest\n";
    std::cout << "  lst           release plus a disassembly listing\n";
    std::cout << "  debug-lst     debug plus a disassembly listing\n";
    std::cout << "  check         Run cargo check for the target\n";
    std::cout << "  doc           Build documentation for the target\n";
    std::cout << "  clean         Remove build outputs\n";
    std::cout << "  show-target   Print the target triple\n";
    std::cout << "\nOptions:\n";
    std::cout << "  --help, -h             Show this help\n";
    std::cout << "  --version, -V          Show version\n";
    std::cout << "  -C <dir>               Board directory (default: current directory)\n";
    std::cout << "  --manifest <path>      Board manifest (default: <dir>/kmake.toml)\n";
    std::cout << "  --log-level=<level>    trace, debug, info, warn, error, off\n";
    std::cout << "  --log-filter=<spec>    Per-module levels, e.g. build=debug,*=warn\n";
    std::cout << "  --log-file=<path>      Also write log records to a file\n";
    std::cout << "  --log-format=json      Emit JSON log records\n";
    std::cout << "  -v, -vv, -vvv          Info, debug, trace logging\n";
    std::cout << "  -q, --quiet            Errors only\n";
    std::cout << "\nEnvironment:\n";
    std::cout << "  PLATFORM, TARGET       Board name and target triple (required)\n";
    std::cout << "  TOOLCHAIN              Binary-utility family (llvm = auto-detect)\n";
    std::cout << "  CARGO, RUSTUP, RUSTC   Tool names or paths\n";
    std::cout << "  SIZE, OBJCOPY, OBJDUMP Binary-utility overrides\n";
    std::cout << "  CI                     Treat warnings as errors\n";
    std::cout << "  V                      Verbose cargo and command echo\n";
    std::cout << "  KMAKE_LOG              Log level or filter when no option is given\n";
}

void print_version() {
    std::cout << "kmake " << VERSION << "\n";
}

} // namespace kmake::cli
