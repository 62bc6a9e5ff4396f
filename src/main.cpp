//! # kmake Entry Point
//!
//! Build driver for Tock kernel boards. All work happens in the CLI driver
//! (`cli/driver.hpp`).
//!
//! ## Usage
//!
//! ```bash
//! PLATFORM=imix TARGET=thumbv7em-none-eabi kmake          # release build
//! PLATFORM=imix TARGET=thumbv7em-none-eabi kmake debug-lst
//! kmake -C boards/imix check
//! ```

#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return kmake_main(argc, argv);
}
