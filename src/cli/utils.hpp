//! # CLI Utilities Interface
//!
//! | Function          | Description               |
//! |-------------------|---------------------------|
//! | `print_usage()`   | Print CLI help text       |
//! | `print_version()` | Print kmake version       |

#pragma once

namespace kmake::cli {

// Help text
void print_usage();
void print_version();

} // namespace kmake::cli
