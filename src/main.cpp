//! # bintag Entry Point
//!
//! The `main()` function only delegates to the CLI driver
//! (`cli/driver.hpp`), which configures logging, parses arguments and
//! dispatches to the `demo` and `dump` commands.
//!
//! ## Usage
//!
//! ```bash
//! bintag demo hello.bin       # Write, read back and compare a sample document
//! bintag dump hello.bin       # Print a document
//! ```

#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return bintag::cli::bintag_main(argc, argv);
}
