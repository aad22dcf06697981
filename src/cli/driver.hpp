//! # CLI Driver Interface
//!
//! This header defines the entry point for the `bintag` command-line tool
//! and the options it parses from argv.
//!
//! ## Entry Point
//!
//! `bintag_main()` dispatches to the appropriate command handler based on
//! the first non-logging argument.

#pragma once

#include <string>
#include <vector>

namespace bintag::cli {

/// Options parsed from the command line.
///
/// Logging options (`--log-level=`, `-v`, `-q`, ...) are consumed by
/// `log::parse_log_options` and do not appear in `paths`.
struct CliOptions {
    std::string command;            ///< First positional argument
    std::vector<std::string> paths; ///< Remaining positional arguments
    bool verbose = false;           ///< `-v` or `--verbose` was given
};

/// Splits argv into a command and its positional arguments.
CliOptions parse_cli_options(int argc, char* argv[]);

/// Main entry point: configures logging, then dispatches the command.
int bintag_main(int argc, char* argv[]);

} // namespace bintag::cli
