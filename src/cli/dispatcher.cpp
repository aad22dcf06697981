//! # CLI Command Dispatcher
//!
//! This file implements the main entry point for the `bintag` CLI.
//! It configures logging, parses the remaining arguments and routes to the
//! appropriate command handler.
//!
//! ## Architecture
//!
//! ```text
//! bintag_main()
//!   ├─ --help, -h     → print_usage()
//!   ├─ --version, -V  → print_version()
//!   ├─ demo           → run_demo()
//!   └─ dump           → run_dump()
//! ```
//!
//! ## Global Flags
//!
//! Logging flags are accepted anywhere on the command line; see
//! `log::parse_log_options`.

#include "commands/cmd_tag.hpp"
#include "driver.hpp"
#include "utils.hpp"

#include "bintag/log/log.hpp"

#include <iostream>
#include <string>
#include <string_view>

namespace bintag::cli {

CliOptions parse_cli_options(int argc, char* argv[]) {
    CliOptions options;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        // -v, -vv and -vvv count as verbose too
        if (arg == "--verbose" || (arg.starts_with("-v") && log::is_log_option(arg))) {
            options.verbose = true;
        }
        if (log::is_log_option(arg)) {
            continue;
        }
        if (options.command.empty()) {
            options.command = std::string(arg);
        } else {
            options.paths.emplace_back(arg);
        }
    }
    return options;
}

/// Main entry point for the `bintag` CLI.
///
/// ## Return Codes
///
/// | Code | Meaning                               |
/// |------|---------------------------------------|
/// | 0    | Success                               |
/// | 1    | Error (usage, I/O, decoding, compare) |
///
/// ## Examples
///
/// ```bash
/// bintag demo hello.bin           # Write and verify the sample document
/// bintag dump hello.bin -vv       # Print a document with debug logging
/// ```
int bintag_main(int argc, char* argv[]) {
    log::Logger::init(log::parse_log_options(argc, argv));

    auto options = parse_cli_options(argc, argv);
    const auto& command = options.command;

    if (command.empty()) {
        print_usage();
        return 0;
    }

    if (command == "--help" || command == "-h") {
        print_usage();
        return 0;
    }

    if (command == "--version" || command == "-V") {
        print_version();
        return 0;
    }

    if (command == "demo") {
        if (options.paths.size() != 1) {
            std::cerr << "Usage: bintag demo <file> [--verbose]\n";
            return 1;
        }
        return run_demo(options.paths[0], options.verbose);
    }

    if (command == "dump") {
        if (options.paths.size() != 1) {
            std::cerr << "Usage: bintag dump <file> [--verbose]\n";
            return 1;
        }
        return run_dump(options.paths[0], options.verbose);
    }

    std::cerr << "Unknown command: " << command << "\n";
    std::cerr << "Run 'bintag --help' for usage information.\n";
    return 1;
}

} // namespace bintag::cli
