#include "utils.hpp"

#include "bintag/common.hpp"

#include <iostream>

namespace bintag::cli {

void print_usage() {
    std::cout << "bintag " << VERSION << "\n\n";
    std::cout << "Usage: bintag <command> [options] [files]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  demo <file>   Write a sample document, read it back and compare\n";
    std::cout << "  dump <file>   Decode a document and print it\n";
    std::cout << "\nOptions:\n";
    std::cout << "  --help, -h          Show this help\n";
    std::cout << "  --version, -V       Show version\n";
    std::cout << "  --verbose, -v       Show detailed output (-vv, -vvv for more)\n";
    std::cout << "  --quiet, -q         Only log errors\n";
    std::cout << "  --log-level=LEVEL   trace, debug, info, warn, error, off\n";
    std::cout << "  --log-filter=SPEC   Per-module levels, e.g. codec=trace,*=warn\n";
    std::cout << "  --log-file=PATH     Also write log lines to PATH\n";
    std::cout << "  --log-format=FMT    text or json\n";
}

void print_version() {
    std::cout << "bintag " << VERSION << "\n";
}

} // namespace bintag::cli
