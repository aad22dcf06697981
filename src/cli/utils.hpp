//! # CLI Utilities Interface
//!
//! Help and version text for the `bintag` tool.

#pragma once

namespace bintag::cli {

// Help text
void print_usage();
void print_version();

} // namespace bintag::cli
