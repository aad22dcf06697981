//! # Document Commands
//!
//! Handlers for `bintag demo` and `bintag dump`.

#pragma once

#include "bintag/tag/binary_tag.hpp"

#include <string>

namespace bintag::cli {

/// Builds the sample document written by `bintag demo`.
tag::BinaryTag sample_document();

/// Writes the sample document to `path`, reads it back and prints both.
///
/// # Returns
///
/// 0 if the document was written and read back equal, 1 otherwise.
int run_demo(const std::string& path, bool verbose);

/// Decodes the root document in `path` and prints its rendering.
int run_dump(const std::string& path, bool verbose);

} // namespace bintag::cli
