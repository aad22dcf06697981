//! # Document Commands Implementation
//!
//! `demo` exercises the whole codec path against a real file: build, write,
//! read, compare. `dump` is the read half on its own.

#include "cmd_tag.hpp"

#include "bintag/log/log.hpp"
#include "bintag/tag/codec.hpp"
#include "bintag/tag/tag_builder.hpp"

#include <filesystem>
#include <iostream>
#include <system_error>

namespace bintag::cli {

tag::BinaryTag sample_document() {
    return tag::TagBuilder()
        .field_string("name", "bin-tag")
        .field_string("version", "1.0.0")
        .field_int("number", 42)
        .field_tag("subtag")
            .field_string("name", "bin-tag")
            .field_string("version", "2.0.0")
            .field_int("number", 43)
            .field_tag_array("subtag-array")
                .item_tag()
                    .field_string("name", "bin-tag")
                    .field_string("version", "3.0.0")
                    .field_int("number", 44)
                    .field_tag("subtag")
                    .end()
                .end()
                .item_tag()
                    .field_string("name", "bin-tag")
                    .field_string("version", "4.0.0")
                    .field_int("number", 45)
                    .field_float_array("position", {1.0f, 0.0f, 0.0f, 1.0f})
                .end()
            .end()
        .end()
        .build();
}

int run_demo(const std::string& path, bool verbose) {
    auto original = sample_document();
    std::cout << original.to_string() << "\n";

    BINTAG_LOG_INFO("cli", "Writing sample document to " << path);
    auto written = tag::write_tag_file(path, original);
    if (is_err(written)) {
        std::cerr << "error: " << unwrap_err(written).to_string() << "\n";
        return 1;
    }

    if (verbose) {
        std::error_code ec;
        auto size = std::filesystem::file_size(path, ec);
        if (!ec) {
            std::cout << "wrote " << size << " bytes to " << path << "\n";
        }
    }

    BINTAG_LOG_INFO("cli", "Reading " << path);
    auto read = tag::read_tag_file(path);
    if (is_err(read)) {
        std::cerr << "error: " << unwrap_err(read).to_string() << "\n";
        return 1;
    }

    const auto& decoded = unwrap(read);
    std::cout << decoded.to_string() << "\n";

    bool same = decoded == original;
    std::cout << "equal: " << (same ? "true" : "false") << "\n";
    return same ? 0 : 1;
}

int run_dump(const std::string& path, bool verbose) {
    BINTAG_LOG_INFO("cli", "Reading " << path);
    auto read = tag::read_tag_file(path);
    if (is_err(read)) {
        std::cerr << "error: " << unwrap_err(read).to_string() << "\n";
        return 1;
    }

    const auto& decoded = unwrap(read);
    if (verbose) {
        std::cout << path << ": " << decoded.size() << " entries\n";
    }
    std::cout << decoded.to_string() << "\n";
    return 0;
}

} // namespace bintag::cli
