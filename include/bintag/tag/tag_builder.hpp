//! # Tag Builder
//!
//! A fluent API for constructing nested `BinaryTag` documents. The builder
//! keeps a stack of open contexts: the root container, nested containers
//! and tag arrays.
//!
//! ## Usage Pattern
//!
//! 1. Create a `TagBuilder`; the root container is already open
//! 2. Add fields with the typed `field_*` methods
//! 3. Open a nested container with `field_tag()` or a tag array with
//!    `field_tag_array()`, and add array elements with `item_tag()`
//! 4. Close each nested context with `end()`
//! 5. Call `build()` to take the finished root container
//!
//! ## Example
//!
//! ```cpp
//! auto tag = TagBuilder()
//!     .field_string("name", "bin-tag")
//!     .field_int("number", 42)
//!     .field_tag("subtag")
//!         .field_float_array("position", {1.0f, 0.0f, 0.0f, 1.0f})
//!         .field_tag_array("children")
//!             .item_tag()
//!                 .field_byte("id", 1)
//!             .end()
//!         .end()
//!     .end()
//!     .build();
//! ```
//!
//! Misuse (adding a field inside a tag array, `end()` on the root, `build()`
//! with open contexts) throws `std::logic_error`.

#pragma once

#include "bintag/tag/binary_data.hpp"
#include "bintag/tag/binary_node.hpp"
#include "bintag/tag/binary_tag.hpp"

#include <cstdint>
#include <stack>
#include <stdexcept>
#include <string>
#include <vector>

namespace bintag::tag {

/// Fluent builder for `BinaryTag` documents.
///
/// Fields added under an existing key replace the earlier value regardless
/// of type.
///
/// # Thread Safety
///
/// The builder is not thread-safe. Each thread should use its own builder.
class TagBuilder {
public:
    /// Creates a builder with an empty root container open.
    TagBuilder();

    // ========================================================================
    // Structure Methods
    // ========================================================================

    /// Opens a nested container stored under `key` when closed.
    auto field_tag(const std::string& key) -> TagBuilder&;

    /// Opens a tag array stored under `key` when closed.
    auto field_tag_array(const std::string& key) -> TagBuilder&;

    /// Opens a container appended to the current tag array when closed.
    ///
    /// # Panics
    ///
    /// Throws `std::logic_error` if the current context is not a tag array.
    auto item_tag() -> TagBuilder&;

    /// Closes the current nested context and stores it in its parent.
    ///
    /// # Panics
    ///
    /// Throws `std::logic_error` if only the root container is open.
    auto end() -> TagBuilder&;

    // ========================================================================
    // Field Methods
    // ========================================================================

    /// Stores `node` under `key` in the current container.
    ///
    /// # Panics
    ///
    /// Throws `std::logic_error` if the current context is a tag array.
    auto field(const std::string& key, BinaryNode node) -> TagBuilder&;

    auto field_byte(const std::string& key, int8_t value) -> TagBuilder&;
    auto field_short(const std::string& key, int16_t value) -> TagBuilder&;
    auto field_int(const std::string& key, int32_t value) -> TagBuilder&;
    auto field_long(const std::string& key, int64_t value) -> TagBuilder&;
    auto field_float(const std::string& key, float value) -> TagBuilder&;
    auto field_double(const std::string& key, double value) -> TagBuilder&;
    auto field_string(const std::string& key, std::string value) -> TagBuilder&;

    auto field_byte_array(const std::string& key, std::vector<int8_t> values) -> TagBuilder&;
    auto field_short_array(const std::string& key, std::vector<int16_t> values) -> TagBuilder&;
    auto field_int_array(const std::string& key, std::vector<int32_t> values) -> TagBuilder&;
    auto field_long_array(const std::string& key, std::vector<int64_t> values) -> TagBuilder&;
    auto field_float_array(const std::string& key, std::vector<float> values) -> TagBuilder&;
    auto field_double_array(const std::string& key, std::vector<double> values) -> TagBuilder&;
    auto field_string_array(const std::string& key, std::vector<std::string> values)
        -> TagBuilder&;

    // ========================================================================
    // Finalization
    // ========================================================================

    /// Returns the root container and resets the builder to an empty root.
    ///
    /// # Panics
    ///
    /// Throws `std::logic_error` if nested contexts are still open.
    [[nodiscard]] auto build() -> BinaryTag;

    /// Number of open contexts, including the root.
    [[nodiscard]] auto depth() const -> size_t {
        return stack_.size();
    }

private:
    /// An open container or tag array, and the key it goes under.
    struct Context {
        enum class Kind { Tag, TagArray };
        Kind kind;
        std::string key;
        BinaryTag tag;
        TagArray items;
    };

    /// Throws `std::logic_error` naming `method` unless a container is open.
    void require_tag_context(const char* method) const;
    auto current_tag(const char* method) -> BinaryTag&;

    std::stack<Context> stack_;
};

} // namespace bintag::tag
