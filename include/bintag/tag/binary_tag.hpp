//! # Binary Tag
//!
//! `BinaryTag` is the container of a tag document: a mapping from string
//! keys to `BinaryNode` values. Containers nest without depth limit, either
//! directly (a `Tag` entry) or through a `TagArray` leaf.
//!
//! ## Lookup Family
//!
//! | Method | Fails With |
//! |--------|------------|
//! | `get(name)` | `KeyNotFound` |
//! | `get_typed(name, type)` | `KeyNotFound`, `TypeMismatch` |
//! | `get_data(name)` | `KeyNotFound`, `CompositeNotData` |
//! | `get_data_typed(name, type)` | `KeyNotFound`, `CompositeNotData`, `TypeMismatch` |
//! | `get_<kind>(name)` | as `get_data_typed` with the kind's type |
//! | `get_tag(name)` | as `get_typed` with `DataType::Tag` |
//!
//! ## Replacement Rules
//!
//! `set(name, node)` checks types by default: replacing an entry with a
//! value of another type fails with `IncompatibleReplacement` and leaves the
//! container unchanged. Pass `check_type = false` to replace
//! unconditionally. Inserting under a new key never fails.
//!
//! ## Ordering
//!
//! Entries are kept sorted by key. Iteration, rendering and encoding all
//! follow that order.
//!
//! ## Example
//!
//! ```cpp
//! BinaryTag tag;
//! tag.set_string("name", "bin-tag");
//! tag.set_int("number", 42);
//!
//! auto n = tag.get_int("number");          // Ok(42)
//! auto s = tag.set_string("number", "x");  // Err(IncompatibleReplacement)
//! tag.set("number", BinaryData::of_string("x"), false);  // Ok
//! ```

#pragma once

#include "bintag/common.hpp"
#include "bintag/tag/binary_data.hpp"
#include "bintag/tag/binary_node.hpp"
#include "bintag/tag/data_type.hpp"
#include "bintag/tag/tag_error.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace bintag::tag {

/// A named mapping of nodes.
class BinaryTag {
public:
    /// The backing store. `std::less<>` allows lookup by `std::string_view`.
    using EntryMap = std::map<std::string, BinaryNode, std::less<>>;

    /// Creates an empty container.
    BinaryTag() = default;

    BinaryTag(BinaryTag&&) noexcept = default;
    auto operator=(BinaryTag&&) noexcept -> BinaryTag& = default;
    BinaryTag(const BinaryTag&) = delete;
    auto operator=(const BinaryTag&) -> BinaryTag& = delete;

    /// Creates an empty container with a capacity hint.
    ///
    /// The hint has no observable effect.
    [[nodiscard]] static auto with_capacity(size_t capacity) -> BinaryTag;

    /// Creates a container that takes ownership of `entries`.
    [[nodiscard]] static auto from(EntryMap entries) -> BinaryTag;

    // ========================================================================
    // Node Lookup
    // ========================================================================

    /// Returns the node stored under `name`.
    ///
    /// # Returns
    ///
    /// A pointer to the node (valid until the entry is replaced or removed),
    /// or a `KeyNotFound` error.
    [[nodiscard]] auto get(std::string_view name) const -> Result<const BinaryNode*, TagError>;

    /// Returns the node stored under `name` for modification.
    [[nodiscard]] auto get_mut(std::string_view name) -> Result<BinaryNode*, TagError>;

    /// Returns the node stored under `name` if its type is `type`.
    [[nodiscard]] auto get_typed(std::string_view name, DataType type) const
        -> Result<const BinaryNode*, TagError>;

    /// Returns the leaf value stored under `name`.
    ///
    /// Fails with `CompositeNotData` if the entry is a container.
    [[nodiscard]] auto get_data(std::string_view name) const
        -> Result<const BinaryData*, TagError>;

    /// Returns the leaf value stored under `name` if its type is `type`.
    ///
    /// A stored container always fails with `CompositeNotData`, even when
    /// `type` is `DataType::Tag`.
    [[nodiscard]] auto get_data_typed(std::string_view name, DataType type) const
        -> Result<const BinaryData*, TagError>;

    // ========================================================================
    // Typed Getters
    // ========================================================================

    [[nodiscard]] auto get_byte(std::string_view name) const -> Result<int8_t, TagError>;
    [[nodiscard]] auto get_short(std::string_view name) const -> Result<int16_t, TagError>;
    [[nodiscard]] auto get_int(std::string_view name) const -> Result<int32_t, TagError>;
    [[nodiscard]] auto get_long(std::string_view name) const -> Result<int64_t, TagError>;
    [[nodiscard]] auto get_float(std::string_view name) const -> Result<float, TagError>;
    [[nodiscard]] auto get_double(std::string_view name) const -> Result<double, TagError>;
    [[nodiscard]] auto get_string(std::string_view name) const
        -> Result<std::string_view, TagError>;

    [[nodiscard]] auto get_byte_array(std::string_view name) const
        -> Result<std::span<const int8_t>, TagError>;
    [[nodiscard]] auto get_short_array(std::string_view name) const
        -> Result<std::span<const int16_t>, TagError>;
    [[nodiscard]] auto get_int_array(std::string_view name) const
        -> Result<std::span<const int32_t>, TagError>;
    [[nodiscard]] auto get_long_array(std::string_view name) const
        -> Result<std::span<const int64_t>, TagError>;
    [[nodiscard]] auto get_float_array(std::string_view name) const
        -> Result<std::span<const float>, TagError>;
    [[nodiscard]] auto get_double_array(std::string_view name) const
        -> Result<std::span<const double>, TagError>;
    [[nodiscard]] auto get_string_array(std::string_view name) const
        -> Result<std::span<const std::string>, TagError>;
    [[nodiscard]] auto get_tag_array(std::string_view name) const
        -> Result<std::span<const BinaryTag>, TagError>;

    /// Returns the nested container stored under `name`.
    [[nodiscard]] auto get_tag(std::string_view name) const -> Result<const BinaryTag*, TagError>;

    /// Returns the nested container stored under `name` for modification.
    [[nodiscard]] auto get_tag_mut(std::string_view name) -> Result<BinaryTag*, TagError>;

    // ========================================================================
    // Mutation
    // ========================================================================

    /// Inserts or replaces the entry `name`.
    ///
    /// # Arguments
    ///
    /// * `name` - The entry key
    /// * `node` - The new value
    /// * `check_type` - If `true` and an entry exists, its type must match
    ///
    /// # Returns
    ///
    /// `Unit` on success, or `IncompatibleReplacement` (container unchanged).
    auto set(std::string_view name, BinaryNode node, bool check_type = true)
        -> Result<Unit, TagError>;

    auto set_byte(std::string_view name, int8_t value) -> Result<Unit, TagError>;
    auto set_short(std::string_view name, int16_t value) -> Result<Unit, TagError>;
    auto set_int(std::string_view name, int32_t value) -> Result<Unit, TagError>;
    auto set_long(std::string_view name, int64_t value) -> Result<Unit, TagError>;
    auto set_float(std::string_view name, float value) -> Result<Unit, TagError>;
    auto set_double(std::string_view name, double value) -> Result<Unit, TagError>;
    auto set_string(std::string_view name, std::string value) -> Result<Unit, TagError>;

    auto set_byte_array(std::string_view name, std::vector<int8_t> values)
        -> Result<Unit, TagError>;
    auto set_short_array(std::string_view name, std::vector<int16_t> values)
        -> Result<Unit, TagError>;
    auto set_int_array(std::string_view name, std::vector<int32_t> values)
        -> Result<Unit, TagError>;
    auto set_long_array(std::string_view name, std::vector<int64_t> values)
        -> Result<Unit, TagError>;
    auto set_float_array(std::string_view name, std::vector<float> values)
        -> Result<Unit, TagError>;
    auto set_double_array(std::string_view name, std::vector<double> values)
        -> Result<Unit, TagError>;
    auto set_string_array(std::string_view name, std::vector<std::string> values)
        -> Result<Unit, TagError>;
    auto set_tag_array(std::string_view name, TagArray values) -> Result<Unit, TagError>;

    /// Stores a nested container under `name`.
    auto set_tag(std::string_view name, BinaryTag value) -> Result<Unit, TagError>;

    /// Removes the entry `name` and returns it, or `std::nullopt` if absent.
    auto remove(std::string_view name) -> std::optional<BinaryNode>;

    // ========================================================================
    // Queries
    // ========================================================================

    [[nodiscard]] auto contains(std::string_view name) const -> bool {
        return entries_.find(name) != entries_.end();
    }

    [[nodiscard]] auto size() const -> size_t {
        return entries_.size();
    }

    [[nodiscard]] auto is_empty() const -> bool {
        return entries_.empty();
    }

    /// Read-only view of all entries, sorted by key.
    [[nodiscard]] auto entries() const -> const EntryMap& {
        return entries_;
    }

    // ========================================================================
    // Copy, Comparison, Rendering
    // ========================================================================

    /// Returns a deep copy; every contained node is copied recursively.
    [[nodiscard]] auto copy() const -> BinaryTag;

    /// Equal if both hold the same keys with equal values.
    [[nodiscard]] auto operator==(const BinaryTag& other) const -> bool;

    [[nodiscard]] auto operator!=(const BinaryTag& other) const -> bool {
        return !(*this == other);
    }

    /// Renders the container as `{key:value,...}`.
    [[nodiscard]] auto to_string() const -> std::string;

private:
    EntryMap entries_;
};

} // namespace bintag::tag
