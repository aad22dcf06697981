//! # Binary Node
//!
//! `BinaryNode` is any value that can be stored under a key, written to a
//! stream or read back: either a leaf `BinaryData` or a `BinaryTag`
//! container. The set is closed; `visit()` dispatches exhaustively over
//! exactly these two alternatives.
//!
//! ## Ownership
//!
//! Nodes form a tree. Every node is owned by exactly one parent container
//! (or by the caller for the root), so there is no sharing, no cycles and
//! `copy()` always terminates.
//!
//! ## Example
//!
//! ```cpp
//! BinaryNode node = BinaryData::of_int(7);
//! node.type();                       // DataType::Int
//! node.visit([](const auto& value) {
//!     std::cout << value.to_string();
//! });
//! ```

#pragma once

#include "bintag/common.hpp"
#include "bintag/tag/binary_data.hpp"
#include "bintag/tag/data_type.hpp"
#include "bintag/tag/tag_error.hpp"

#include <string>
#include <utility>
#include <variant>

namespace bintag::tag {

class BinaryTag;

/// A leaf value or a container.
class BinaryNode {
public:
    /// Wraps a leaf value.
    BinaryNode(BinaryData data);

    /// Wraps a container.
    BinaryNode(BinaryTag tag);

    ~BinaryNode();
    BinaryNode(BinaryNode&& other) noexcept;
    auto operator=(BinaryNode&& other) noexcept -> BinaryNode&;
    BinaryNode(const BinaryNode&) = delete;
    auto operator=(const BinaryNode&) -> BinaryNode& = delete;

    /// Returns the data type; `DataType::Tag` for containers.
    [[nodiscard]] auto type() const -> DataType;

    /// Returns `true` if this node holds leaf data.
    [[nodiscard]] auto is_data() const -> bool {
        return std::holds_alternative<BinaryData>(node_);
    }

    /// Returns `true` if this node holds a container.
    [[nodiscard]] auto is_tag() const -> bool {
        return std::holds_alternative<Box<BinaryTag>>(node_);
    }

    /// Returns the leaf value, or `CompositeNotData` for containers.
    [[nodiscard]] auto as_data() const -> Result<const BinaryData*, TagError>;

    /// Returns the container, or `TypeMismatch` for leaf values.
    [[nodiscard]] auto as_tag() const -> Result<const BinaryTag*, TagError>;

    /// Returns the container for modification, or `TypeMismatch`.
    [[nodiscard]] auto as_tag_mut() -> Result<BinaryTag*, TagError>;

    /// Calls `f` with either `const BinaryData&` or `const BinaryTag&`.
    template <typename F> auto visit(F&& f) const -> decltype(auto) {
        if (const auto* data = std::get_if<BinaryData>(&node_)) {
            return std::forward<F>(f)(*data);
        }
        return std::forward<F>(f)(*std::get<Box<BinaryTag>>(node_));
    }

    /// Returns a deep copy of the node.
    [[nodiscard]] auto copy() const -> BinaryNode;

    /// Structural equality: same alternative and equal contents.
    [[nodiscard]] auto operator==(const BinaryNode& other) const -> bool;

    [[nodiscard]] auto operator!=(const BinaryNode& other) const -> bool {
        return !(*this == other);
    }

    /// Renders the node as diagnostic text.
    [[nodiscard]] auto to_string() const -> std::string;

private:
    std::variant<BinaryData, Box<BinaryTag>> node_;
};

} // namespace bintag::tag
