//! # Binary Node Implementation

#include "bintag/tag/binary_node.hpp"

#include "bintag/tag/binary_tag.hpp"

namespace bintag::tag {

BinaryNode::BinaryNode(BinaryData data) : node_(std::move(data)) {}

BinaryNode::BinaryNode(BinaryTag tag) : node_(make_box<BinaryTag>(std::move(tag))) {}

BinaryNode::~BinaryNode() = default;
BinaryNode::BinaryNode(BinaryNode&& other) noexcept = default;
auto BinaryNode::operator=(BinaryNode&& other) noexcept -> BinaryNode& = default;

auto BinaryNode::type() const -> DataType {
    if (const auto* data = std::get_if<BinaryData>(&node_)) {
        return data->type();
    }
    return DataType::Tag;
}

auto BinaryNode::as_data() const -> Result<const BinaryData*, TagError> {
    if (const auto* data = std::get_if<BinaryData>(&node_)) {
        return data;
    }
    return TagError::composite_not_data();
}

auto BinaryNode::as_tag() const -> Result<const BinaryTag*, TagError> {
    if (const auto* tag = std::get_if<Box<BinaryTag>>(&node_)) {
        return static_cast<const BinaryTag*>(tag->get());
    }
    return TagError::type_mismatch(DataType::Tag, type());
}

auto BinaryNode::as_tag_mut() -> Result<BinaryTag*, TagError> {
    if (auto* tag = std::get_if<Box<BinaryTag>>(&node_)) {
        return tag->get();
    }
    return TagError::type_mismatch(DataType::Tag, type());
}

auto BinaryNode::copy() const -> BinaryNode {
    return visit([](const auto& value) { return BinaryNode(value.copy()); });
}

auto BinaryNode::operator==(const BinaryNode& other) const -> bool {
    if (node_.index() != other.node_.index()) {
        return false;
    }
    if (const auto* data = std::get_if<BinaryData>(&node_)) {
        return *data == std::get<BinaryData>(other.node_);
    }
    return *std::get<Box<BinaryTag>>(node_) == *std::get<Box<BinaryTag>>(other.node_);
}

} // namespace bintag::tag
