//! # Tag Builder Implementation
//!
//! The builder keeps a stack of `Context` objects. A `Tag` context
//! accumulates entries; a `TagArray` context accumulates containers. Each
//! nested context remembers the key it will be stored under, and `end()`
//! pops it into its parent: as an entry if the parent is a container, as an
//! element if the parent is a tag array.

#include "bintag/tag/tag_builder.hpp"

namespace bintag::tag {

TagBuilder::TagBuilder() {
    stack_.push(Context{Context::Kind::Tag, "", BinaryTag(), TagArray()});
}

void TagBuilder::require_tag_context(const char* method) const {
    if (stack_.top().kind != Context::Kind::Tag) {
        throw std::logic_error(std::string("TagBuilder::") + method +
                               "() called inside a tag array; use item_tag()");
    }
}

auto TagBuilder::current_tag(const char* method) -> BinaryTag& {
    require_tag_context(method);
    return stack_.top().tag;
}

// ============================================================================
// Structure Methods
// ============================================================================

auto TagBuilder::field_tag(const std::string& key) -> TagBuilder& {
    require_tag_context("field_tag");
    stack_.push(Context{Context::Kind::Tag, key, BinaryTag(), TagArray()});
    return *this;
}

auto TagBuilder::field_tag_array(const std::string& key) -> TagBuilder& {
    require_tag_context("field_tag_array");
    stack_.push(Context{Context::Kind::TagArray, key, BinaryTag(), TagArray()});
    return *this;
}

auto TagBuilder::item_tag() -> TagBuilder& {
    if (stack_.top().kind != Context::Kind::TagArray) {
        throw std::logic_error("TagBuilder::item_tag() called outside a tag array");
    }
    stack_.push(Context{Context::Kind::Tag, "", BinaryTag(), TagArray()});
    return *this;
}

auto TagBuilder::end() -> TagBuilder& {
    if (stack_.size() <= 1) {
        throw std::logic_error("TagBuilder::end() called with no nested context open");
    }

    Context ctx = std::move(stack_.top());
    stack_.pop();
    auto& parent = stack_.top();

    if (parent.kind == Context::Kind::TagArray) {
        parent.items.push_back(std::move(ctx.tag));
        return *this;
    }

    BinaryNode node = ctx.kind == Context::Kind::Tag
                          ? BinaryNode(std::move(ctx.tag))
                          : BinaryNode(BinaryData::of_tag_array(std::move(ctx.items)));
    auto status = parent.tag.set(ctx.key, std::move(node), false);
    if (is_err(status)) {
        throw std::logic_error("TagBuilder::end(): " + unwrap_err(status).to_string());
    }
    return *this;
}

// ============================================================================
// Field Methods
// ============================================================================

auto TagBuilder::field(const std::string& key, BinaryNode node) -> TagBuilder& {
    auto status = current_tag("field").set(key, std::move(node), false);
    if (is_err(status)) {
        throw std::logic_error("TagBuilder::field(): " + unwrap_err(status).to_string());
    }
    return *this;
}

auto TagBuilder::field_byte(const std::string& key, int8_t value) -> TagBuilder& {
    return field(key, BinaryData::of_byte(value));
}

auto TagBuilder::field_short(const std::string& key, int16_t value) -> TagBuilder& {
    return field(key, BinaryData::of_short(value));
}

auto TagBuilder::field_int(const std::string& key, int32_t value) -> TagBuilder& {
    return field(key, BinaryData::of_int(value));
}

auto TagBuilder::field_long(const std::string& key, int64_t value) -> TagBuilder& {
    return field(key, BinaryData::of_long(value));
}

auto TagBuilder::field_float(const std::string& key, float value) -> TagBuilder& {
    return field(key, BinaryData::of_float(value));
}

auto TagBuilder::field_double(const std::string& key, double value) -> TagBuilder& {
    return field(key, BinaryData::of_double(value));
}

auto TagBuilder::field_string(const std::string& key, std::string value) -> TagBuilder& {
    return field(key, BinaryData::of_string(std::move(value)));
}

auto TagBuilder::field_byte_array(const std::string& key, std::vector<int8_t> values)
    -> TagBuilder& {
    return field(key, BinaryData::of_byte_array(std::move(values)));
}

auto TagBuilder::field_short_array(const std::string& key, std::vector<int16_t> values)
    -> TagBuilder& {
    return field(key, BinaryData::of_short_array(std::move(values)));
}

auto TagBuilder::field_int_array(const std::string& key, std::vector<int32_t> values)
    -> TagBuilder& {
    return field(key, BinaryData::of_int_array(std::move(values)));
}

auto TagBuilder::field_long_array(const std::string& key, std::vector<int64_t> values)
    -> TagBuilder& {
    return field(key, BinaryData::of_long_array(std::move(values)));
}

auto TagBuilder::field_float_array(const std::string& key, std::vector<float> values)
    -> TagBuilder& {
    return field(key, BinaryData::of_float_array(std::move(values)));
}

auto TagBuilder::field_double_array(const std::string& key, std::vector<double> values)
    -> TagBuilder& {
    return field(key, BinaryData::of_double_array(std::move(values)));
}

auto TagBuilder::field_string_array(const std::string& key, std::vector<std::string> values)
    -> TagBuilder& {
    return field(key, BinaryData::of_string_array(std::move(values)));
}

// ============================================================================
// Finalization
// ============================================================================

auto TagBuilder::build() -> BinaryTag {
    if (stack_.size() != 1) {
        throw std::logic_error("TagBuilder::build() called with " +
                               std::to_string(stack_.size() - 1) + " unclosed context(s)");
    }
    BinaryTag result = std::move(stack_.top().tag);
    stack_.top().tag = BinaryTag();
    return result;
}

} // namespace bintag::tag
