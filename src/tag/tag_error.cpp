//! # Tag Error Implementation
//!
//! Factory functions and formatting for `TagError`.

#include "bintag/tag/tag_error.hpp"

#include "bintag/tag/data_type.hpp"

namespace bintag::tag {

auto error_kind_name(TagErrorKind kind) -> const char* {
    switch (kind) {
    case TagErrorKind::TypeMismatch:
        return "TypeMismatch";
    case TagErrorKind::KeyNotFound:
        return "KeyNotFound";
    case TagErrorKind::CompositeNotData:
        return "CompositeNotData";
    case TagErrorKind::IncompatibleReplacement:
        return "IncompatibleReplacement";
    case TagErrorKind::UnknownDiscriminant:
        return "UnknownDiscriminant";
    case TagErrorKind::InvalidData:
        return "InvalidData";
    case TagErrorKind::Io:
        return "Io";
    }
    return "???";
}

auto TagError::type_mismatch(DataType expected, DataType actual, std::string_view key)
    -> TagError {
    std::string msg = "expected " + describe(expected) + ", got " + describe(actual);
    if (!key.empty()) {
        msg = "entry '" + std::string(key) + "': " + msg;
    }
    return TagError{TagErrorKind::TypeMismatch, std::move(msg), std::string(key), expected, actual,
                    std::nullopt};
}

auto TagError::key_not_found(std::string_view key) -> TagError {
    return TagError{TagErrorKind::KeyNotFound,
                    "no entry named '" + std::string(key) + "'",
                    std::string(key),
                    std::nullopt,
                    std::nullopt,
                    std::nullopt};
}

auto TagError::composite_not_data(std::string_view key) -> TagError {
    std::string msg = "expected leaf data, got TAG";
    if (!key.empty()) {
        msg = "entry '" + std::string(key) + "': " + msg;
    }
    return TagError{TagErrorKind::CompositeNotData, std::move(msg), std::string(key),
                    std::nullopt, DataType::Tag, std::nullopt};
}

auto TagError::incompatible_replacement(std::string_view key, DataType previous,
                                        DataType replacement) -> TagError {
    return TagError{TagErrorKind::IncompatibleReplacement,
                    "entry '" + std::string(key) + "' holds " + describe(previous) +
                        ", which does not match the new type " + describe(replacement),
                    std::string(key),
                    previous,
                    replacement,
                    std::nullopt};
}

auto TagError::unknown_discriminant(unsigned id, std::optional<size_t> offset) -> TagError {
    return TagError{TagErrorKind::UnknownDiscriminant,
                    "unknown data type id " + std::to_string(id),
                    "",
                    std::nullopt,
                    std::nullopt,
                    offset};
}

auto TagError::invalid_data(std::string msg, std::optional<size_t> offset) -> TagError {
    return TagError{TagErrorKind::InvalidData, std::move(msg), "", std::nullopt, std::nullopt,
                    offset};
}

auto TagError::io(std::string msg, std::optional<size_t> offset) -> TagError {
    return TagError{TagErrorKind::Io, std::move(msg), "", std::nullopt, std::nullopt, offset};
}

auto TagError::to_string() const -> std::string {
    std::string result = std::string(error_kind_name(kind)) + ": " + message;
    if (offset) {
        return "offset " + std::to_string(*offset) + ": " + result;
    }
    return result;
}

} // namespace bintag::tag
