//! # Tag Rendering
//!
//! Implements `to_string()` for `BinaryData`, `BinaryTag` and `BinaryNode`.
//! The output is diagnostic text, never parsed back, but its punctuation is
//! stable so that tests and logs can rely on it.
//!
//! ## Format
//!
//! | Value | Rendering |
//! |-------|-----------|
//! | `Byte` / `Short` / `Int` / `Long` | `42b` / `42s` / `42` / `42L` |
//! | `Float` / `Double` | `1.5f` / `1.5d` (always with a fraction or exponent) |
//! | `String` | `"text"` with `\"` and `\\` escaped |
//! | numeric arrays | `[B;1b,2b]`, `[S;..]`, `[I;..]`, `[L;..]`, `[F;..]`, `[D;..]` |
//! | `StringArray` / `TagArray` | `["a","b"]` / `[{..},{..}]` |
//! | `Tag` | `{key:value,...}` in key order |
//!
//! Keys made only of `[A-Za-z0-9_.+-]` are written bare; others are quoted.
//!
//! ## Example
//!
//! ```cpp
//! BinaryTag tag;
//! tag.set_int("number", 42);
//! tag.set_float_array("position", {1.0f, 0.0f});
//! tag.to_string();   // {number:42,position:[F;1.0f,0.0f]}
//! ```

#include "bintag/tag/binary_data.hpp"
#include "bintag/tag/binary_node.hpp"
#include "bintag/tag/binary_tag.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <string>
#include <type_traits>

namespace bintag::tag {

namespace {

void render_tag(const BinaryTag& tag, std::string& out);

/// Appends `s` in double quotes, escaping quotes and backslashes.
void append_quoted(std::string_view s, std::string& out) {
    out += '"';
    for (char c : s) {
        if (c == '"' || c == '\\') {
            out += '\\';
        }
        out += c;
    }
    out += '"';
}

auto is_bare_key(std::string_view key) -> bool {
    if (key.empty()) {
        return false;
    }
    for (char c : key) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                  c == '_' || c == '.' || c == '+' || c == '-';
        if (!ok) {
            return false;
        }
    }
    return true;
}

/// Formats a float or double using the shortest text that reads back to
/// the same value.
///
/// Integral values get a `.0` so they never look like integers.
template <typename T> void append_floating(T value, char suffix, std::string& out) {
    if (std::isnan(value)) {
        out += "NaN";
    } else if (std::isinf(value)) {
        out += value < 0 ? "-Infinity" : "Infinity";
    } else {
        std::array<char, 64> buf{};
        auto result = std::to_chars(buf.data(), buf.data() + buf.size(), value);
        std::string_view text(buf.data(), static_cast<size_t>(result.ptr - buf.data()));
        out += text;
        if (text.find_first_of(".e") == std::string_view::npos) {
            out += ".0";
        }
    }
    out += suffix;
}

/// Appends one scalar element in its suffixed form.
template <typename T> void append_scalar(const T& value, std::string& out) {
    if constexpr (std::is_same_v<T, int8_t>) {
        out += std::to_string(static_cast<int>(value));
        out += 'b';
    } else if constexpr (std::is_same_v<T, int16_t>) {
        out += std::to_string(value);
        out += 's';
    } else if constexpr (std::is_same_v<T, int32_t>) {
        out += std::to_string(value);
    } else if constexpr (std::is_same_v<T, int64_t>) {
        out += std::to_string(value);
        out += 'L';
    } else if constexpr (std::is_same_v<T, float>) {
        append_floating(value, 'f', out);
    } else if constexpr (std::is_same_v<T, double>) {
        append_floating(value, 'd', out);
    } else {
        append_quoted(value, out);
    }
}

/// Returns the `X;` prefix of a numeric array, or nothing for strings.
template <typename T> constexpr auto array_prefix() -> std::string_view {
    if constexpr (std::is_same_v<T, int8_t>) {
        return "B;";
    } else if constexpr (std::is_same_v<T, int16_t>) {
        return "S;";
    } else if constexpr (std::is_same_v<T, int32_t>) {
        return "I;";
    } else if constexpr (std::is_same_v<T, int64_t>) {
        return "L;";
    } else if constexpr (std::is_same_v<T, float>) {
        return "F;";
    } else if constexpr (std::is_same_v<T, double>) {
        return "D;";
    } else {
        return "";
    }
}

void render_data(const BinaryData& data, std::string& out) {
    std::visit(
        [&data, &out]([[maybe_unused]] const auto& value) {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, Box<TagArray>>) {
                auto items = unwrap(data.as_tag_array());
                out += '[';
                for (size_t i = 0; i < items.size(); ++i) {
                    if (i > 0) {
                        out += ',';
                    }
                    render_tag(items[i], out);
                }
                out += ']';
            } else if constexpr (std::is_arithmetic_v<T> || std::is_same_v<T, std::string>) {
                append_scalar(value, out);
            } else {
                using Elem = typename T::value_type;
                out += '[';
                out += array_prefix<Elem>();
                for (size_t i = 0; i < value.size(); ++i) {
                    if (i > 0) {
                        out += ',';
                    }
                    append_scalar(value[i], out);
                }
                out += ']';
            }
        },
        data.payload());
}

void render_tag(const BinaryTag& tag, std::string& out) {
    out += '{';
    bool first = true;
    for (const auto& [key, node] : tag.entries()) {
        if (!first) {
            out += ',';
        }
        first = false;
        if (is_bare_key(key)) {
            out += key;
        } else {
            append_quoted(key, out);
        }
        out += ':';
        node.visit([&out](const auto& value) {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, BinaryData>) {
                render_data(value, out);
            } else {
                render_tag(value, out);
            }
        });
    }
    out += '}';
}

} // namespace

auto BinaryData::to_string() const -> std::string {
    std::string out;
    render_data(*this, out);
    return out;
}

auto BinaryTag::to_string() const -> std::string {
    std::string out;
    render_tag(*this, out);
    return out;
}

auto BinaryNode::to_string() const -> std::string {
    return visit([](const auto& value) { return value.to_string(); });
}

} // namespace bintag::tag
