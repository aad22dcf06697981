//! # Binary Tag Library
//!
//! Umbrella header for the tagged value model and its binary codec.
//!
//! ## Components
//!
//! | Header            | Contents                                      |
//! |-------------------|-----------------------------------------------|
//! | `data_type.hpp`   | The 16 type discriminants                     |
//! | `tag_error.hpp`   | `TagError` and `TagErrorKind`                 |
//! | `binary_data.hpp` | Leaf values (`BinaryData`)                    |
//! | `binary_tag.hpp`  | Containers (`BinaryTag`)                      |
//! | `binary_node.hpp` | The node sum type (`BinaryNode`)              |
//! | `byte_stream.hpp` | Byte sinks and sources                        |
//! | `data_io.hpp`     | Big-endian primitives and modified UTF-8      |
//! | `codec.hpp`       | Encoding and decoding documents               |
//! | `tag_builder.hpp` | Fluent construction of nested documents       |

#pragma once

#include "bintag/tag/binary_data.hpp"
#include "bintag/tag/binary_node.hpp"
#include "bintag/tag/binary_tag.hpp"
#include "bintag/tag/byte_stream.hpp"
#include "bintag/tag/codec.hpp"
#include "bintag/tag/data_io.hpp"
#include "bintag/tag/data_type.hpp"
#include "bintag/tag/tag_builder.hpp"
#include "bintag/tag/tag_error.hpp"
