// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file binary_codec.h
/// @brief Compact binary encoding of DeltaDocuments.
///
/// Layout:
/// @code
///   [header]            only when include_header
///     magic "SDC1"
///     varuint version   (1)
///     varuint fingerprint
///     u8 flags          bit0 string table, bit1 type table
///   [string table]      when use_string_table: varuint count, strings
///   [type table]        when use_type_table:   varuint count, (u8 kind, string name)
///   varuint op count
///   op*                 varuint kind, zigzag member index, [varuint index],
///                       [key value], [value], [varuint count, op*]
/// @endcode
///
/// Integers use varuint / zigzag-varint encoding, floats little-endian IEEE.
/// Strings go to the string table when they occur at least twice or are at
/// least STRUCT_DELTA_STRING_TABLE_MIN_BYTES long.
///
/// Without a header the table flags are not on the wire: reader and writer
/// must agree on the options (and on the schema) out of band.
///
/// Decoding checks every count and length against the safety caps and the
/// remaining input before allocating.

#pragma once

#include <struct_delta/api.h>
#include <struct_delta/delta.h>
#include <struct_delta/value.h>

#include <cstdint>
#include <span>
#include <stdexcept>

namespace struct_delta {

class TypeRegistry;

struct SafetyLimits {
    std::size_t max_ops = 1'000'000;
    std::size_t max_string_bytes = 16u * 1024u * 1024u;
    std::size_t max_nesting = 256;
};

struct BinaryDeltaOptions {
    bool include_header = false;
    bool use_string_table = true;
    bool use_type_table = true;
    bool include_enum_type_identity = true;

    /// Written into the header. When non-zero on the reading side, a header
    /// carrying another fingerprint is rejected.
    uint64_t stable_type_fingerprint = 0;

    SafetyLimits safety;

    /// Resolves object type names while decoding; nullptr uses the global
    /// registry
    const TypeRegistry* types = nullptr;
};

/// Corrupt, truncated or over-limit input. No partial document is returned.
class STRUCT_DELTA_API DecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Document that cannot be encoded (opaque values, nesting over the limit)
class STRUCT_DELTA_API EncodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

inline constexpr uint8_t codec_magic[4] = {'S', 'D', 'C', '1'};
inline constexpr uint32_t codec_version = 1;

/// Appends the encoding of doc to sink
/// @throws EncodeError
STRUCT_DELTA_API void write_delta(const DeltaDocument& doc, ByteBuffer& sink,
                                  const BinaryDeltaOptions& options = {});

/// @throws EncodeError
[[nodiscard]] STRUCT_DELTA_API ByteBuffer encode_delta(const DeltaDocument& doc,
                                                       const BinaryDeltaOptions& options = {});

/// @throws DecodeError
[[nodiscard]] STRUCT_DELTA_API DeltaDocument decode_delta(std::span<const uint8_t> bytes,
                                                          const BinaryDeltaOptions& options = {});

/// @throws DecodeError
[[nodiscard]] STRUCT_DELTA_API DeltaDocument decode_delta(const uint8_t* data, std::size_t size,
                                                          const BinaryDeltaOptions& options = {});

} // namespace struct_delta
