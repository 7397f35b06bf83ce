// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value.h
/// @brief Value type for in-memory object graphs.
///
/// A Value is one slot of an object graph. It can hold:
/// - Null (std::monostate)
/// - Scalars: bool, int8..int64, uint8..uint64, float, double, Decimal,
///   string, Guid, ByteBuffer, EnumValue
/// - Temporal values: Timestamp, OffsetTimestamp, Duration
/// - Reference types, shared by pointer and identified by address:
///   Object, Sequence, FrozenSequence, Map, FrozenMap, MultiArray, Opaque
///
/// Reference types make cycles possible. Two Values naming the same node
/// share it, which is what the comparison engines treat as "identical".
///
/// Mutable collections (Sequence, Map) are edited in place. The frozen ones
/// (FrozenSequence, FrozenMap) are immer containers and never change after
/// construction.

#pragma once

#include "struct_delta_config.h"

#include "api.h"
#include "value_fwd.h"

#include <immer/flex_vector.hpp>
#include <immer/map.hpp>

#include <tsl/robin_map.h>

#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/multiprecision/cpp_dec_float.hpp>
#include <boost/uuid/uuid.hpp>

#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <source_location> // for std::source_location (C++20)
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace struct_delta {

namespace detail {

inline void log_access_error(
    std::string_view func,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if STRUCT_DELTA_VERBOSE_LOG
    std::cerr << "[" << func << "] " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)message;
    (void)loc;
#endif
}

inline void log_key_error(
    std::string_view func,
    std::string_view key,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if STRUCT_DELTA_VERBOSE_LOG
    std::cerr << "[" << func << "] key '" << key << "' " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)key;
    (void)reason;
    (void)loc;
#endif
}

inline void log_index_error(
    std::string_view func,
    std::size_t index,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if STRUCT_DELTA_VERBOSE_LOG
    std::cerr << "[" << func << "] index " << index << " " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)index;
    (void)reason;
    (void)loc;
#endif
}

template <typename T>
struct is_shared_ptr : std::false_type {};

template <typename T>
struct is_shared_ptr<std::shared_ptr<T>> : std::true_type {};

/// True for the reference alternatives of Value (all held by shared_ptr)
template <typename T>
inline constexpr bool is_reference_alternative_v = is_shared_ptr<T>::value;

} // namespace detail

// ============================================================
// Scalar types
// ============================================================

using Decimal    = boost::multiprecision::cpp_dec_float_50;
using Guid       = boost::uuids::uuid;
using DateTime   = boost::posix_time::ptime;
using Duration   = boost::posix_time::time_duration;
using ByteBuffer = std::vector<uint8_t>;

using PathElement = std::variant<std::string, std::size_t>;
using Path        = std::vector<PathElement>;

/// What a Timestamp's wall-clock reading is relative to
enum class TimeKind : uint8_t {
    Unspecified = 0,
    Utc         = 1,
    Local       = 2,
};

/// Point in time plus the kind it was recorded in.
/// Equal only when both the instant and the kind match.
struct Timestamp {
    DateTime instant;
    TimeKind kind = TimeKind::Unspecified;

    bool operator==(const Timestamp& other) const {
        return kind == other.kind && instant == other.instant;
    }
};

/// Wall-clock time at a fixed UTC offset.
/// Equal only when the offset and the UTC instant both match.
struct OffsetTimestamp {
    DateTime local;
    Duration offset;

    [[nodiscard]] DateTime utc() const { return local - offset; }

    bool operator==(const OffsetTimestamp& other) const {
        return offset == other.offset && utc() == other.utc();
    }
};

/// Enumeration value: declaring type name plus underlying value.
/// An empty type name means "identity unknown" (decoded without enum identity)
/// and matches any type name carrying the same value.
struct EnumValue {
    std::string type_name;
    int64_t value = 0;

    bool operator==(const EnumValue& other) const {
        return value == other.value &&
               (type_name.empty() || other.type_name.empty() || type_name == other.type_name);
    }
};

/// Host-native value the engines cannot look into.
/// Compared through equals() (and the TypeRegistry, keyed by type_name()).
class STRUCT_DELTA_API Opaque {
public:
    virtual ~Opaque() = default;

    [[nodiscard]] virtual std::string_view type_name() const noexcept = 0;
    [[nodiscard]] virtual bool equals(const Opaque& other) const = 0;
    [[nodiscard]] virtual std::string to_string() const;
};

// Hash/equality used for map keys: same alternative and same value,
// reference types by identity.
struct STRUCT_DELTA_API ValueKeyHash {
    [[nodiscard]] std::size_t operator()(const Value& v) const;
};

struct STRUCT_DELTA_API ValueKeyEqual {
    [[nodiscard]] bool operator()(const Value& a, const Value& b) const noexcept;
};

// ============================================================
// Value
// ============================================================

struct STRUCT_DELTA_API Value
{
    using variant_type = std::variant<std::monostate,
                                      bool,
                                      int8_t,
                                      int16_t,
                                      int32_t,
                                      int64_t,
                                      uint8_t,
                                      uint16_t,
                                      uint32_t,
                                      uint64_t,
                                      float,
                                      double,
                                      Decimal,
                                      std::string,
                                      Guid,
                                      ByteBuffer,
                                      EnumValue,
                                      Timestamp,
                                      OffsetTimestamp,
                                      Duration,
                                      ObjectPtr,
                                      SequencePtr,
                                      FrozenSequencePtr,
                                      MapPtr,
                                      FrozenMapPtr,
                                      ArrayPtr,
                                      OpaquePtr>;

    variant_type data;

    Value() noexcept : data(std::monostate{}) {}
    Value(std::nullptr_t) noexcept : data(std::monostate{}) {}
    Value(bool v) noexcept : data(std::in_place_type<bool>, v) {}
    Value(int8_t v) noexcept : data(std::in_place_type<int8_t>, v) {}
    Value(int16_t v) noexcept : data(std::in_place_type<int16_t>, v) {}
    Value(int32_t v) noexcept : data(std::in_place_type<int32_t>, v) {}
    Value(int64_t v) noexcept : data(std::in_place_type<int64_t>, v) {}
    Value(uint8_t v) noexcept : data(std::in_place_type<uint8_t>, v) {}
    Value(uint16_t v) noexcept : data(std::in_place_type<uint16_t>, v) {}
    Value(uint32_t v) noexcept : data(std::in_place_type<uint32_t>, v) {}
    Value(uint64_t v) noexcept : data(std::in_place_type<uint64_t>, v) {}
    Value(float v) noexcept : data(std::in_place_type<float>, v) {}
    Value(double v) noexcept : data(std::in_place_type<double>, v) {}
    Value(Decimal v) : data(std::in_place_type<Decimal>, std::move(v)) {}
    Value(const std::string& v) : data(std::in_place_type<std::string>, v) {}
    Value(std::string&& v) noexcept : data(std::in_place_type<std::string>, std::move(v)) {}
    Value(std::string_view v) : data(std::in_place_type<std::string>, v) {}
    Value(const char* v) : data(std::in_place_type<std::string>, v) {}
    Value(const Guid& v) noexcept : data(std::in_place_type<Guid>, v) {}
    Value(ByteBuffer v) noexcept : data(std::in_place_type<ByteBuffer>, std::move(v)) {}
    Value(EnumValue v) noexcept : data(std::in_place_type<EnumValue>, std::move(v)) {}
    Value(Timestamp v) noexcept : data(std::in_place_type<Timestamp>, v) {}
    Value(OffsetTimestamp v) noexcept : data(std::in_place_type<OffsetTimestamp>, v) {}
    Value(Duration v) noexcept : data(std::in_place_type<Duration>, v) {}
    Value(ObjectPtr v) noexcept : data(std::in_place_type<ObjectPtr>, std::move(v)) {}
    Value(SequencePtr v) noexcept : data(std::in_place_type<SequencePtr>, std::move(v)) {}
    Value(FrozenSequencePtr v) noexcept : data(std::in_place_type<FrozenSequencePtr>, std::move(v)) {}
    Value(MapPtr v) noexcept : data(std::in_place_type<MapPtr>, std::move(v)) {}
    Value(FrozenMapPtr v) noexcept : data(std::in_place_type<FrozenMapPtr>, std::move(v)) {}
    Value(ArrayPtr v) noexcept : data(std::in_place_type<ArrayPtr>, std::move(v)) {}
    Value(OpaquePtr v) noexcept : data(std::in_place_type<OpaquePtr>, std::move(v)) {}

    template <typename T>
    [[nodiscard]] const T* get_if() const { return std::get_if<T>(&data); }

    template <typename T>
    [[nodiscard]] T* get_if() { return std::get_if<T>(&data); }

    template <typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(data); }

    [[nodiscard]] std::size_t type_index() const noexcept { return data.index(); }

    /// True for null and for a reference alternative holding a null pointer
    [[nodiscard]] bool is_null() const noexcept;

    [[nodiscard]] bool is_object() const noexcept { return is<ObjectPtr>() && *get_if<ObjectPtr>(); }
    [[nodiscard]] bool is_numeric() const noexcept;
    [[nodiscard]] bool is_floating() const noexcept;

    /// Any sequence shape: Sequence or FrozenSequence
    [[nodiscard]] bool is_sequence() const noexcept;

    /// Any map shape: Map or FrozenMap
    [[nodiscard]] bool is_map() const noexcept;

    /// Address of the referenced node, nullptr for scalars and null references
    [[nodiscard]] const void* identity() const noexcept;

    [[nodiscard]] ObjectPtr as_object() const {
        if (auto* p = get_if<ObjectPtr>()) return *p;
        return nullptr;
    }

    [[nodiscard]] int64_t as_int64(int64_t default_val = 0) const;
    [[nodiscard]] double as_double(double default_val = 0.0) const;

    [[nodiscard]] std::string as_string(std::string default_val = "") const {
        if (auto* p = get_if<std::string>()) return *p;
        return default_val;
    }

    [[nodiscard]] bool as_bool(bool default_val = false) const {
        if (auto* p = get_if<bool>()) return *p;
        return default_val;
    }

    /// Short name of the held alternative ("int32", "object", "sequence", ...)
    [[nodiscard]] std::string_view kind_name() const noexcept;
};

/// Exact value equality: same alternative, same scalar value,
/// reference alternatives by identity. Deep comparison lives in deep_equal.h.
STRUCT_DELTA_API bool operator==(const Value& a, const Value& b);

// ============================================================
// Reference node types
// ============================================================

/// Typed object: one field slot per member of its descriptor
struct STRUCT_DELTA_API Object {
    TypeDescriptorPtr type;
    std::vector<Value> fields;

    explicit Object(TypeDescriptorPtr t);

    [[nodiscard]] static ObjectPtr make(TypeDescriptorPtr t);

    [[nodiscard]] const std::string& type_name() const;

    /// Field slot by member name, nullptr (and a log line) if unknown
    [[nodiscard]] Value* find(std::string_view member);
    [[nodiscard]] const Value* find(std::string_view member) const;

    /// Field value by member name, null if unknown
    [[nodiscard]] Value get(std::string_view member) const;

    /// @throws std::out_of_range if the member does not exist
    void set(std::string_view member, Value v);
};

/// Growable list, mutated in place
struct STRUCT_DELTA_API Sequence {
    std::vector<Value> items;

    [[nodiscard]] static SequencePtr make(std::vector<Value> items = {}) {
        auto s = std::make_shared<Sequence>();
        s->items = std::move(items);
        return s;
    }
};

/// Read-only list; edits go through clone-on-write
struct STRUCT_DELTA_API FrozenSequence {
    immer::flex_vector<Value> items;

    [[nodiscard]] static FrozenSequencePtr make(immer::flex_vector<Value> items = {}) {
        auto s = std::make_shared<FrozenSequence>();
        s->items = std::move(items);
        return s;
    }
};

using MapStorage       = tsl::robin_map<Value, Value, ValueKeyHash, ValueKeyEqual>;
using FrozenMapStorage = immer::map<Value, Value, ValueKeyHash, ValueKeyEqual>;

/// Mutable key-value map
struct STRUCT_DELTA_API Map {
    MapStorage entries;

    [[nodiscard]] static MapPtr make() { return std::make_shared<Map>(); }
};

/// Read-only key-value map; edits go through clone-on-write
struct STRUCT_DELTA_API FrozenMap {
    FrozenMapStorage entries;

    [[nodiscard]] static FrozenMapPtr make(FrozenMapStorage entries = {}) {
        auto m = std::make_shared<FrozenMap>();
        m->entries = std::move(entries);
        return m;
    }
};

/// Fixed-rank array, cells stored in row-major order.
/// A jagged array is a Sequence (or MultiArray) of MultiArrays instead.
struct STRUCT_DELTA_API MultiArray {
    std::vector<std::size_t> shape;
    std::vector<Value> cells;

    [[nodiscard]] static ArrayPtr make(std::vector<std::size_t> shape);
    [[nodiscard]] static ArrayPtr make_1d(std::vector<Value> cells);

    [[nodiscard]] std::size_t rank() const noexcept { return shape.size(); }

    /// Row-major offset of a multi-index
    /// @throws std::out_of_range on rank mismatch or out-of-range index
    [[nodiscard]] std::size_t offset(const std::vector<std::size_t>& index) const;

    [[nodiscard]] Value& at(const std::vector<std::size_t>& index) { return cells[offset(index)]; }
    [[nodiscard]] const Value& at(const std::vector<std::size_t>& index) const { return cells[offset(index)]; }
};

// ============================================================
// Uniform read access over the two sequence and the two map shapes
// ============================================================

class STRUCT_DELTA_API SequenceView {
public:
    /// Empty optional when v is not a (non-null) sequence
    [[nodiscard]] static std::optional<SequenceView> of(const Value& v);

    [[nodiscard]] std::size_t size() const noexcept {
        return vec_ ? vec_->size() : flex_->size();
    }

    [[nodiscard]] const Value& operator[](std::size_t i) const {
        return vec_ ? (*vec_)[i] : (*flex_)[i];
    }

    [[nodiscard]] bool frozen() const noexcept { return flex_ != nullptr; }

private:
    const std::vector<Value>* vec_ = nullptr;
    const immer::flex_vector<Value>* flex_ = nullptr;
};

class STRUCT_DELTA_API MapView {
public:
    [[nodiscard]] static std::optional<MapView> of(const Value& v);

    [[nodiscard]] std::size_t size() const noexcept {
        return map_ ? map_->size() : frozen_->size();
    }

    [[nodiscard]] const Value* find(const Value& key) const;

    /// fn(const Value& key, const Value& value) for every entry
    template <typename Fn>
    void for_each(Fn&& fn) const {
        if (map_) {
            for (const auto& kv : *map_) fn(kv.first, kv.second);
        } else {
            for (const auto& kv : *frozen_) fn(kv.first, kv.second);
        }
    }

    [[nodiscard]] bool frozen() const noexcept { return frozen_ != nullptr; }

private:
    const MapStorage* map_ = nullptr;
    const FrozenMapStorage* frozen_ = nullptr;
};

// ============================================================
// Utility functions
// ============================================================

/// Deep copy of a graph. Sharing and cycles inside the copied graph are
/// preserved; opaque values are shared (they are immutable by contract).
[[nodiscard]] STRUCT_DELTA_API Value clone_value(const Value& val);

// Convert Value to a single-line human-readable string
[[nodiscard]] STRUCT_DELTA_API std::string value_to_string(const Value& val);

// Print Value with indentation
STRUCT_DELTA_API void print_value(const Value& val, const std::string& prefix = "", std::size_t depth = 0);

// Convert Path to dot-notation string (e.g., ".orders[0].lines[2]")
[[nodiscard]] STRUCT_DELTA_API std::string path_to_string(const Path& path);

} // namespace struct_delta
