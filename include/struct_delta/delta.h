// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file delta.h
/// @brief Delta documents: compute the edit list between two graphs and
///        replay it onto a target.
///
/// A DeltaDocument is an ordered list of DeltaOps addressing the members of
/// one object. Member slots are identified by their member index under the
/// declaring type's IndexMode (see type_descriptor.h), never by name.
/// Changes deep inside a nested object are expressed with the Nested* kinds,
/// whose nested document addresses the nested object's own members.
///
/// Operations are applied strictly in order and later operations see the
/// state left by earlier ones (two SeqAddAt at the same index are cumulative).
///
/// Usage:
/// @code
///   DeltaDocument doc = compute_delta(before, after);
///   Value target = clone_value(before);
///   apply_delta(target, doc);           // target now deep-equals after
/// @endcode

#pragma once

#include <struct_delta/api.h>
#include <struct_delta/comparison_context.h>
#include <struct_delta/value.h>

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace struct_delta {

enum class DeltaKind : uint8_t {
    ReplaceObject = 0,   ///< replace the whole document target with value
    SetMember     = 1,   ///< assign value to the member
    NestedMember  = 2,   ///< apply nested to the object held by the member

    SeqSetAt      = 10,  ///< element[index] = value
    SeqAddAt      = 11,  ///< insert value before index (index == size appends)
    SeqRemoveAt   = 12,  ///< erase element[index]
    SeqNestedAt   = 13,  ///< apply nested to the object element[index]

    MapSet        = 20,  ///< map[key] = value
    MapRemove     = 21,  ///< erase key (absent key is a no-op)
    MapNested     = 22,  ///< apply nested to the object map[key]
};

[[nodiscard]] STRUCT_DELTA_API const char* to_string(DeltaKind kind) noexcept;

/// True for the kinds that carry an `index`
[[nodiscard]] constexpr bool has_index(DeltaKind k) noexcept {
    return k == DeltaKind::SeqSetAt || k == DeltaKind::SeqAddAt ||
           k == DeltaKind::SeqRemoveAt || k == DeltaKind::SeqNestedAt;
}

/// True for the kinds that carry a `key`
[[nodiscard]] constexpr bool has_key(DeltaKind k) noexcept {
    return k == DeltaKind::MapSet || k == DeltaKind::MapRemove || k == DeltaKind::MapNested;
}

/// True for the kinds that carry a `value`
[[nodiscard]] constexpr bool has_value(DeltaKind k) noexcept {
    return k == DeltaKind::ReplaceObject || k == DeltaKind::SetMember ||
           k == DeltaKind::SeqSetAt || k == DeltaKind::SeqAddAt || k == DeltaKind::MapSet;
}

/// True for the kinds that carry a `nested` document
[[nodiscard]] constexpr bool has_nested(DeltaKind k) noexcept {
    return k == DeltaKind::NestedMember || k == DeltaKind::SeqNestedAt || k == DeltaKind::MapNested;
}

class DeltaDocument;

struct STRUCT_DELTA_API DeltaOp {
    DeltaKind kind = DeltaKind::SetMember;
    int32_t member_index = -1;  // -1 for ReplaceObject
    int32_t index = -1;
    Value key;
    Value value;
    std::shared_ptr<const DeltaDocument> nested;
};

/// Operation-for-operation equality; values and keys compare with deep_equal
STRUCT_DELTA_API bool operator==(const DeltaOp& a, const DeltaOp& b);

class STRUCT_DELTA_API DeltaDocument {
public:
    DeltaDocument() = default;
    explicit DeltaDocument(std::vector<DeltaOp> ops) : ops_(std::move(ops)) {}

    [[nodiscard]] const std::vector<DeltaOp>& ops() const noexcept { return ops_; }
    [[nodiscard]] bool empty() const noexcept { return ops_.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return ops_.size(); }

    /// Operations of the whole tree, nested documents included
    [[nodiscard]] std::size_t total_ops() const noexcept;

    /// Deepest nesting of nested documents (1 for a flat document)
    [[nodiscard]] std::size_t depth() const noexcept;

    friend bool operator==(const DeltaDocument& a, const DeltaDocument& b) { return a.ops_ == b.ops_; }

private:
    friend class DeltaWriter;
    std::vector<DeltaOp> ops_;
};

// ============================================================
// DeltaWriter - appends operations in document order
// ============================================================

class STRUCT_DELTA_API DeltaWriter {
public:
    void replace_object(Value value);
    void set_member(int32_t member_index, Value value);
    void nested_member(int32_t member_index, DeltaDocument nested);

    void seq_set_at(int32_t member_index, int32_t index, Value value);
    void seq_add_at(int32_t member_index, int32_t index, Value value);
    void seq_remove_at(int32_t member_index, int32_t index);
    void seq_nested_at(int32_t member_index, int32_t index, DeltaDocument nested);

    void map_set(int32_t member_index, Value key, Value value);
    void map_remove(int32_t member_index, Value key);
    void map_nested(int32_t member_index, Value key, DeltaDocument nested);

    void append(DeltaOp op) { doc_.ops_.push_back(std::move(op)); }

    [[nodiscard]] bool empty() const noexcept { return doc_.ops_.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return doc_.ops_.size(); }

    /// Moves the accumulated document out; the writer is empty afterwards
    [[nodiscard]] DeltaDocument finish();

private:
    DeltaDocument doc_;
};

// ============================================================
// DeltaReader - iterates operations, optionally of a single member
// ============================================================

class STRUCT_DELTA_API DeltaReader {
public:
    explicit DeltaReader(const DeltaDocument& doc) : doc_(&doc) {}

    [[nodiscard]] auto begin() const { return doc_->ops().begin(); }
    [[nodiscard]] auto end() const { return doc_->ops().end(); }

    /// Operations targeting member_index, in document order
    [[nodiscard]] std::vector<const DeltaOp*> for_member(int32_t member_index) const;

    [[nodiscard]] bool touches(int32_t member_index) const;

private:
    const DeltaDocument* doc_;
};

/// Apply-time shape mismatch: unknown member index, index outside the valid
/// range, or an operation addressing a slot of the wrong shape
class STRUCT_DELTA_API ApplyError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ============================================================
// Compute / apply
// ============================================================

[[nodiscard]] STRUCT_DELTA_API DeltaDocument compute_delta(const Value& before, const Value& after);
[[nodiscard]] STRUCT_DELTA_API DeltaDocument compute_delta(const Value& before, const Value& after,
                                                           const ComparisonOptions& options);
[[nodiscard]] STRUCT_DELTA_API DeltaDocument compute_delta(const Value& before, const Value& after,
                                                           ComparisonContext& ctx);

/// Member-level delta between two objects of the same type
[[nodiscard]] STRUCT_DELTA_API DeltaDocument compute_object_delta(const Object& before, const Object& after,
                                                                  ComparisonContext& ctx);

/// Replays doc onto target and returns it.
/// Frozen collections on the way are replaced by mutable copies.
/// @throws ApplyError on a shape mismatch
STRUCT_DELTA_API Value& apply_delta(Value& target, const DeltaDocument& doc);

/// Replays a member-level document onto an object
/// @throws ApplyError on a shape mismatch
STRUCT_DELTA_API void apply_object_delta(Object& target, const DeltaDocument& doc);

/// Print the document with indentation (one line per operation)
STRUCT_DELTA_API void print_delta(const DeltaDocument& doc, std::size_t depth = 0);

} // namespace struct_delta
