// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file type_descriptor.h
/// @brief Runtime member descriptor tables.
///
/// A TypeDescriptor lists the members of one object type in declaration
/// order, together with the policy flags the engines honour for each member.
/// Tables are built at runtime (see TypeBuilder in builders.h) and shared
/// by every Object of that type.
///
/// Policy precedence: member-level setting, then the type-level default,
/// then the root default carried by ComparisonOptions.

#pragma once

#include "struct_delta_config.h"

#include "api.h"
#include "value_fwd.h"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace struct_delta {

/// How a member takes part in comparison
enum class MemberKind : uint8_t {
    Deep      = 0,  ///< recurse structurally
    Shallow   = 1,  ///< native equality of the value, no recursion
    Reference = 2,  ///< identity only
    Skip      = 3,  ///< never examined
};

/// How member indices in delta documents are assigned
enum class IndexMode : uint8_t {
    Auto    = 0,  ///< Stable when delta generation is enabled, else Ordinal
    Stable  = 1,  ///< hash of the member name
    Ordinal = 2,  ///< declaration position
};

using MemberComparer = std::function<bool(const Value&, const Value&, ComparisonContext&)>;
using NativeEquals   = std::function<bool(const Object&, const Object&)>;

struct MemberDescriptor {
    std::string name;

    /// Unset: use the member value type's default kind, else Deep
    std::optional<MemberKind> kind;

    /// Collection members only. Unset: use the declaring type's default,
    /// else the root default.
    std::optional<bool> order_insensitive;

    /// Unordered collections of objects: match elements inside buckets
    /// of equal key members
    std::vector<std::string> key_members;

    /// Runtime type not statically known: consult the TypeRegistry first
    bool polymorphic = false;

    /// Schema-less data: numeric values compare across numeric types
    bool dynamic = false;

    /// Overrides every other rule for this member when set
    MemberComparer comparer;
};

struct TypeOptions {
    /// Kind used where this type appears as a member value without an
    /// explicit member kind
    std::optional<MemberKind> default_kind;

    /// Default ordering policy for the collection members of this type
    std::optional<bool> order_insensitive_collections;

    IndexMode index_mode = IndexMode::Auto;
    bool delta_enabled = true;

    /// Native equality used for Shallow members holding this type.
    /// Identity when unset.
    NativeEquals native_equals;
};

class STRUCT_DELTA_API TypeDescriptor {
public:
    /// @throws std::invalid_argument on empty or duplicate member names,
    ///         or when two member names hash to the same stable index
    TypeDescriptor(std::string name, std::vector<MemberDescriptor> members, TypeOptions options = {});

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const std::vector<MemberDescriptor>& members() const noexcept { return members_; }
    [[nodiscard]] const MemberDescriptor& member(std::size_t ordinal) const { return members_.at(ordinal); }
    [[nodiscard]] std::size_t size() const noexcept { return members_.size(); }

    /// Declaration position of a member, empty if unknown
    [[nodiscard]] std::optional<std::size_t> find_member(std::string_view name) const;

    [[nodiscard]] const TypeOptions& options() const noexcept { return options_; }

    /// index_mode with Auto resolved
    [[nodiscard]] IndexMode effective_index_mode() const noexcept { return effective_mode_; }

    /// Delta member index of the member at `ordinal` under the active mode
    [[nodiscard]] int32_t member_index(std::size_t ordinal) const { return indices_.at(ordinal); }

    /// Inverse of member_index(), empty if no member carries that index
    [[nodiscard]] std::optional<std::size_t> ordinal_for_index(int32_t index) const;

    /// 64-bit schema tag over the type name and its member names and kinds
    [[nodiscard]] uint64_t fingerprint() const noexcept { return fingerprint_; }

private:
    std::string name_;
    std::vector<MemberDescriptor> members_;
    TypeOptions options_;
    IndexMode effective_mode_;
    std::vector<int32_t> indices_;
    std::unordered_map<int32_t, std::size_t> ordinal_by_index_;
    uint64_t fingerprint_ = 0;
};

/// Name-derived member index: 31-bit FNV-1a of the UTF-8 name.
/// Depends on nothing but the name.
[[nodiscard]] STRUCT_DELTA_API int32_t stable_member_index(std::string_view name) noexcept;

[[nodiscard]] STRUCT_DELTA_API IndexMode resolve_index_mode(IndexMode mode, bool delta_enabled) noexcept;

/// Combined fingerprint of several descriptors (order-sensitive)
[[nodiscard]] STRUCT_DELTA_API uint64_t schema_fingerprint(const std::vector<TypeDescriptorPtr>& types) noexcept;

} // namespace struct_delta
