// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file deep_equal.h
/// @brief Structural equality over object graphs.
///
/// Dispatch for one value pair:
///  1. identical reference -> equal; exactly one side null -> not equal
///  2. different runtime shapes -> not equal (the dynamic path compares
///     numbers across numeric types)
///  3. scalars and enums by value, strings by StringMode, floating point
///     with epsilon and NaN policy, temporal values with their metadata
///  4. sequences ordered, unordered (multiset) or keyed-unordered
///  5. fixed-rank arrays by shape then row-major cells
///  6. maps by exact key set, then values
///  7. objects: same type name, registry comparator (polymorphic slots and
///     roots), then member-by-member through the descriptor
///
/// Every descent into a reference node goes through the context's cycle
/// guard; a pair already on the stack compares equal.

#pragma once

#include <struct_delta/api.h>
#include <struct_delta/comparison_context.h>
#include <struct_delta/type_descriptor.h>
#include <struct_delta/value.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace struct_delta {

/// Effective rules for one comparison slot after precedence is resolved
struct ComparePolicy {
    MemberKind kind = MemberKind::Deep;
    bool order_insensitive = false;
    const std::vector<std::string>* key_members = nullptr;
    bool polymorphic = false;
    bool dynamic = false;
    const MemberComparer* comparer = nullptr;

    [[nodiscard]] bool keyed() const noexcept { return key_members && !key_members->empty(); }
};

/// Policy for a top-level pair: Deep, root ordering, registry enabled
[[nodiscard]] STRUCT_DELTA_API ComparePolicy root_policy(const ComparisonOptions& options) noexcept;

/// Policy for the elements (and map values) of a collection slot
[[nodiscard]] STRUCT_DELTA_API ComparePolicy element_policy(const ComparePolicy& slot) noexcept;

/// Policy for member `ordinal` of `owner`, given the two member values
[[nodiscard]] STRUCT_DELTA_API ComparePolicy member_policy(const TypeDescriptor& owner,
                                                           std::size_t ordinal,
                                                           const Value& left,
                                                           const Value& right,
                                                           const ComparisonOptions& options);

// ============================================================
// Entry points
// ============================================================

[[nodiscard]] STRUCT_DELTA_API bool deep_equal(const Value& left, const Value& right);
[[nodiscard]] STRUCT_DELTA_API bool deep_equal(const Value& left, const Value& right, const ComparisonOptions& options);
[[nodiscard]] STRUCT_DELTA_API bool deep_equal(const Value& left, const Value& right, ComparisonContext& ctx);

/// Compares one slot under an explicit policy
[[nodiscard]] STRUCT_DELTA_API bool equal_with_policy(const Value& left,
                                                      const Value& right,
                                                      const ComparePolicy& policy,
                                                      ComparisonContext& ctx);

/// Member-by-member comparison of two objects of the same type, without
/// consulting the registry. Registered comparators delegate here.
[[nodiscard]] STRUCT_DELTA_API bool compare_members(const Object& left, const Object& right, ComparisonContext& ctx);

/// Schema-less comparison: numbers across numeric types, maps and lists by
/// shape, registry for objects and opaque values, native equality last
[[nodiscard]] STRUCT_DELTA_API bool dynamic_equal(const Value& left, const Value& right, ComparisonContext& ctx);

/// Shallow equality: scalars by value, objects via TypeOptions::native_equals
/// (identity when unset), opaque values via equals(), collections by identity
[[nodiscard]] STRUCT_DELTA_API bool native_equal(const Value& left, const Value& right);

// ============================================================
// Leaf comparisons
// ============================================================

[[nodiscard]] STRUCT_DELTA_API bool strings_equal(std::string_view a, std::string_view b, const ComparisonOptions& options);
[[nodiscard]] STRUCT_DELTA_API bool floats_equal(float a, float b, const ComparisonOptions& options) noexcept;
[[nodiscard]] STRUCT_DELTA_API bool doubles_equal(double a, double b, const ComparisonOptions& options) noexcept;
[[nodiscard]] STRUCT_DELTA_API bool decimals_equal(const Decimal& a, const Decimal& b, const ComparisonOptions& options);

/// Cross-type numeric comparison used by the dynamic path.
/// Empty when either side is not numeric.
[[nodiscard]] STRUCT_DELTA_API std::optional<bool> numeric_equal(const Value& a, const Value& b, const ComparisonOptions& options);

// ============================================================
// Matching helpers shared with the diff and delta engines
// ============================================================

/// Greedy multiset matching: result[i] is the right index matched to left
/// element i, or npos. Candidates are tried in ascending order.
/// Keyed policies restrict candidates to elements with equal key members.
[[nodiscard]] STRUCT_DELTA_API std::vector<std::size_t> match_unordered(const SequenceView& left,
                                                                        const SequenceView& right,
                                                                        const ComparePolicy& slot,
                                                                        ComparisonContext& ctx);

/// True when both elements are objects whose key members compare equal
[[nodiscard]] STRUCT_DELTA_API bool keys_equal(const Value& left,
                                               const Value& right,
                                               const std::vector<std::string>& key_members,
                                               ComparisonContext& ctx);

inline constexpr std::size_t npos = static_cast<std::size_t>(-1);

} // namespace struct_delta
