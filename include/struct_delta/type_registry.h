// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file type_registry.h
/// @brief Specialized same-type comparators and the descriptor catalog.
///
/// The registry maps a runtime type name (Object::type_name() or
/// Opaque::type_name()) to a pairwise comparator. The engines consult it for
/// polymorphic members, for dynamic data and for top-level objects before
/// falling back to descriptor-driven comparison.
///
/// Lookups that miss are remembered in a negative cache, so repeated misses
/// for one type cost a single shared-lock lookup. Registering a comparator
/// clears the negative entry for its type.
///
/// The registry also keeps a name -> TypeDescriptor catalog, which the binary
/// codec uses to materialize decoded objects.
///
/// Thread safety: every member function may be called concurrently.
/// Comparators run outside the lock.
///
/// @code
/// TypeRegistry::global().register_comparer("Money",
///     [](const Value& l, const Value& r, ComparisonContext&) {
///         return l.as_object()->get("Cents") == r.as_object()->get("Cents");
///     });
/// @endcode

#pragma once

#include <struct_delta/api.h>
#include <struct_delta/type_descriptor.h>
#include <struct_delta/value.h>

#include <atomic>
#include <functional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

namespace struct_delta {

using SameTypeComparer = std::function<bool(const Value&, const Value&, ComparisonContext&)>;

struct CompareOutcome {
    bool handled = false;
    bool equal = false;
};

class STRUCT_DELTA_API TypeRegistry {
public:
    TypeRegistry() = default;

    TypeRegistry(const TypeRegistry&) = delete;
    TypeRegistry& operator=(const TypeRegistry&) = delete;

    /// Process-wide instance, created on first use and never destroyed early
    [[nodiscard]] static TypeRegistry& global();

    /// Last writer wins. Clears the negative-cache entry for type_name.
    void register_comparer(std::string type_name, SameTypeComparer comparer);

    [[nodiscard]] bool has_comparer(std::string_view type_name) const;

    /// Runs the comparator registered for type_name, if any.
    /// A miss is recorded in the negative cache and reported as handled=false.
    [[nodiscard]] CompareOutcome try_compare_same_type(std::string_view type_name,
                                                       const Value& left,
                                                       const Value& right,
                                                       ComparisonContext& ctx);

    /// Adds (or replaces) a descriptor in the catalog, keyed by its name
    void register_descriptor(TypeDescriptorPtr type);

    [[nodiscard]] TypeDescriptorPtr find_descriptor(std::string_view name) const;

    [[nodiscard]] bool is_negative_cached(std::string_view type_name) const;

    [[nodiscard]] std::size_t comparer_count() const;

    [[nodiscard]] std::size_t hits() const noexcept { return hits_.load(std::memory_order_relaxed); }
    [[nodiscard]] std::size_t misses() const noexcept { return misses_.load(std::memory_order_relaxed); }

    void reset_stats() noexcept {
        hits_.store(0, std::memory_order_relaxed);
        misses_.store(0, std::memory_order_relaxed);
    }

private:
    mutable std::shared_mutex rw_mutex_;
    std::unordered_map<std::string, SameTypeComparer> comparers_;
    std::unordered_set<std::string> negative_;
    std::unordered_map<std::string, TypeDescriptorPtr> descriptors_;

    std::atomic<std::size_t> hits_{0};
    std::atomic<std::size_t> misses_{0};
};

} // namespace struct_delta
