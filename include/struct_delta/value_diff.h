// value_diff.h - Structural diff between two object graphs

#pragma once

#include <struct_delta/api.h>
#include <struct_delta/comparison_context.h>
#include <struct_delta/deep_equal.h>
#include <struct_delta/value.h>

#include <vector>

namespace struct_delta {

struct DiffEntry {
    enum class Type { Add, Remove, Change, LengthChange };

    Type type;
    Path path;        // Path to the differing slot
    Value old_value;  // meaningful for Remove, Change and LengthChange (old size)
    Value new_value;  // meaningful for Add, Change and LengthChange (new size)

    DiffEntry(Type t, const Path& p, Value old_v, Value new_v)
        : type(t), path(p), old_value(std::move(old_v)), new_value(std::move(new_v)) {}

    DiffEntry() : type(Type::Change) {}

    /// Add: new value. Remove: old value. Change/LengthChange: new value.
    [[nodiscard]] const Value& value() const {
        return (type == Type::Remove) ? old_value : new_value;
    }

    [[nodiscard]] const Value& get_old() const { return old_value; }
    [[nodiscard]] const Value& get_new() const { return new_value; }
};

struct DiffResult {
    bool has_difference = false;
    std::vector<DiffEntry> entries;
};

// ============================================================
// DiffCollector - walks both graphs like deep_equal, but keeps going after
// the first difference and records every differing path.
//
// Path elements: member names for object members, indices for sequence
// elements and array cells (row-major offset), value_to_string(key) for
// map entries.
//
// A cycle that closes is "no difference" at that point, as in deep_equal.
// ============================================================

class STRUCT_DELTA_API DiffCollector {
private:
    std::vector<DiffEntry> diffs_;

    void diff_slot(const Value& old_val, const Value& new_val, const ComparePolicy& policy,
                   ComparisonContext& ctx, Path& current_path);
    void diff_object(const Object& old_obj, const Object& new_obj, ComparisonContext& ctx, Path& current_path);
    void diff_sequence(const SequenceView& old_seq, const SequenceView& new_seq, const ComparePolicy& policy,
                       ComparisonContext& ctx, Path& current_path);
    void diff_unordered(const SequenceView& old_seq, const SequenceView& new_seq, const ComparePolicy& policy,
                        ComparisonContext& ctx, Path& current_path);
    void diff_array(const MultiArray& old_arr, const MultiArray& new_arr, const ComparePolicy& policy,
                    ComparisonContext& ctx, Path& current_path);
    void diff_map(const MapView& old_map, const MapView& new_map, const ComparePolicy& policy,
                  ComparisonContext& ctx, Path& current_path);

public:
    void diff(const Value& old_val, const Value& new_val);
    void diff(const Value& old_val, const Value& new_val, const ComparisonOptions& options);
    void diff(const Value& old_val, const Value& new_val, ComparisonContext& ctx);

    [[nodiscard]] const std::vector<DiffEntry>& get_diffs() const;
    void clear();
    [[nodiscard]] bool has_changes() const;
    void print_diffs() const;
};

[[nodiscard]] STRUCT_DELTA_API DiffResult diff(const Value& left, const Value& right,
                                               const ComparisonOptions& options = {});

[[nodiscard]] STRUCT_DELTA_API DiffResult diff(const Value& left, const Value& right, ComparisonContext& ctx);

/// Same answer as !deep_equal(), spelled for diff call sites
[[nodiscard]] STRUCT_DELTA_API bool has_any_difference(const Value& left, const Value& right,
                                                       const ComparisonOptions& options = {});

} // namespace struct_delta
