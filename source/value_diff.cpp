// value_diff.cpp - DiffCollector and the diff entry points

#include <struct_delta/value_diff.h>
#include <struct_delta/type_registry.h>

#include <algorithm>
#include <iostream>

namespace struct_delta {

namespace {

PathElement key_path_element(const Value& key)
{
    if (auto* s = key.get_if<std::string>()) {
        return *s;
    }
    return value_to_string(key);
}

Value size_value(std::size_t n)
{
    return Value{static_cast<uint64_t>(n)};
}

} // anonymous namespace

// ============================================================
// DiffCollector Implementation
// ============================================================

void DiffCollector::diff(const Value& old_val, const Value& new_val)
{
    ComparisonContext ctx;
    diff(old_val, new_val, ctx);
}

void DiffCollector::diff(const Value& old_val, const Value& new_val, const ComparisonOptions& options)
{
    ComparisonContext ctx(options);
    diff(old_val, new_val, ctx);
}

void DiffCollector::diff(const Value& old_val, const Value& new_val, ComparisonContext& ctx)
{
    diffs_.clear();

    Path root_path;
    root_path.reserve(16);  // Pre-allocate for typical nesting depth
    diff_slot(old_val, new_val, root_policy(ctx.options()), ctx, root_path);
}

const std::vector<DiffEntry>& DiffCollector::get_diffs() const
{
    return diffs_;
}

void DiffCollector::clear()
{
    diffs_.clear();
}

bool DiffCollector::has_changes() const
{
    return !diffs_.empty();
}

void DiffCollector::print_diffs() const
{
    if (diffs_.empty()) {
        std::cout << "  (no changes)\n";
        return;
    }
    for (const auto& d : diffs_) {
        std::string type_str;
        switch (d.type) {
            case DiffEntry::Type::Add:          type_str = "ADD   "; break;
            case DiffEntry::Type::Remove:       type_str = "REMOVE"; break;
            case DiffEntry::Type::Change:       type_str = "CHANGE"; break;
            case DiffEntry::Type::LengthChange: type_str = "LENGTH"; break;
        }
        std::cout << "  " << type_str << " " << path_to_string(d.path);
        if (d.type == DiffEntry::Type::Change || d.type == DiffEntry::Type::LengthChange) {
            std::cout << ": " << value_to_string(d.old_value) << " -> " << value_to_string(d.new_value);
        } else if (d.type == DiffEntry::Type::Add) {
            std::cout << ": " << value_to_string(d.new_value);
        } else {
            std::cout << ": " << value_to_string(d.old_value);
        }
        std::cout << "\n";
    }
}

void DiffCollector::diff_slot(const Value& old_val, const Value& new_val, const ComparePolicy& policy,
                              ComparisonContext& ctx, Path& current_path)
{
    // Leaf-like slots cannot be broken down further
    if ((policy.comparer && *policy.comparer) || policy.kind != MemberKind::Deep || policy.dynamic) {
        if (!equal_with_policy(old_val, new_val, policy, ctx)) {
            diffs_.emplace_back(DiffEntry::Type::Change, current_path, old_val, new_val);
        }
        return;
    }

    const void* old_id = old_val.identity();
    const void* new_id = new_val.identity();
    if (old_id && old_id == new_id) [[likely]] {
        return;
    }
    if (old_val.is_null() || new_val.is_null()) {
        if (old_val.is_null() != new_val.is_null()) {
            diffs_.emplace_back(DiffEntry::Type::Change, current_path, old_val, new_val);
        }
        return;
    }

    if (auto old_seq = SequenceView::of(old_val)) {
        auto new_seq = SequenceView::of(new_val);
        if (!new_seq) {
            diffs_.emplace_back(DiffEntry::Type::Change, current_path, old_val, new_val);
            return;
        }
        CycleGuard guard(ctx, old_id, new_id);
        if (!guard.entered()) return;
        if (policy.order_insensitive) {
            diff_unordered(*old_seq, *new_seq, policy, ctx, current_path);
        } else {
            diff_sequence(*old_seq, *new_seq, policy, ctx, current_path);
        }
        return;
    }

    if (auto old_map = MapView::of(old_val)) {
        auto new_map = MapView::of(new_val);
        if (!new_map) {
            diffs_.emplace_back(DiffEntry::Type::Change, current_path, old_val, new_val);
            return;
        }
        CycleGuard guard(ctx, old_id, new_id);
        if (!guard.entered()) return;
        diff_map(*old_map, *new_map, policy, ctx, current_path);
        return;
    }

    if (old_val.type_index() != new_val.type_index()) [[unlikely]] {
        diffs_.emplace_back(DiffEntry::Type::Change, current_path, old_val, new_val);
        return;
    }

    if (auto* old_obj = old_val.get_if<ObjectPtr>()) {
        const auto& new_obj = *new_val.get_if<ObjectPtr>();
        const auto& ot = (*old_obj)->type;
        const auto& nt = new_obj->type;
        if (ot->name() != nt->name() || (ot != nt && ot->fingerprint() != nt->fingerprint())) {
            diffs_.emplace_back(DiffEntry::Type::Change, current_path, old_val, new_val);
            return;
        }
        CycleGuard guard(ctx, old_id, new_id);
        if (!guard.entered()) return;
        if (policy.polymorphic) {
            auto outcome = ctx.registry().try_compare_same_type(ot->name(), old_val, new_val, ctx);
            if (outcome.handled) {
                if (!outcome.equal) {
                    diffs_.emplace_back(DiffEntry::Type::Change, current_path, old_val, new_val);
                }
                return;
            }
        }
        diff_object(**old_obj, *new_obj, ctx, current_path);
        return;
    }

    if (auto* old_arr = old_val.get_if<ArrayPtr>()) {
        const auto& new_arr = *new_val.get_if<ArrayPtr>();
        if ((*old_arr)->shape != new_arr->shape) {
            diffs_.emplace_back(DiffEntry::Type::Change, current_path, old_val, new_val);
            return;
        }
        CycleGuard guard(ctx, old_id, new_id);
        if (!guard.entered()) return;
        diff_array(**old_arr, *new_arr, policy, ctx, current_path);
        return;
    }

    // Scalars and opaque values
    if (!equal_with_policy(old_val, new_val, policy, ctx)) {
        diffs_.emplace_back(DiffEntry::Type::Change, current_path, old_val, new_val);
    }
}

void DiffCollector::diff_object(const Object& old_obj, const Object& new_obj, ComparisonContext& ctx,
                                Path& current_path)
{
    const auto& type = *old_obj.type;
    for (std::size_t i = 0; i < type.size(); ++i) {
        const auto policy = member_policy(type, i, old_obj.fields[i], new_obj.fields[i], ctx.options());
        if (policy.kind == MemberKind::Skip) {
            continue;
        }
        current_path.push_back(type.member(i).name);
        diff_slot(old_obj.fields[i], new_obj.fields[i], policy, ctx, current_path);
        current_path.pop_back();
    }
}

void DiffCollector::diff_sequence(const SequenceView& old_seq, const SequenceView& new_seq,
                                  const ComparePolicy& policy, ComparisonContext& ctx, Path& current_path)
{
    const std::size_t old_size = old_seq.size();
    const std::size_t new_size = new_seq.size();
    const std::size_t common_size = std::min(old_size, new_size);

    if (old_size != new_size) {
        diffs_.emplace_back(DiffEntry::Type::LengthChange, current_path, size_value(old_size), size_value(new_size));
    }

    const auto elem = element_policy(policy);
    for (std::size_t i = 0; i < common_size; ++i) {
        current_path.push_back(i);
        diff_slot(old_seq[i], new_seq[i], elem, ctx, current_path);
        current_path.pop_back();
    }

    // Removed tail elements
    for (std::size_t i = common_size; i < old_size; ++i) {
        current_path.push_back(i);
        diffs_.emplace_back(DiffEntry::Type::Remove, current_path, old_seq[i], Value{});
        current_path.pop_back();
    }

    // Added tail elements
    for (std::size_t i = common_size; i < new_size; ++i) {
        current_path.push_back(i);
        diffs_.emplace_back(DiffEntry::Type::Add, current_path, Value{}, new_seq[i]);
        current_path.pop_back();
    }
}

void DiffCollector::diff_unordered(const SequenceView& old_seq, const SequenceView& new_seq,
                                   const ComparePolicy& policy, ComparisonContext& ctx, Path& current_path)
{
    if (old_seq.size() != new_seq.size()) {
        diffs_.emplace_back(DiffEntry::Type::LengthChange, current_path,
                            size_value(old_seq.size()), size_value(new_seq.size()));
    }

    const auto matched = match_unordered(old_seq, new_seq, policy, ctx);
    std::vector<bool> new_used(new_seq.size(), false);
    for (auto j : matched) {
        if (j != npos) new_used[j] = true;
    }

    // Keyed: an unmatched pair with equal keys is the same element, changed
    const auto elem = element_policy(policy);
    std::vector<bool> old_paired(old_seq.size(), false);
    if (policy.keyed()) {
        for (std::size_t i = 0; i < old_seq.size(); ++i) {
            if (matched[i] != npos) continue;
            for (std::size_t j = 0; j < new_seq.size(); ++j) {
                if (new_used[j]) continue;
                if (keys_equal(old_seq[i], new_seq[j], *policy.key_members, ctx)) {
                    new_used[j] = true;
                    old_paired[i] = true;
                    current_path.push_back(i);
                    diff_slot(old_seq[i], new_seq[j], elem, ctx, current_path);
                    current_path.pop_back();
                    break;
                }
            }
        }
    }

    for (std::size_t i = 0; i < old_seq.size(); ++i) {
        if (matched[i] != npos || old_paired[i]) continue;
        current_path.push_back(i);
        diffs_.emplace_back(DiffEntry::Type::Remove, current_path, old_seq[i], Value{});
        current_path.pop_back();
    }
    for (std::size_t j = 0; j < new_seq.size(); ++j) {
        if (new_used[j]) continue;
        current_path.push_back(j);
        diffs_.emplace_back(DiffEntry::Type::Add, current_path, Value{}, new_seq[j]);
        current_path.pop_back();
    }
}

void DiffCollector::diff_array(const MultiArray& old_arr, const MultiArray& new_arr, const ComparePolicy& policy,
                               ComparisonContext& ctx, Path& current_path)
{
    auto elem = element_policy(policy);
    elem.order_insensitive = false;
    for (std::size_t i = 0; i < old_arr.cells.size(); ++i) {
        current_path.push_back(i);
        diff_slot(old_arr.cells[i], new_arr.cells[i], elem, ctx, current_path);
        current_path.pop_back();
    }
}

void DiffCollector::diff_map(const MapView& old_map, const MapView& new_map, const ComparePolicy& policy,
                             ComparisonContext& ctx, Path& current_path)
{
    const auto elem = element_policy(policy);

    // removed and retained keys
    old_map.for_each([&](const Value& key, const Value& old_v) {
        current_path.push_back(key_path_element(key));
        if (const Value* new_v = new_map.find(key)) {
            diff_slot(old_v, *new_v, elem, ctx, current_path);
        } else {
            diffs_.emplace_back(DiffEntry::Type::Remove, current_path, old_v, Value{});
        }
        current_path.pop_back();
    });

    // added keys
    new_map.for_each([&](const Value& key, const Value& new_v) {
        if (old_map.find(key)) return;
        current_path.push_back(key_path_element(key));
        diffs_.emplace_back(DiffEntry::Type::Add, current_path, Value{}, new_v);
        current_path.pop_back();
    });
}

// ============================================================
// Free functions
// ============================================================

DiffResult diff(const Value& left, const Value& right, const ComparisonOptions& options)
{
    ComparisonContext ctx(options);
    return diff(left, right, ctx);
}

DiffResult diff(const Value& left, const Value& right, ComparisonContext& ctx)
{
    DiffCollector collector;
    collector.diff(left, right, ctx);
    DiffResult result;
    result.has_difference = collector.has_changes();
    result.entries = collector.get_diffs();
    return result;
}

bool has_any_difference(const Value& left, const Value& right, const ComparisonOptions& options)
{
    return !deep_equal(left, right, options);
}

} // namespace struct_delta
