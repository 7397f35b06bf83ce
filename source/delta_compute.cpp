// delta_compute.cpp - DeltaDocument helpers and delta computation

#include <struct_delta/delta.h>
#include <struct_delta/deep_equal.h>

#include <algorithm>
#include <iostream>

namespace struct_delta {

// ============================================================
// DeltaKind / DeltaOp / DeltaDocument
// ============================================================

const char* to_string(DeltaKind kind) noexcept
{
    switch (kind) {
        case DeltaKind::ReplaceObject: return "ReplaceObject";
        case DeltaKind::SetMember:     return "SetMember";
        case DeltaKind::NestedMember:  return "NestedMember";
        case DeltaKind::SeqSetAt:      return "SeqSetAt";
        case DeltaKind::SeqAddAt:      return "SeqAddAt";
        case DeltaKind::SeqRemoveAt:   return "SeqRemoveAt";
        case DeltaKind::SeqNestedAt:   return "SeqNestedAt";
        case DeltaKind::MapSet:        return "MapSet";
        case DeltaKind::MapRemove:     return "MapRemove";
        case DeltaKind::MapNested:     return "MapNested";
    }
    return "Unknown";
}

bool operator==(const DeltaOp& a, const DeltaOp& b)
{
    if (a.kind != b.kind || a.member_index != b.member_index || a.index != b.index) {
        return false;
    }
    if (!deep_equal(a.key, b.key) || !deep_equal(a.value, b.value)) {
        return false;
    }
    if (!a.nested || !b.nested) {
        return !a.nested && !b.nested;
    }
    return *a.nested == *b.nested;
}

std::size_t DeltaDocument::total_ops() const noexcept
{
    std::size_t n = ops_.size();
    for (const auto& op : ops_) {
        if (op.nested) n += op.nested->total_ops();
    }
    return n;
}

std::size_t DeltaDocument::depth() const noexcept
{
    std::size_t deepest = 0;
    for (const auto& op : ops_) {
        if (op.nested) deepest = std::max(deepest, op.nested->depth());
    }
    return deepest + 1;
}

// ============================================================
// DeltaWriter
// ============================================================

void DeltaWriter::replace_object(Value value)
{
    DeltaOp op;
    op.kind = DeltaKind::ReplaceObject;
    op.value = std::move(value);
    append(std::move(op));
}

void DeltaWriter::set_member(int32_t member_index, Value value)
{
    DeltaOp op;
    op.kind = DeltaKind::SetMember;
    op.member_index = member_index;
    op.value = std::move(value);
    append(std::move(op));
}

void DeltaWriter::nested_member(int32_t member_index, DeltaDocument nested)
{
    DeltaOp op;
    op.kind = DeltaKind::NestedMember;
    op.member_index = member_index;
    op.nested = std::make_shared<const DeltaDocument>(std::move(nested));
    append(std::move(op));
}

void DeltaWriter::seq_set_at(int32_t member_index, int32_t index, Value value)
{
    DeltaOp op;
    op.kind = DeltaKind::SeqSetAt;
    op.member_index = member_index;
    op.index = index;
    op.value = std::move(value);
    append(std::move(op));
}

void DeltaWriter::seq_add_at(int32_t member_index, int32_t index, Value value)
{
    DeltaOp op;
    op.kind = DeltaKind::SeqAddAt;
    op.member_index = member_index;
    op.index = index;
    op.value = std::move(value);
    append(std::move(op));
}

void DeltaWriter::seq_remove_at(int32_t member_index, int32_t index)
{
    DeltaOp op;
    op.kind = DeltaKind::SeqRemoveAt;
    op.member_index = member_index;
    op.index = index;
    append(std::move(op));
}

void DeltaWriter::seq_nested_at(int32_t member_index, int32_t index, DeltaDocument nested)
{
    DeltaOp op;
    op.kind = DeltaKind::SeqNestedAt;
    op.member_index = member_index;
    op.index = index;
    op.nested = std::make_shared<const DeltaDocument>(std::move(nested));
    append(std::move(op));
}

void DeltaWriter::map_set(int32_t member_index, Value key, Value value)
{
    DeltaOp op;
    op.kind = DeltaKind::MapSet;
    op.member_index = member_index;
    op.key = std::move(key);
    op.value = std::move(value);
    append(std::move(op));
}

void DeltaWriter::map_remove(int32_t member_index, Value key)
{
    DeltaOp op;
    op.kind = DeltaKind::MapRemove;
    op.member_index = member_index;
    op.key = std::move(key);
    append(std::move(op));
}

void DeltaWriter::map_nested(int32_t member_index, Value key, DeltaDocument nested)
{
    DeltaOp op;
    op.kind = DeltaKind::MapNested;
    op.member_index = member_index;
    op.key = std::move(key);
    op.nested = std::make_shared<const DeltaDocument>(std::move(nested));
    append(std::move(op));
}

DeltaDocument DeltaWriter::finish()
{
    DeltaDocument out = std::move(doc_);
    doc_ = DeltaDocument{};
    return out;
}

// ============================================================
// DeltaReader
// ============================================================

std::vector<const DeltaOp*> DeltaReader::for_member(int32_t member_index) const
{
    std::vector<const DeltaOp*> result;
    for (const auto& op : doc_->ops()) {
        if (op.member_index == member_index) {
            result.push_back(&op);
        }
    }
    return result;
}

bool DeltaReader::touches(int32_t member_index) const
{
    return std::any_of(doc_->ops().begin(), doc_->ops().end(),
                       [member_index](const DeltaOp& op) { return op.member_index == member_index; });
}

// ============================================================
// Computation
// ============================================================

namespace {

/// Row-major cells of a rank-1 array, read like a SequenceView
class ArrayCells {
public:
    explicit ArrayCells(const MultiArray& arr) : cells_(&arr.cells) {}
    [[nodiscard]] std::size_t size() const noexcept { return cells_->size(); }
    [[nodiscard]] const Value& operator[](std::size_t i) const { return (*cells_)[i]; }

private:
    const std::vector<Value>* cells_;
};

/// Both values are non-null objects sharing one member layout
bool same_object_type(const Value& a, const Value& b)
{
    const auto* ao = a.get_if<ObjectPtr>();
    const auto* bo = b.get_if<ObjectPtr>();
    if (!ao || !bo || !*ao || !*bo) {
        return false;
    }
    const auto& at = (*ao)->type;
    const auto& bt = (*bo)->type;
    return at == bt || (at->name() == bt->name() && at->fingerprint() == bt->fingerprint());
}

int32_t to_index(std::size_t i)
{
    return static_cast<int32_t>(i);
}

class DeltaComputer {
public:
    explicit DeltaComputer(ComparisonContext& ctx) : ctx_(ctx) {}

    DeltaDocument object_delta(const Object& before, const Object& after)
    {
        DeltaWriter w;
        CycleGuard guard(ctx_, &before, &after);
        if (!guard.entered()) {
            return w.finish();
        }

        const auto& type = *before.type;
        for (std::size_t i = 0; i < type.size(); ++i) {
            const Value& bv = before.fields[i];
            const Value& av = after.fields[i];
            const auto policy = member_policy(type, i, bv, av, ctx_.options());
            if (policy.kind == MemberKind::Skip) {
                continue;
            }
            if (equal_with_policy(bv, av, policy, ctx_)) {
                continue;
            }
            emit_member(w, type.member_index(i), bv, av, policy);
        }
        return w.finish();
    }

private:
    ComparisonContext& ctx_;

    void emit_member(DeltaWriter& w, int32_t mi, const Value& bv, const Value& av, const ComparePolicy& policy)
    {
        const bool opaque_rule = (policy.comparer && *policy.comparer) ||
                                 policy.kind != MemberKind::Deep || policy.dynamic;
        if (opaque_rule || bv.is_null() || av.is_null()) {
            w.set_member(mi, clone_value(av));
            return;
        }

        if (same_object_type(bv, av)) {
            auto nested = object_delta(*bv.as_object(), *av.as_object());
            if (nested.empty()) {
                w.set_member(mi, clone_value(av));
            } else {
                w.nested_member(mi, std::move(nested));
            }
            return;
        }

        auto bs = SequenceView::of(bv);
        auto as = SequenceView::of(av);
        if (bs && as) {
            emit_list(w, mi, *bs, *as, policy);
            return;
        }

        auto bm = MapView::of(bv);
        auto am = MapView::of(av);
        if (bm && am) {
            emit_map(w, mi, *bm, *am, policy);
            return;
        }

        const auto* ba = bv.get_if<ArrayPtr>();
        const auto* aa = av.get_if<ArrayPtr>();
        if (ba && aa && (*ba)->rank() == 1 && (*aa)->rank() == 1) {
            auto elem_policy = policy;
            elem_policy.order_insensitive = false;
            emit_list(w, mi, ArrayCells(**ba), ArrayCells(**aa), elem_policy);
            return;
        }

        w.set_member(mi, clone_value(av));
    }

    template <typename List>
    void emit_list(DeltaWriter& w, int32_t mi, const List& before, const List& after, const ComparePolicy& policy)
    {
        if (policy.order_insensitive) {
            emit_unordered(w, mi, before, after, policy);
        } else {
            emit_ordered(w, mi, before, after, policy);
        }
    }

    void emit_element_update(DeltaWriter& w, int32_t mi, std::size_t index, const Value& bv, const Value& av)
    {
        if (same_object_type(bv, av)) {
            auto nested = object_delta(*bv.as_object(), *av.as_object());
            if (!nested.empty()) {
                w.seq_nested_at(mi, to_index(index), std::move(nested));
                return;
            }
        }
        w.seq_set_at(mi, to_index(index), clone_value(av));
    }

    template <typename List>
    void emit_ordered(DeltaWriter& w, int32_t mi, const List& before, const List& after, const ComparePolicy& policy)
    {
        const auto elem = element_policy(policy);
        const std::size_t nb = before.size();
        const std::size_t na = after.size();
        const std::size_t shorter = std::min(nb, na);

        std::size_t prefix = 0;
        while (prefix < shorter && equal_with_policy(before[prefix], after[prefix], elem, ctx_)) {
            ++prefix;
        }
        std::size_t suffix = 0;
        while (suffix < shorter - prefix &&
               equal_with_policy(before[nb - 1 - suffix], after[na - 1 - suffix], elem, ctx_)) {
            ++suffix;
        }

        const std::size_t mid_before = nb - prefix - suffix;
        const std::size_t mid_after = na - prefix - suffix;
        const std::size_t common = std::min(mid_before, mid_after);

        for (std::size_t k = 0; k < common; ++k) {
            const std::size_t i = prefix + k;
            if (!equal_with_policy(before[i], after[i], elem, ctx_)) {
                emit_element_update(w, mi, i, before[i], after[i]);
            }
        }

        // Excess before-elements, highest index first so lower indices stay valid
        for (std::size_t i = prefix + mid_before; i > prefix + common; --i) {
            w.seq_remove_at(mi, to_index(i - 1));
        }

        for (std::size_t i = prefix + common; i < prefix + mid_after; ++i) {
            w.seq_add_at(mi, to_index(i), clone_value(after[i]));
        }
    }

    template <typename List>
    void emit_unordered(DeltaWriter& w, int32_t mi, const List& before, const List& after,
                        const ComparePolicy& policy)
    {
        const std::size_t nb = before.size();
        const std::size_t na = after.size();

        // match_unordered reads through SequenceView; arrays never get here
        std::vector<std::size_t> matched;
        if constexpr (std::is_same_v<List, SequenceView>) {
            matched = match_unordered(before, after, policy, ctx_);
        } else {
            matched.assign(nb, npos);
        }

        std::vector<bool> after_used(na, false);
        for (auto j : matched) {
            if (j != npos) after_used[j] = true;
        }

        // Pair the leftovers: same key when keyed, else first free candidate
        std::vector<bool> before_updated(nb, false);
        for (std::size_t i = 0; i < nb; ++i) {
            if (matched[i] != npos) continue;
            for (std::size_t j = 0; j < na; ++j) {
                if (after_used[j]) continue;
                if (policy.keyed() && !keys_equal(before[i], after[j], *policy.key_members, ctx_)) {
                    continue;
                }
                after_used[j] = true;
                before_updated[i] = true;
                emit_element_update(w, mi, i, before[i], after[j]);
                break;
            }
        }

        std::size_t size = nb;
        for (std::size_t i = nb; i > 0; --i) {
            if (matched[i - 1] == npos && !before_updated[i - 1]) {
                w.seq_remove_at(mi, to_index(i - 1));
                --size;
            }
        }

        for (std::size_t j = 0; j < na; ++j) {
            if (after_used[j]) continue;
            w.seq_add_at(mi, to_index(size), clone_value(after[j]));
            ++size;
        }
    }

    void emit_map(DeltaWriter& w, int32_t mi, const MapView& before, const MapView& after,
                  const ComparePolicy& policy)
    {
        const auto elem = element_policy(policy);

        before.for_each([&](const Value& key, const Value&) {
            if (!after.find(key)) {
                w.map_remove(mi, clone_value(key));
            }
        });

        after.for_each([&](const Value& key, const Value& av) {
            const Value* bv = before.find(key);
            if (!bv) {
                w.map_set(mi, clone_value(key), clone_value(av));
                return;
            }
            if (equal_with_policy(*bv, av, elem, ctx_)) {
                return;
            }
            if (same_object_type(*bv, av)) {
                auto nested = object_delta(*bv->as_object(), *av.as_object());
                if (!nested.empty()) {
                    w.map_nested(mi, clone_value(key), std::move(nested));
                    return;
                }
            }
            w.map_set(mi, clone_value(key), clone_value(av));
        });
    }
};

} // anonymous namespace

DeltaDocument compute_delta(const Value& before, const Value& after)
{
    ComparisonContext ctx;
    return compute_delta(before, after, ctx);
}

DeltaDocument compute_delta(const Value& before, const Value& after, const ComparisonOptions& options)
{
    ComparisonContext ctx(options);
    return compute_delta(before, after, ctx);
}

DeltaDocument compute_delta(const Value& before, const Value& after, ComparisonContext& ctx)
{
    if (deep_equal(before, after, ctx)) {
        return {};
    }

    if (!same_object_type(before, after)) {
        DeltaWriter w;
        w.replace_object(clone_value(after));
        return w.finish();
    }

    auto doc = compute_object_delta(*before.as_object(), *after.as_object(), ctx);
    if (doc.empty()) {
        // Unequal only through a registered comparator
        DeltaWriter w;
        w.replace_object(clone_value(after));
        return w.finish();
    }
    return doc;
}

DeltaDocument compute_object_delta(const Object& before, const Object& after, ComparisonContext& ctx)
{
    DeltaComputer computer(ctx);
    return computer.object_delta(before, after);
}

void print_delta(const DeltaDocument& doc, std::size_t depth)
{
    const std::string indent(depth * 2, ' ');
    if (doc.empty()) {
        std::cout << indent << "(empty delta)\n";
        return;
    }
    for (const auto& op : doc.ops()) {
        std::cout << indent << to_string(op.kind);
        if (op.kind != DeltaKind::ReplaceObject) {
            std::cout << " #" << op.member_index;
        }
        if (has_index(op.kind)) {
            std::cout << " [" << op.index << "]";
        }
        if (has_key(op.kind)) {
            std::cout << " {" << value_to_string(op.key) << "}";
        }
        if (has_value(op.kind)) {
            std::cout << " = " << value_to_string(op.value);
        }
        std::cout << "\n";
        if (op.nested) {
            print_delta(*op.nested, depth + 1);
        }
    }
}

} // namespace struct_delta
