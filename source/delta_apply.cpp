// delta_apply.cpp - replay of delta documents onto a target graph
//
// Read-only collections met on the way are replaced by mutable copies
// (clone-on-write) before the first edit; the copy is stored back into the
// owning slot, so later operations in the same document see it.

#include <struct_delta/delta.h>
#include <struct_delta/type_descriptor.h>

#include <string>

namespace struct_delta {

namespace {

[[noreturn]] void fail(std::string_view func, const std::string& message)
{
    detail::log_access_error(func, message);
    throw ApplyError(message);
}

[[noreturn]] void fail_index(std::string_view func, int32_t index, std::size_t size)
{
    const std::string message = "index " + std::to_string(index) + " out of range for size " + std::to_string(size);
    detail::log_index_error(func, static_cast<std::size_t>(index), "out of range");
    throw ApplyError(message);
}

const DeltaDocument& nested_of(const DeltaOp& op)
{
    if (!op.nested) {
        fail("apply_delta", std::string(to_string(op.kind)) + " without a nested document");
    }
    return *op.nested;
}

void apply_nested(const Value& holder, const DeltaOp& op, std::string_view func)
{
    ObjectPtr obj = holder.as_object();
    if (!obj) {
        fail(func, std::string(to_string(op.kind)) + " against a " + std::string(holder.kind_name()) + " slot");
    }
    apply_object_delta(*obj, nested_of(op));
}

// ============================================================
// Sequence operations
// ============================================================

void check_seq_index(const DeltaOp& op, std::size_t size)
{
    const bool insert = op.kind == DeltaKind::SeqAddAt;
    if (op.index < 0 || static_cast<std::size_t>(op.index) > size ||
        (!insert && static_cast<std::size_t>(op.index) == size)) {
        fail_index(to_string(op.kind), op.index, size);
    }
}

void edit_items(std::vector<Value>& items, const DeltaOp& op)
{
    check_seq_index(op, items.size());
    const auto pos = static_cast<std::size_t>(op.index);
    switch (op.kind) {
        case DeltaKind::SeqSetAt:
            items[pos] = clone_value(op.value);
            break;
        case DeltaKind::SeqAddAt:
            items.insert(items.begin() + op.index, clone_value(op.value));
            break;
        case DeltaKind::SeqRemoveAt:
            items.erase(items.begin() + op.index);
            break;
        case DeltaKind::SeqNestedAt:
            apply_nested(items[pos], op, "SeqNestedAt");
            break;
        default:
            fail("apply_delta", std::string(to_string(op.kind)) + " is not a sequence operation");
    }
}

void apply_seq_op(Value& slot, const DeltaOp& op)
{
    if (slot.is_null()) {
        if (op.kind != DeltaKind::SeqAddAt) {
            fail(to_string(op.kind), "sequence operation against a null member");
        }
        slot = Value{Sequence::make()};
    }

    if (auto* seq = slot.get_if<SequencePtr>()) {
        edit_items((*seq)->items, op);
        return;
    }

    if (auto* frozen = slot.get_if<FrozenSequencePtr>()) {
        auto copy = Sequence::make(std::vector<Value>((*frozen)->items.begin(), (*frozen)->items.end()));
        slot = Value{copy};
        edit_items(copy->items, op);
        return;
    }

    if (auto* arr = slot.get_if<ArrayPtr>(); arr && (*arr)->rank() == 1) {
        const bool resizes = op.kind == DeltaKind::SeqAddAt || op.kind == DeltaKind::SeqRemoveAt;
        if (!resizes) {
            edit_items((*arr)->cells, op);
            return;
        }
        auto copy = MultiArray::make_1d((*arr)->cells);
        edit_items(copy->cells, op);
        copy->shape[0] = copy->cells.size();
        slot = Value{copy};
        return;
    }

    fail(to_string(op.kind), "sequence operation against a " + std::string(slot.kind_name()) + " member");
}

// ============================================================
// Map operations
// ============================================================

void edit_entries(MapStorage& entries, const DeltaOp& op)
{
    switch (op.kind) {
        case DeltaKind::MapSet:
            entries.insert_or_assign(clone_value(op.key), clone_value(op.value));
            break;
        case DeltaKind::MapRemove:
            entries.erase(op.key);
            break;
        case DeltaKind::MapNested: {
            auto it = entries.find(op.key);
            if (it == entries.end()) {
                detail::log_key_error("MapNested", value_to_string(op.key), "not found");
                throw ApplyError("MapNested: key " + value_to_string(op.key) + " not found");
            }
            apply_nested(it->second, op, "MapNested");
            break;
        }
        default:
            fail("apply_delta", std::string(to_string(op.kind)) + " is not a map operation");
    }
}

void apply_map_op(Value& slot, const DeltaOp& op)
{
    if (slot.is_null()) {
        if (op.kind == DeltaKind::MapRemove) {
            return;
        }
        if (op.kind != DeltaKind::MapSet) {
            fail(to_string(op.kind), "map operation against a null member");
        }
        slot = Value{Map::make()};
    }

    if (auto* map = slot.get_if<MapPtr>()) {
        edit_entries((*map)->entries, op);
        return;
    }

    if (auto* frozen = slot.get_if<FrozenMapPtr>()) {
        auto copy = Map::make();
        copy->entries.reserve((*frozen)->entries.size());
        for (const auto& kv : (*frozen)->entries) {
            copy->entries.emplace(kv.first, kv.second);
        }
        slot = Value{copy};
        edit_entries(copy->entries, op);
        return;
    }

    fail(to_string(op.kind), "map operation against a " + std::string(slot.kind_name()) + " member");
}

void apply_member_op(Object& target, const DeltaOp& op)
{
    auto ordinal = target.type->ordinal_for_index(op.member_index);
    if (!ordinal) {
        detail::log_index_error("apply_delta", static_cast<std::size_t>(op.member_index), "is not a member index");
        throw ApplyError("unknown member index " + std::to_string(op.member_index) + " for type " +
                         target.type_name());
    }
    Value& slot = target.fields[*ordinal];

    switch (op.kind) {
        case DeltaKind::SetMember:
            slot = clone_value(op.value);
            break;
        case DeltaKind::NestedMember:
            apply_nested(slot, op, "NestedMember");
            break;
        case DeltaKind::SeqSetAt:
        case DeltaKind::SeqAddAt:
        case DeltaKind::SeqRemoveAt:
        case DeltaKind::SeqNestedAt:
            apply_seq_op(slot, op);
            break;
        case DeltaKind::MapSet:
        case DeltaKind::MapRemove:
        case DeltaKind::MapNested:
            apply_map_op(slot, op);
            break;
        case DeltaKind::ReplaceObject:
            fail("apply_object_delta", "ReplaceObject inside a member-level document");
    }
}

} // anonymous namespace

Value& apply_delta(Value& target, const DeltaDocument& doc)
{
    for (const auto& op : doc.ops()) {
        if (op.kind == DeltaKind::ReplaceObject) {
            target = clone_value(op.value);
            continue;
        }
        ObjectPtr obj = target.as_object();
        if (!obj) {
            fail("apply_delta", std::string(to_string(op.kind)) + " against a " +
                                    std::string(target.kind_name()) + " target");
        }
        apply_member_op(*obj, op);
    }
    return target;
}

void apply_object_delta(Object& target, const DeltaDocument& doc)
{
    for (const auto& op : doc.ops()) {
        apply_member_op(target, op);
    }
}

} // namespace struct_delta
