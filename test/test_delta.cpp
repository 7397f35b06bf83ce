// test_delta.cpp - Tests for delta documents
// DeltaWriter/DeltaReader, compute_delta and apply_delta

#include <catch2/catch_all.hpp>
#include <struct_delta/deep_equal.h>
#include <struct_delta/delta.h>

#include "test_types.h"

using namespace struct_delta;
using namespace test_types;

// ============================================================
// Helper Functions
// ============================================================

namespace {

int32_t index_of(const TypeDescriptorPtr& type, std::string_view member)
{
    return type->member_index(*type->find_member(member));
}

Value make_shelf()
{
    return ObjectBuilder(shelf_type())
        .set("List", SequenceBuilder().push_back(1).push_back(2).push_back(3).finish())
        .set("Frozen", FrozenSequenceBuilder().push_back(1).push_back(2).finish())
        .set("Dict", MapBuilder().set("k", make_abc(1, 2, 3)).set("n", 5).finish())
        .set("FrozenDict", FrozenMapBuilder().set("x", 1).set("y", 2).finish())
        .set("Row", ArrayBuilder({3}).push_back(1).push_back(2).push_back(3).finish())
        .set("Grid", ArrayBuilder({2, 2}).push_back(1).push_back(2).push_back(3).push_back(4).finish())
        .set("Bag", SequenceBuilder().push_back(1).push_back(2).push_back(3).finish())
        .finish();
}

/// Applies the delta of (before, after) to a copy of before and checks the result
Value round_trip(const Value& before, const Value& after)
{
    auto doc = compute_delta(before, after);
    Value target = clone_value(before);
    apply_delta(target, doc);
    return target;
}

} // namespace

// ============================================================
// DeltaWriter / DeltaReader
// ============================================================

TEST_CASE("DeltaWriter builds documents in order", "[delta][writer]") {
    DeltaWriter w;
    REQUIRE(w.empty());

    w.set_member(1, Value{10});
    w.seq_add_at(2, 0, Value{"x"});
    w.map_remove(3, Value{"k"});

    DeltaWriter inner;
    inner.set_member(7, Value{true});
    w.nested_member(4, inner.finish());
    REQUIRE(inner.empty());
    REQUIRE(w.size() == 4);

    auto doc = w.finish();
    REQUIRE(w.empty());
    REQUIRE(doc.size() == 4);
    REQUIRE(doc.total_ops() == 5);
    REQUIRE(doc.depth() == 2);

    REQUIRE(doc.ops()[0].kind == DeltaKind::SetMember);
    REQUIRE(doc.ops()[1].kind == DeltaKind::SeqAddAt);
    REQUIRE(doc.ops()[1].index == 0);
    REQUIRE(doc.ops()[2].key == Value{"k"});
    REQUIRE(doc.ops()[3].nested->ops()[0].member_index == 7);

    SECTION("DeltaReader filters by member") {
        DeltaReader reader(doc);
        REQUIRE(reader.touches(2));
        REQUIRE_FALSE(reader.touches(99));
        auto ops = reader.for_member(3);
        REQUIRE(ops.size() == 1);
        REQUIRE(ops[0]->kind == DeltaKind::MapRemove);

        std::size_t count = 0;
        for (const auto& op : reader) {
            (void)op;
            ++count;
        }
        REQUIRE(count == 4);
    }

    SECTION("document equality compares values deeply") {
        DeltaWriter a;
        a.set_member(1, make_abc(1, 2, 3));
        DeltaWriter b;
        b.set_member(1, make_abc(1, 2, 3));
        DeltaWriter c;
        c.set_member(1, make_abc(1, 2, 4));
        auto da = a.finish();
        REQUIRE(da == b.finish());
        REQUIRE_FALSE(da == c.finish());
    }

    SECTION("operation properties") {
        REQUIRE(has_index(DeltaKind::SeqRemoveAt));
        REQUIRE_FALSE(has_value(DeltaKind::SeqRemoveAt));
        REQUIRE(has_key(DeltaKind::MapNested));
        REQUIRE(has_nested(DeltaKind::MapNested));
        REQUIRE_FALSE(has_value(DeltaKind::MapNested));
        REQUIRE(std::string{to_string(DeltaKind::SeqNestedAt)} == "SeqNestedAt");
    }
}

// ============================================================
// compute_delta on objects
// ============================================================

TEST_CASE("compute_delta on flat objects", "[delta][compute]") {
    Value before = make_abc(1, 2, 3);

    SECTION("one changed member gives one SetMember") {
        Value after = make_abc(1, 20, 3);
        auto doc = compute_delta(before, after);
        REQUIRE(doc.size() == 1);
        const auto& op = doc.ops()[0];
        REQUIRE(op.kind == DeltaKind::SetMember);
        REQUIRE(op.member_index == abc_type()->member_index(1));
        REQUIRE(op.value == Value{20});

        Value target = clone_value(before);
        apply_delta(target, doc);
        REQUIRE(deep_equal(target, after));
    }

    SECTION("equal graphs give an empty document") {
        REQUIRE(compute_delta(before, make_abc(1, 2, 3)).empty());
    }

    SECTION("different root types replace the target") {
        Value after = make_item("pen", 2);
        auto doc = compute_delta(before, after);
        REQUIRE(doc.size() == 1);
        REQUIRE(doc.ops()[0].kind == DeltaKind::ReplaceObject);
        REQUIRE(deep_equal(round_trip(before, after), after));
    }

    SECTION("scalar roots are replaced") {
        auto doc = compute_delta(Value{1}, Value{2});
        REQUIRE(doc.size() == 1);
        REQUIRE(doc.ops()[0].kind == DeltaKind::ReplaceObject);
        Value target{1};
        apply_delta(target, doc);
        REQUIRE(target == Value{2});
    }

    SECTION("comparison options are honoured") {
        ComparisonOptions opts;
        opts.string_mode = StringMode::OrdinalIgnoreCase;
        REQUIRE(compute_delta(make_item("pen", 1), make_item("PEN", 1), opts).empty());
        REQUIRE_FALSE(compute_delta(make_item("pen", 1), make_item("PEN", 1)).empty());
    }
}

TEST_CASE("compute_delta on nested objects", "[delta][compute][nested]") {
    Value before = make_person("Ann", 41, "Oslo");

    SECTION("a change inside a member object nests") {
        Value after = make_person("Ann", 41, "Rome");
        auto doc = compute_delta(before, after);
        REQUIRE(doc.size() == 1);
        const auto& op = doc.ops()[0];
        REQUIRE(op.kind == DeltaKind::NestedMember);
        REQUIRE(op.member_index == index_of(person_type(), "Address"));
        REQUIRE(op.nested->size() == 1);
        REQUIRE(op.nested->ops()[0].member_index == index_of(address_type(), "City"));
        REQUIRE(doc.depth() == 2);
        REQUIRE(deep_equal(round_trip(before, after), after));
    }

    SECTION("null member gets the whole value") {
        Value empty = make_person("Ann", 41, "Oslo");
        empty.as_object()->set("Address", Value{});
        auto doc = compute_delta(empty, before);
        REQUIRE(doc.size() == 1);
        REQUIRE(doc.ops()[0].kind == DeltaKind::SetMember);

        Value target = clone_value(empty);
        apply_delta(target, doc);
        REQUIRE(deep_equal(target, before));
        REQUIRE(target.as_object()->get("Address").identity() != before.as_object()->get("Address").identity());
    }

    SECTION("value cleared to null") {
        Value cleared = make_person("Ann", 41, "Oslo");
        cleared.as_object()->set("Address", Value{});
        auto doc = compute_delta(before, cleared);
        REQUIRE(doc.ops()[0].kind == DeltaKind::SetMember);
        REQUIRE(doc.ops()[0].value.is_null());
        REQUIRE(deep_equal(round_trip(before, cleared), cleared));
    }

    SECTION("several members at once") {
        Value after = make_person("Bob", 42, "Rome");
        after.as_object()->set("Tags", SequenceBuilder().push_back("a").finish());
        auto doc = compute_delta(before, after);
        REQUIRE(doc.size() == 4);
        REQUIRE(deep_equal(round_trip(before, after), after));
    }
}

TEST_CASE("compute_delta member policies", "[delta][compute][policy]") {
    SECTION("skipped members produce no operation") {
        auto type = TypeBuilder("Audit").member("Id").member("Stamp", MemberKind::Skip).finish();
        Value l = ObjectBuilder(type).set("Id", 1).set("Stamp", 100).finish();
        Value r = ObjectBuilder(type).set("Id", 2).set("Stamp", 200).finish();
        auto doc = compute_delta(l, r);
        REQUIRE(doc.size() == 1);
        REQUIRE(doc.ops()[0].member_index == index_of(type, "Id"));
    }

    SECTION("shallow members are replaced whole") {
        auto type = TypeBuilder("Holder").member("Inner", MemberKind::Shallow).finish();
        Value l = ObjectBuilder(type).set("Inner", make_abc(1, 2, 3)).finish();
        Value r = ObjectBuilder(type).set("Inner", make_abc(1, 2, 4)).finish();
        auto doc = compute_delta(l, r);
        REQUIRE(doc.size() == 1);
        REQUIRE(doc.ops()[0].kind == DeltaKind::SetMember);
    }

    SECTION("custom comparers decide and replace whole") {
        auto type = TypeBuilder("Rounded")
                        .custom("Value",
                                [](const Value& a, const Value& b, ComparisonContext&) {
                                    return a.as_int64() / 10 == b.as_int64() / 10;
                                })
                        .finish();
        Value l = ObjectBuilder(type).set("Value", 41).finish();
        REQUIRE(compute_delta(l, ObjectBuilder(type).set("Value", 45).finish()).empty());

        auto doc = compute_delta(l, ObjectBuilder(type).set("Value", 52).finish());
        REQUIRE(doc.size() == 1);
        REQUIRE(doc.ops()[0].kind == DeltaKind::SetMember);
    }

    SECTION("difference seen only by a registered comparator replaces the root") {
        TypeRegistry registry;
        registry.register_comparer("Money", [](const Value&, const Value&, ComparisonContext&) { return false; });
        ComparisonContext ctx(ComparisonOptions{}, &registry);
        auto doc = compute_delta(make_money(1, "a"), make_money(1, "a"), ctx);
        REQUIRE(doc.size() == 1);
        REQUIRE(doc.ops()[0].kind == DeltaKind::ReplaceObject);
    }
}

// ============================================================
// Sequences
// ============================================================

TEST_CASE("compute_delta on ordered sequences", "[delta][sequence]") {
    const auto tags = index_of(person_type(), "Tags");
    Value before = make_person("Ann", 41, "Oslo");

    auto with_tags = [](std::initializer_list<const char*> items) {
        Value p = make_person("Ann", 41, "Oslo");
        SequenceBuilder seq;
        for (const char* s : items) seq.push_back(s);
        p.as_object()->set("Tags", seq.finish());
        return p;
    };

    SECTION("insertion in the middle") {
        Value after = with_tags({"a", "x", "b"});
        auto doc = compute_delta(before, after);
        REQUIRE(doc.size() == 1);
        REQUIRE(doc.ops()[0].kind == DeltaKind::SeqAddAt);
        REQUIRE(doc.ops()[0].member_index == tags);
        REQUIRE(doc.ops()[0].index == 1);
        REQUIRE(doc.ops()[0].value == Value{"x"});
        REQUIRE(deep_equal(round_trip(before, after), after));
    }

    SECTION("replacement of one element") {
        Value after = with_tags({"a", "z"});
        auto doc = compute_delta(before, after);
        REQUIRE(doc.size() == 1);
        REQUIRE(doc.ops()[0].kind == DeltaKind::SeqSetAt);
        REQUIRE(doc.ops()[0].index == 1);
    }

    SECTION("removal from the highest index down") {
        Value from = with_tags({"a", "b", "c"});
        Value after = with_tags({"a"});
        auto doc = compute_delta(from, after);
        REQUIRE(doc.size() == 2);
        REQUIRE(doc.ops()[0].kind == DeltaKind::SeqRemoveAt);
        REQUIRE(doc.ops()[0].index == 2);
        REQUIRE(doc.ops()[1].index == 1);
        REQUIRE(deep_equal(round_trip(from, after), after));
    }

    SECTION("emptied and refilled lists") {
        Value empty = with_tags({});
        REQUIRE(deep_equal(round_trip(before, empty), empty));
        REQUIRE(deep_equal(round_trip(empty, before), before));
    }

    SECTION("mixed edits") {
        Value from = with_tags({"a", "b", "c", "d", "e"});
        Value after = with_tags({"a", "x", "d", "e", "f", "g"});
        REQUIRE(deep_equal(round_trip(from, after), after));
    }

    SECTION("elements that are objects nest") {
        auto type = TypeBuilder("Doc").ordered("Lines").finish();
        Value l = ObjectBuilder(type)
                      .set("Lines", SequenceBuilder().push_back(make_abc(1, 2, 3)).push_back(make_abc(4, 5, 6)).finish())
                      .finish();
        Value r = ObjectBuilder(type)
                      .set("Lines", SequenceBuilder().push_back(make_abc(1, 2, 3)).push_back(make_abc(4, 5, 7)).finish())
                      .finish();
        auto doc = compute_delta(l, r);
        REQUIRE(doc.size() == 1);
        REQUIRE(doc.ops()[0].kind == DeltaKind::SeqNestedAt);
        REQUIRE(doc.ops()[0].index == 1);
        REQUIRE(deep_equal(round_trip(l, r), r));
    }
}

TEST_CASE("compute_delta on unordered sequences", "[delta][sequence][unordered]") {
    const auto bag = index_of(shelf_type(), "Bag");
    Value before = make_shelf();

    auto with_bag = [](std::initializer_list<int> items) {
        Value s = make_shelf();
        SequenceBuilder seq;
        for (int i : items) seq.push_back(i);
        s.as_object()->set("Bag", seq.finish());
        return s;
    };

    SECTION("permutation is empty") {
        REQUIRE(compute_delta(before, with_bag({3, 1, 2})).empty());
    }

    SECTION("unmatched element is updated in place") {
        Value after = with_bag({2, 3, 9});
        auto doc = compute_delta(before, after);
        REQUIRE(doc.size() == 1);
        REQUIRE(doc.ops()[0].kind == DeltaKind::SeqSetAt);
        REQUIRE(doc.ops()[0].member_index == bag);
        REQUIRE(doc.ops()[0].index == 0);
        REQUIRE(deep_equal(round_trip(before, after), after));
    }

    SECTION("removals and additions") {
        Value fewer = with_bag({2});
        auto doc = compute_delta(before, fewer);
        REQUIRE(doc.size() == 2);
        REQUIRE(doc.ops()[0].index == 2);
        REQUIRE(doc.ops()[1].index == 0);
        REQUIRE(deep_equal(round_trip(before, fewer), fewer));

        Value more = with_bag({4, 3, 2, 1, 5});
        REQUIRE(deep_equal(round_trip(before, more), more));
    }
}

TEST_CASE("compute_delta on keyed sequences", "[delta][sequence][keyed]") {
    const auto items = index_of(basket_type(), "Items");

    SECTION("reordering keyed items is empty") {
        REQUIRE(compute_delta(make_basket({{"A", 1}, {"B", 2}}), make_basket({{"B", 2}, {"A", 1}})).empty());
    }

    SECTION("changed member of a keyed item nests at its old position") {
        Value before = make_basket({{"A", 1}, {"B", 2}});
        Value after = make_basket({{"B", 2}, {"A", 5}});
        auto doc = compute_delta(before, after);
        REQUIRE(doc.size() == 1);
        const auto& op = doc.ops()[0];
        REQUIRE(op.kind == DeltaKind::SeqNestedAt);
        REQUIRE(op.member_index == items);
        REQUIRE(op.index == 0);
        REQUIRE(op.nested->size() == 1);
        REQUIRE(op.nested->ops()[0].member_index == index_of(item_type(), "Qty"));
        REQUIRE(deep_equal(round_trip(before, after), after));
    }

    SECTION("different keys are removed and added") {
        Value before = make_basket({{"A", 1}, {"B", 2}});
        Value after = make_basket({{"A", 1}, {"C", 2}});
        auto doc = compute_delta(before, after);
        REQUIRE(doc.size() == 2);
        REQUIRE(doc.ops()[0].kind == DeltaKind::SeqRemoveAt);
        REQUIRE(doc.ops()[0].index == 1);
        REQUIRE(doc.ops()[1].kind == DeltaKind::SeqAddAt);
        REQUIRE(doc.ops()[1].index == 1);
        REQUIRE(deep_equal(round_trip(before, after), after));
    }
}

// ============================================================
// Maps and arrays
// ============================================================

TEST_CASE("compute_delta on maps", "[delta][map]") {
    Value before = make_person("Ann", 41, "Oslo");
    Value after = make_person("Ann", 41, "Oslo");
    after.as_object()->set("Scores", MapBuilder().set("math", 95).set("music", 60).finish());

    auto doc = compute_delta(before, after);
    REQUIRE(doc.size() == 3);

    DeltaReader reader(doc);
    auto ops = reader.for_member(index_of(person_type(), "Scores"));
    REQUIRE(ops.size() == 3);
    REQUIRE(ops[0]->kind == DeltaKind::MapRemove);
    REQUIRE(ops[0]->key == Value{"art"});

    REQUIRE(deep_equal(round_trip(before, after), after));

    SECTION("object values nest") {
        Value l = make_shelf();
        Value r = make_shelf();
        r.as_object()->set("Dict", MapBuilder().set("k", make_abc(1, 2, 4)).set("n", 5).finish());
        auto nested = compute_delta(l, r);
        REQUIRE(nested.size() == 1);
        REQUIRE(nested.ops()[0].kind == DeltaKind::MapNested);
        REQUIRE(nested.ops()[0].key == Value{"k"});
        REQUIRE(deep_equal(round_trip(l, r), r));
    }
}

TEST_CASE("compute_delta on arrays", "[delta][array]") {
    Value before = make_shelf();

    SECTION("rank-1 arrays are edited like lists") {
        Value after = make_shelf();
        after.as_object()->set("Row", ArrayBuilder({4}).push_back(1).push_back(2).push_back(3).push_back(4).finish());
        auto doc = compute_delta(before, after);
        REQUIRE(doc.size() == 1);
        REQUIRE(doc.ops()[0].kind == DeltaKind::SeqAddAt);
        REQUIRE(doc.ops()[0].index == 3);

        Value target = round_trip(before, after);
        REQUIRE(deep_equal(target, after));
        const Value row = target.as_object()->get("Row");
        REQUIRE(row.is<ArrayPtr>());
        REQUIRE((*row.get_if<ArrayPtr>())->shape == std::vector<std::size_t>{4});
    }

    SECTION("cell change in a rank-1 array") {
        Value after = make_shelf();
        after.as_object()->set("Row", ArrayBuilder({3}).push_back(1).push_back(7).push_back(3).finish());
        auto doc = compute_delta(before, after);
        REQUIRE(doc.ops()[0].kind == DeltaKind::SeqSetAt);
        REQUIRE(deep_equal(round_trip(before, after), after));
    }

    SECTION("multi-dimensional arrays are replaced whole") {
        Value after = make_shelf();
        after.as_object()->set("Grid",
                               ArrayBuilder({2, 2}).push_back(1).push_back(2).push_back(3).push_back(9).finish());
        auto doc = compute_delta(before, after);
        REQUIRE(doc.size() == 1);
        REQUIRE(doc.ops()[0].kind == DeltaKind::SetMember);
        REQUIRE(deep_equal(round_trip(before, after), after));
    }
}

// ============================================================
// apply_delta
// ============================================================

TEST_CASE("apply_delta on frozen collections copies before writing", "[delta][apply][frozen]") {
    Value shelf = make_shelf();
    const Value frozen_list = shelf.as_object()->get("Frozen");
    const Value frozen_map = shelf.as_object()->get("FrozenDict");

    DeltaWriter w;
    w.seq_add_at(index_of(shelf_type(), "Frozen"), 2, Value{3});
    w.map_set(index_of(shelf_type(), "FrozenDict"), Value{"z"}, Value{26});
    apply_delta(shelf, w.finish());

    const Value list = shelf.as_object()->get("Frozen");
    REQUIRE(list.is<SequencePtr>());
    REQUIRE(SequenceView::of(list)->size() == 3);
    REQUIRE(SequenceView::of(frozen_list)->size() == 2);

    const Value map = shelf.as_object()->get("FrozenDict");
    REQUIRE(map.is<MapPtr>());
    REQUIRE(MapView::of(map)->size() == 3);
    REQUIRE(MapView::of(frozen_map)->size() == 2);

    SECTION("computed deltas on frozen members round-trip") {
        Value before = make_shelf();
        Value after = make_shelf();
        after.as_object()->set("Frozen", FrozenSequenceBuilder().push_back(2).finish());
        after.as_object()->set("FrozenDict", FrozenMapBuilder().set("x", 10).finish());
        REQUIRE(deep_equal(round_trip(before, after), after));
    }
}

TEST_CASE("apply_delta vivifies null collections", "[delta][apply][null]") {
    Value shelf = ObjectBuilder(shelf_type()).finish();
    const auto list = index_of(shelf_type(), "List");
    const auto dict = index_of(shelf_type(), "Dict");

    SECTION("SeqAddAt creates a list") {
        DeltaWriter w;
        w.seq_add_at(list, 0, Value{7});
        apply_delta(shelf, w.finish());
        auto view = SequenceView::of(shelf.as_object()->get("List"));
        REQUIRE(view);
        REQUIRE(view->size() == 1);
        REQUIRE((*view)[0] == Value{7});
    }

    SECTION("MapSet creates a map") {
        DeltaWriter w;
        w.map_set(dict, Value{"a"}, Value{1});
        apply_delta(shelf, w.finish());
        REQUIRE(MapView::of(shelf.as_object()->get("Dict"))->size() == 1);
    }

    SECTION("MapRemove on null is a no-op") {
        DeltaWriter w;
        w.map_remove(dict, Value{"a"});
        apply_delta(shelf, w.finish());
        REQUIRE(shelf.as_object()->get("Dict").is_null());
    }

    SECTION("other operations on null fail") {
        DeltaWriter w;
        w.seq_set_at(list, 0, Value{7});
        REQUIRE_THROWS_AS(apply_delta(shelf, w.finish()), ApplyError);
    }
}

TEST_CASE("apply_delta applies operations in order", "[delta][apply][order]") {
    Value shelf = make_shelf();
    const auto list = index_of(shelf_type(), "List");

    DeltaWriter w;
    w.seq_add_at(list, 0, Value{"first"});
    w.seq_add_at(list, 0, Value{"second"});
    w.seq_add_at(list, 5, Value{"end"});
    w.seq_remove_at(list, 2);
    apply_delta(shelf, w.finish());

    auto view = SequenceView::of(shelf.as_object()->get("List"));
    REQUIRE(view->size() == 5);
    REQUIRE((*view)[0] == Value{"second"});
    REQUIRE((*view)[1] == Value{"first"});
    REQUIRE((*view)[2] == Value{2});
    REQUIRE((*view)[4] == Value{"end"});
}

TEST_CASE("apply_delta rejects shape mismatches", "[delta][apply][error]") {
    Value shelf = make_shelf();
    const auto list = index_of(shelf_type(), "List");

    SECTION("index past the end") {
        DeltaWriter w;
        w.seq_remove_at(list, 3);
        REQUIRE_THROWS_AS(apply_delta(shelf, w.finish()), ApplyError);
    }

    SECTION("negative index") {
        DeltaWriter w;
        w.seq_add_at(list, -1, Value{1});
        REQUIRE_THROWS_AS(apply_delta(shelf, w.finish()), ApplyError);
    }

    SECTION("sequence operation against a map") {
        DeltaWriter w;
        w.seq_set_at(index_of(shelf_type(), "Dict"), 0, Value{1});
        REQUIRE_THROWS_AS(apply_delta(shelf, w.finish()), ApplyError);
    }

    SECTION("map operation against a list") {
        DeltaWriter w;
        w.map_set(list, Value{"k"}, Value{1});
        REQUIRE_THROWS_AS(apply_delta(shelf, w.finish()), ApplyError);
    }

    SECTION("nested operation against a scalar") {
        DeltaWriter inner;
        inner.set_member(0, Value{1});
        DeltaWriter w;
        w.seq_nested_at(list, 0, inner.finish());
        REQUIRE_THROWS_AS(apply_delta(shelf, w.finish()), ApplyError);
    }

    SECTION("nested operation on a missing key") {
        DeltaWriter inner;
        inner.set_member(abc_type()->member_index(0), Value{1});
        DeltaWriter w;
        w.map_nested(index_of(shelf_type(), "Dict"), Value{"missing"}, inner.finish());
        REQUIRE_THROWS_AS(apply_delta(shelf, w.finish()), ApplyError);
    }

    SECTION("member operation against a non-object target") {
        Value scalar{1};
        DeltaWriter w;
        w.set_member(list, Value{1});
        REQUIRE_THROWS_AS(apply_delta(scalar, w.finish()), ApplyError);
    }

    SECTION("ReplaceObject inside a nested document") {
        DeltaWriter inner;
        inner.replace_object(Value{1});
        DeltaWriter w;
        w.map_nested(index_of(shelf_type(), "Dict"), Value{"k"}, inner.finish());
        REQUIRE_THROWS_AS(apply_delta(shelf, w.finish()), ApplyError);
    }
}

TEST_CASE("print_delta", "[delta][print]") {
    auto doc = compute_delta(make_person("Ann", 41, "Oslo"), make_person("Bob", 41, "Rome"));
    REQUIRE_NOTHROW(print_delta(doc));
    REQUIRE_NOTHROW(print_delta(DeltaDocument{}));
}
