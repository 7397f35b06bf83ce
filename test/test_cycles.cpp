// test_cycles.cpp - Tests for cycle tracking in ComparisonContext
// and for cyclic graphs through every engine

#include <catch2/catch_all.hpp>
#include <struct_delta/deep_equal.h>
#include <struct_delta/builders.h>
#include <struct_delta/delta.h>
#include <struct_delta/type_registry.h>
#include <struct_delta/value_diff.h>

#include "test_types.h"

using namespace struct_delta;
using namespace test_types;

// ============================================================
// ComparisonContext / CycleGuard
// ============================================================

TEST_CASE("ComparisonContext enter and exit", "[cycles][context]") {
    ComparisonContext ctx;
    int a = 0;
    int b = 0;

    SECTION("a pair is tracked only while on the stack") {
        REQUIRE(ctx.enter(&a, &b));
        REQUIRE(ctx.depth() == 1);
        REQUIRE_FALSE(ctx.enter(&a, &b));
        REQUIRE(ctx.depth() == 1);

        ctx.exit(&a, &b);
        REQUIRE(ctx.depth() == 0);
        REQUIRE(ctx.enter(&a, &b));
        ctx.exit(&a, &b);
    }

    SECTION("pairs are ordered") {
        REQUIRE(ctx.enter(&a, &b));
        REQUIRE(ctx.enter(&b, &a));
        ctx.exit(&b, &a);
        ctx.exit(&a, &b);
        REQUIRE(ctx.depth() == 0);
    }

    SECTION("CycleGuard pops on scope exit") {
        {
            CycleGuard outer(ctx, &a, &b);
            REQUIRE(outer.entered());
            CycleGuard inner(ctx, &a, &b);
            REQUIRE_FALSE(inner.entered());
            REQUIRE(ctx.depth() == 1);
        }
        REQUIRE(ctx.depth() == 0);
    }

    SECTION("no_tracking never reports a cycle") {
        auto untracked = ComparisonContext::no_tracking();
        REQUIRE_FALSE(untracked.tracking());
        REQUIRE(untracked.enter(&a, &b));
        REQUIRE(untracked.enter(&a, &b));
        REQUIRE(untracked.depth() == 0);
    }
}

// ============================================================
// Cyclic graphs
// ============================================================

TEST_CASE("deep_equal terminates on cyclic graphs", "[cycles][equality]") {
    Value left = make_ring("a", "b");
    Value right = make_ring("a", "b");
    Value other = make_ring("a", "c");

    SECTION("same shape and values") {
        REQUIRE(deep_equal(left, right));
    }

    SECTION("non-cyclic value along the path differs") {
        REQUIRE_FALSE(deep_equal(left, other));
    }

    SECTION("self loop") {
        auto self_a = ObjectBuilder(node_type()).set("Name", "x").finish_ptr();
        self_a->set("Next", Value{self_a});
        auto self_b = ObjectBuilder(node_type()).set("Name", "x").finish_ptr();
        self_b->set("Next", Value{self_b});
        REQUIRE(deep_equal(Value{self_a}, Value{self_b}));
        self_a->set("Next", Value{});
        self_b->set("Next", Value{});
    }

    SECTION("a sequence containing itself") {
        auto s1 = Sequence::make({Value{1}});
        s1->items.push_back(Value{s1});
        auto s2 = Sequence::make({Value{1}});
        s2->items.push_back(Value{s2});
        REQUIRE(deep_equal(Value{s1}, Value{s2}));
        s1->items.clear();
        s2->items.clear();
    }

    SECTION("siblings do not inherit each other's visited pairs") {
        // The same leaf pair reached twice through different parents must be
        // compared both times
        Value leaf_l = make_abc(1, 2, 3);
        Value leaf_r = make_abc(1, 2, 3);
        Value l = SequenceBuilder().push_back(leaf_l).push_back(leaf_l).finish();
        Value r = SequenceBuilder().push_back(leaf_r).push_back(leaf_r).finish();
        ComparisonContext ctx;
        REQUIRE(deep_equal(l, r, ctx));
        REQUIRE(ctx.depth() == 0);
    }

    break_ring(left);
    break_ring(right);
    break_ring(other);
}

TEST_CASE("diff and delta terminate on cyclic graphs", "[cycles][diff][delta]") {
    Value before = make_ring("a", "b");
    Value after = make_ring("a", "changed");

    SECTION("diff reports the non-cyclic difference") {
        auto result = diff(before, after);
        REQUIRE(result.has_difference);
        REQUIRE(result.entries.size() == 1);
        REQUIRE(path_to_string(result.entries[0].path) == ".Next.Name");
    }

    SECTION("delta reaches the differing member through the cycle") {
        auto doc = compute_delta(before, after);
        REQUIRE(doc.size() == 1);
        REQUIRE(doc.ops()[0].kind == DeltaKind::NestedMember);

        Value target = clone_value(before);
        apply_delta(target, doc);
        REQUIRE(deep_equal(target, after));
        break_ring(target);
    }

    SECTION("clone_value preserves the cycle") {
        Value copy = clone_value(before);
        auto a = copy.as_object();
        auto b = a->get("Next").as_object();
        REQUIRE(b->get("Next").as_object() == a);
        REQUIRE(a != before.as_object());
        break_ring(copy);
    }

    break_ring(before);
    break_ring(after);
}

// ============================================================
// Registered comparators on cyclic graphs
// ============================================================

namespace {

TypeDescriptorPtr link_type()
{
    static const auto type = TypeBuilder("Link").member("Id").polymorphic("Next").finish();
    return type;
}

// A Link whose Next points back at itself
Value make_self_link(int id)
{
    auto link = ObjectBuilder(link_type()).set("Id", id).finish_ptr();
    link->set("Next", Value{link});
    return Value{link};
}

void break_self_link(const Value& v)
{
    v.as_object()->set("Next", Value{});
}

} // anonymous namespace

TEST_CASE("registered comparators on cyclic graphs", "[cycles][registry]") {
    // Delegates back into member-wise comparison, which reaches the same pair again
    TypeRegistry registry;
    registry.register_comparer("Link", [](const Value& l, const Value& r, ComparisonContext& ctx) {
        return compare_members(*l.as_object(), *r.as_object(), ctx);
    });

    Value before = make_self_link(1);
    Value same = make_self_link(1);
    Value after = make_self_link(2);

    SECTION("deep_equal") {
        ComparisonContext ctx{ComparisonOptions{}, &registry};
        REQUIRE(deep_equal(before, same, ctx));
        REQUIRE(ctx.depth() == 0);
        REQUIRE_FALSE(deep_equal(before, after, ctx));
        REQUIRE(ctx.depth() == 0);
        REQUIRE(registry.hits() > 0);
    }

    SECTION("two-node rings") {
        auto a1 = ObjectBuilder(link_type()).set("Id", 1).finish_ptr();
        auto b1 = ObjectBuilder(link_type()).set("Id", 2).finish_ptr();
        a1->set("Next", Value{b1});
        b1->set("Next", Value{a1});
        auto a2 = ObjectBuilder(link_type()).set("Id", 1).finish_ptr();
        auto b2 = ObjectBuilder(link_type()).set("Id", 3).finish_ptr();
        a2->set("Next", Value{b2});
        b2->set("Next", Value{a2});

        ComparisonContext ctx{ComparisonOptions{}, &registry};
        REQUIRE_FALSE(deep_equal(Value{a1}, Value{a2}, ctx));
        b2->set("Id", 2);
        REQUIRE(deep_equal(Value{a1}, Value{a2}, ctx));

        b1->set("Next", Value{});
        b2->set("Next", Value{});
    }

    SECTION("diff") {
        ComparisonContext ctx{ComparisonOptions{}, &registry};
        auto equal_result = diff(before, same, ctx);
        REQUIRE_FALSE(equal_result.has_difference);

        // The comparator owns the root, so the change is reported there
        auto result = diff(before, after, ctx);
        REQUIRE(result.has_difference);
        REQUIRE(result.entries.size() == 1);
        REQUIRE(result.entries[0].path.empty());
    }

    SECTION("compute_delta and apply") {
        ComparisonContext ctx{ComparisonOptions{}, &registry};
        auto doc = compute_delta(before, after, ctx);
        REQUIRE(doc.size() == 1);
        REQUIRE(doc.ops()[0].kind == DeltaKind::SetMember);
        REQUIRE(doc.ops()[0].member_index == link_type()->member_index(0));

        Value target = clone_value(before);
        apply_delta(target, doc);
        REQUIRE(target.as_object()->get("Id") == Value{2});
        REQUIRE(target.as_object()->get("Next").identity() == target.identity());
        REQUIRE(deep_equal(target, after));
        break_self_link(target);
    }

    break_self_link(before);
    break_self_link(after);
    break_self_link(same);
}
