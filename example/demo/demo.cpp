// demo.cpp
// Demo functions for comparison, diff, delta and the binary codec
#include "struct_delta/binary_codec.h"
#include "struct_delta/builders.h"
#include "struct_delta/comparison_context.h"
#include "struct_delta/deep_equal.h"
#include "struct_delta/delta.h"
#include "struct_delta/type_registry.h"
#include "struct_delta/value.h"
#include "struct_delta/value_diff.h"

#include <cstddef>
#include <iomanip>
#include <iostream>

namespace struct_delta {

// ============================================================
// Sample schema shared by the demos
//
// Order {
//   Id, Customer, Lines (unordered, keyed by Sku), Notes (ordered),
//   Totals (map), Cache (skipped)
// }
// Line { Sku, Qty, Price }
// ============================================================
namespace {

TypeDescriptorPtr line_type()
{
    static const auto type = TypeBuilder("Line").member("Sku").member("Qty").member("Price").finish();
    return type;
}

TypeDescriptorPtr order_type()
{
    static const auto type = TypeBuilder("Order")
                                 .member("Id")
                                 .member("Customer")
                                 .unordered("Lines", {"Sku"})
                                 .ordered("Notes")
                                 .member("Totals")
                                 .member("Cache", MemberKind::Skip)
                                 .finish();
    return type;
}

Value make_line(const std::string& sku, int qty, double price)
{
    return ObjectBuilder(line_type()).set("Sku", sku).set("Qty", qty).set("Price", price).finish();
}

Value create_sample_order()
{
    return ObjectBuilder(order_type())
        .set("Id", int64_t{1001})
        .set("Customer", "Alice")
        .set("Lines", SequenceBuilder()
                          .push_back(make_line("A-1", 2, 9.5))
                          .push_back(make_line("B-7", 1, 120.0))
                          .finish())
        .set("Notes", SequenceBuilder().push_back("gift").finish())
        .set("Totals", MapBuilder().set("net", 139.0).set("tax", 27.8).finish())
        .set("Cache", "stale")
        .finish();
}

// Same order after a customer edit: lines reordered, one quantity changed,
// a note appended and the tax recomputed
Value create_edited_order()
{
    return ObjectBuilder(order_type())
        .set("Id", int64_t{1001})
        .set("Customer", "Alice")
        .set("Lines", SequenceBuilder()
                          .push_back(make_line("B-7", 1, 120.0))
                          .push_back(make_line("A-1", 3, 9.5))
                          .finish())
        .set("Notes", SequenceBuilder().push_back("gift").push_back("express").finish())
        .set("Totals", MapBuilder().set("net", 148.5).set("tax", 29.7).finish())
        .set("Cache", "fresh")
        .finish();
}

void print_bytes(const ByteBuffer& bytes)
{
    std::cout << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        std::cout << std::setw(2) << static_cast<unsigned>(bytes[i]) << ((i + 1) % 16 == 0 ? "\n" : " ");
    }
    std::cout << std::dec << std::setfill(' ') << "\n";
}

} // namespace

// ============================================================
// Deep equality
// ============================================================
void demo_deep_equal()
{
    std::cout << "\n=== Deep Equality Demo ===\n\n";

    Value order = create_sample_order();
    Value copy = clone_value(order);

    std::cout << "Sample order:\n";
    print_value(order, "", 1);

    // -------------------------------------------------------
    // Test 1: a cloned graph is structurally equal
    // -------------------------------------------------------
    std::cout << "\n--- Test 1: clone ---\n";
    std::cout << "deep_equal(order, clone) = " << std::boolalpha << deep_equal(order, copy) << "\n";

    // -------------------------------------------------------
    // Test 2: skipped members never matter
    // -------------------------------------------------------
    std::cout << "\n--- Test 2: skipped member ---\n";
    copy.as_object()->set("Cache", "something else");
    std::cout << "after changing Cache: " << deep_equal(order, copy) << "\n";

    // -------------------------------------------------------
    // Test 3: keyed lines compare regardless of order
    // -------------------------------------------------------
    std::cout << "\n--- Test 3: reordered lines ---\n";
    copy.as_object()->set("Lines", SequenceBuilder()
                                       .push_back(make_line("B-7", 1, 120.0))
                                       .push_back(make_line("A-1", 2, 9.5))
                                       .finish());
    std::cout << "after reordering Lines: " << deep_equal(order, copy) << "\n";

    // -------------------------------------------------------
    // Test 4: tolerances
    // -------------------------------------------------------
    std::cout << "\n--- Test 4: tolerances ---\n";
    ComparisonOptions loose;
    loose.double_epsilon = 0.01;
    loose.string_mode = StringMode::OrdinalIgnoreCase;
    copy.as_object()->set("Customer", "ALICE");
    copy.as_object()->set("Totals", MapBuilder().set("net", 139.001).set("tax", 27.8).finish());
    std::cout << "exact:  " << deep_equal(order, copy) << "\n";
    std::cout << "loose:  " << deep_equal(order, copy, loose) << "\n";

    // -------------------------------------------------------
    // Test 5: registered comparer
    // -------------------------------------------------------
    std::cout << "\n--- Test 5: registered comparer for Line ---\n";
    TypeRegistry registry;
    registry.register_comparer("Line", [](const Value& l, const Value& r, ComparisonContext&) {
        return l.as_object()->get("Sku") == r.as_object()->get("Sku");
    });
    Value a = make_line("A-1", 2, 9.5);
    Value b = make_line("A-1", 5, 9.5);
    ComparisonContext plain_ctx{ComparisonOptions{}, &registry};
    std::cout << "lines with the same Sku: " << deep_equal(a, b, plain_ctx) << "\n";
    std::cout << "registry hits=" << registry.hits() << " misses=" << registry.misses() << "\n";
}

// ============================================================
// Cycles
// ============================================================
void demo_cycles()
{
    std::cout << "\n=== Cycle Handling Demo ===\n\n";

    auto node = TypeBuilder("Node").member("Name").member("Next").finish();

    auto make_ring = [&](const std::string& first, const std::string& second) {
        auto a = ObjectBuilder(node).set("Name", first).finish_ptr();
        auto b = ObjectBuilder(node).set("Name", second).finish_ptr();
        a->set("Next", Value{b});
        b->set("Next", Value{a});
        return a;
    };

    auto left = make_ring("x", "y");
    auto right = make_ring("x", "y");
    auto other = make_ring("x", "z");

    std::cout << "ring(x,y) vs ring(x,y): " << std::boolalpha << deep_equal(Value{left}, Value{right}) << "\n";
    std::cout << "ring(x,y) vs ring(x,z): " << deep_equal(Value{left}, Value{other}) << "\n";

    std::cout << "\nprint_value on a ring:\n";
    print_value(Value{left}, "", 1);

    // Break the rings so the shared_ptr graph can be released
    for (const auto& ring : {left, right, other}) {
        ring->get("Next").as_object()->set("Next", Value{});
    }
}

// ============================================================
// Diff
// ============================================================
void demo_diff()
{
    std::cout << "\n=== Diff Demo ===\n\n";

    Value before = create_sample_order();
    Value after = create_edited_order();

    DiffCollector collector;
    collector.diff(before, after);

    std::cout << "Changes found: " << collector.get_diffs().size() << "\n";
    collector.print_diffs();

    std::cout << "\n--- Free function ---\n";
    DiffResult result = diff(before, after);
    for (const auto& entry : result.entries) {
        std::cout << "  " << path_to_string(entry.path) << " -> " << value_to_string(entry.value()) << "\n";
    }
}

// ============================================================
// Delta compute / apply
// ============================================================
void demo_delta()
{
    std::cout << "\n=== Delta Demo ===\n\n";

    Value before = create_sample_order();
    Value after = create_edited_order();

    DeltaDocument doc = compute_delta(before, after);
    std::cout << "Delta (" << doc.total_ops() << " ops, depth " << doc.depth() << "):\n";
    print_delta(doc, 1);

    Value replica = clone_value(before);
    apply_delta(replica, doc);
    std::cout << "\nreplica equals edited order: " << std::boolalpha << deep_equal(replica, after) << "\n";

    std::cout << "\n--- Reapplying to a mismatched target ---\n";
    Value wrong{"not an order"};
    DeltaWriter writer;
    writer.set_member(order_type()->member_index(1), Value{"Bob"});
    try {
        apply_delta(wrong, writer.finish());
        std::cout << "unexpected success\n";
    } catch (const ApplyError& e) {
        std::cout << "ApplyError: " << e.what() << "\n";
    }
}

// ============================================================
// Binary codec
// ============================================================
void demo_binary_codec()
{
    std::cout << "\n=== Binary Codec Demo ===\n\n";

    TypeRegistry registry;
    registry.register_descriptor(order_type());
    registry.register_descriptor(line_type());

    DeltaDocument doc = compute_delta(create_sample_order(), create_edited_order());

    BinaryDeltaOptions options;
    options.include_header = true;
    options.stable_type_fingerprint = schema_fingerprint({order_type(), line_type()});
    options.types = &registry;

    ByteBuffer bytes = encode_delta(doc, options);
    std::cout << "Encoded " << doc.total_ops() << " ops into " << bytes.size() << " bytes:\n";
    print_bytes(bytes);

    DeltaDocument decoded = decode_delta(bytes, options);
    std::cout << "decoded == original: " << std::boolalpha << (decoded == doc) << "\n";

    BinaryDeltaOptions bare = options;
    bare.use_string_table = false;
    bare.use_type_table = false;
    std::cout << "without tables: " << encode_delta(doc, bare).size() << " bytes\n";

    std::cout << "\n--- Corrupt input ---\n";
    ByteBuffer truncated(bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(bytes.size() / 2));
    try {
        auto partial = decode_delta(truncated, options);
        std::cout << "unexpected success (" << partial.size() << " ops)\n";
    } catch (const DecodeError& e) {
        std::cout << "DecodeError: " << e.what() << "\n";
    }
}

} // namespace struct_delta
