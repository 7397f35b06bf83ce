// test_binary_codec.cpp - Tests for the binary delta codec
// Round trips, string/type tables, header checks and malformed input

#include <catch2/catch_all.hpp>
#include <struct_delta/binary_codec.h>
#include <struct_delta/deep_equal.h>

#include "test_types.h"

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/uuid/string_generator.hpp>

#include <string>
#include <vector>

using namespace struct_delta;
using namespace test_types;

// ============================================================
// Helper Functions
// ============================================================

namespace {

class Handle : public Opaque {
public:
    explicit Handle(int id) : id_(id) {}
    std::string_view type_name() const noexcept override { return "Handle"; }
    bool equals(const Opaque& other) const override {
        return id_ == static_cast<const Handle&>(other).id_;
    }

private:
    int id_;
};

BinaryDeltaOptions fixture_options()
{
    BinaryDeltaOptions opts;
    opts.types = &fixture_registry();
    return opts;
}

BinaryDeltaOptions bare_options()
{
    BinaryDeltaOptions opts = fixture_options();
    opts.use_string_table = false;
    opts.use_type_table = false;
    return opts;
}

/// Document holding one value of every kind the codec knows
DeltaDocument make_rich_document()
{
    using namespace boost::posix_time;
    const DateTime noon(boost::gregorian::date(2024, 5, 1), hours(12) + microseconds(250));

    DeltaWriter w;
    w.set_member(1, Value{});
    w.set_member(2, Value{true});
    w.set_member(3, Value{int8_t{-8}});
    w.set_member(4, Value{int16_t{-1600}});
    w.set_member(5, Value{int32_t{-320000}});
    w.set_member(6, Value{int64_t{-6400000000}});
    w.set_member(7, Value{uint8_t{250}});
    w.set_member(8, Value{uint16_t{65000}});
    w.set_member(9, Value{uint32_t{4000000000u}});
    w.set_member(10, Value{uint64_t{18000000000000000000ull}});
    w.set_member(11, Value{1.5f});
    w.set_member(12, Value{-2.25});
    w.set_member(13, Value{Decimal{"1234.5678"}});
    w.set_member(14, Value{"text"});
    w.set_member(15, Value{boost::uuids::string_generator{}("01234567-89ab-cdef-0123-456789abcdef")});
    w.set_member(16, Value{ByteBuffer{0x00, 0xFF, 0x10}});
    w.set_member(17, Value{EnumValue{"Color", 2}});
    w.set_member(18, Value{Timestamp{noon, TimeKind::Utc}});
    w.set_member(19, Value{OffsetTimestamp{noon, hours(2)}});
    w.set_member(20, Value{Duration{minutes(90)}});
    w.set_member(21, Value{Timestamp{DateTime(boost::date_time::pos_infin), TimeKind::Local}});
    w.seq_add_at(22, 0, SequenceBuilder().push_back(1).push_back("two").finish());
    w.seq_set_at(23, 4, FrozenSequenceBuilder().push_back(3.0).finish());
    w.map_set(24, Value{"key"}, MapBuilder().set(1, "one").set("two", 2).finish());
    w.map_set(25, Value{7}, FrozenMapBuilder().set("x", true).finish());
    w.map_remove(26, Value{"gone"});
    w.seq_remove_at(27, 3);
    w.set_member(28, ArrayBuilder({2, 2}).push_back(1).push_back(2).push_back(3).push_back(4).finish());
    w.set_member(29, make_person("Ann", 41, "Oslo"));

    DeltaWriter inner;
    inner.set_member(abc_type()->member_index(1), Value{20});
    w.nested_member(30, inner.finish());

    DeltaWriter keyed;
    keyed.set_member(item_type()->member_index(1), Value{5});
    w.map_nested(31, Value{"k"}, keyed.finish());
    return w.finish();
}

} // namespace

// ============================================================
// Round trips
// ============================================================

TEST_CASE("binary codec round trips every value kind", "[codec][roundtrip]") {
    const auto doc = make_rich_document();

    SECTION("tables on, no header") {
        auto opts = fixture_options();
        auto bytes = encode_delta(doc, opts);
        REQUIRE(decode_delta(bytes, opts) == doc);
    }

    SECTION("tables off") {
        auto opts = bare_options();
        auto bytes = encode_delta(doc, opts);
        REQUIRE(decode_delta(bytes, opts) == doc);
    }

    SECTION("with header") {
        auto opts = fixture_options();
        opts.include_header = true;
        auto bytes = encode_delta(doc, opts);
        REQUIRE(bytes.size() > 4);
        REQUIRE(bytes[0] == 'S');
        REQUIRE(bytes[3] == '1');
        REQUIRE(decode_delta(bytes, opts) == doc);
    }

    SECTION("header carries the table flags") {
        auto write_opts = bare_options();
        write_opts.include_header = true;
        auto bytes = encode_delta(doc, write_opts);

        auto read_opts = fixture_options();
        read_opts.include_header = true;
        REQUIRE(decode_delta(bytes, read_opts) == doc);
    }

    SECTION("frozen shapes stay frozen") {
        auto decoded = decode_delta(encode_delta(doc, fixture_options()), fixture_options());
        REQUIRE(decoded.ops()[22].value.is<FrozenSequencePtr>());
        REQUIRE(decoded.ops()[24].value.is<FrozenMapPtr>());
        REQUIRE(decoded.ops()[21].value.is<SequencePtr>());
    }

    SECTION("decoded objects use the registered descriptors") {
        auto decoded = decode_delta(encode_delta(doc, fixture_options()), fixture_options());
        auto person = decoded.ops()[28].value.as_object();
        REQUIRE(person);
        REQUIRE(person->type == person_type());
        REQUIRE(person->get("Address").as_object()->get("City") == Value{"Oslo"});
    }

    SECTION("empty document") {
        auto bytes = encode_delta(DeltaDocument{}, fixture_options());
        REQUIRE(bytes.size() == 3);
        REQUIRE(decode_delta(bytes, fixture_options()).empty());
    }
}

TEST_CASE("computed deltas survive the wire", "[codec][roundtrip][delta]") {
    auto opts = fixture_options();
    opts.include_header = true;

    SECTION("keyed collection with new objects") {
        Value before = make_basket({{"A", 1}, {"B", 2}});
        Value after = make_basket({{"B", 3}, {"C", 1}, {"A", 1}});

        auto doc = decode_delta(encode_delta(compute_delta(before, after), opts), opts);
        Value target = clone_value(before);
        apply_delta(target, doc);
        REQUIRE(deep_equal(target, after));
    }

    SECTION("nested member and map edits") {
        Value before = make_person("Ann", 41, "Oslo");
        Value after = make_person("Ann", 42, "Rome");
        after.as_object()->set("Scores", MapBuilder().set("math", 95).set("music", 60).finish());

        auto doc = decode_delta(encode_delta(compute_delta(before, after), opts), opts);
        Value target = clone_value(before);
        apply_delta(target, doc);
        REQUIRE(deep_equal(target, after));
    }
}

// ============================================================
// Tables and options
// ============================================================

TEST_CASE("string table shrinks repeated strings", "[codec][tables]") {
    DeltaWriter w;
    for (int i = 0; i < 10; ++i) {
        w.set_member(i, Value{"a repeated string value"});
    }
    const auto doc = w.finish();

    auto with_table = fixture_options();
    auto without_table = fixture_options();
    without_table.use_string_table = false;

    auto compact = encode_delta(doc, with_table);
    auto plain = encode_delta(doc, without_table);
    REQUIRE(compact.size() < plain.size());
    REQUIRE(decode_delta(compact, with_table) == doc);
    REQUIRE(decode_delta(plain, without_table) == doc);
}

TEST_CASE("enum identity can be left out", "[codec][enum]") {
    DeltaWriter w;
    w.set_member(1, Value{EnumValue{"Color", 3}});
    const auto doc = w.finish();

    auto opts = fixture_options();
    opts.include_enum_type_identity = false;
    auto decoded = decode_delta(encode_delta(doc, opts), opts);

    const auto* e = decoded.ops()[0].value.get_if<EnumValue>();
    REQUIRE(e != nullptr);
    REQUIRE(e->type_name.empty());
    REQUIRE(e->value == 3);
    REQUIRE(decoded.ops()[0].value == doc.ops()[0].value);

    auto full = encode_delta(doc, fixture_options());
    REQUIRE(encode_delta(doc, opts).size() < full.size());
}

TEST_CASE("write_delta appends to the sink", "[codec]") {
    const auto doc = compute_delta(make_abc(1, 2, 3), make_abc(1, 20, 3));
    ByteBuffer sink{0xAA};
    write_delta(doc, sink, fixture_options());
    REQUIRE(sink[0] == 0xAA);
    REQUIRE(sink.size() == 1 + encode_delta(doc, fixture_options()).size());
}

// ============================================================
// Header checks
// ============================================================

TEST_CASE("header validation", "[codec][header]") {
    const auto doc = compute_delta(make_abc(1, 2, 3), make_abc(1, 20, 3));
    auto opts = fixture_options();
    opts.include_header = true;
    opts.stable_type_fingerprint = 123;
    auto bytes = encode_delta(doc, opts);

    SECTION("matching fingerprint") {
        REQUIRE(decode_delta(bytes, opts) == doc);
    }

    SECTION("reader without a fingerprint accepts any") {
        auto read = opts;
        read.stable_type_fingerprint = 0;
        REQUIRE(decode_delta(bytes, read) == doc);
    }

    SECTION("fingerprint mismatch") {
        auto read = opts;
        read.stable_type_fingerprint = 456;
        REQUIRE_THROWS_AS(decode_delta(bytes, read), DecodeError);
    }

    SECTION("bad magic") {
        bytes[0] = 'X';
        REQUIRE_THROWS_AS(decode_delta(bytes, opts), DecodeError);
    }

    SECTION("unsupported version") {
        bytes[4] = 2;
        REQUIRE_THROWS_AS(decode_delta(bytes, opts), DecodeError);
    }

    SECTION("unknown flag bits") {
        // magic(4) version(1) fingerprint 123 (1) flags
        bytes[6] |= 0x80;
        REQUIRE_THROWS_AS(decode_delta(bytes, opts), DecodeError);
    }
}

// ============================================================
// Malformed input
// ============================================================

TEST_CASE("decoder rejects malformed input", "[codec][malformed]") {
    const auto doc = make_rich_document();
    const auto opts = fixture_options();
    const auto bytes = encode_delta(doc, opts);

    SECTION("every truncation fails") {
        for (std::size_t n = 0; n < bytes.size(); ++n) {
            REQUIRE_THROWS_AS(decode_delta(bytes.data(), n, opts), DecodeError);
        }
    }

    SECTION("trailing bytes") {
        auto longer = bytes;
        longer.push_back(0);
        REQUIRE_THROWS_AS(decode_delta(longer, opts), DecodeError);
    }

    SECTION("null buffer") {
        REQUIRE_THROWS_AS(decode_delta(nullptr, 3, opts), DecodeError);
    }

    SECTION("unknown object type") {
        TypeRegistry empty;
        auto read = opts;
        read.types = &empty;
        REQUIRE_THROWS_AS(decode_delta(bytes, read), DecodeError);
    }

    SECTION("nesting over the limit") {
        auto read = opts;
        read.safety.max_nesting = 2;
        REQUIRE_THROWS_AS(decode_delta(bytes, read), DecodeError);
    }

    SECTION("string longer than max_string_bytes") {
        auto read = opts;
        read.safety.max_string_bytes = 4;
        REQUIRE_THROWS_AS(decode_delta(bytes, read), DecodeError);
    }
}

TEST_CASE("decoder rejects crafted input", "[codec][malformed]") {
    // No header and no tables: the stream starts with the op count
    const auto opts = bare_options();

    SECTION("op count over max_ops") {
        auto read = opts;
        read.safety.max_ops = 2;
        const ByteBuffer bytes{0x05, 0x01, 0x00, 0x00};
        REQUIRE_THROWS_AS(decode_delta(bytes, read), DecodeError);
    }

    SECTION("op count past the end of input") {
        const ByteBuffer bytes{0x7F};
        REQUIRE_THROWS_AS(decode_delta(bytes, opts), DecodeError);
    }

    SECTION("varint longer than 64 bits") {
        const ByteBuffer bytes{0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0x02};
        REQUIRE_THROWS_AS(decode_delta(bytes, opts), DecodeError);
    }

    SECTION("unknown operation kind") {
        const ByteBuffer bytes{0x01, 0x63, 0x00};
        REQUIRE_THROWS_AS(decode_delta(bytes, opts), DecodeError);
    }

    SECTION("unknown value tag") {
        // 1 op, SetMember, member 1, tag 0x7E
        const ByteBuffer bytes{0x01, 0x01, 0x02, 0x7E};
        REQUIRE_THROWS_AS(decode_delta(bytes, opts), DecodeError);
    }

    SECTION("integer out of range for its tag") {
        // Int8 tag carrying 300 (zigzag 600)
        const ByteBuffer bytes{0x01, 0x01, 0x02, 0x03, 0xD8, 0x04};
        REQUIRE_THROWS_AS(decode_delta(bytes, opts), DecodeError);
    }

    SECTION("string table reference out of range") {
        auto read = opts;
        read.use_string_table = true;
        // empty table, 1 op, SetMember, member 1, String tag, ref 5
        const ByteBuffer bytes{0x00, 0x01, 0x01, 0x02, 0x0E, 0x05};
        REQUIRE_THROWS_AS(decode_delta(bytes, read), DecodeError);
    }

    SECTION("sequence count past the end of input") {
        // 1 op, SetMember, member 1, Sequence tag, 100 elements
        const ByteBuffer bytes{0x01, 0x01, 0x02, 0x16, 0x64};
        REQUIRE_THROWS_AS(decode_delta(bytes, opts), DecodeError);
    }

    SECTION("timestamp outside the representable range") {
        // 1 op, SetMember, member 1, Timestamp tag, normal marker, INT64_MAX microseconds, kind 0
        const ByteBuffer bytes{0x01, 0x01, 0x02, 0x12, 0x00,
                               0xFE, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0x01, 0x00};
        REQUIRE_THROWS_AS(decode_delta(bytes, opts), DecodeError);
    }

    SECTION("duration outside the representable range") {
        // 1 op, SetMember, member 1, Duration tag, normal marker, INT64_MAX microseconds
        const ByteBuffer bytes{0x01, 0x01, 0x02, 0x14, 0x00,
                               0xFE, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0x01};
        REQUIRE_THROWS_AS(decode_delta(bytes, opts), DecodeError);
    }

    SECTION("timestamp at the epoch decodes") {
        const ByteBuffer bytes{0x01, 0x01, 0x02, 0x12, 0x00, 0x00, 0x00};
        auto doc = decode_delta(bytes, opts);
        REQUIRE(doc.size() == 1);
        const auto* ts = doc.ops()[0].value.get_if<Timestamp>();
        REQUIRE(ts != nullptr);
        REQUIRE(ts->instant == DateTime(boost::gregorian::date(1970, 1, 1)));
    }

    SECTION("a well-formed crafted document decodes") {
        // 1 op, SetMember, member 1, Int32 tag, 21 (zigzag 42)
        const ByteBuffer bytes{0x01, 0x01, 0x02, 0x05, 0x2A};
        auto doc = decode_delta(bytes, opts);
        REQUIRE(doc.size() == 1);
        REQUIRE(doc.ops()[0].member_index == 1);
        REQUIRE(doc.ops()[0].value == Value{21});
    }
}

// ============================================================
// Encoder errors
// ============================================================

TEST_CASE("encoder rejects documents it cannot represent", "[codec][encode]") {
    SECTION("opaque values") {
        DeltaWriter w;
        w.set_member(1, Value{OpaquePtr{std::make_shared<Handle>(1)}});
        REQUIRE_THROWS_AS(encode_delta(w.finish()), EncodeError);
    }

    SECTION("nesting over the limit") {
        const auto doc = compute_delta(make_person("Ann", 41, "Oslo"), make_person("Ann", 41, "Rome"));
        BinaryDeltaOptions opts;
        opts.safety.max_nesting = 2;
        REQUIRE_THROWS_AS(encode_delta(doc, opts), EncodeError);
    }

    SECTION("negative sequence index") {
        DeltaWriter w;
        w.seq_add_at(1, -1, Value{1});
        REQUIRE_THROWS_AS(encode_delta(w.finish()), EncodeError);
    }

    SECTION("nested kind without a nested document") {
        DeltaWriter w;
        DeltaOp op;
        op.kind = DeltaKind::NestedMember;
        op.member_index = 1;
        w.append(op);
        REQUIRE_THROWS_AS(encode_delta(w.finish()), EncodeError);
    }
}
