// binary_codec.cpp - compact binary encoding of delta documents

#include <struct_delta/binary_codec.h>
#include <struct_delta/type_registry.h>

#include <immer/flex_vector_transient.hpp>
#include <immer/map_transient.hpp>

#include <boost/date_time/posix_time/posix_time_types.hpp>

#include <cstring>
#include <limits>
#include <string>
#include <unordered_map>
#include <utility>

namespace struct_delta {

namespace {

enum class ValueTag : uint8_t {
    Null            = 0x00,
    False           = 0x01,
    True            = 0x02,
    Int8            = 0x03,
    Int16           = 0x04,
    Int32           = 0x05,
    Int64           = 0x06,
    UInt8           = 0x07,
    UInt16          = 0x08,
    UInt32          = 0x09,
    UInt64          = 0x0A,
    Float           = 0x0B,
    Double          = 0x0C,
    Decimal         = 0x0D,
    String          = 0x0E,
    Guid            = 0x0F,
    Bytes           = 0x10,
    Enum            = 0x11,
    Timestamp       = 0x12,
    OffsetTimestamp = 0x13,
    Duration        = 0x14,
    Object          = 0x15,
    Sequence        = 0x16,
    FrozenSequence  = 0x17,
    Map             = 0x18,
    FrozenMap       = 0x19,
    Array           = 0x1A,
};

constexpr uint8_t flag_string_table = 0x01;
constexpr uint8_t flag_type_table   = 0x02;

constexpr uint8_t type_kind_enum   = 0;
constexpr uint8_t type_kind_object = 1;

// Special-value markers for ptime / time_duration
constexpr uint8_t time_normal   = 0;
constexpr uint8_t time_nadt     = 1;
constexpr uint8_t time_pos_inf  = 2;
constexpr uint8_t time_neg_inf  = 3;

const DateTime& unix_epoch()
{
    static const DateTime epoch(boost::gregorian::date(1970, 1, 1));
    return epoch;
}

// Microsecond offsets from the epoch that land inside [min_date_time, max_date_time]
int64_t min_time_offset()
{
    static const int64_t v = (DateTime(boost::date_time::min_date_time) - unix_epoch()).total_microseconds();
    return v;
}

int64_t max_time_offset()
{
    static const int64_t v = (DateTime(boost::date_time::max_date_time) - unix_epoch()).total_microseconds();
    return v;
}

// Largest microsecond count whose tick value stays clear of the special-value
// sentinels at the ends of the int64 range
int64_t max_duration_micros()
{
    static const int64_t v = (std::numeric_limits<int64_t>::max() - 2) /
                             (Duration::ticks_per_second() / 1'000'000);
    return v;
}

bool known_kind(uint64_t k)
{
    switch (static_cast<DeltaKind>(k)) {
        case DeltaKind::ReplaceObject:
        case DeltaKind::SetMember:
        case DeltaKind::NestedMember:
        case DeltaKind::SeqSetAt:
        case DeltaKind::SeqAddAt:
        case DeltaKind::SeqRemoveAt:
        case DeltaKind::SeqNestedAt:
        case DeltaKind::MapSet:
        case DeltaKind::MapRemove:
        case DeltaKind::MapNested:
            return k <= std::numeric_limits<uint8_t>::max();
    }
    return false;
}

uint64_t zigzag(int64_t v)
{
    return (static_cast<uint64_t>(v) << 1) ^ static_cast<uint64_t>(v >> 63);
}

int64_t unzigzag(uint64_t u)
{
    return static_cast<int64_t>((u >> 1) ^ (~(u & 1) + 1));
}

// ============================================================
// ByteWriter / ByteReader
// ============================================================

// Helper: write bytes to buffer, little-endian
class ByteWriter {
public:
    ByteBuffer buffer;

    void write_u8(uint8_t v) {
        buffer.push_back(v);
    }

    void write_varuint(uint64_t v) {
        while (v >= 0x80) {
            buffer.push_back(static_cast<uint8_t>(v | 0x80));
            v >>= 7;
        }
        buffer.push_back(static_cast<uint8_t>(v));
    }

    void write_varint(int64_t v) {
        write_varuint(zigzag(v));
    }

    void write_u32_le(uint32_t v) {
        for (int i = 0; i < 4; ++i) buffer.push_back(static_cast<uint8_t>(v >> (8 * i)));
    }

    void write_u64_le(uint64_t v) {
        for (int i = 0; i < 8; ++i) buffer.push_back(static_cast<uint8_t>(v >> (8 * i)));
    }

    void write_f32(float v) {
        uint32_t bits;
        std::memcpy(&bits, &v, sizeof(bits));
        write_u32_le(bits);
    }

    void write_f64(double v) {
        uint64_t bits;
        std::memcpy(&bits, &v, sizeof(bits));
        write_u64_le(bits);
    }

    void write_bytes(const uint8_t* data, std::size_t n) {
        buffer.insert(buffer.end(), data, data + n);
    }

    void write_raw_string(std::string_view s) {
        write_varuint(s.size());
        write_bytes(reinterpret_cast<const uint8_t*>(s.data()), s.size());
    }
};

// Helper: read bytes from buffer; every read is bounds-checked
class ByteReader {
public:
    const uint8_t* data;
    std::size_t size;
    std::size_t pos = 0;

    ByteReader(const uint8_t* d, std::size_t s) : data(d), size(s) {}

    bool has_bytes(std::size_t n) const {
        return n <= size - pos;
    }

    std::size_t remaining() const {
        return size - pos;
    }

    uint8_t read_u8() {
        if (!has_bytes(1)) throw DecodeError("Unexpected end of buffer");
        return data[pos++];
    }

    uint64_t read_varuint() {
        uint64_t result = 0;
        for (int i = 0; i < 10; ++i) {
            const uint8_t b = read_u8();
            if (i == 9 && b > 0x01) {
                throw DecodeError("Malformed varint: value exceeds 64 bits");
            }
            result |= static_cast<uint64_t>(b & 0x7F) << (7 * i);
            if ((b & 0x80) == 0) {
                return result;
            }
        }
        throw DecodeError("Malformed varint: more than 10 bytes");
    }

    int64_t read_varint() {
        return unzigzag(read_varuint());
    }

    uint32_t read_u32_le() {
        if (!has_bytes(4)) throw DecodeError("Unexpected end of buffer");
        uint32_t v = 0;
        for (int i = 0; i < 4; ++i) v |= static_cast<uint32_t>(data[pos + i]) << (8 * i);
        pos += 4;
        return v;
    }

    uint64_t read_u64_le() {
        if (!has_bytes(8)) throw DecodeError("Unexpected end of buffer");
        uint64_t v = 0;
        for (int i = 0; i < 8; ++i) v |= static_cast<uint64_t>(data[pos + i]) << (8 * i);
        pos += 8;
        return v;
    }

    float read_f32() {
        const uint32_t bits = read_u32_le();
        float v;
        std::memcpy(&v, &bits, sizeof(v));
        return v;
    }

    double read_f64() {
        const uint64_t bits = read_u64_le();
        double v;
        std::memcpy(&v, &bits, sizeof(v));
        return v;
    }

    /// Length-prefixed byte run, checked against the cap and the input left
    std::pair<const uint8_t*, std::size_t> read_run(std::size_t max_bytes) {
        const uint64_t len = read_varuint();
        if (len > max_bytes) {
            throw DecodeError("Length " + std::to_string(len) + " exceeds max_string_bytes");
        }
        if (!has_bytes(static_cast<std::size_t>(len))) throw DecodeError("Unexpected end of buffer");
        const uint8_t* start = data + pos;
        pos += static_cast<std::size_t>(len);
        return {start, static_cast<std::size_t>(len)};
    }

    std::string read_raw_string(std::size_t max_bytes) {
        auto [start, len] = read_run(max_bytes);
        return std::string(reinterpret_cast<const char*>(start), len);
    }

    /// Element count that must fit in the input left (every element takes a byte)
    std::size_t read_count(std::string_view what) {
        const uint64_t n = read_varuint();
        if (n > remaining()) {
            throw DecodeError(std::string(what) + " count " + std::to_string(n) + " exceeds remaining input");
        }
        return static_cast<std::size_t>(n);
    }
};

// ============================================================
// Encoder
// ============================================================

using TypeKey = std::pair<uint8_t, std::string>;

struct TypeKeyHash {
    std::size_t operator()(const TypeKey& k) const noexcept {
        return std::hash<std::string>{}(k.second) ^ k.first;
    }
};

class DeltaEncoder {
public:
    explicit DeltaEncoder(const BinaryDeltaOptions& options) : opts_(options) {}

    void encode(const DeltaDocument& doc, ByteWriter& w) {
        collect_document(doc, 1);
        build_string_table();

        if (opts_.include_header) {
            w.write_bytes(codec_magic, sizeof(codec_magic));
            w.write_varuint(codec_version);
            w.write_varuint(opts_.stable_type_fingerprint);
            uint8_t flags = 0;
            if (opts_.use_string_table) flags |= flag_string_table;
            if (opts_.use_type_table) flags |= flag_type_table;
            w.write_u8(flags);
        }

        if (opts_.use_string_table) {
            w.write_varuint(string_table_.size());
            for (const auto& s : string_table_) {
                w.write_raw_string(s);
            }
        }
        if (opts_.use_type_table) {
            w.write_varuint(type_table_.size());
            for (const auto& [kind, name] : type_table_) {
                w.write_u8(kind);
                w.write_raw_string(name);
            }
        }

        write_document(w, doc, 1);
    }

private:
    const BinaryDeltaOptions& opts_;

    std::unordered_map<std::string, std::size_t> string_counts_;
    std::vector<std::string> string_order_;
    std::vector<std::string> string_table_;
    std::unordered_map<std::string, std::size_t> string_refs_;

    std::vector<TypeKey> type_table_;
    std::unordered_map<TypeKey, std::size_t, TypeKeyHash> type_refs_;

    void check_depth(std::size_t depth) const {
        if (depth > opts_.safety.max_nesting) {
            throw EncodeError("Nesting depth exceeds max_nesting (" + std::to_string(opts_.safety.max_nesting) +
                              "); cyclic payload?");
        }
    }

    // --- pass 1: gather strings and type names ---

    void note_string(const std::string& s) {
        auto [it, inserted] = string_counts_.emplace(s, 0);
        if (inserted) string_order_.push_back(s);
        ++it->second;
    }

    void note_type(uint8_t kind, const std::string& name) {
        if (!opts_.use_type_table) {
            note_string(name);
            return;
        }
        TypeKey key{kind, name};
        if (type_refs_.emplace(key, type_table_.size()).second) {
            type_table_.push_back(std::move(key));
        }
    }

    void collect_document(const DeltaDocument& doc, std::size_t depth) {
        check_depth(depth);
        for (const auto& op : doc.ops()) {
            if (has_key(op.kind)) collect_value(op.key, depth + 1);
            if (has_value(op.kind)) collect_value(op.value, depth + 1);
            if (has_nested(op.kind)) {
                if (!op.nested) {
                    throw EncodeError(std::string(to_string(op.kind)) + " without a nested document");
                }
                collect_document(*op.nested, depth + 1);
            }
        }
    }

    void collect_value(const Value& v, std::size_t depth) {
        check_depth(depth);
        if (v.is_null()) return;

        std::visit([&](const auto& arg) {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (std::is_same_v<T, std::string>) {
                note_string(arg);
            } else if constexpr (std::is_same_v<T, EnumValue>) {
                if (opts_.include_enum_type_identity) note_type(type_kind_enum, arg.type_name);
            } else if constexpr (std::is_same_v<T, ObjectPtr>) {
                note_type(type_kind_object, arg->type_name());
                for (const auto& f : arg->fields) collect_value(f, depth + 1);
            } else if constexpr (std::is_same_v<T, SequencePtr> || std::is_same_v<T, FrozenSequencePtr>) {
                for (const auto& item : arg->items) collect_value(item, depth + 1);
            } else if constexpr (std::is_same_v<T, MapPtr> || std::is_same_v<T, FrozenMapPtr>) {
                for (const auto& kv : arg->entries) {
                    collect_value(kv.first, depth + 1);
                    collect_value(kv.second, depth + 1);
                }
            } else if constexpr (std::is_same_v<T, ArrayPtr>) {
                for (const auto& c : arg->cells) collect_value(c, depth + 1);
            } else if constexpr (std::is_same_v<T, OpaquePtr>) {
                throw EncodeError("Opaque value of type '" + std::string(arg->type_name()) + "' cannot be encoded");
            }
        }, v.data);
    }

    void build_string_table() {
        if (!opts_.use_string_table) return;
        for (const auto& s : string_order_) {
            if (string_counts_[s] >= 2 || s.size() >= STRUCT_DELTA_STRING_TABLE_MIN_BYTES) {
                string_refs_.emplace(s, string_table_.size());
                string_table_.push_back(s);
            }
        }
    }

    // --- pass 2: emit ---

    void write_string(ByteWriter& w, const std::string& s) {
        if (!opts_.use_string_table) {
            w.write_raw_string(s);
            return;
        }
        // 0 = inline, k = table entry k - 1
        if (auto it = string_refs_.find(s); it != string_refs_.end()) {
            w.write_varuint(it->second + 1);
        } else {
            w.write_varuint(0);
            w.write_raw_string(s);
        }
    }

    void write_type(ByteWriter& w, uint8_t kind, const std::string& name) {
        if (!opts_.use_type_table) {
            write_string(w, name);
            return;
        }
        w.write_varuint(type_refs_.at(TypeKey{kind, name}));
    }

    static void write_time(ByteWriter& w, const DateTime& t) {
        if (t.is_not_a_date_time()) { w.write_u8(time_nadt); return; }
        if (t.is_pos_infinity())    { w.write_u8(time_pos_inf); return; }
        if (t.is_neg_infinity())    { w.write_u8(time_neg_inf); return; }
        w.write_u8(time_normal);
        w.write_varint((t - unix_epoch()).total_microseconds());
    }

    static void write_duration(ByteWriter& w, const Duration& d) {
        if (d.is_not_a_date_time()) { w.write_u8(time_nadt); return; }
        if (d.is_pos_infinity())    { w.write_u8(time_pos_inf); return; }
        if (d.is_neg_infinity())    { w.write_u8(time_neg_inf); return; }
        w.write_u8(time_normal);
        w.write_varint(d.total_microseconds());
    }

    void write_value(ByteWriter& w, const Value& val, std::size_t depth) {
        if (val.is_null()) {
            w.write_u8(static_cast<uint8_t>(ValueTag::Null));
            return;
        }

        std::visit([&](const auto& arg) {
            using T = std::decay_t<decltype(arg)>;

            if constexpr (std::is_same_v<T, std::monostate>) {
                w.write_u8(static_cast<uint8_t>(ValueTag::Null));
            } else if constexpr (std::is_same_v<T, bool>) {
                w.write_u8(static_cast<uint8_t>(arg ? ValueTag::True : ValueTag::False));
            } else if constexpr (std::is_same_v<T, int8_t>) {
                w.write_u8(static_cast<uint8_t>(ValueTag::Int8));
                w.write_varint(arg);
            } else if constexpr (std::is_same_v<T, int16_t>) {
                w.write_u8(static_cast<uint8_t>(ValueTag::Int16));
                w.write_varint(arg);
            } else if constexpr (std::is_same_v<T, int32_t>) {
                w.write_u8(static_cast<uint8_t>(ValueTag::Int32));
                w.write_varint(arg);
            } else if constexpr (std::is_same_v<T, int64_t>) {
                w.write_u8(static_cast<uint8_t>(ValueTag::Int64));
                w.write_varint(arg);
            } else if constexpr (std::is_same_v<T, uint8_t>) {
                w.write_u8(static_cast<uint8_t>(ValueTag::UInt8));
                w.write_varuint(arg);
            } else if constexpr (std::is_same_v<T, uint16_t>) {
                w.write_u8(static_cast<uint8_t>(ValueTag::UInt16));
                w.write_varuint(arg);
            } else if constexpr (std::is_same_v<T, uint32_t>) {
                w.write_u8(static_cast<uint8_t>(ValueTag::UInt32));
                w.write_varuint(arg);
            } else if constexpr (std::is_same_v<T, uint64_t>) {
                w.write_u8(static_cast<uint8_t>(ValueTag::UInt64));
                w.write_varuint(arg);
            } else if constexpr (std::is_same_v<T, float>) {
                w.write_u8(static_cast<uint8_t>(ValueTag::Float));
                w.write_f32(arg);
            } else if constexpr (std::is_same_v<T, double>) {
                w.write_u8(static_cast<uint8_t>(ValueTag::Double));
                w.write_f64(arg);
            } else if constexpr (std::is_same_v<T, struct_delta::Decimal>) {
                w.write_u8(static_cast<uint8_t>(ValueTag::Decimal));
                w.write_raw_string(arg.str(std::numeric_limits<struct_delta::Decimal>::max_digits10,
                                           std::ios_base::scientific));
            } else if constexpr (std::is_same_v<T, std::string>) {
                w.write_u8(static_cast<uint8_t>(ValueTag::String));
                write_string(w, arg);
            } else if constexpr (std::is_same_v<T, struct_delta::Guid>) {
                w.write_u8(static_cast<uint8_t>(ValueTag::Guid));
                w.write_bytes(arg.data, arg.static_size());
            } else if constexpr (std::is_same_v<T, ByteBuffer>) {
                w.write_u8(static_cast<uint8_t>(ValueTag::Bytes));
                w.write_varuint(arg.size());
                w.write_bytes(arg.data(), arg.size());
            } else if constexpr (std::is_same_v<T, EnumValue>) {
                w.write_u8(static_cast<uint8_t>(ValueTag::Enum));
                if (opts_.include_enum_type_identity) {
                    w.write_u8(1);
                    write_type(w, type_kind_enum, arg.type_name);
                } else {
                    w.write_u8(0);
                }
                w.write_varint(arg.value);
            } else if constexpr (std::is_same_v<T, struct_delta::Timestamp>) {
                w.write_u8(static_cast<uint8_t>(ValueTag::Timestamp));
                write_time(w, arg.instant);
                w.write_u8(static_cast<uint8_t>(arg.kind));
            } else if constexpr (std::is_same_v<T, struct_delta::OffsetTimestamp>) {
                w.write_u8(static_cast<uint8_t>(ValueTag::OffsetTimestamp));
                write_time(w, arg.local);
                write_duration(w, arg.offset);
            } else if constexpr (std::is_same_v<T, struct_delta::Duration>) {
                w.write_u8(static_cast<uint8_t>(ValueTag::Duration));
                write_duration(w, arg);
            } else if constexpr (std::is_same_v<T, ObjectPtr>) {
                w.write_u8(static_cast<uint8_t>(ValueTag::Object));
                write_type(w, type_kind_object, arg->type_name());
                std::size_t present = 0;
                for (const auto& f : arg->fields) {
                    if (!f.is_null()) ++present;
                }
                w.write_varuint(present);
                for (std::size_t i = 0; i < arg->fields.size(); ++i) {
                    if (arg->fields[i].is_null()) continue;
                    w.write_varint(arg->type->member_index(i));
                    write_value(w, arg->fields[i], depth + 1);
                }
            } else if constexpr (std::is_same_v<T, SequencePtr> || std::is_same_v<T, FrozenSequencePtr>) {
                w.write_u8(static_cast<uint8_t>(std::is_same_v<T, SequencePtr> ? ValueTag::Sequence
                                                                               : ValueTag::FrozenSequence));
                w.write_varuint(arg->items.size());
                for (const auto& item : arg->items) {
                    write_value(w, item, depth + 1);
                }
            } else if constexpr (std::is_same_v<T, MapPtr> || std::is_same_v<T, FrozenMapPtr>) {
                w.write_u8(static_cast<uint8_t>(std::is_same_v<T, MapPtr> ? ValueTag::Map : ValueTag::FrozenMap));
                w.write_varuint(arg->entries.size());
                for (const auto& kv : arg->entries) {
                    write_value(w, kv.first, depth + 1);
                    write_value(w, kv.second, depth + 1);
                }
            } else if constexpr (std::is_same_v<T, ArrayPtr>) {
                w.write_u8(static_cast<uint8_t>(ValueTag::Array));
                w.write_varuint(arg->shape.size());
                for (auto extent : arg->shape) {
                    w.write_varuint(extent);
                }
                for (const auto& c : arg->cells) {
                    write_value(w, c, depth + 1);
                }
            } else if constexpr (std::is_same_v<T, OpaquePtr>) {
                throw EncodeError("Opaque value of type '" + std::string(arg->type_name()) + "' cannot be encoded");
            }
        }, val.data);
    }

    void write_document(ByteWriter& w, const DeltaDocument& doc, std::size_t depth) {
        w.write_varuint(doc.size());
        for (const auto& op : doc.ops()) {
            w.write_varuint(static_cast<uint8_t>(op.kind));
            w.write_varint(op.member_index);
            if (has_index(op.kind)) {
                if (op.index < 0) {
                    throw EncodeError(std::string(to_string(op.kind)) + " with negative index " +
                                      std::to_string(op.index));
                }
                w.write_varuint(static_cast<uint64_t>(op.index));
            }
            if (has_key(op.kind)) write_value(w, op.key, depth + 1);
            if (has_value(op.kind)) write_value(w, op.value, depth + 1);
            if (has_nested(op.kind)) write_document(w, *op.nested, depth + 1);
        }
    }
};

// ============================================================
// Decoder
// ============================================================

class DeltaDecoder {
public:
    DeltaDecoder(ByteReader& r, const BinaryDeltaOptions& options)
        : r_(r)
        , opts_(options)
        , use_strings_(options.use_string_table)
        , use_types_(options.use_type_table)
    {
    }

    DeltaDocument decode() {
        if (opts_.include_header) {
            read_header();
        }
        if (use_strings_) {
            const std::size_t n = r_.read_count("String table");
            string_table_.reserve(n);
            for (std::size_t i = 0; i < n; ++i) {
                string_table_.push_back(r_.read_raw_string(opts_.safety.max_string_bytes));
            }
        }
        if (use_types_) {
            const std::size_t n = r_.read_count("Type table");
            type_table_.reserve(n);
            for (std::size_t i = 0; i < n; ++i) {
                const uint8_t kind = r_.read_u8();
                if (kind != type_kind_enum && kind != type_kind_object) {
                    throw DecodeError("Unknown type table kind " + std::to_string(kind));
                }
                type_table_.emplace_back(kind, r_.read_raw_string(opts_.safety.max_string_bytes));
            }
        }

        DeltaDocument doc = read_document(1);
        if (r_.remaining() != 0) {
            throw DecodeError(std::to_string(r_.remaining()) + " trailing bytes after document");
        }
        return doc;
    }

private:
    ByteReader& r_;
    const BinaryDeltaOptions& opts_;
    bool use_strings_;
    bool use_types_;
    std::vector<std::string> string_table_;
    std::vector<TypeKey> type_table_;
    std::size_t total_ops_ = 0;

    void read_header() {
        if (!r_.has_bytes(sizeof(codec_magic)) || std::memcmp(r_.data + r_.pos, codec_magic, sizeof(codec_magic)) != 0) {
            throw DecodeError("Bad magic");
        }
        r_.pos += sizeof(codec_magic);

        const uint64_t version = r_.read_varuint();
        if (version != codec_version) {
            throw DecodeError("Unsupported codec version " + std::to_string(version));
        }
        const uint64_t fingerprint = r_.read_varuint();
        if (opts_.stable_type_fingerprint != 0 && fingerprint != opts_.stable_type_fingerprint) {
            throw DecodeError("Type fingerprint mismatch: stream " + std::to_string(fingerprint) + ", expected " +
                              std::to_string(opts_.stable_type_fingerprint));
        }
        const uint8_t flags = r_.read_u8();
        if (flags & ~(flag_string_table | flag_type_table)) {
            throw DecodeError("Unknown header flags " + std::to_string(flags));
        }
        use_strings_ = (flags & flag_string_table) != 0;
        use_types_ = (flags & flag_type_table) != 0;
    }

    void check_depth(std::size_t depth) const {
        if (depth > opts_.safety.max_nesting) {
            throw DecodeError("Nesting depth exceeds max_nesting (" + std::to_string(opts_.safety.max_nesting) + ")");
        }
    }

    std::string read_string() {
        if (!use_strings_) {
            return r_.read_raw_string(opts_.safety.max_string_bytes);
        }
        const uint64_t ref = r_.read_varuint();
        if (ref == 0) {
            return r_.read_raw_string(opts_.safety.max_string_bytes);
        }
        if (ref > string_table_.size()) {
            throw DecodeError("String table reference " + std::to_string(ref) + " out of range");
        }
        return string_table_[static_cast<std::size_t>(ref - 1)];
    }

    std::string read_type(uint8_t kind) {
        if (!use_types_) {
            return read_string();
        }
        const uint64_t ref = r_.read_varuint();
        if (ref >= type_table_.size()) {
            throw DecodeError("Type table reference " + std::to_string(ref) + " out of range");
        }
        const auto& entry = type_table_[static_cast<std::size_t>(ref)];
        if (entry.first != kind) {
            throw DecodeError("Type table entry '" + entry.second + "' has the wrong kind");
        }
        return entry.second;
    }

    TypeDescriptorPtr resolve_type(const std::string& name) const {
        const TypeRegistry& types = opts_.types ? *opts_.types : TypeRegistry::global();
        auto type = types.find_descriptor(name);
        if (!type) {
            detail::log_key_error("decode_delta", name, "is not a registered type");
            throw DecodeError("Unknown object type '" + name + "'");
        }
        return type;
    }

    template <typename Int>
    Int narrow_signed() {
        const int64_t v = r_.read_varint();
        if (v < std::numeric_limits<Int>::min() || v > std::numeric_limits<Int>::max()) {
            throw DecodeError("Integer out of range for its tag");
        }
        return static_cast<Int>(v);
    }

    template <typename UInt>
    UInt narrow_unsigned() {
        const uint64_t v = r_.read_varuint();
        if (v > std::numeric_limits<UInt>::max()) {
            throw DecodeError("Integer out of range for its tag");
        }
        return static_cast<UInt>(v);
    }

    DateTime read_time() {
        switch (r_.read_u8()) {
            case time_normal: {
                const int64_t us = r_.read_varint();
                if (us < min_time_offset() || us > max_time_offset()) {
                    throw DecodeError("Timestamp out of range: " + std::to_string(us) + " microseconds from epoch");
                }
                return unix_epoch() + boost::posix_time::microseconds(us);
            }
            case time_nadt:    return DateTime(boost::date_time::not_a_date_time);
            case time_pos_inf: return DateTime(boost::date_time::pos_infin);
            case time_neg_inf: return DateTime(boost::date_time::neg_infin);
            default: throw DecodeError("Unknown time marker");
        }
    }

    Duration read_duration() {
        switch (r_.read_u8()) {
            case time_normal: {
                const int64_t us = r_.read_varint();
                if (us > max_duration_micros() || us < -max_duration_micros()) {
                    throw DecodeError("Duration out of range: " + std::to_string(us) + " microseconds");
                }
                return boost::posix_time::microseconds(us);
            }
            case time_nadt:    return Duration(boost::date_time::not_a_date_time);
            case time_pos_inf: return Duration(boost::date_time::pos_infin);
            case time_neg_inf: return Duration(boost::date_time::neg_infin);
            default: throw DecodeError("Unknown duration marker");
        }
    }

    Value read_value(std::size_t depth) {
        check_depth(depth);
        const uint8_t tag = r_.read_u8();

        switch (static_cast<ValueTag>(tag)) {
            case ValueTag::Null:   return Value{};
            case ValueTag::False:  return Value{false};
            case ValueTag::True:   return Value{true};
            case ValueTag::Int8:   return Value{narrow_signed<int8_t>()};
            case ValueTag::Int16:  return Value{narrow_signed<int16_t>()};
            case ValueTag::Int32:  return Value{narrow_signed<int32_t>()};
            case ValueTag::Int64:  return Value{r_.read_varint()};
            case ValueTag::UInt8:  return Value{narrow_unsigned<uint8_t>()};
            case ValueTag::UInt16: return Value{narrow_unsigned<uint16_t>()};
            case ValueTag::UInt32: return Value{narrow_unsigned<uint32_t>()};
            case ValueTag::UInt64: return Value{r_.read_varuint()};
            case ValueTag::Float:  return Value{r_.read_f32()};
            case ValueTag::Double: return Value{r_.read_f64()};

            case ValueTag::Decimal: {
                const std::string text = r_.read_raw_string(opts_.safety.max_string_bytes);
                try {
                    return Value{struct_delta::Decimal(text)};
                } catch (const std::exception& e) {
                    throw DecodeError("Malformed decimal '" + text + "': " + e.what());
                }
            }

            case ValueTag::String:
                return Value{read_string()};

            case ValueTag::Guid: {
                struct_delta::Guid g;
                if (!r_.has_bytes(g.static_size())) throw DecodeError("Unexpected end of buffer");
                std::memcpy(g.data, r_.data + r_.pos, g.static_size());
                r_.pos += g.static_size();
                return Value{g};
            }

            case ValueTag::Bytes: {
                auto [start, len] = r_.read_run(opts_.safety.max_string_bytes);
                return Value{ByteBuffer(start, start + len)};
            }

            case ValueTag::Enum: {
                EnumValue e;
                const uint8_t has_identity = r_.read_u8();
                if (has_identity > 1) throw DecodeError("Malformed enum identity marker");
                if (has_identity) {
                    e.type_name = read_type(type_kind_enum);
                }
                e.value = r_.read_varint();
                return Value{std::move(e)};
            }

            case ValueTag::Timestamp: {
                struct_delta::Timestamp t;
                t.instant = read_time();
                const uint8_t kind = r_.read_u8();
                if (kind > static_cast<uint8_t>(TimeKind::Local)) throw DecodeError("Unknown time kind");
                t.kind = static_cast<TimeKind>(kind);
                return Value{t};
            }

            case ValueTag::OffsetTimestamp: {
                struct_delta::OffsetTimestamp t;
                t.local = read_time();
                t.offset = read_duration();
                return Value{t};
            }

            case ValueTag::Duration:
                return Value{read_duration()};

            case ValueTag::Object: {
                auto type = resolve_type(read_type(type_kind_object));
                auto obj = Object::make(type);
                const std::size_t n = r_.read_count("Object field");
                for (std::size_t i = 0; i < n; ++i) {
                    const int64_t index = r_.read_varint();
                    if (index < std::numeric_limits<int32_t>::min() || index > std::numeric_limits<int32_t>::max()) {
                        throw DecodeError("Member index out of range");
                    }
                    auto ordinal = type->ordinal_for_index(static_cast<int32_t>(index));
                    if (!ordinal) {
                        throw DecodeError("Type '" + type->name() + "' has no member index " + std::to_string(index));
                    }
                    obj->fields[*ordinal] = read_value(depth + 1);
                }
                return Value{std::move(obj)};
            }

            case ValueTag::Sequence: {
                const std::size_t n = r_.read_count("Sequence element");
                auto seq = Sequence::make();
                seq->items.reserve(n);
                for (std::size_t i = 0; i < n; ++i) {
                    seq->items.push_back(read_value(depth + 1));
                }
                return Value{std::move(seq)};
            }

            case ValueTag::FrozenSequence: {
                const std::size_t n = r_.read_count("Sequence element");
                auto t = immer::flex_vector<Value>{}.transient();
                for (std::size_t i = 0; i < n; ++i) {
                    t.push_back(read_value(depth + 1));
                }
                return Value{FrozenSequence::make(t.persistent())};
            }

            case ValueTag::Map: {
                const std::size_t n = r_.read_count("Map entry");
                auto map = Map::make();
                map->entries.reserve(n);
                for (std::size_t i = 0; i < n; ++i) {
                    Value k = read_value(depth + 1);
                    Value v = read_value(depth + 1);
                    map->entries.insert_or_assign(std::move(k), std::move(v));
                }
                return Value{std::move(map)};
            }

            case ValueTag::FrozenMap: {
                const std::size_t n = r_.read_count("Map entry");
                auto t = FrozenMapStorage{}.transient();
                for (std::size_t i = 0; i < n; ++i) {
                    Value k = read_value(depth + 1);
                    Value v = read_value(depth + 1);
                    t.set(std::move(k), std::move(v));
                }
                return Value{FrozenMap::make(t.persistent())};
            }

            case ValueTag::Array: {
                const std::size_t rank = r_.read_count("Array rank");
                std::vector<std::size_t> shape;
                shape.reserve(rank);
                std::size_t cells = rank == 0 ? 0 : 1;
                for (std::size_t i = 0; i < rank; ++i) {
                    const uint64_t extent = r_.read_varuint();
                    if (extent > r_.remaining() || (extent != 0 && cells > r_.remaining() / extent)) {
                        throw DecodeError("Array cell count exceeds remaining input");
                    }
                    cells *= static_cast<std::size_t>(extent);
                    shape.push_back(static_cast<std::size_t>(extent));
                }
                if (cells > r_.remaining()) {
                    throw DecodeError("Array cell count exceeds remaining input");
                }
                auto arr = MultiArray::make(std::move(shape));
                for (auto& cell : arr->cells) {
                    cell = read_value(depth + 1);
                }
                return Value{std::move(arr)};
            }
        }
        throw DecodeError("Unknown value tag " + std::to_string(tag));
    }

    DeltaDocument read_document(std::size_t depth) {
        check_depth(depth);
        const uint64_t count = r_.read_varuint();
        if (count > opts_.safety.max_ops || total_ops_ + count > opts_.safety.max_ops) {
            throw DecodeError("Operation count " + std::to_string(count) + " exceeds max_ops");
        }
        if (count > r_.remaining()) {
            throw DecodeError("Operation count " + std::to_string(count) + " exceeds remaining input");
        }
        total_ops_ += static_cast<std::size_t>(count);

        std::vector<DeltaOp> ops;
        ops.reserve(static_cast<std::size_t>(count));
        for (uint64_t i = 0; i < count; ++i) {
            DeltaOp op;
            const uint64_t kind = r_.read_varuint();
            if (!known_kind(kind)) {
                throw DecodeError("Unknown operation kind " + std::to_string(kind));
            }
            op.kind = static_cast<DeltaKind>(kind);

            const int64_t member = r_.read_varint();
            if (member < std::numeric_limits<int32_t>::min() || member > std::numeric_limits<int32_t>::max()) {
                throw DecodeError("Member index out of range");
            }
            op.member_index = static_cast<int32_t>(member);

            if (has_index(op.kind)) {
                const uint64_t index = r_.read_varuint();
                if (index > static_cast<uint64_t>(std::numeric_limits<int32_t>::max())) {
                    throw DecodeError("Sequence index out of range");
                }
                op.index = static_cast<int32_t>(index);
            }
            if (has_key(op.kind)) op.key = read_value(depth + 1);
            if (has_value(op.kind)) op.value = read_value(depth + 1);
            if (has_nested(op.kind)) {
                op.nested = std::make_shared<const DeltaDocument>(read_document(depth + 1));
            }
            ops.push_back(std::move(op));
        }
        return DeltaDocument(std::move(ops));
    }
};

} // anonymous namespace

void write_delta(const DeltaDocument& doc, ByteBuffer& sink, const BinaryDeltaOptions& options)
{
    ByteWriter w;
    DeltaEncoder encoder(options);
    encoder.encode(doc, w);
    sink.insert(sink.end(), w.buffer.begin(), w.buffer.end());
}

ByteBuffer encode_delta(const DeltaDocument& doc, const BinaryDeltaOptions& options)
{
    ByteWriter w;
    DeltaEncoder encoder(options);
    encoder.encode(doc, w);
    return std::move(w.buffer);
}

DeltaDocument decode_delta(std::span<const uint8_t> bytes, const BinaryDeltaOptions& options)
{
    return decode_delta(bytes.data(), bytes.size(), options);
}

DeltaDocument decode_delta(const uint8_t* data, std::size_t size, const BinaryDeltaOptions& options)
{
    if (!data && size != 0) {
        throw DecodeError("Null input buffer");
    }
    ByteReader r(data, size);
    DeltaDecoder decoder(r, options);
    return decoder.decode();
}

} // namespace struct_delta
