// value.cpp - Value model utilities: key hashing, node helpers, cloning, printing

#include <struct_delta/value.h>
#include <struct_delta/type_descriptor.h>

#include <immer/flex_vector_transient.hpp>
#include <immer/map_transient.hpp>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/uuid/uuid_hash.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <array>
#include <cstdio>
#include <functional>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

namespace struct_delta {

namespace {

constexpr std::array<std::string_view, std::variant_size_v<Value::variant_type>> kind_names = {
    "null",      "bool",     "int8",    "int16",         "int32",     "int64",
    "uint8",     "uint16",   "uint32",  "uint64",        "float",     "double",
    "decimal",   "string",   "guid",    "bytes",         "enum",      "timestamp",
    "offset-timestamp",      "duration", "object",       "sequence",  "frozen-sequence",
    "map",       "frozen-map",          "array",         "opaque",
};

std::size_t hash_combine(std::size_t seed, std::size_t h) noexcept
{
    return seed ^ (h + 0x9e3779b97f4a7c15ull + (seed << 6) + (seed >> 2));
}

std::size_t hash_ptime(const DateTime& t) noexcept
{
    if (t.is_special()) {
        return std::hash<int>{}(t.is_not_a_date_time() ? 1 : (t.is_pos_infinity() ? 2 : 3));
    }
    static const DateTime epoch(boost::gregorian::date(1970, 1, 1));
    return std::hash<int64_t>{}((t - epoch).ticks());
}

std::string format_ptime(const DateTime& t)
{
    return boost::posix_time::to_iso_extended_string(t);
}

std::string format_kind(TimeKind k)
{
    switch (k) {
        case TimeKind::Utc:   return "Z";
        case TimeKind::Local: return " local";
        default:              return "";
    }
}

std::string format_shape(const MultiArray& arr)
{
    std::string s;
    for (std::size_t i = 0; i < arr.shape.size(); ++i) {
        if (i > 0) s += "x";
        s += std::to_string(arr.shape[i]);
    }
    return s;
}

// Deep copy with a memo of already-copied nodes, so that shared nodes stay
// shared and cycles close onto the copy.
class GraphCloner {
public:
    Value clone(const Value& val)
    {
        return std::visit([&](const auto& arg) -> Value {
            using T = std::decay_t<decltype(arg)>;

            if constexpr (!detail::is_reference_alternative_v<T>) {
                return val;
            } else {
                if (!arg) return val;
                if (auto it = done_.find(arg.get()); it != done_.end()) {
                    return it->second;
                }

                if constexpr (std::is_same_v<T, ObjectPtr>) {
                    auto copy = Object::make(arg->type);
                    done_.emplace(arg.get(), Value{copy});
                    for (std::size_t i = 0; i < arg->fields.size(); ++i) {
                        copy->fields[i] = clone(arg->fields[i]);
                    }
                    return Value{copy};
                } else if constexpr (std::is_same_v<T, SequencePtr>) {
                    auto copy = Sequence::make();
                    done_.emplace(arg.get(), Value{copy});
                    copy->items.reserve(arg->items.size());
                    for (const auto& item : arg->items) {
                        copy->items.push_back(clone(item));
                    }
                    return Value{copy};
                } else if constexpr (std::is_same_v<T, FrozenSequencePtr>) {
                    // Registered before the items are copied so a cycle through
                    // the list closes onto this copy; filled once, then read-only
                    auto copy = std::make_shared<FrozenSequence>();
                    done_.emplace(arg.get(), Value{FrozenSequencePtr{copy}});
                    auto t = immer::flex_vector<Value>{}.transient();
                    for (const auto& item : arg->items) {
                        t.push_back(clone(item));
                    }
                    copy->items = t.persistent();
                    return Value{FrozenSequencePtr{copy}};
                } else if constexpr (std::is_same_v<T, MapPtr>) {
                    auto copy = Map::make();
                    done_.emplace(arg.get(), Value{copy});
                    copy->entries.reserve(arg->entries.size());
                    for (const auto& kv : arg->entries) {
                        copy->entries.insert_or_assign(clone(kv.first), clone(kv.second));
                    }
                    return Value{copy};
                } else if constexpr (std::is_same_v<T, FrozenMapPtr>) {
                    auto copy = std::make_shared<FrozenMap>();
                    done_.emplace(arg.get(), Value{FrozenMapPtr{copy}});
                    auto t = FrozenMapStorage{}.transient();
                    for (const auto& kv : arg->entries) {
                        t.set(clone(kv.first), clone(kv.second));
                    }
                    copy->entries = t.persistent();
                    return Value{FrozenMapPtr{copy}};
                } else if constexpr (std::is_same_v<T, ArrayPtr>) {
                    auto copy = MultiArray::make(arg->shape);
                    done_.emplace(arg.get(), Value{copy});
                    for (std::size_t i = 0; i < arg->cells.size(); ++i) {
                        copy->cells[i] = clone(arg->cells[i]);
                    }
                    return Value{copy};
                } else {
                    // Opaque values are immutable; share them
                    return val;
                }
            }
        }, val.data);
    }

private:
    std::unordered_map<const void*, Value> done_;
};

void print_node(const Value& val, const std::string& prefix, std::size_t depth,
                std::unordered_set<const void*>& on_path)
{
    const std::string indent(depth * 2, ' ');
    const void* id = val.identity();
    if (id && on_path.count(id)) {
        std::cout << indent << prefix << "<cycle " << val.kind_name() << ">\n";
        return;
    }

    std::visit(
        [&](const auto& arg) {
            using T = std::decay_t<decltype(arg)>;

            if constexpr (std::is_same_v<T, ObjectPtr>) {
                if (!arg) {
                    std::cout << indent << prefix << "null\n";
                    return;
                }
                on_path.insert(id);
                std::cout << indent << prefix << arg->type_name() << " {\n";
                const auto& members = arg->type->members();
                for (std::size_t i = 0; i < arg->fields.size(); ++i) {
                    print_node(arg->fields[i], members[i].name + ": ", depth + 1, on_path);
                }
                std::cout << indent << "}\n";
                on_path.erase(id);
            } else if constexpr (std::is_same_v<T, SequencePtr> || std::is_same_v<T, FrozenSequencePtr>) {
                if (!arg) {
                    std::cout << indent << prefix << "null\n";
                    return;
                }
                on_path.insert(id);
                std::cout << indent << prefix << "[\n";
                std::size_t i = 0;
                for (const auto& item : arg->items) {
                    print_node(item, "[" + std::to_string(i++) + "] ", depth + 1, on_path);
                }
                std::cout << indent << "]\n";
                on_path.erase(id);
            } else if constexpr (std::is_same_v<T, MapPtr> || std::is_same_v<T, FrozenMapPtr>) {
                if (!arg) {
                    std::cout << indent << prefix << "null\n";
                    return;
                }
                on_path.insert(id);
                std::cout << indent << prefix << "{\n";
                for (const auto& kv : arg->entries) {
                    print_node(kv.second, value_to_string(kv.first) + ": ", depth + 1, on_path);
                }
                std::cout << indent << "}\n";
                on_path.erase(id);
            } else if constexpr (std::is_same_v<T, ArrayPtr>) {
                if (!arg) {
                    std::cout << indent << prefix << "null\n";
                    return;
                }
                on_path.insert(id);
                std::cout << indent << prefix << "array<" << format_shape(*arg) << "> (\n";
                for (std::size_t i = 0; i < arg->cells.size(); ++i) {
                    print_node(arg->cells[i], "(" + std::to_string(i) + ") ", depth + 1, on_path);
                }
                std::cout << indent << ")\n";
                on_path.erase(id);
            } else {
                std::cout << indent << prefix << value_to_string(val) << "\n";
            }
        },
        val.data);
}

} // anonymous namespace

// ============================================================
// Opaque
// ============================================================

std::string Opaque::to_string() const
{
    return "<" + std::string(type_name()) + ">";
}

// ============================================================
// Map key hashing and exact equality
// ============================================================

std::size_t ValueKeyHash::operator()(const Value& v) const
{
    const std::size_t seed = v.data.index();
    return hash_combine(seed, std::visit([](const auto& arg) -> std::size_t {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            return 0;
        } else if constexpr (detail::is_reference_alternative_v<T>) {
            return std::hash<const void*>{}(arg.get());
        } else if constexpr (std::is_same_v<T, Decimal>) {
            return std::hash<std::string>{}(arg.str());
        } else if constexpr (std::is_same_v<T, Guid>) {
            return boost::uuids::hash_value(arg);
        } else if constexpr (std::is_same_v<T, ByteBuffer>) {
            std::size_t h = arg.size();
            for (auto b : arg) h = hash_combine(h, b);
            return h;
        } else if constexpr (std::is_same_v<T, EnumValue>) {
            // Type name left out: an empty name matches any name
            return std::hash<int64_t>{}(arg.value);
        } else if constexpr (std::is_same_v<T, Timestamp>) {
            return hash_combine(hash_ptime(arg.instant), static_cast<std::size_t>(arg.kind));
        } else if constexpr (std::is_same_v<T, OffsetTimestamp>) {
            return hash_combine(hash_ptime(arg.utc()), std::hash<int64_t>{}(arg.offset.ticks()));
        } else if constexpr (std::is_same_v<T, Duration>) {
            return std::hash<int64_t>{}(arg.ticks());
        } else {
            return std::hash<T>{}(arg);
        }
    }, v.data));
}

bool ValueKeyEqual::operator()(const Value& a, const Value& b) const noexcept
{
    return a == b;
}

bool operator==(const Value& a, const Value& b)
{
    if (a.data.index() != b.data.index()) {
        return false;
    }
    return std::visit([&](const auto& lhs) -> bool {
        using T = std::decay_t<decltype(lhs)>;
        const auto& rhs = std::get<T>(b.data);
        if constexpr (std::is_same_v<T, std::monostate>) {
            return true;
        } else if constexpr (detail::is_reference_alternative_v<T>) {
            return lhs.get() == rhs.get();
        } else {
            return lhs == rhs;
        }
    }, a.data);
}

// ============================================================
// Value
// ============================================================

bool Value::is_null() const noexcept
{
    return std::visit([](const auto& arg) -> bool {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return true;
        } else if constexpr (detail::is_reference_alternative_v<T>) {
            return arg == nullptr;
        } else {
            return false;
        }
    }, data);
}

bool Value::is_numeric() const noexcept
{
    return std::visit([](const auto& arg) -> bool {
        using T = std::decay_t<decltype(arg)>;
        return (std::is_arithmetic_v<T> && !std::is_same_v<T, bool>) || std::is_same_v<T, Decimal>;
    }, data);
}

bool Value::is_floating() const noexcept
{
    return is<float>() || is<double>();
}

bool Value::is_sequence() const noexcept
{
    if (auto* p = get_if<SequencePtr>()) return *p != nullptr;
    if (auto* p = get_if<FrozenSequencePtr>()) return *p != nullptr;
    return false;
}

bool Value::is_map() const noexcept
{
    if (auto* p = get_if<MapPtr>()) return *p != nullptr;
    if (auto* p = get_if<FrozenMapPtr>()) return *p != nullptr;
    return false;
}

const void* Value::identity() const noexcept
{
    return std::visit([](const auto& arg) -> const void* {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (detail::is_reference_alternative_v<T>) {
            return static_cast<const void*>(arg.get());
        } else {
            return nullptr;
        }
    }, data);
}

int64_t Value::as_int64(int64_t default_val) const
{
    return std::visit([&](const auto& arg) -> int64_t {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_integral_v<T> && !std::is_same_v<T, bool>) {
            return static_cast<int64_t>(arg);
        } else if constexpr (std::is_same_v<T, EnumValue>) {
            return arg.value;
        } else {
            return default_val;
        }
    }, data);
}

double Value::as_double(double default_val) const
{
    return std::visit([&](const auto& arg) -> double {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_arithmetic_v<T> && !std::is_same_v<T, bool>) {
            return static_cast<double>(arg);
        } else if constexpr (std::is_same_v<T, Decimal>) {
            return arg.template convert_to<double>();
        } else {
            return default_val;
        }
    }, data);
}

std::string_view Value::kind_name() const noexcept
{
    return kind_names[data.index()];
}

// ============================================================
// Object
// ============================================================

Object::Object(TypeDescriptorPtr t)
    : type(std::move(t))
{
    if (!type) {
        throw std::invalid_argument("Object: type descriptor is null");
    }
    fields.resize(type->size());
}

ObjectPtr Object::make(TypeDescriptorPtr t)
{
    return std::make_shared<Object>(std::move(t));
}

const std::string& Object::type_name() const
{
    return type->name();
}

Value* Object::find(std::string_view member)
{
    if (auto ordinal = type->find_member(member)) {
        return &fields[*ordinal];
    }
    detail::log_key_error("Object::find", member, "is not a member of " + type->name());
    return nullptr;
}

const Value* Object::find(std::string_view member) const
{
    if (auto ordinal = type->find_member(member)) {
        return &fields[*ordinal];
    }
    detail::log_key_error("Object::find", member, "is not a member of " + type->name());
    return nullptr;
}

Value Object::get(std::string_view member) const
{
    if (const auto* slot = find(member)) {
        return *slot;
    }
    return Value{};
}

void Object::set(std::string_view member, Value v)
{
    auto* slot = find(member);
    if (!slot) {
        throw std::out_of_range("Object::set: type '" + type->name() + "' has no member '" +
                                std::string(member) + "'");
    }
    *slot = std::move(v);
}

// ============================================================
// MultiArray
// ============================================================

ArrayPtr MultiArray::make(std::vector<std::size_t> shape)
{
    auto arr = std::make_shared<MultiArray>();
    std::size_t total = 1;
    for (auto extent : shape) total *= extent;
    arr->shape = std::move(shape);
    arr->cells.resize(arr->shape.empty() ? 0 : total);
    return arr;
}

ArrayPtr MultiArray::make_1d(std::vector<Value> cells)
{
    auto arr = std::make_shared<MultiArray>();
    arr->shape = {cells.size()};
    arr->cells = std::move(cells);
    return arr;
}

std::size_t MultiArray::offset(const std::vector<std::size_t>& index) const
{
    if (index.size() != shape.size()) {
        throw std::out_of_range("MultiArray: index rank " + std::to_string(index.size()) +
                                " does not match array rank " + std::to_string(shape.size()));
    }
    std::size_t off = 0;
    for (std::size_t d = 0; d < shape.size(); ++d) {
        if (index[d] >= shape[d]) {
            detail::log_index_error("MultiArray::offset", index[d], "out of range");
            throw std::out_of_range("MultiArray: index out of range in dimension " + std::to_string(d));
        }
        off = off * shape[d] + index[d];
    }
    return off;
}

// ============================================================
// Views
// ============================================================

std::optional<SequenceView> SequenceView::of(const Value& v)
{
    SequenceView view;
    if (auto* p = v.get_if<SequencePtr>(); p && *p) {
        view.vec_ = &(*p)->items;
        return view;
    }
    if (auto* p = v.get_if<FrozenSequencePtr>(); p && *p) {
        view.flex_ = &(*p)->items;
        return view;
    }
    return std::nullopt;
}

std::optional<MapView> MapView::of(const Value& v)
{
    MapView view;
    if (auto* p = v.get_if<MapPtr>(); p && *p) {
        view.map_ = &(*p)->entries;
        return view;
    }
    if (auto* p = v.get_if<FrozenMapPtr>(); p && *p) {
        view.frozen_ = &(*p)->entries;
        return view;
    }
    return std::nullopt;
}

const Value* MapView::find(const Value& key) const
{
    if (map_) {
        auto it = map_->find(key);
        return it == map_->end() ? nullptr : &it->second;
    }
    return frozen_->find(key);
}

// ============================================================
// Utility functions
// ============================================================

Value clone_value(const Value& val)
{
    GraphCloner cloner;
    return cloner.clone(val);
}

std::string value_to_string(const Value& val)
{
    return std::visit([](const auto& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return "\"" + arg + "\"";
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int8_t>) {
            return std::to_string(static_cast<int>(arg)) + "i8";
        } else if constexpr (std::is_same_v<T, int16_t>) {
            return std::to_string(arg) + "i16";
        } else if constexpr (std::is_same_v<T, int32_t>) {
            return std::to_string(arg);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(arg) + "L";
        } else if constexpr (std::is_same_v<T, uint8_t>) {
            return std::to_string(static_cast<unsigned>(arg)) + "u8";
        } else if constexpr (std::is_same_v<T, uint16_t>) {
            return std::to_string(arg) + "u16";
        } else if constexpr (std::is_same_v<T, uint32_t>) {
            return std::to_string(arg) + "u";
        } else if constexpr (std::is_same_v<T, uint64_t>) {
            return std::to_string(arg) + "uL";
        } else if constexpr (std::is_same_v<T, float>) {
            return std::to_string(arg) + "f";
        } else if constexpr (std::is_same_v<T, double>) {
            return std::to_string(arg);
        } else if constexpr (std::is_same_v<T, Decimal>) {
            return arg.str() + "m";
        } else if constexpr (std::is_same_v<T, Guid>) {
            return "{" + boost::uuids::to_string(arg) + "}";
        } else if constexpr (std::is_same_v<T, ByteBuffer>) {
            return "bytes(" + std::to_string(arg.size()) + ")";
        } else if constexpr (std::is_same_v<T, EnumValue>) {
            return (arg.type_name.empty() ? std::string("enum") : arg.type_name) +
                   "(" + std::to_string(arg.value) + ")";
        } else if constexpr (std::is_same_v<T, Timestamp>) {
            return format_ptime(arg.instant) + format_kind(arg.kind);
        } else if constexpr (std::is_same_v<T, OffsetTimestamp>) {
            const bool negative = arg.offset.is_negative();
            auto abs_offset = negative ? arg.offset.invert_sign() : arg.offset;
            char buf[8];
            std::snprintf(buf, sizeof(buf), "%c%02d:%02d", negative ? '-' : '+',
                          static_cast<int>(abs_offset.hours()), static_cast<int>(abs_offset.minutes()));
            return format_ptime(arg.local) + buf;
        } else if constexpr (std::is_same_v<T, Duration>) {
            return boost::posix_time::to_simple_string(arg);
        } else if constexpr (std::is_same_v<T, ObjectPtr>) {
            return arg ? "{object:" + arg->type_name() + "}" : "null";
        } else if constexpr (std::is_same_v<T, SequencePtr>) {
            return arg ? "[sequence:" + std::to_string(arg->items.size()) + "]" : "null";
        } else if constexpr (std::is_same_v<T, FrozenSequencePtr>) {
            return arg ? "[frozen:" + std::to_string(arg->items.size()) + "]" : "null";
        } else if constexpr (std::is_same_v<T, MapPtr>) {
            return arg ? "{map:" + std::to_string(arg->entries.size()) + "}" : "null";
        } else if constexpr (std::is_same_v<T, FrozenMapPtr>) {
            return arg ? "{frozen-map:" + std::to_string(arg->entries.size()) + "}" : "null";
        } else if constexpr (std::is_same_v<T, ArrayPtr>) {
            return arg ? "[array:" + format_shape(*arg) + "]" : "null";
        } else if constexpr (std::is_same_v<T, OpaquePtr>) {
            return arg ? arg->to_string() : "null";
        } else {
            return "null";
        }
    }, val.data);
}

void print_value(const Value& val, const std::string& prefix, std::size_t depth)
{
    std::unordered_set<const void*> on_path;
    print_node(val, prefix, depth, on_path);
}

std::string path_to_string(const Path& path)
{
    std::string result;
    for (const auto& elem : path) {
        std::visit([&](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>) {
                result += "." + v;
            } else {
                result += "[" + std::to_string(v) + "]";
            }
        }, elem);
    }
    return result.empty() ? "/" : result;
}

} // namespace struct_delta
