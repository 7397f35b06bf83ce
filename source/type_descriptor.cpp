// type_descriptor.cpp - member tables, index modes and schema fingerprints

#include <struct_delta/type_descriptor.h>
#include <struct_delta/value.h>

#include <stdexcept>
#include <unordered_set>

namespace struct_delta {

namespace {

constexpr uint32_t fnv32_offset = 2166136261u;
constexpr uint32_t fnv32_prime  = 16777619u;
constexpr uint64_t fnv64_offset = 14695981039346656037ull;
constexpr uint64_t fnv64_prime  = 1099511628211ull;

uint64_t fnv64_append(uint64_t h, std::string_view bytes) noexcept
{
    for (unsigned char c : bytes) {
        h ^= c;
        h *= fnv64_prime;
    }
    return h;
}

uint64_t fnv64_append_byte(uint64_t h, uint8_t b) noexcept
{
    h ^= b;
    h *= fnv64_prime;
    return h;
}

} // anonymous namespace

int32_t stable_member_index(std::string_view name) noexcept
{
    uint32_t h = fnv32_offset;
    for (unsigned char c : name) {
        h ^= c;
        h *= fnv32_prime;
    }
    return static_cast<int32_t>(h & 0x7FFFFFFFu);
}

IndexMode resolve_index_mode(IndexMode mode, bool delta_enabled) noexcept
{
    if (mode != IndexMode::Auto) {
        return mode;
    }
    return delta_enabled ? IndexMode::Stable : IndexMode::Ordinal;
}

uint64_t schema_fingerprint(const std::vector<TypeDescriptorPtr>& types) noexcept
{
    uint64_t h = fnv64_offset;
    for (const auto& t : types) {
        if (!t) continue;
        const uint64_t f = t->fingerprint();
        for (int shift = 0; shift < 64; shift += 8) {
            h = fnv64_append_byte(h, static_cast<uint8_t>(f >> shift));
        }
    }
    return h;
}

TypeDescriptor::TypeDescriptor(std::string name, std::vector<MemberDescriptor> members, TypeOptions options)
    : name_(std::move(name))
    , members_(std::move(members))
    , options_(std::move(options))
    , effective_mode_(resolve_index_mode(options_.index_mode, options_.delta_enabled))
{
    if (name_.empty()) {
        throw std::invalid_argument("TypeDescriptor: type name must not be empty");
    }

    std::unordered_set<std::string_view> seen;
    indices_.reserve(members_.size());
    for (std::size_t i = 0; i < members_.size(); ++i) {
        const auto& m = members_[i];
        if (m.name.empty()) {
            throw std::invalid_argument("TypeDescriptor " + name_ + ": member " + std::to_string(i) +
                                        " has an empty name");
        }
        if (!seen.insert(m.name).second) {
            throw std::invalid_argument("TypeDescriptor " + name_ + ": duplicate member '" + m.name + "'");
        }

        const int32_t index = effective_mode_ == IndexMode::Stable
                                  ? stable_member_index(m.name)
                                  : static_cast<int32_t>(i);
        auto [it, inserted] = ordinal_by_index_.emplace(index, i);
        if (!inserted) {
            throw std::invalid_argument("TypeDescriptor " + name_ + ": members '" + members_[it->second].name +
                                        "' and '" + m.name + "' share stable index " + std::to_string(index));
        }
        indices_.push_back(index);
    }

    uint64_t h = fnv64_append(fnv64_offset, name_);
    for (const auto& m : members_) {
        h = fnv64_append_byte(h, 0);
        h = fnv64_append(h, m.name);
        h = fnv64_append_byte(h, static_cast<uint8_t>(m.kind.value_or(MemberKind::Deep)));
    }
    fingerprint_ = h;
}

std::optional<std::size_t> TypeDescriptor::find_member(std::string_view name) const
{
    for (std::size_t i = 0; i < members_.size(); ++i) {
        if (members_[i].name == name) return i;
    }
    return std::nullopt;
}

std::optional<std::size_t> TypeDescriptor::ordinal_for_index(int32_t index) const
{
    if (auto it = ordinal_by_index_.find(index); it != ordinal_by_index_.end()) {
        return it->second;
    }
    return std::nullopt;
}

} // namespace struct_delta
