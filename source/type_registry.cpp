// type_registry.cpp - thread-safe comparator registry with negative cache
//
// Locking follows the reader-writer pattern: lookups take a shared lock,
// registration and negative-cache inserts take an exclusive lock, statistics
// are relaxed atomics. Comparators are copied out and run unlocked so they
// may recurse into the engine (and into the registry) freely.

#include <struct_delta/type_registry.h>

#include <mutex>

namespace struct_delta {

TypeRegistry& TypeRegistry::global()
{
    static TypeRegistry instance;
    return instance;
}

void TypeRegistry::register_comparer(std::string type_name, SameTypeComparer comparer)
{
    std::unique_lock<std::shared_mutex> lock(rw_mutex_);
    negative_.erase(type_name);
    if (comparers_.count(type_name)) {
        detail::log_key_error("TypeRegistry::register_comparer", type_name, "already registered, replacing");
    }
    comparers_.insert_or_assign(std::move(type_name), std::move(comparer));
}

bool TypeRegistry::has_comparer(std::string_view type_name) const
{
    std::shared_lock<std::shared_mutex> lock(rw_mutex_);
    return comparers_.count(std::string(type_name)) > 0;
}

CompareOutcome TypeRegistry::try_compare_same_type(std::string_view type_name,
                                                   const Value& left,
                                                   const Value& right,
                                                   ComparisonContext& ctx)
{
    const std::string key(type_name);
    SameTypeComparer comparer;
    {
        std::shared_lock<std::shared_mutex> lock(rw_mutex_);
        if (negative_.count(key)) {
            misses_.fetch_add(1, std::memory_order_relaxed);
            return {};
        }
        if (auto it = comparers_.find(key); it != comparers_.end()) {
            comparer = it->second;
        }
    }

    if (!comparer) {
        std::unique_lock<std::shared_mutex> lock(rw_mutex_);
        // A registration may have raced in between the two locks
        if (auto it = comparers_.find(key); it != comparers_.end()) {
            comparer = it->second;
        } else {
            negative_.insert(key);
            misses_.fetch_add(1, std::memory_order_relaxed);
            return {};
        }
    }

    hits_.fetch_add(1, std::memory_order_relaxed);
    return CompareOutcome{true, comparer(left, right, ctx)};
}

void TypeRegistry::register_descriptor(TypeDescriptorPtr type)
{
    if (!type) {
        return;
    }
    std::unique_lock<std::shared_mutex> lock(rw_mutex_);
    descriptors_.insert_or_assign(type->name(), std::move(type));
}

TypeDescriptorPtr TypeRegistry::find_descriptor(std::string_view name) const
{
    std::shared_lock<std::shared_mutex> lock(rw_mutex_);
    if (auto it = descriptors_.find(std::string(name)); it != descriptors_.end()) {
        return it->second;
    }
    return nullptr;
}

bool TypeRegistry::is_negative_cached(std::string_view type_name) const
{
    std::shared_lock<std::shared_mutex> lock(rw_mutex_);
    return negative_.count(std::string(type_name)) > 0;
}

std::size_t TypeRegistry::comparer_count() const
{
    std::shared_lock<std::shared_mutex> lock(rw_mutex_);
    return comparers_.size();
}

} // namespace struct_delta
