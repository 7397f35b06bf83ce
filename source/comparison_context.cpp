// comparison_context.cpp - cycle tracking for deep comparison

#include <struct_delta/comparison_context.h>
#include <struct_delta/type_registry.h>

namespace struct_delta {

ComparisonContext::ComparisonContext()
    : options_(std::make_shared<const ComparisonOptions>())
{
}

ComparisonContext::ComparisonContext(ComparisonOptions options, TypeRegistry* registry)
    : options_(std::make_shared<const ComparisonOptions>(std::move(options)))
    , registry_(registry)
{
}

ComparisonContext::ComparisonContext(std::shared_ptr<const ComparisonOptions> options, TypeRegistry* registry)
    : options_(options ? std::move(options) : std::make_shared<const ComparisonOptions>())
    , registry_(registry)
{
}

ComparisonContext ComparisonContext::no_tracking(ComparisonOptions options)
{
    ComparisonContext ctx(std::move(options));
    ctx.tracking_ = false;
    return ctx;
}

TypeRegistry& ComparisonContext::registry() const noexcept
{
    return registry_ ? *registry_ : TypeRegistry::global();
}

bool ComparisonContext::enter(const void* left, const void* right)
{
    if (!tracking_) {
        return true;
    }
    RefPair pair{left, right};
    if (!visited_.insert(pair).second) {
        return false;
    }
    stack_.push_back(pair);
    return true;
}

void ComparisonContext::exit(const void* left, const void* right)
{
    if (!tracking_ || stack_.empty()) {
        return;
    }
    RefPair pair{left, right};
    if (stack_.back() != pair) {
        detail::log_access_error("ComparisonContext::exit", "exit does not match the innermost enter");
    }
    visited_.erase(stack_.back());
    stack_.pop_back();
}

} // namespace struct_delta
