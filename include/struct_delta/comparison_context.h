// comparison_context.h - per-call state of a deep comparison

#pragma once

#include <struct_delta/api.h>
#include <struct_delta/comparison_options.h>

#include <cstddef>
#include <functional>
#include <memory>
#include <unordered_set>
#include <utility>
#include <vector>

namespace struct_delta {

class TypeRegistry;

/// State of one top-level comparison, diff or delta computation.
///
/// Holds the options (shared, immutable), the registry to consult and the
/// cycle tracker. A pair of nodes is in the visited set exactly while it is
/// on the recursion stack, so sibling subtrees never see each other's pairs.
///
/// Not safe for concurrent use; give each thread its own context.
class STRUCT_DELTA_API ComparisonContext {
public:
    ComparisonContext();
    explicit ComparisonContext(ComparisonOptions options, TypeRegistry* registry = nullptr);
    ComparisonContext(std::shared_ptr<const ComparisonOptions> options, TypeRegistry* registry = nullptr);

    /// Context without cycle tracking, for graphs known to be acyclic
    [[nodiscard]] static ComparisonContext no_tracking(ComparisonOptions options = {});

    ComparisonContext(const ComparisonContext&) = delete;
    ComparisonContext& operator=(const ComparisonContext&) = delete;
    ComparisonContext(ComparisonContext&&) noexcept = default;
    ComparisonContext& operator=(ComparisonContext&&) noexcept = default;

    [[nodiscard]] const ComparisonOptions& options() const noexcept { return *options_; }
    [[nodiscard]] const std::shared_ptr<const ComparisonOptions>& shared_options() const noexcept { return options_; }

    /// Registry given at construction, or TypeRegistry::global()
    [[nodiscard]] TypeRegistry& registry() const noexcept;

    [[nodiscard]] bool tracking() const noexcept { return tracking_; }

    /// Push (left, right). False if the pair is already on the stack,
    /// in which case nothing is pushed.
    [[nodiscard]] bool enter(const void* left, const void* right);

    /// Pop the pair pushed by the matching enter()
    void exit(const void* left, const void* right);

    [[nodiscard]] std::size_t depth() const noexcept { return stack_.size(); }

private:
    using RefPair = std::pair<const void*, const void*>;

    struct RefPairHash {
        std::size_t operator()(const RefPair& p) const noexcept {
            auto h1 = std::hash<const void*>{}(p.first);
            auto h2 = std::hash<const void*>{}(p.second);
            return h1 ^ (h2 + 0x9e3779b97f4a7c15ull + (h1 << 6) + (h1 >> 2));
        }
    };

    std::shared_ptr<const ComparisonOptions> options_;
    TypeRegistry* registry_ = nullptr;
    bool tracking_ = true;
    std::vector<RefPair> stack_;
    std::unordered_set<RefPair, RefPairHash> visited_;
};

/// RAII enter/exit around one recursion step.
/// entered() is false when the pair closes a cycle; exit only runs after a
/// successful enter.
class CycleGuard {
public:
    CycleGuard(ComparisonContext& ctx, const void* left, const void* right)
        : ctx_(ctx), left_(left), right_(right)
    {
        entered_ = ctx_.enter(left_, right_);
    }

    ~CycleGuard() {
        if (entered_) ctx_.exit(left_, right_);
    }

    CycleGuard(const CycleGuard&) = delete;
    CycleGuard& operator=(const CycleGuard&) = delete;

    [[nodiscard]] bool entered() const noexcept { return entered_; }

private:
    ComparisonContext& ctx_;
    const void* left_;
    const void* right_;
    bool entered_ = false;
};

} // namespace struct_delta
