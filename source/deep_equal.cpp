// deep_equal.cpp - structural equality over object graphs

#include <struct_delta/deep_equal.h>
#include <struct_delta/type_registry.h>

#include <boost/algorithm/string/predicate.hpp>

#include <cmath>
#include <locale>

namespace struct_delta {

namespace {

bool deep_value(const Value& l, const Value& r, const ComparePolicy& policy, ComparisonContext& ctx);

Decimal integral_to_decimal(const Value& v)
{
    return std::visit([](const auto& arg) -> Decimal {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_integral_v<T> && !std::is_same_v<T, bool>) {
            if constexpr (std::is_signed_v<T>) {
                return Decimal(static_cast<long long>(arg));
            } else {
                return Decimal(static_cast<unsigned long long>(arg));
            }
        } else if constexpr (std::is_same_v<T, Decimal>) {
            return arg;
        } else {
            return Decimal(0);
        }
    }, v.data);
}

// Same alternative on both sides, not a reference type
bool scalar_equal(const Value& l, const Value& r, const ComparisonOptions& opts)
{
    return std::visit([&](const auto& lhs) -> bool {
        using T = std::decay_t<decltype(lhs)>;
        const auto& rhs = std::get<T>(r.data);
        if constexpr (std::is_same_v<T, std::string>) {
            return strings_equal(lhs, rhs, opts);
        } else if constexpr (std::is_same_v<T, float>) {
            return floats_equal(lhs, rhs, opts);
        } else if constexpr (std::is_same_v<T, double>) {
            return doubles_equal(lhs, rhs, opts);
        } else if constexpr (std::is_same_v<T, Decimal>) {
            return decimals_equal(lhs, rhs, opts);
        } else if constexpr (std::is_same_v<T, std::monostate>) {
            return true;
        } else if constexpr (detail::is_reference_alternative_v<T>) {
            return lhs.get() == rhs.get();
        } else {
            return lhs == rhs;
        }
    }, l.data);
}

bool sequences_equal(const SequenceView& l, const SequenceView& r,
                     const ComparePolicy& policy, ComparisonContext& ctx)
{
    if (l.size() != r.size()) {
        return false;
    }

    if (!policy.order_insensitive) {
        const auto elem = element_policy(policy);
        for (std::size_t i = 0; i < l.size(); ++i) {
            if (!equal_with_policy(l[i], r[i], elem, ctx)) {
                return false;
            }
        }
        return true;
    }

    const auto matched = match_unordered(l, r, policy, ctx);
    for (auto m : matched) {
        if (m == npos) return false;
    }
    return true;
}

bool maps_equal(const MapView& l, const MapView& r, const ComparePolicy& policy, ComparisonContext& ctx)
{
    if (l.size() != r.size()) {
        return false;
    }
    const auto elem = element_policy(policy);
    bool equal = true;
    l.for_each([&](const Value& key, const Value& lv) {
        if (!equal) return;
        const Value* rv = r.find(key);
        if (!rv || !equal_with_policy(lv, *rv, elem, ctx)) {
            equal = false;
        }
    });
    return equal;
}

bool arrays_equal(const MultiArray& l, const MultiArray& r, const ComparePolicy& policy, ComparisonContext& ctx)
{
    if (l.shape != r.shape) {
        return false;
    }
    auto elem = element_policy(policy);
    elem.order_insensitive = false;
    for (std::size_t i = 0; i < l.cells.size(); ++i) {
        if (!equal_with_policy(l.cells[i], r.cells[i], elem, ctx)) {
            return false;
        }
    }
    return true;
}

bool objects_equal(const ObjectPtr& l, const ObjectPtr& r, bool use_registry, ComparisonContext& ctx)
{
    if (l->type_name() != r->type_name()) {
        return false;
    }
    // Entered before the registry: a comparator may recurse back through compare_members
    CycleGuard guard(ctx, l.get(), r.get());
    if (!guard.entered()) {
        return true;
    }
    if (use_registry) {
        auto outcome = ctx.registry().try_compare_same_type(l->type_name(), Value{l}, Value{r}, ctx);
        if (outcome.handled) {
            return outcome.equal;
        }
    }
    return compare_members(*l, *r, ctx);
}

bool opaques_equal(const OpaquePtr& l, const OpaquePtr& r, ComparisonContext& ctx)
{
    if (l->type_name() != r->type_name()) {
        return false;
    }
    auto outcome = ctx.registry().try_compare_same_type(l->type_name(), Value{l}, Value{r}, ctx);
    if (outcome.handled) {
        return outcome.equal;
    }
    return l->equals(*r);
}

bool deep_value(const Value& l, const Value& r, const ComparePolicy& policy, ComparisonContext& ctx)
{
    const void* li = l.identity();
    const void* ri = r.identity();
    if (li && li == ri) {
        return true;
    }
    const bool ln = l.is_null();
    const bool rn = r.is_null();
    if (ln || rn) {
        return ln && rn;
    }

    // Mutable and frozen views of one shape compare by content
    if (auto ls = SequenceView::of(l)) {
        auto rs = SequenceView::of(r);
        if (!rs) return false;
        CycleGuard guard(ctx, li, ri);
        if (!guard.entered()) return true;
        return sequences_equal(*ls, *rs, policy, ctx);
    }
    if (auto lm = MapView::of(l)) {
        auto rm = MapView::of(r);
        if (!rm) return false;
        CycleGuard guard(ctx, li, ri);
        if (!guard.entered()) return true;
        return maps_equal(*lm, *rm, policy, ctx);
    }

    if (l.type_index() != r.type_index()) {
        return false;
    }

    if (auto* lo = l.get_if<ObjectPtr>()) {
        return objects_equal(*lo, *r.get_if<ObjectPtr>(), policy.polymorphic, ctx);
    }
    if (auto* la = l.get_if<ArrayPtr>()) {
        const auto& ra = *r.get_if<ArrayPtr>();
        if ((*la)->shape != ra->shape) return false;
        CycleGuard guard(ctx, li, ri);
        if (!guard.entered()) return true;
        return arrays_equal(**la, *ra, policy, ctx);
    }
    if (auto* lq = l.get_if<OpaquePtr>()) {
        return opaques_equal(*lq, *r.get_if<OpaquePtr>(), ctx);
    }
    return scalar_equal(l, r, ctx.options());
}

} // anonymous namespace

// ============================================================
// Policies
// ============================================================

ComparePolicy root_policy(const ComparisonOptions& options) noexcept
{
    ComparePolicy p;
    p.order_insensitive = options.order_insensitive_collections;
    p.polymorphic = true;
    return p;
}

ComparePolicy element_policy(const ComparePolicy& slot) noexcept
{
    ComparePolicy p;
    p.order_insensitive = slot.order_insensitive;
    p.polymorphic = slot.polymorphic;
    p.dynamic = slot.dynamic;
    return p;
}

ComparePolicy member_policy(const TypeDescriptor& owner,
                            std::size_t ordinal,
                            const Value& left,
                            const Value& right,
                            const ComparisonOptions& options)
{
    const auto& m = owner.member(ordinal);
    ComparePolicy p;

    if (m.kind) {
        p.kind = *m.kind;
    } else {
        // Type-level default of the member value's own type
        auto type_default = [](const Value& v) -> std::optional<MemberKind> {
            if (auto* o = v.get_if<ObjectPtr>(); o && *o) return (*o)->type->options().default_kind;
            return std::nullopt;
        };
        p.kind = type_default(left).value_or(type_default(right).value_or(MemberKind::Deep));
    }

    if (m.order_insensitive) {
        p.order_insensitive = *m.order_insensitive;
    } else if (owner.options().order_insensitive_collections) {
        p.order_insensitive = *owner.options().order_insensitive_collections;
    } else {
        p.order_insensitive = options.order_insensitive_collections;
    }

    p.key_members = m.key_members.empty() ? nullptr : &m.key_members;
    p.polymorphic = m.polymorphic;
    p.dynamic = m.dynamic;
    p.comparer = m.comparer ? &m.comparer : nullptr;
    return p;
}

// ============================================================
// Entry points
// ============================================================

bool deep_equal(const Value& left, const Value& right)
{
    ComparisonContext ctx;
    return deep_equal(left, right, ctx);
}

bool deep_equal(const Value& left, const Value& right, const ComparisonOptions& options)
{
    ComparisonContext ctx(options);
    return deep_equal(left, right, ctx);
}

bool deep_equal(const Value& left, const Value& right, ComparisonContext& ctx)
{
    return equal_with_policy(left, right, root_policy(ctx.options()), ctx);
}

bool equal_with_policy(const Value& left, const Value& right, const ComparePolicy& policy, ComparisonContext& ctx)
{
    if (policy.comparer && *policy.comparer) {
        return (*policy.comparer)(left, right, ctx);
    }

    switch (policy.kind) {
        case MemberKind::Skip:
            return true;
        case MemberKind::Reference:
            if (left.identity() || right.identity()) {
                return left.identity() == right.identity();
            }
            return native_equal(left, right);
        case MemberKind::Shallow:
            return native_equal(left, right);
        case MemberKind::Deep:
            break;
    }

    if (policy.dynamic) {
        return dynamic_equal(left, right, ctx);
    }
    return deep_value(left, right, policy, ctx);
}

bool compare_members(const Object& left, const Object& right, ComparisonContext& ctx)
{
    if (left.type != right.type && left.type->fingerprint() != right.type->fingerprint()) {
        return false;
    }
    const auto& type = *left.type;
    for (std::size_t i = 0; i < type.size(); ++i) {
        const auto policy = member_policy(type, i, left.fields[i], right.fields[i], ctx.options());
        if (policy.kind == MemberKind::Skip) {
            continue;
        }
        if (!equal_with_policy(left.fields[i], right.fields[i], policy, ctx)) {
            return false;
        }
    }
    return true;
}

bool dynamic_equal(const Value& left, const Value& right, ComparisonContext& ctx)
{
    const void* li = left.identity();
    const void* ri = right.identity();
    if (li && li == ri) {
        return true;
    }
    const bool ln = left.is_null();
    const bool rn = right.is_null();
    if (ln || rn) {
        return ln && rn;
    }

    const auto& opts = ctx.options();

    if (left.type_index() == right.type_index()) {
        if (auto* s = left.get_if<std::string>()) return strings_equal(*s, *right.get_if<std::string>(), opts);
        if (auto* f = left.get_if<float>()) return floats_equal(*f, *right.get_if<float>(), opts);
        if (auto* d = left.get_if<double>()) return doubles_equal(*d, *right.get_if<double>(), opts);
        if (auto* m = left.get_if<Decimal>()) return decimals_equal(*m, *right.get_if<Decimal>(), opts);
    }

    if (auto numeric = numeric_equal(left, right, opts)) {
        return *numeric;
    }

    if (auto ls = SequenceView::of(left)) {
        auto rs = SequenceView::of(right);
        if (!rs || ls->size() != rs->size()) return false;
        CycleGuard guard(ctx, li, ri);
        if (!guard.entered()) return true;
        for (std::size_t i = 0; i < ls->size(); ++i) {
            if (!dynamic_equal((*ls)[i], (*rs)[i], ctx)) return false;
        }
        return true;
    }

    if (auto lm = MapView::of(left)) {
        auto rm = MapView::of(right);
        if (!rm || lm->size() != rm->size()) return false;
        CycleGuard guard(ctx, li, ri);
        if (!guard.entered()) return true;
        bool equal = true;
        lm->for_each([&](const Value& key, const Value& lv) {
            if (!equal) return;
            const Value* rv = rm->find(key);
            if (!rv || !dynamic_equal(lv, *rv, ctx)) equal = false;
        });
        return equal;
    }

    if (left.type_index() != right.type_index()) {
        return false;
    }

    if (auto* lo = left.get_if<ObjectPtr>()) {
        return objects_equal(*lo, *right.get_if<ObjectPtr>(), true, ctx);
    }
    if (auto* la = left.get_if<ArrayPtr>()) {
        const auto& ra = *right.get_if<ArrayPtr>();
        if ((*la)->shape != ra->shape) return false;
        CycleGuard guard(ctx, li, ri);
        if (!guard.entered()) return true;
        for (std::size_t i = 0; i < (*la)->cells.size(); ++i) {
            if (!dynamic_equal((*la)->cells[i], ra->cells[i], ctx)) return false;
        }
        return true;
    }
    if (auto* lq = left.get_if<OpaquePtr>()) {
        return opaques_equal(*lq, *right.get_if<OpaquePtr>(), ctx);
    }
    return scalar_equal(left, right, opts);
}

bool native_equal(const Value& left, const Value& right)
{
    if (left.type_index() != right.type_index()) {
        return left.is_null() && right.is_null();
    }
    return std::visit([&](const auto& lhs) -> bool {
        using T = std::decay_t<decltype(lhs)>;
        const auto& rhs = std::get<T>(right.data);
        if constexpr (std::is_same_v<T, ObjectPtr>) {
            if (lhs == rhs) return true;
            if (!lhs || !rhs) return false;
            if (lhs->type_name() != rhs->type_name()) return false;
            const auto& fn = lhs->type->options().native_equals;
            return fn ? fn(*lhs, *rhs) : false;
        } else if constexpr (std::is_same_v<T, OpaquePtr>) {
            if (lhs == rhs) return true;
            if (!lhs || !rhs) return false;
            return lhs->type_name() == rhs->type_name() && lhs->equals(*rhs);
        } else {
            return left == right;
        }
    }, left.data);
}

// ============================================================
// Leaf comparisons
// ============================================================

bool strings_equal(std::string_view a, std::string_view b, const ComparisonOptions& options)
{
    switch (options.string_mode) {
        case StringMode::Ordinal:
            return a == b;
        case StringMode::OrdinalIgnoreCase:
            return boost::algorithm::iequals(a, b, std::locale::classic());
        case StringMode::Culture: {
            const auto& coll = std::use_facet<std::collate<char>>(options.culture);
            return coll.compare(a.data(), a.data() + a.size(), b.data(), b.data() + b.size()) == 0;
        }
        case StringMode::CultureIgnoreCase: {
            std::string fa(a);
            std::string fb(b);
            for (auto& c : fa) c = std::tolower(c, options.culture);
            for (auto& c : fb) c = std::tolower(c, options.culture);
            const auto& coll = std::use_facet<std::collate<char>>(options.culture);
            return coll.compare(fa.data(), fa.data() + fa.size(), fb.data(), fb.data() + fb.size()) == 0;
        }
    }
    return a == b;
}

bool floats_equal(float a, float b, const ComparisonOptions& options) noexcept
{
    if (std::isnan(a) || std::isnan(b)) {
        return options.treat_nan_equal && std::isnan(a) && std::isnan(b);
    }
    if (a == b) {
        return true;
    }
    if (options.float_epsilon <= 0.0f) {
        return false;
    }
    return std::fabs(a - b) <= options.float_epsilon;
}

bool doubles_equal(double a, double b, const ComparisonOptions& options) noexcept
{
    if (std::isnan(a) || std::isnan(b)) {
        return options.treat_nan_equal && std::isnan(a) && std::isnan(b);
    }
    if (a == b) {
        return true;
    }
    if (options.double_epsilon <= 0.0) {
        return false;
    }
    return std::fabs(a - b) <= options.double_epsilon;
}

bool decimals_equal(const Decimal& a, const Decimal& b, const ComparisonOptions& options)
{
    if (a == b) {
        return true;
    }
    if (options.decimal_epsilon <= 0) {
        return false;
    }
    return Decimal(boost::multiprecision::abs(a - b)) <= options.decimal_epsilon;
}

std::optional<bool> numeric_equal(const Value& a, const Value& b, const ComparisonOptions& options)
{
    if (!a.is_numeric() || !b.is_numeric()) {
        return std::nullopt;
    }
    if (a.is_floating() || b.is_floating() || a.is<Decimal>() || b.is<Decimal>()) {
        return doubles_equal(a.as_double(), b.as_double(), options);
    }
    return integral_to_decimal(a) == integral_to_decimal(b);
}

// ============================================================
// Matching helpers
// ============================================================

bool keys_equal(const Value& left, const Value& right,
                const std::vector<std::string>& key_members, ComparisonContext& ctx)
{
    const auto* lo = left.get_if<ObjectPtr>();
    const auto* ro = right.get_if<ObjectPtr>();
    const bool l_obj = lo && *lo;
    const bool r_obj = ro && *ro;
    if (!l_obj || !r_obj) {
        if (l_obj != r_obj) return false;
        // Non-object elements act as their own key
        return deep_equal(left, right, ctx);
    }

    const auto key_policy = root_policy(ctx.options());
    for (const auto& name : key_members) {
        auto l_ord = (*lo)->type->find_member(name);
        auto r_ord = (*ro)->type->find_member(name);
        const Value& lk = l_ord ? (*lo)->fields[*l_ord] : Value{};
        const Value& rk = r_ord ? (*ro)->fields[*r_ord] : Value{};
        if (!equal_with_policy(lk, rk, key_policy, ctx)) {
            return false;
        }
    }
    return true;
}

std::vector<std::size_t> match_unordered(const SequenceView& left,
                                         const SequenceView& right,
                                         const ComparePolicy& slot,
                                         ComparisonContext& ctx)
{
    const auto elem = element_policy(slot);
    std::vector<std::size_t> result(left.size(), npos);
    std::vector<bool> used(right.size(), false);

    if (!slot.keyed()) {
        for (std::size_t i = 0; i < left.size(); ++i) {
            for (std::size_t j = 0; j < right.size(); ++j) {
                if (used[j]) continue;
                if (equal_with_policy(left[i], right[j], elem, ctx)) {
                    used[j] = true;
                    result[i] = j;
                    break;
                }
            }
        }
        return result;
    }

    // Bucket the right side by key; buckets[b][0] is the representative
    std::vector<std::vector<std::size_t>> buckets;
    for (std::size_t j = 0; j < right.size(); ++j) {
        bool placed = false;
        for (auto& bucket : buckets) {
            if (keys_equal(right[bucket.front()], right[j], *slot.key_members, ctx)) {
                bucket.push_back(j);
                placed = true;
                break;
            }
        }
        if (!placed) {
            buckets.push_back({j});
        }
    }

    for (std::size_t i = 0; i < left.size(); ++i) {
        for (const auto& bucket : buckets) {
            if (!keys_equal(left[i], right[bucket.front()], *slot.key_members, ctx)) {
                continue;
            }
            for (auto j : bucket) {
                if (used[j]) continue;
                if (equal_with_policy(left[i], right[j], elem, ctx)) {
                    used[j] = true;
                    result[i] = j;
                    break;
                }
            }
            break;
        }
    }
    return result;
}

} // namespace struct_delta
