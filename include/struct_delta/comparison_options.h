// comparison_options.h - tolerance and culture settings for deep comparison

#pragma once

#include <struct_delta/value.h>

#include <locale>

namespace struct_delta {

enum class StringMode : uint8_t {
    Ordinal           = 0,
    OrdinalIgnoreCase = 1,
    Culture           = 2,  ///< collation of ComparisonOptions::culture
    CultureIgnoreCase = 3,
};

/// Immutable once handed to a ComparisonContext.
///
/// Epsilons are absolute tolerances; 0 means exact comparison (where
/// +0.0 equals -0.0).
struct ComparisonOptions {
    StringMode string_mode = StringMode::Ordinal;
    float float_epsilon = 0.0f;
    double double_epsilon = 0.0;
    Decimal decimal_epsilon = 0;

    /// NaN equals NaN (and nothing else) when set; NaN never equals
    /// anything when cleared
    bool treat_nan_equal = true;

    /// Root default for collections without a member or type setting
    bool order_insensitive_collections = false;

    /// Locale for the Culture string modes
    std::locale culture;
};

} // namespace struct_delta
