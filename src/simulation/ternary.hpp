#pragma once

/// @file ternary.hpp
/// @brief The balanced-ternary signal domain

#include <cstdint>
#include <string_view>

namespace trilogic {

/// A balanced-ternary signal. The underlying values give the total order
/// PLUS > NEUTRAL > MINUS, so the relational operators compare signals.
enum class TernaryValue : int8_t { MINUS = -1, NEUTRAL = 0, PLUS = 1 };

/// All three values, lowest first
inline constexpr TernaryValue ALL_TERNARY_VALUES[] = {TernaryValue::MINUS, TernaryValue::NEUTRAL,
                                                      TernaryValue::PLUS};

/// Returns the canonical display name: "(+)", "(0)" or "(-)"
[[nodiscard]] constexpr std::string_view ternary_name(TernaryValue value) {
    switch (value) {
    case TernaryValue::PLUS:
        return "(+)";
    case TernaryValue::NEUTRAL:
        return "(0)";
    case TernaryValue::MINUS:
        return "(-)";
    }
    return "(?)";
}

/// Numeric form of a value: +1, 0 or -1
[[nodiscard]] constexpr int to_int(TernaryValue value) { return static_cast<int>(value); }

/// Converts a raw integer to a ternary value.
/// @throws InvalidValueError if raw is not one of -1, 0, +1
[[nodiscard]] TernaryValue ternary_from_int(int raw);

/// Minimum under PLUS > NEUTRAL > MINUS
[[nodiscard]] constexpr TernaryValue ternary_min(TernaryValue a, TernaryValue b) { return a < b ? a : b; }

/// Maximum under PLUS > NEUTRAL > MINUS
[[nodiscard]] constexpr TernaryValue ternary_max(TernaryValue a, TernaryValue b) { return a < b ? b : a; }

} // namespace trilogic
