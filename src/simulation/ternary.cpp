/// @file ternary.cpp
/// @brief Checked conversion into the ternary domain

#include "simulation/ternary.hpp"

#include "simulation/errors.hpp"

namespace trilogic {

TernaryValue ternary_from_int(int raw) {
    switch (raw) {
    case -1:
        return TernaryValue::MINUS;
    case 0:
        return TernaryValue::NEUTRAL;
    case 1:
        return TernaryValue::PLUS;
    default:
        throw InvalidValueError(raw);
    }
}

} // namespace trilogic
