#pragma once

/// @file errors.hpp
/// @brief Exceptions raised by circuit construction and propagation

#include <cstddef>
#include <stdexcept>
#include <string>

namespace trilogic {

/// Structural wiring violation: double connect, disconnecting a pair that
/// is not connected, or wiring a fixed-arity component with the wrong shape.
class ConnectionError : public std::runtime_error {
  public:
    explicit ConnectionError(const std::string& message) : std::runtime_error(message) {}
};

/// A raw value outside the three-valued domain
class InvalidValueError : public std::invalid_argument {
  public:
    explicit InvalidValueError(int raw)
        : std::invalid_argument("Cannot set state to: " + std::to_string(raw)), raw_(raw) {}

    [[nodiscard]] int raw_value() const { return raw_; }

  private:
    int raw_;
};

/// A single cascade nested deeper than the configured limit, which means
/// the wiring contains a feedback loop that does not settle.
class CascadeDepthError : public std::runtime_error {
  public:
    explicit CascadeDepthError(std::size_t limit)
        : std::runtime_error("Propagation cascade exceeded depth " + std::to_string(limit) +
                             " (unsettled feedback loop?)"),
          limit_(limit) {}

    [[nodiscard]] std::size_t limit() const { return limit_; }

  private:
    std::size_t limit_;
};

} // namespace trilogic
