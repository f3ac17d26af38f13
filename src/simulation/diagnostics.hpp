#pragma once

/// @file diagnostics.hpp
/// @brief Non-fatal warnings raised while wiring or driving a circuit

#include <array>
#include <cstddef>
#include <deque>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace trilogic {

/// Conditions that are reported but do not stop the simulation
enum class WarningKind { DISCONNECT_UNCONNECTED, MULTIPLE_WRITERS, WRONG_ROLE };

[[nodiscard]] constexpr std::string_view warning_kind_name(WarningKind kind) {
    switch (kind) {
    case WarningKind::DISCONNECT_UNCONNECTED:
        return "DISCONNECT_UNCONNECTED";
    case WarningKind::MULTIPLE_WRITERS:
        return "MULTIPLE_WRITERS";
    case WarningKind::WRONG_ROLE:
        return "WRONG_ROLE";
    }
    return "UNKNOWN";
}

struct Warning {
    WarningKind kind;
    std::string message;
};

/// Collects warnings for one circuit and forwards each to a handler.
///
/// The default handler prints "[trilogic] warning: ..." to stderr. The most
/// recent warnings are kept in warnings() regardless of the handler; count()
/// covers every warning since the last clear(), kept or dropped.
class Diagnostics {
  public:
    using Handler = std::function<void(const Warning&)>;

    static constexpr std::size_t DEFAULT_HISTORY = 256;

    /// @param log_to_stderr Install the stderr handler (otherwise no handler)
    /// @param history Number of recent warnings to keep
    explicit Diagnostics(bool log_to_stderr = true, std::size_t history = DEFAULT_HISTORY);

    void warn(WarningKind kind, std::string message);

    /// Replaces the handler; an empty handler silences output
    void set_handler(Handler handler) { handler_ = std::move(handler); }

    /// Recent warnings, oldest first
    [[nodiscard]] const std::deque<Warning>& warnings() const { return warnings_; }

    /// Number of warnings of one kind since construction or clear()
    [[nodiscard]] std::size_t count(WarningKind kind) const { return counts_[static_cast<std::size_t>(kind)]; }

    [[nodiscard]] std::size_t history() const { return history_; }

    void clear();

  private:
    Handler handler_;
    std::size_t history_;
    std::deque<Warning> warnings_;
    std::array<std::size_t, 3> counts_{};
};

} // namespace trilogic
