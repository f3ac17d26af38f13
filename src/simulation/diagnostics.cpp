/// @file diagnostics.cpp
/// @brief Warning collection and the default stderr handler

#include "simulation/diagnostics.hpp"

#include <cstdio>

namespace trilogic {

namespace {

void print_to_stderr(const Warning& warning) {
    std::fprintf(stderr, "[trilogic] warning: %s\n", warning.message.c_str());
}

} // namespace

Diagnostics::Diagnostics(bool log_to_stderr, std::size_t history) : history_(history) {
    if (log_to_stderr) {
        handler_ = print_to_stderr;
    }
}

void Diagnostics::warn(WarningKind kind, std::string message) {
    const Warning warning{kind, std::move(message)};
    ++counts_[static_cast<std::size_t>(kind)];
    if (handler_) {
        handler_(warning);
    }

    if (history_ == 0) {
        return;
    }
    if (warnings_.size() == history_) {
        warnings_.pop_front();
    }
    warnings_.push_back(warning);
}

void Diagnostics::clear() {
    warnings_.clear();
    counts_.fill(0);
}

} // namespace trilogic
