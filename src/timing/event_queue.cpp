/// @file event_queue.cpp
/// @brief Implements the simulated-time event calendar

#include "timing/event_queue.hpp"

#include <stdexcept>
#include <utility>

namespace trilogic {

void EventQueue::schedule_at(SimTime time, Callback callback) {
    if (time < now_) {
        throw std::invalid_argument("Cannot schedule an event in the past");
    }
    calendar_[time].push_back(std::move(callback));
    ++size_;
}

void EventQueue::schedule_after(Duration delay, Callback callback) {
    if (delay < Duration::zero()) {
        throw std::invalid_argument("Event delay must not be negative");
    }
    schedule_at(now_ + delay, std::move(callback));
}

bool EventQueue::step() {
    if (calendar_.empty()) {
        return false;
    }

    auto slot = calendar_.begin();
    now_ = slot->first;
    Callback callback = std::move(slot->second.front());
    slot->second.pop_front();
    if (slot->second.empty()) {
        calendar_.erase(slot);
    }
    --size_;

    // The callback may schedule more events; the calendar is consistent here.
    if (callback) {
        callback();
    }
    return true;
}

std::size_t EventQueue::advance(Duration span) {
    if (span < Duration::zero()) {
        throw std::invalid_argument("Cannot advance by a negative span");
    }

    const SimTime target = now_ + span;
    std::size_t fired = 0;
    while (!calendar_.empty() && calendar_.begin()->first <= target) {
        step();
        ++fired;
    }
    now_ = target;
    return fired;
}

std::size_t EventQueue::run() {
    std::size_t fired = 0;
    while (step()) {
        ++fired;
    }
    return fired;
}

std::optional<SimTime> EventQueue::next_time() const {
    if (calendar_.empty()) {
        return std::nullopt;
    }
    return calendar_.begin()->first;
}

} // namespace trilogic
