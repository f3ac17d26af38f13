/// @file timer.cpp
/// @brief Event-queue backed timers

#include "timing/timer.hpp"

#include <stdexcept>
#include <utility>

namespace trilogic {

EventQueueTimer::EventQueueTimer(EventQueue* queue, Duration period, std::function<void()> callback)
    : queue_(queue), period_(period), callback_(std::move(callback)), armed_(std::make_shared<bool>(true)) {
    if (queue_ == nullptr) {
        throw std::invalid_argument("EventQueueTimer requires an event queue");
    }
}

EventQueueTimer::~EventQueueTimer() {
    *armed_ = false;
}

void EventQueueTimer::start() {
    // The queue holds its own copy of the callback and shares the armed flag,
    // so the timer may be destroyed before its event fires
    queue_->schedule_after(period_, [armed = armed_, callback = callback_]() {
        if (*armed) {
            callback();
        }
    });
}

TimerFactory event_queue_timer_factory(EventQueue* queue) {
    return [queue](Duration period, std::function<void()> callback) -> std::unique_ptr<Timer> {
        return std::make_unique<EventQueueTimer>(queue, period, std::move(callback));
    };
}

} // namespace trilogic
