#pragma once

/// @file timer.hpp
/// @brief One-shot timers and the factory seam that lets tests replace them

#include "timing/event_queue.hpp"

#include <functional>
#include <memory>

namespace trilogic {

/// A one-shot timer: after start(), the callback runs once, period later.
/// Destroying a timer disarms it; owners rely on this to hand out callbacks
/// that capture `this`.
class Timer {
  public:
    virtual ~Timer() = default;

    virtual void start() = 0;
};

/// Builds a timer for a period and callback. Components that need time take
/// one of these instead of a clock so tests can fire callbacks by hand.
using TimerFactory = std::function<std::unique_ptr<Timer>(Duration period, std::function<void()> callback)>;

/// Timer that schedules its callback on an EventQueue.
/// Destroying the timer disarms any callback it already scheduled: the
/// queued event still fires at its time but does nothing.
class EventQueueTimer : public Timer {
  public:
    EventQueueTimer(EventQueue* queue, Duration period, std::function<void()> callback);
    ~EventQueueTimer() override;

    EventQueueTimer(const EventQueueTimer&) = delete;
    EventQueueTimer& operator=(const EventQueueTimer&) = delete;

    void start() override;

  private:
    EventQueue* queue_;
    Duration period_;
    std::function<void()> callback_;
    std::shared_ptr<bool> armed_;
};

/// Factory producing EventQueueTimers on the given queue
[[nodiscard]] TimerFactory event_queue_timer_factory(EventQueue* queue);

} // namespace trilogic
