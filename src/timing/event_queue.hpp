/// @file event_queue.hpp
/// @brief Deterministic queue of deferred callbacks in simulated time.
///
/// Events fire in order of scheduled time; events scheduled for the same
/// time fire in the order they were submitted. Nothing is ever cancelled.
/// Time only moves when the owner calls advance(), step() or run(), so
/// tests control it exactly.

#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <map>
#include <optional>

namespace trilogic {

/// Simulated time span
using Duration = std::chrono::nanoseconds;

/// Simulated time since the queue was created
using SimTime = Duration;

class EventQueue {
  public:
    using Callback = std::function<void()>;

    EventQueue() = default;

    // Callbacks capture owners by reference
    EventQueue(const EventQueue&) = delete;
    EventQueue& operator=(const EventQueue&) = delete;

    /// Schedules a callback at an absolute time.
    /// @throws std::invalid_argument if time is earlier than now()
    void schedule_at(SimTime time, Callback callback);

    /// Schedules a callback delay after now(); a zero delay fires on the
    /// next advance(), step() or run()
    void schedule_after(Duration delay, Callback callback);

    /// Fires every event due within [now, now + span], including events
    /// scheduled by those callbacks, then sets now to now + span.
    /// @return Number of events fired
    std::size_t advance(Duration span);

    /// Fires the single earliest event, moving now to its time.
    /// @return false if the queue was empty
    bool step();

    /// Fires events until the queue is empty. Does not return while a
    /// periodic source keeps re-arming itself; use advance() for those.
    /// @return Number of events fired
    std::size_t run();

    [[nodiscard]] SimTime now() const { return now_; }
    [[nodiscard]] bool empty() const { return size_ == 0; }
    [[nodiscard]] std::size_t size() const { return size_; }

    /// Time of the earliest pending event
    [[nodiscard]] std::optional<SimTime> next_time() const;

  private:
    std::map<SimTime, std::deque<Callback>> calendar_;
    SimTime now_{0};
    std::size_t size_ = 0;
};

} // namespace trilogic
