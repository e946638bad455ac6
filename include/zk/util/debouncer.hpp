#pragma once

#include <chrono>

namespace zk {

/**
 * Quiescence timer for bursts of filesystem events.
 *
 * Every event re-arms the timer; the debouncer becomes ready once the
 * window has passed without a new event.
 *
 * Usage:
 *   Debouncer debouncer(std::chrono::milliseconds(300));
 *
 *   // On each raw event:
 *   debouncer.trigger();
 *
 *   // In the observation loop:
 *   if (debouncer.ready()) {
 *       emit_batch();
 *   }
 */
class Debouncer {
public:
    using Clock = std::chrono::steady_clock;
    using Duration = std::chrono::milliseconds;
    using TimePoint = Clock::time_point;

    explicit Debouncer(Duration window)
        : window_(window)
        , last_trigger_(Clock::now())
    {}

    // Re-arm the timer
    void trigger() {
        last_trigger_ = Clock::now();
        pending_ = true;
    }

    /**
     * True once the window has elapsed since the last trigger.
     * Clears the pending state (one-shot).
     */
    bool ready() {
        if (!pending_) {
            return false;
        }
        if (Clock::now() - last_trigger_ >= window_) {
            pending_ = false;
            return true;
        }
        return false;
    }

    void cancel() {
        pending_ = false;
    }

    bool is_pending() const {
        return pending_;
    }

    /**
     * Milliseconds until ready; 0 when not pending or already due.
     */
    int remaining_ms() const {
        if (!pending_) {
            return 0;
        }

        auto elapsed = Clock::now() - last_trigger_;
        auto remaining = window_ - std::chrono::duration_cast<Duration>(elapsed);
        if (remaining.count() <= 0) {
            return 0;
        }
        return static_cast<int>(remaining.count());
    }

    Duration window() const {
        return window_;
    }

private:
    Duration window_;
    TimePoint last_trigger_;
    bool pending_ = false;
};

}  // namespace zk
