#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstddef>
#include <deque>
#include <mutex>
#include <vector>

/**
 * NotificationQueue - Hands inbound notifications from the BLE callback
 * context to the thread running the print job.
 *
 * The receive path only pushes copies of the raw bytes; it never touches
 * job state. The job thread pops with a deadline.
 */
class NotificationQueue {
public:
    struct Event {
        enum class Kind {
            Frame,
            StreamClosed
        };

        Kind kind = Kind::Frame;
        std::vector<uint8_t> bytes;
    };

    enum class PopResult {
        Event,
        TimedOut,
        Cancelled
    };

    using Clock = std::chrono::steady_clock;

    NotificationQueue() = default;
    NotificationQueue(const NotificationQueue&) = delete;
    NotificationQueue& operator=(const NotificationQueue&) = delete;

    void pushFrame(const uint8_t* data, size_t len);
    void pushStreamClosed();

    /**
     * Wait for the next event
     * @param deadline Give up at this point in time
     * @param out Receives the event when PopResult::Event is returned
     */
    PopResult popUntil(Clock::time_point deadline, Event& out);

    // Wake the waiter; later pops return Cancelled
    void cancel();

    size_t size() const;

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_available;
    std::deque<Event> m_events;
    bool m_cancelled = false;
};
