#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>

/**
 * FlowController - Bounds writes outstanding in the local BLE stack
 *
 * A slot is taken before every write and given back when the transport
 * reports the write has left its queue. The printer never acknowledges
 * individual blocks, so this is local pacing only: it keeps the controller
 * from dropping write-without-response packets when its buffers fill.
 *
 * The window is a tuning knob. Two matches the controller credits seen in
 * captured traffic; larger windows are untested against real hardware.
 */
class FlowController {
public:
    static constexpr size_t DEFAULT_WINDOW = 2;

    enum class AcquireResult {
        Acquired,
        TimedOut,
        Cancelled
    };

    explicit FlowController(size_t window = DEFAULT_WINDOW);

    FlowController(const FlowController&) = delete;
    FlowController& operator=(const FlowController&) = delete;

    /**
     * Wait for a free slot and take it
     * @param timeout Maximum time to wait
     * @return Acquired, TimedOut, or Cancelled once cancel() was called
     */
    AcquireResult acquire(std::chrono::milliseconds timeout);

    /**
     * Give back one slot. Called from the transport's write-complete context.
     */
    void release();

    /**
     * Wake every waiter; later acquire() calls return Cancelled
     */
    void cancel();

    size_t outstanding() const;
    size_t peakOutstanding() const;
    size_t window() const { return m_window; }

private:
    const size_t m_window;

    mutable std::mutex m_mutex;
    std::condition_variable m_slotFreed;
    size_t m_outstanding = 0;
    size_t m_peakOutstanding = 0;
    bool m_cancelled = false;
};
