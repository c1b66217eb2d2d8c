#include "FlowController.hpp"
#include "LxLog.hpp"

// Define static constexpr members for pre-C++17 ODR compliance
constexpr size_t FlowController::DEFAULT_WINDOW;

FlowController::FlowController(size_t window)
    : m_window(window == 0 ? 1 : window)
{
    if (window == 0) {
        LXPRINT_LOG_WARN("FlowController: window 0 is not usable, using 1\n");
    }
}

FlowController::AcquireResult FlowController::acquire(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_mutex);

    bool ready = m_slotFreed.wait_for(lock, timeout, [this]() {
        return m_cancelled || m_outstanding < m_window;
    });

    if (m_cancelled) {
        return AcquireResult::Cancelled;
    }
    if (!ready) {
        LXPRINT_LOG_WARN("FlowController: no slot freed within %ld ms (%u outstanding)\n",
                         static_cast<long>(timeout.count()), static_cast<unsigned>(m_outstanding));
        return AcquireResult::TimedOut;
    }

    m_outstanding++;
    if (m_outstanding > m_peakOutstanding) {
        m_peakOutstanding = m_outstanding;
    }
    return AcquireResult::Acquired;
}

void FlowController::release() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_outstanding == 0) {
            LXPRINT_LOG_WARN("FlowController: release with no outstanding write, ignored\n");
            return;
        }
        m_outstanding--;
    }
    m_slotFreed.notify_one();
}

void FlowController::cancel() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_cancelled = true;
    }
    m_slotFreed.notify_all();
}

size_t FlowController::outstanding() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_outstanding;
}

size_t FlowController::peakOutstanding() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_peakOutstanding;
}
