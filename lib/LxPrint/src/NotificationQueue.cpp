#include "NotificationQueue.hpp"

void NotificationQueue::pushFrame(const uint8_t* data, size_t len) {
    Event event;
    event.kind = Event::Kind::Frame;
    if (data != nullptr && len > 0) {
        event.bytes.assign(data, data + len);
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_events.push_back(std::move(event));
    }
    m_available.notify_one();
}

void NotificationQueue::pushStreamClosed() {
    Event event;
    event.kind = Event::Kind::StreamClosed;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_events.push_back(std::move(event));
    }
    m_available.notify_one();
}

NotificationQueue::PopResult NotificationQueue::popUntil(Clock::time_point deadline, Event& out) {
    std::unique_lock<std::mutex> lock(m_mutex);

    bool ready = m_available.wait_until(lock, deadline, [this]() {
        return m_cancelled || !m_events.empty();
    });

    if (m_cancelled) {
        return PopResult::Cancelled;
    }
    if (!ready) {
        return PopResult::TimedOut;
    }

    out = std::move(m_events.front());
    m_events.pop_front();
    return PopResult::Event;
}

void NotificationQueue::cancel() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_cancelled = true;
    }
    m_available.notify_all();
}

size_t NotificationQueue::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_events.size();
}
