#include "JobStateMachine.hpp"
#include "LxLog.hpp"
#include <chrono>
#include <cstdarg>
#include <cstdio>

// Define static constexpr members for pre-C++17 ODR compliance
constexpr size_t JobStateMachine::STATUS_WORD_COUNT;

namespace {

std::chrono::milliseconds toMs(uint32_t ms) {
    return std::chrono::milliseconds(ms);
}

}  // namespace

JobStateMachine::JobStateMachine(IPrinterTransport& transport, const JobConfig& config)
    : m_transport(transport)
    , m_config(config)
    , m_flow(config.flowControlWindow > 0 ? static_cast<size_t>(config.flowControlWindow) : 0)
{
}

const char* JobStateMachine::stateName(State state) {
    switch (state) {
        case State::Idle: return "Idle";
        case State::AwaitingStatus: return "AwaitingStatus";
        case State::Starting: return "Starting";
        case State::Streaming: return "Streaming";
        case State::AwaitingCompletion: return "AwaitingCompletion";
        case State::Acknowledging: return "Acknowledging";
        case State::Done: return "Done";
        case State::Failed: return "Failed";
        default: return "Unknown";
    }
}

void JobStateMachine::setStateCallback(StateCallback callback) {
    m_stateCallback = std::move(callback);
}

void JobStateMachine::setState(State newState) {
    State oldState = m_state.load();
    if (oldState == newState) {
        return;
    }
    LXPRINT_LOG_DEBUG("JobStateMachine: state %s -> %s\n", stateName(oldState), stateName(newState));
    m_state.store(newState);
    if (m_stateCallback) {
        m_stateCallback(newState);
    }
}

PrintError JobStateMachine::fail(PrintError error, const char* format, ...) {
    char detail[160];
    va_list args;
    va_start(args, format);
    vsnprintf(detail, sizeof(detail), format, args);
    va_end(args);

    m_session.error = error;
    m_lastError = detail;
    LXPRINT_LOG_ERROR("JobStateMachine: %s in %s: %s\n",
                      printErrorString(error), getStateString(), detail);
    setState(State::Failed);
    return error;
}

void JobStateMachine::onNotification(const uint8_t* data, size_t len) {
    LXPRINT_LOG_DEBUG_BYTES("RX ", data, len);
    m_notifications.pushFrame(data, len);
}

void JobStateMachine::onStreamClosed() {
    LXPRINT_LOG_WARN("JobStateMachine: notification stream closed\n");
    m_notifications.pushStreamClosed();
}

void JobStateMachine::onWriteComplete() {
    m_flow.release();
}

void JobStateMachine::cancel() {
    if (m_cancelled.exchange(true)) {
        return;
    }
    LXPRINT_LOG_INFO("JobStateMachine: cancel requested in %s\n", getStateString());
    m_flow.cancel();
    m_notifications.cancel();
}

PrintError JobStateMachine::run(const PrintJob& job) {
    if (getState() != State::Idle) {
        m_lastError = "session already used";
        LXPRINT_LOG_ERROR("JobStateMachine: run() on a %s session\n", getStateString());
        return PrintError::JobInProgress;
    }
    if (job.empty()) {
        return fail(PrintError::EmptyImage, "job has no blocks");
    }

    const uint16_t blockCount = job.blockCount();
    LXPRINT_LOG_INFO("JobStateMachine: printing %u blocks, copies %u, window %u\n",
                     static_cast<unsigned>(blockCount), static_cast<unsigned>(job.copies()),
                     static_cast<unsigned>(m_flow.window()));

    PrintError err = awaitStatus();
    if (err != PrintError::None) {
        return err;
    }

    err = sendStart(job);
    if (err != PrintError::None) {
        return err;
    }

    err = streamBlocks(job);
    if (err != PrintError::None) {
        return err;
    }

    err = awaitCompletion(blockCount);
    if (err != PrintError::None) {
        return err;
    }

    err = sendAck(blockCount);
    if (err != PrintError::None) {
        return err;
    }

    setState(State::Done);
    drainAfterAck(blockCount);

    LXPRINT_LOG_INFO("JobStateMachine: job of %u blocks done\n", static_cast<unsigned>(blockCount));
    return PrintError::None;
}

PrintError JobStateMachine::awaitStatus() {
    setState(State::AwaitingStatus);

    if (m_config.skipStatusWait) {
        LXPRINT_LOG_DEBUG("JobStateMachine: status wait skipped\n");
        return PrintError::None;
    }

    const auto deadline = NotificationQueue::Clock::now() + toMs(m_config.statusWaitTimeoutMs);
    NotificationQueue::Event event;

    while (true) {
        switch (m_notifications.popUntil(deadline, event)) {
            case NotificationQueue::PopResult::Cancelled:
                return fail(PrintError::Cancelled, "cancelled while waiting for status");
            case NotificationQueue::PopResult::TimedOut:
                // Status is advisory
                LXPRINT_LOG_WARN("JobStateMachine: no status within %u ms, continuing\n",
                                 static_cast<unsigned>(m_config.statusWaitTimeoutMs));
                return PrintError::None;
            case NotificationQueue::PopResult::Event:
                break;
        }

        if (event.kind == NotificationQueue::Event::Kind::StreamClosed) {
            return fail(PrintError::TransportError, "notification stream closed while waiting for status");
        }

        ControlFrame frame;
        DecodeError decodeErr = FrameCodec::decodeControl(event.bytes.data(), event.bytes.size(), frame);
        if (decodeErr != DecodeError::None) {
            LXPRINT_LOG_WARN("JobStateMachine: discarding %u-byte frame (%s)\n",
                             static_cast<unsigned>(event.bytes.size()), decodeErrorString(decodeErr));
            continue;
        }

        if (frame.opcode != Opcode::Status) {
            LXPRINT_LOG_DEBUG("JobStateMachine: ignoring %s before start\n", FrameCodec::opcodeName(frame.opcode));
            continue;
        }

        m_session.statusReceived = true;
        m_session.statusWords = {{frame.w1, frame.w2, frame.w3, frame.w4, frame.w5}};
        LXPRINT_LOG_INFO("JobStateMachine: status %04X %04X %04X %04X %04X\n",
                         frame.w1, frame.w2, frame.w3, frame.w4, frame.w5);
        return PrintError::None;
    }
}

PrintError JobStateMachine::writeFrame(const uint8_t* data, size_t len) {
    if (m_cancelled.load()) {
        return fail(PrintError::Cancelled, "cancelled before write");
    }

    switch (m_flow.acquire(toMs(m_config.writeSlotTimeoutMs))) {
        case FlowController::AcquireResult::Acquired:
            break;
        case FlowController::AcquireResult::Cancelled:
            return fail(PrintError::Cancelled, "cancelled while waiting for a write slot");
        case FlowController::AcquireResult::TimedOut:
            return fail(PrintError::TransportError, "no write completion within %u ms",
                        static_cast<unsigned>(m_config.writeSlotTimeoutMs));
    }

    LXPRINT_LOG_TRACE_BYTES("TX ", data, len);

    if (!m_transport.writeWithoutResponse(data, len)) {
        // A rejected write never reports completion
        m_flow.release();
        return fail(PrintError::TransportError, "write of %u bytes rejected by transport",
                    static_cast<unsigned>(len));
    }
    return PrintError::None;
}

PrintError JobStateMachine::sendStart(const PrintJob& job) {
    setState(State::Starting);

    uint8_t frame[FrameCodec::CONTROL_FRAME_SIZE];
    if (!FrameCodec::encodeStart(job.blockCount(), job.copies(), frame)) {
        return fail(PrintError::EncodingError, "start frame out of range");
    }
    LXPRINT_LOG_DEBUG_BYTES("TX start ", frame, sizeof(frame));
    return writeFrame(frame, sizeof(frame));
}

PrintError JobStateMachine::streamBlocks(const PrintJob& job) {
    setState(State::Streaming);

    const uint16_t blockCount = job.blockCount();
    uint8_t frame[FrameCodec::DATA_FRAME_SIZE];

    for (uint32_t index = 0; index < blockCount; index++) {
        const PrintJob::Block& block = job.block(index);
        if (!FrameCodec::encodeDataFrame(static_cast<uint16_t>(index), block.data(), block.size(), frame)) {
            return fail(PrintError::EncodingError, "data frame %u", static_cast<unsigned>(index));
        }

        PrintError err = writeFrame(frame, sizeof(frame));
        if (err != PrintError::None) {
            return err;
        }
        m_session.blocksSent++;

        if ((m_session.blocksSent % 256) == 0) {
            LXPRINT_LOG_DEBUG("JobStateMachine: %u/%u blocks sent\n",
                              static_cast<unsigned>(m_session.blocksSent), static_cast<unsigned>(blockCount));
        }
    }

    LXPRINT_LOG_INFO("JobStateMachine: all %u blocks sent, peak %u in flight\n",
                     static_cast<unsigned>(blockCount), static_cast<unsigned>(m_flow.peakOutstanding()));
    return PrintError::None;
}

PrintError JobStateMachine::awaitCompletion(uint16_t blockCount) {
    setState(State::AwaitingCompletion);

    const auto deadline = NotificationQueue::Clock::now() + toMs(m_config.completionWaitTimeoutMs);
    NotificationQueue::Event event;

    while (true) {
        switch (m_notifications.popUntil(deadline, event)) {
            case NotificationQueue::PopResult::Cancelled:
                return fail(PrintError::Cancelled, "cancelled while waiting for completion");
            case NotificationQueue::PopResult::TimedOut:
                return fail(PrintError::JobTimeout, "no completion for %u blocks within %u ms",
                            static_cast<unsigned>(blockCount),
                            static_cast<unsigned>(m_config.completionWaitTimeoutMs));
            case NotificationQueue::PopResult::Event:
                break;
        }

        if (event.kind == NotificationQueue::Event::Kind::StreamClosed) {
            return fail(PrintError::TransportError, "notification stream closed while waiting for completion");
        }

        const uint8_t* data = event.bytes.data();
        const size_t len = event.bytes.size();

        ControlFrame frame;
        DecodeError decodeErr = FrameCodec::decodeControl(data, len, frame);
        if (decodeErr != DecodeError::None) {
            if (m_config.strictCompletionDecode && FrameCodec::looksLikeComplete(data, len)) {
                return fail(PrintError::DecodeError, "malformed completion frame (%s, %u bytes)",
                            decodeErrorString(decodeErr), static_cast<unsigned>(len));
            }
            LXPRINT_LOG_WARN("JobStateMachine: discarding %u-byte frame (%s)\n",
                             static_cast<unsigned>(len), decodeErrorString(decodeErr));
            continue;
        }

        switch (frame.opcode) {
            case Opcode::Complete:
                if (frame.w1 == blockCount) {
                    LXPRINT_LOG_INFO("JobStateMachine: printer reports %u blocks complete\n",
                                     static_cast<unsigned>(frame.w1));
                    return PrintError::None;
                }
                LXPRINT_LOG_WARN("JobStateMachine: completion for %u blocks, expected %u\n",
                                 static_cast<unsigned>(frame.w1), static_cast<unsigned>(blockCount));
                break;
            case Opcode::Start:
                LXPRINT_LOG_DEBUG("JobStateMachine: %s echo for %u blocks\n",
                                  FrameCodec::isAckToken(frame) ? "ack" : "start",
                                  static_cast<unsigned>(frame.w1));
                break;
            case Opcode::MidProgress:
                LXPRINT_LOG_DEBUG("JobStateMachine: progress %04X %04X\n", frame.w1, frame.w2);
                break;
            case Opcode::Status:
                LXPRINT_LOG_DEBUG("JobStateMachine: status while printing %04X\n", frame.w1);
                break;
        }
    }
}

PrintError JobStateMachine::sendAck(uint16_t blockCount) {
    setState(State::Acknowledging);

    uint8_t frame[FrameCodec::CONTROL_FRAME_SIZE];
    if (!FrameCodec::encodeAck(blockCount, frame)) {
        return fail(PrintError::EncodingError, "ack frame out of range");
    }
    LXPRINT_LOG_DEBUG_BYTES("TX ack ", frame, sizeof(frame));
    return writeFrame(frame, sizeof(frame));
}

void JobStateMachine::drainAfterAck(uint16_t blockCount) {
    if (m_config.ackDrainGraceMs == 0) {
        return;
    }

    const auto deadline = NotificationQueue::Clock::now() + toMs(m_config.ackDrainGraceMs);
    NotificationQueue::Event event;

    while (m_notifications.popUntil(deadline, event) == NotificationQueue::PopResult::Event) {
        if (event.kind == NotificationQueue::Event::Kind::StreamClosed) {
            LXPRINT_LOG_DEBUG("JobStateMachine: stream closed after ack\n");
            break;
        }

        ControlFrame frame;
        if (FrameCodec::decodeControl(event.bytes.data(), event.bytes.size(), frame) == DecodeError::None &&
            frame.w1 == blockCount &&
            (frame.opcode == Opcode::Complete || frame.opcode == Opcode::Start)) {
            m_session.duplicateCompletions++;
            LXPRINT_LOG_DEBUG("JobStateMachine: absorbed repeated %s\n", FrameCodec::opcodeName(frame.opcode));
        } else {
            LXPRINT_LOG_DEBUG("JobStateMachine: discarded %u-byte frame after ack\n",
                              static_cast<unsigned>(event.bytes.size()));
        }
    }

    if (m_session.duplicateCompletions > 0) {
        LXPRINT_LOG_INFO("JobStateMachine: absorbed %u repeated completions\n",
                         static_cast<unsigned>(m_session.duplicateCompletions));
    }
}
