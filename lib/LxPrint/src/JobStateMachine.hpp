#pragma once

#include "FlowController.hpp"
#include "FrameCodec.hpp"
#include "IPrinterTransport.hpp"
#include "JobConfig.hpp"
#include "NotificationQueue.hpp"
#include "PrintJob.hpp"
#include "PrintTypes.hpp"
#include <array>
#include <atomic>
#include <cstdint>
#include <functional>
#include <string>

/**
 * JobStateMachine - Runs one print job over one session
 *
 * State machine:
 *   Idle -> AwaitingStatus -> Starting -> Streaming -> AwaitingCompletion
 *        -> Acknowledging -> Done
 * Any non-terminal state can move to Failed. Both Done and Failed are final;
 * a machine is used for exactly one job and then discarded.
 *
 * Threading: run() executes on the caller's thread and is the only writer of
 * session state. onNotification(), onStreamClosed() and onWriteComplete()
 * are called from the transport's callback context and only enqueue events
 * or return flow-control slots. cancel() may be called from any thread.
 *
 * The printer repeats its completion frame until it sees the ACK. After the
 * ACK the machine stays in Done and absorbs repeats for ackDrainGraceMs so
 * they are not left on the stream for the next job.
 */
class JobStateMachine {
public:
    enum class State {
        Idle,
        AwaitingStatus,
        Starting,
        Streaming,
        AwaitingCompletion,
        Acknowledging,
        Done,
        Failed
    };

    // Callback for state transitions
    using StateCallback = std::function<void(State newState)>;

    static constexpr size_t STATUS_WORD_COUNT = 5;

    JobStateMachine(IPrinterTransport& transport, const JobConfig& config);

    JobStateMachine(const JobStateMachine&) = delete;
    JobStateMachine& operator=(const JobStateMachine&) = delete;

    /**
     * Drive the job to Done or Failed
     * @param job Blocks to stream
     * @return PrintError::None when Done, otherwise the failure cause
     */
    PrintError run(const PrintJob& job);

    // Receive path, transport callback context
    void onNotification(const uint8_t* data, size_t len);
    void onStreamClosed();
    void onWriteComplete();

    /**
     * Abort every pending wait. The job fails with Cancelled and no
     * further frames are written.
     */
    void cancel();

    State getState() const { return m_state.load(); }
    const char* getStateString() const { return stateName(getState()); }
    static const char* stateName(State state);

    void setStateCallback(StateCallback callback);

    PrintError getError() const { return m_session.error; }
    const std::string& getLastError() const { return m_lastError; }

    // Capability words from the initial 5A02 status; opaque to the protocol
    bool statusReceived() const { return m_session.statusReceived; }
    const std::array<uint16_t, STATUS_WORD_COUNT>& statusWords() const { return m_session.statusWords; }

    uint32_t blocksSent() const { return m_session.blocksSent; }
    uint32_t duplicateCompletions() const { return m_session.duplicateCompletions; }
    size_t peakOutstandingWrites() const { return m_flow.peakOutstanding(); }

private:
    struct Session {
        bool statusReceived = false;
        std::array<uint16_t, STATUS_WORD_COUNT> statusWords{};
        uint32_t blocksSent = 0;
        uint32_t duplicateCompletions = 0;
        PrintError error = PrintError::None;
    };

    PrintError awaitStatus();
    PrintError sendStart(const PrintJob& job);
    PrintError streamBlocks(const PrintJob& job);
    PrintError awaitCompletion(uint16_t blockCount);
    PrintError sendAck(uint16_t blockCount);
    void drainAfterAck(uint16_t blockCount);

    PrintError writeFrame(const uint8_t* data, size_t len);
    PrintError fail(PrintError error, const char* format, ...);
    void setState(State newState);

    IPrinterTransport& m_transport;
    JobConfig m_config;

    FlowController m_flow;
    NotificationQueue m_notifications;

    std::atomic<State> m_state{State::Idle};
    std::atomic<bool> m_cancelled{false};
    StateCallback m_stateCallback;

    Session m_session;
    std::string m_lastError;
};
