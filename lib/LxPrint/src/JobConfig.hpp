#pragma once

#include "FlowController.hpp"
#include "FrameCodec.hpp"
#include <cstdint>

/**
 * JobConfig - Timing and pacing policy for one print session
 */
struct JobConfig {
    // Writes allowed in flight before waiting for a write-complete signal
    int flowControlWindow = static_cast<int>(FlowController::DEFAULT_WINDOW);

    // The initial 5A02 status is informational; the job proceeds on timeout
    uint32_t statusWaitTimeoutMs = 1000;
    bool skipStatusWait = false;

    // Longest wait for the transport to hand back a write slot
    uint32_t writeSlotTimeoutMs = 2000;

    // Longest wait for the 5A06 completion after the last block
    uint32_t completionWaitTimeoutMs = 10000;

    // How long repeated completions are absorbed after the ACK
    uint32_t ackDrainGraceMs = 500;

    // Copy count / job id carried in w2 of the Start frame
    uint16_t copies = FrameCodec::DEFAULT_COPIES;

    // Fail instead of discarding a malformed frame that carries the Complete opcode
    bool strictCompletionDecode = false;
};
