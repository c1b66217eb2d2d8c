#pragma once

#include "PrintTypes.hpp"
#include <cstdint>
#include <cstddef>

/**
 * FrameCodec - Wire encoding for the LX print protocol
 *
 * This class handles:
 * - Building and parsing 12-byte control frames
 * - Building and parsing 20-byte data frames
 *
 * Control frame: [5A] [opcode] [w1 lo hi] [w2 lo hi] [w3 lo hi] [w4 lo hi] [w5 lo hi]
 * Data frame:    [55] [00] [index lo hi] [payload x16]
 *
 * BLE notifications are already length-delimited, so a frame is always a
 * whole notification or a whole write. All members are stateless.
 *
 * Note: opcode 0x04 is overloaded. The host sends it once to start a job
 * (w2 = copies) and once to acknowledge completion (w2 = ACK_TOKEN).
 */
class FrameCodec {
public:
    static constexpr size_t CONTROL_FRAME_SIZE = 12;
    static constexpr uint8_t CONTROL_MARKER = 0x5A;

    static constexpr size_t DATA_FRAME_SIZE = 20;
    static constexpr size_t DATA_PAYLOAD_SIZE = 16;
    static constexpr uint8_t DATA_MARKER_0 = 0x55;
    static constexpr uint8_t DATA_MARKER_1 = 0x00;

    // Block index is a 16-bit field
    static constexpr uint32_t MAX_BLOCK_COUNT = 0xFFFF;

    // w2 value that turns a Start frame into a completion ACK
    static constexpr uint16_t ACK_TOKEN = 0x0100;

    static constexpr uint16_t DEFAULT_COPIES = 1;

    /**
     * Encode a control frame
     * @param opcode Frame opcode
     * @param w1..w5 Words; each must fit in 16 unsigned bits
     * @param out Output buffer of CONTROL_FRAME_SIZE bytes
     * @return false if a word is out of range (nothing is written)
     */
    static bool encodeControl(Opcode opcode, uint32_t w1, uint32_t w2, uint32_t w3,
                              uint32_t w4, uint32_t w5, uint8_t* out);

    static bool encodeControl(const ControlFrame& frame, uint8_t* out);

    /**
     * Decode a control frame
     * @param data Received bytes
     * @param len Length of received bytes
     * @param out Decoded frame, valid only when DecodeError::None is returned
     * @return BadLength, BadMarker, UnknownOpcode or None
     */
    static DecodeError decodeControl(const uint8_t* data, size_t len, ControlFrame& out);

    /**
     * Encode a data frame
     * @param index Block index
     * @param payload Payload bytes
     * @param payloadLen Must be DATA_PAYLOAD_SIZE
     * @param out Output buffer of DATA_FRAME_SIZE bytes
     * @return false if payloadLen is wrong
     */
    static bool encodeDataFrame(uint16_t index, const uint8_t* payload, size_t payloadLen, uint8_t* out);

    static DecodeError decodeDataFrame(const uint8_t* data, size_t len, DataFrame& out);

    // Start job: w1 = block count, w2 = copies/job id
    static bool encodeStart(uint32_t blockCount, uint32_t copies, uint8_t* out);

    // Completion ACK: Start opcode with w2 = ACK_TOKEN
    static bool encodeAck(uint32_t blockCount, uint8_t* out);

    static bool isAckToken(const ControlFrame& frame) {
        return frame.opcode == Opcode::Start && frame.w2 == ACK_TOKEN;
    }

    // True when the first two bytes carry the control marker and a Complete opcode
    static bool looksLikeComplete(const uint8_t* data, size_t len);

    static const char* opcodeName(Opcode opcode);

private:
    static bool isKnownOpcode(uint8_t value);
    static void putLe16(uint8_t* out, uint16_t value);
    static uint16_t getLe16(const uint8_t* in);
};
