#include "FrameCodec.hpp"
#include <cstring>

// Define static constexpr members for pre-C++17 ODR compliance
constexpr size_t FrameCodec::CONTROL_FRAME_SIZE;
constexpr uint8_t FrameCodec::CONTROL_MARKER;
constexpr size_t FrameCodec::DATA_FRAME_SIZE;
constexpr size_t FrameCodec::DATA_PAYLOAD_SIZE;
constexpr uint8_t FrameCodec::DATA_MARKER_0;
constexpr uint8_t FrameCodec::DATA_MARKER_1;
constexpr uint32_t FrameCodec::MAX_BLOCK_COUNT;
constexpr uint16_t FrameCodec::ACK_TOKEN;
constexpr uint16_t FrameCodec::DEFAULT_COPIES;

void FrameCodec::putLe16(uint8_t* out, uint16_t value) {
    out[0] = static_cast<uint8_t>(value & 0xFF);
    out[1] = static_cast<uint8_t>((value >> 8) & 0xFF);
}

uint16_t FrameCodec::getLe16(const uint8_t* in) {
    return static_cast<uint16_t>(in[0] | (in[1] << 8));
}

bool FrameCodec::isKnownOpcode(uint8_t value) {
    switch (static_cast<Opcode>(value)) {
        case Opcode::Status:
        case Opcode::Start:
        case Opcode::Complete:
        case Opcode::MidProgress:
            return true;
    }
    return false;
}

bool FrameCodec::encodeControl(Opcode opcode, uint32_t w1, uint32_t w2, uint32_t w3,
                               uint32_t w4, uint32_t w5, uint8_t* out) {
    if (w1 > 0xFFFF || w2 > 0xFFFF || w3 > 0xFFFF || w4 > 0xFFFF || w5 > 0xFFFF) {
        return false;
    }

    out[0] = CONTROL_MARKER;
    out[1] = static_cast<uint8_t>(opcode);
    putLe16(out + 2, static_cast<uint16_t>(w1));
    putLe16(out + 4, static_cast<uint16_t>(w2));
    putLe16(out + 6, static_cast<uint16_t>(w3));
    putLe16(out + 8, static_cast<uint16_t>(w4));
    putLe16(out + 10, static_cast<uint16_t>(w5));
    return true;
}

bool FrameCodec::encodeControl(const ControlFrame& frame, uint8_t* out) {
    return encodeControl(frame.opcode, frame.w1, frame.w2, frame.w3, frame.w4, frame.w5, out);
}

DecodeError FrameCodec::decodeControl(const uint8_t* data, size_t len, ControlFrame& out) {
    if (data == nullptr || len != CONTROL_FRAME_SIZE) {
        return DecodeError::BadLength;
    }
    if (data[0] != CONTROL_MARKER) {
        return DecodeError::BadMarker;
    }
    if (!isKnownOpcode(data[1])) {
        return DecodeError::UnknownOpcode;
    }

    out.opcode = static_cast<Opcode>(data[1]);
    out.w1 = getLe16(data + 2);
    out.w2 = getLe16(data + 4);
    out.w3 = getLe16(data + 6);
    out.w4 = getLe16(data + 8);
    out.w5 = getLe16(data + 10);
    return DecodeError::None;
}

bool FrameCodec::encodeDataFrame(uint16_t index, const uint8_t* payload, size_t payloadLen, uint8_t* out) {
    if (payload == nullptr || payloadLen != DATA_PAYLOAD_SIZE) {
        return false;
    }

    out[0] = DATA_MARKER_0;
    out[1] = DATA_MARKER_1;
    putLe16(out + 2, index);
    memcpy(out + 4, payload, DATA_PAYLOAD_SIZE);
    return true;
}

DecodeError FrameCodec::decodeDataFrame(const uint8_t* data, size_t len, DataFrame& out) {
    if (data == nullptr || len != DATA_FRAME_SIZE) {
        return DecodeError::BadLength;
    }
    if (data[0] != DATA_MARKER_0 || data[1] != DATA_MARKER_1) {
        return DecodeError::BadMarker;
    }

    out.index = getLe16(data + 2);
    memcpy(out.payload.data(), data + 4, DATA_PAYLOAD_SIZE);
    return DecodeError::None;
}

bool FrameCodec::encodeStart(uint32_t blockCount, uint32_t copies, uint8_t* out) {
    return encodeControl(Opcode::Start, blockCount, copies, 0, 0, 0, out);
}

bool FrameCodec::encodeAck(uint32_t blockCount, uint8_t* out) {
    return encodeControl(Opcode::Start, blockCount, ACK_TOKEN, 0, 0, 0, out);
}

bool FrameCodec::looksLikeComplete(const uint8_t* data, size_t len) {
    return data != nullptr && len >= 2 &&
           data[0] == CONTROL_MARKER &&
           data[1] == static_cast<uint8_t>(Opcode::Complete);
}

const char* FrameCodec::opcodeName(Opcode opcode) {
    switch (opcode) {
        case Opcode::Status: return "Status";
        case Opcode::Start: return "Start";
        case Opcode::Complete: return "Complete";
        case Opcode::MidProgress: return "MidProgress";
        default: return "Unknown";
    }
}
