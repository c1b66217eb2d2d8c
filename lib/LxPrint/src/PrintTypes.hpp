#pragma once

#include <array>
#include <cstdint>
#include <cstddef>

/**
 * Shared wire types and result codes for the LX-series print protocol.
 */

// Control frame opcodes (second byte after the 0x5A marker)
enum class Opcode : uint8_t {
    Status = 0x02,       // device -> host, capability/status words
    Start = 0x04,        // host <-> device, start job or ACK completion (see w2)
    Complete = 0x06,     // device -> host, all blocks received
    MidProgress = 0x07   // device -> host, informational
};

// 12-byte control message: marker, opcode, five little-endian words
struct ControlFrame {
    Opcode opcode = Opcode::Status;
    uint16_t w1 = 0;
    uint16_t w2 = 0;
    uint16_t w3 = 0;
    uint16_t w4 = 0;
    uint16_t w5 = 0;
};

// 20-byte data message: marker, block index, 16 payload bytes
struct DataFrame {
    uint16_t index = 0;
    std::array<uint8_t, 16> payload{};
};

enum class DecodeError {
    None,
    BadLength,
    BadMarker,
    UnknownOpcode
};

// Caller-visible outcome of a print job
enum class PrintError {
    None,
    EncodingError,
    DecodeError,
    TransportError,
    JobTimeout,
    Cancelled,
    ImageTooLarge,
    JobInProgress,
    EmptyImage
};

const char* printErrorString(PrintError error);
const char* decodeErrorString(DecodeError error);
