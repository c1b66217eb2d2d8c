#include "FrameCodec.hpp"
#include <gtest/gtest.h>
#include <array>
#include <vector>

namespace {

std::vector<uint8_t> bytes(const uint8_t* data, size_t len) {
    return std::vector<uint8_t>(data, data + len);
}

}  // namespace

TEST(FrameCodecTest, StartFrameForFiftyEightBlocks) {
    uint8_t out[FrameCodec::CONTROL_FRAME_SIZE];
    ASSERT_TRUE(FrameCodec::encodeStart(58, 1, out));

    const std::vector<uint8_t> expected = {0x5A, 0x04, 0x3A, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00};
    EXPECT_EQ(bytes(out, sizeof(out)), expected);
}

TEST(FrameCodecTest, AckReusesStartOpcodeWithToken) {
    uint8_t out[FrameCodec::CONTROL_FRAME_SIZE];
    ASSERT_TRUE(FrameCodec::encodeAck(58, out));

    const std::vector<uint8_t> expected = {0x5A, 0x04, 0x3A, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00};
    EXPECT_EQ(bytes(out, sizeof(out)), expected);

    ControlFrame frame;
    ASSERT_EQ(FrameCodec::decodeControl(out, sizeof(out), frame), DecodeError::None);
    EXPECT_EQ(frame.opcode, Opcode::Start);
    EXPECT_TRUE(FrameCodec::isAckToken(frame));
}

TEST(FrameCodecTest, StartWithCopiesIsNotAnAck) {
    uint8_t out[FrameCodec::CONTROL_FRAME_SIZE];
    ASSERT_TRUE(FrameCodec::encodeStart(10, 2, out));

    ControlFrame frame;
    ASSERT_EQ(FrameCodec::decodeControl(out, sizeof(out), frame), DecodeError::None);
    EXPECT_FALSE(FrameCodec::isAckToken(frame));
    EXPECT_EQ(frame.w2, 2);
}

TEST(FrameCodecTest, DecodesCompletionFromPrinter) {
    const uint8_t wire[] = {0x5A, 0x06, 0x3A, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00};

    ControlFrame frame;
    ASSERT_EQ(FrameCodec::decodeControl(wire, sizeof(wire), frame), DecodeError::None);
    EXPECT_EQ(frame.opcode, Opcode::Complete);
    EXPECT_EQ(frame.w1, 58);
    EXPECT_EQ(frame.w2, 1);
    EXPECT_EQ(frame.w3, 0);
}

TEST(FrameCodecTest, DecodesAllStatusWords) {
    const uint8_t wire[] = {0x5A, 0x02, 0x01, 0x00, 0x80, 0x01, 0x34, 0x12, 0xFF, 0xFF, 0x00, 0x03};

    ControlFrame frame;
    ASSERT_EQ(FrameCodec::decodeControl(wire, sizeof(wire), frame), DecodeError::None);
    EXPECT_EQ(frame.opcode, Opcode::Status);
    EXPECT_EQ(frame.w1, 0x0001);
    EXPECT_EQ(frame.w2, 0x0180);
    EXPECT_EQ(frame.w3, 0x1234);
    EXPECT_EQ(frame.w4, 0xFFFF);
    EXPECT_EQ(frame.w5, 0x0300);
}

TEST(FrameCodecTest, RejectsShortAndLongControlFrames) {
    const uint8_t eleven[] = {0x5A, 0x06, 0x3A, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00};
    const uint8_t thirteen[] = {0x5A, 0x06, 0x3A, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00};

    ControlFrame frame;
    EXPECT_EQ(FrameCodec::decodeControl(eleven, sizeof(eleven), frame), DecodeError::BadLength);
    EXPECT_EQ(FrameCodec::decodeControl(thirteen, sizeof(thirteen), frame), DecodeError::BadLength);
    EXPECT_EQ(FrameCodec::decodeControl(nullptr, 12, frame), DecodeError::BadLength);
}

TEST(FrameCodecTest, RejectsWrongMarker) {
    const uint8_t wire[] = {0xA5, 0x06, 0x3A, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00};

    ControlFrame frame;
    EXPECT_EQ(FrameCodec::decodeControl(wire, sizeof(wire), frame), DecodeError::BadMarker);
}

TEST(FrameCodecTest, RejectsUnknownOpcode) {
    // Motor-control command bytes are not part of the print protocol
    const uint8_t wire[] = {0x5A, 0xA4, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00};

    ControlFrame frame;
    EXPECT_EQ(FrameCodec::decodeControl(wire, sizeof(wire), frame), DecodeError::UnknownOpcode);
}

TEST(FrameCodecTest, OutOfRangeWordLeavesBufferUntouched) {
    std::array<uint8_t, FrameCodec::CONTROL_FRAME_SIZE> out;
    out.fill(0xEE);

    EXPECT_FALSE(FrameCodec::encodeControl(Opcode::Start, 0x10000, 1, 0, 0, 0, out.data()));
    EXPECT_FALSE(FrameCodec::encodeControl(Opcode::Start, 1, 0, 0, 0, 0x1FFFF, out.data()));
    for (uint8_t b : out) {
        EXPECT_EQ(b, 0xEE);
    }
}

TEST(FrameCodecTest, ControlFrameStructRoundTrip) {
    ControlFrame in;
    in.opcode = Opcode::MidProgress;
    in.w1 = 0xBEEF;
    in.w2 = 7;
    in.w5 = 0x8000;

    uint8_t out[FrameCodec::CONTROL_FRAME_SIZE];
    ASSERT_TRUE(FrameCodec::encodeControl(in, out));

    ControlFrame decoded;
    ASSERT_EQ(FrameCodec::decodeControl(out, sizeof(out), decoded), DecodeError::None);
    EXPECT_EQ(decoded.opcode, Opcode::MidProgress);
    EXPECT_EQ(decoded.w1, 0xBEEF);
    EXPECT_EQ(decoded.w2, 7);
    EXPECT_EQ(decoded.w3, 0);
    EXPECT_EQ(decoded.w4, 0);
    EXPECT_EQ(decoded.w5, 0x8000);
}

TEST(FrameCodecTest, DataFrameLayout) {
    uint8_t payload[FrameCodec::DATA_PAYLOAD_SIZE];
    for (size_t i = 0; i < sizeof(payload); i++) {
        payload[i] = static_cast<uint8_t>(0xA0 + i);
    }

    uint8_t out[FrameCodec::DATA_FRAME_SIZE];
    ASSERT_TRUE(FrameCodec::encodeDataFrame(0x0139, payload, sizeof(payload), out));

    EXPECT_EQ(out[0], 0x55);
    EXPECT_EQ(out[1], 0x00);
    EXPECT_EQ(out[2], 0x39);
    EXPECT_EQ(out[3], 0x01);
    EXPECT_EQ(bytes(out + 4, 16), bytes(payload, sizeof(payload)));

    DataFrame frame;
    ASSERT_EQ(FrameCodec::decodeDataFrame(out, sizeof(out), frame), DecodeError::None);
    EXPECT_EQ(frame.index, 0x0139);
    EXPECT_EQ(bytes(frame.payload.data(), frame.payload.size()), bytes(payload, sizeof(payload)));
}

TEST(FrameCodecTest, DataFrameHighestIndex) {
    uint8_t payload[FrameCodec::DATA_PAYLOAD_SIZE] = {};
    uint8_t out[FrameCodec::DATA_FRAME_SIZE];
    ASSERT_TRUE(FrameCodec::encodeDataFrame(0xFFFF, payload, sizeof(payload), out));

    DataFrame frame;
    ASSERT_EQ(FrameCodec::decodeDataFrame(out, sizeof(out), frame), DecodeError::None);
    EXPECT_EQ(frame.index, 0xFFFF);
}

TEST(FrameCodecTest, DataFrameRejectsWrongPayloadLength) {
    uint8_t payload[17] = {};
    uint8_t out[FrameCodec::DATA_FRAME_SIZE];

    EXPECT_FALSE(FrameCodec::encodeDataFrame(0, payload, 15, out));
    EXPECT_FALSE(FrameCodec::encodeDataFrame(0, payload, 17, out));
    EXPECT_FALSE(FrameCodec::encodeDataFrame(0, nullptr, 16, out));
}

TEST(FrameCodecTest, DataFrameDecodeErrors) {
    uint8_t wire[FrameCodec::DATA_FRAME_SIZE] = {0x55, 0x00};
    DataFrame frame;

    EXPECT_EQ(FrameCodec::decodeDataFrame(wire, 19, frame), DecodeError::BadLength);

    wire[1] = 0x01;
    EXPECT_EQ(FrameCodec::decodeDataFrame(wire, sizeof(wire), frame), DecodeError::BadMarker);
}

TEST(FrameCodecTest, LooksLikeCompleteChecksPrefixOnly) {
    const uint8_t truncated[] = {0x5A, 0x06, 0x3A};
    const uint8_t progress[] = {0x5A, 0x07, 0x3A};

    EXPECT_TRUE(FrameCodec::looksLikeComplete(truncated, sizeof(truncated)));
    EXPECT_FALSE(FrameCodec::looksLikeComplete(progress, sizeof(progress)));
    EXPECT_FALSE(FrameCodec::looksLikeComplete(truncated, 1));
}

TEST(FrameCodecTest, OpcodeNames) {
    EXPECT_STREQ(FrameCodec::opcodeName(Opcode::Status), "Status");
    EXPECT_STREQ(FrameCodec::opcodeName(Opcode::Complete), "Complete");
}

TEST(FrameCodecTest, EveryOpcodeRoundTripsBoundaryWords) {
    const Opcode opcodes[] = {Opcode::Status, Opcode::Start, Opcode::Complete, Opcode::MidProgress};
    const uint16_t values[] = {0x0000, 0x0001, 0x7FFF, 0x8000, 0xFFFF};
    const size_t valueCount = sizeof(values) / sizeof(values[0]);

    for (Opcode opcode : opcodes) {
        // Rotate the values so each boundary lands in every word slot
        for (size_t shift = 0; shift < valueCount; shift++) {
            const uint16_t w1 = values[shift % valueCount];
            const uint16_t w2 = values[(shift + 1) % valueCount];
            const uint16_t w3 = values[(shift + 2) % valueCount];
            const uint16_t w4 = values[(shift + 3) % valueCount];
            const uint16_t w5 = values[(shift + 4) % valueCount];

            uint8_t out[FrameCodec::CONTROL_FRAME_SIZE];
            ASSERT_TRUE(FrameCodec::encodeControl(opcode, w1, w2, w3, w4, w5, out));
            EXPECT_EQ(out[0], FrameCodec::CONTROL_MARKER);
            EXPECT_EQ(out[1], static_cast<uint8_t>(opcode));
            EXPECT_EQ(out[2], w1 & 0xFF);
            EXPECT_EQ(out[3], w1 >> 8);

            ControlFrame frame;
            ASSERT_EQ(FrameCodec::decodeControl(out, sizeof(out), frame), DecodeError::None)
                << FrameCodec::opcodeName(opcode) << " shift " << shift;
            EXPECT_EQ(frame.opcode, opcode);
            EXPECT_EQ(frame.w1, w1);
            EXPECT_EQ(frame.w2, w2);
            EXPECT_EQ(frame.w3, w3);
            EXPECT_EQ(frame.w4, w4);
            EXPECT_EQ(frame.w5, w5);

            uint8_t again[FrameCodec::CONTROL_FRAME_SIZE];
            ASSERT_TRUE(FrameCodec::encodeControl(frame, again));
            EXPECT_EQ(bytes(again, sizeof(again)), bytes(out, sizeof(out)));
        }
    }
}

TEST(FrameCodecTest, OnlyKnownOpcodeBytesDecode) {
    for (int value = 0; value <= 0xFF; value++) {
        uint8_t wire[FrameCodec::CONTROL_FRAME_SIZE] = {FrameCodec::CONTROL_MARKER, static_cast<uint8_t>(value)};
        const bool known = value == 0x02 || value == 0x04 || value == 0x06 || value == 0x07;

        ControlFrame frame;
        const DecodeError err = FrameCodec::decodeControl(wire, sizeof(wire), frame);
        if (known) {
            EXPECT_EQ(err, DecodeError::None) << "opcode " << value;
            EXPECT_EQ(static_cast<int>(frame.opcode), value);
        } else {
            EXPECT_EQ(err, DecodeError::UnknownOpcode) << "opcode " << value;
        }
    }
}

TEST(FrameCodecTest, DataFramesRoundTripBoundaryIndices) {
    const uint16_t indices[] = {0x0000, 0x0001, 0x7FFF, 0x8000, 0xFFFE, 0xFFFF};

    for (uint16_t index : indices) {
        uint8_t payload[FrameCodec::DATA_PAYLOAD_SIZE];
        for (size_t i = 0; i < sizeof(payload); i++) {
            payload[i] = static_cast<uint8_t>(index ^ (i * 17));
        }

        uint8_t out[FrameCodec::DATA_FRAME_SIZE];
        ASSERT_TRUE(FrameCodec::encodeDataFrame(index, payload, sizeof(payload), out));
        EXPECT_EQ(out[2], index & 0xFF);
        EXPECT_EQ(out[3], index >> 8);

        DataFrame frame;
        ASSERT_EQ(FrameCodec::decodeDataFrame(out, sizeof(out), frame), DecodeError::None) << "index " << index;
        EXPECT_EQ(frame.index, index);
        EXPECT_EQ(bytes(frame.payload.data(), frame.payload.size()), bytes(payload, sizeof(payload)));
    }
}
