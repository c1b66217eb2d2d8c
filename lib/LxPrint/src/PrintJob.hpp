#pragma once

#include "FrameCodec.hpp"
#include "PrintTypes.hpp"
#include <array>
#include <cstdint>
#include <cstddef>
#include <vector>

/**
 * PrintJob - One print request split into 16-byte blocks
 *
 * The last block is zero-padded. The block count must fit the 16-bit index
 * field of a data frame.
 */
class PrintJob {
public:
    using Block = std::array<uint8_t, FrameCodec::DATA_PAYLOAD_SIZE>;

    PrintJob() = default;

    /**
     * Build a job from raw image bytes
     * @param image Rasterized image data
     * @param len Image length in bytes
     * @param copies Copy count / job id sent in the Start frame
     * @param out Receives the job on success
     * @return None, EmptyImage or ImageTooLarge
     */
    static PrintError fromImage(const uint8_t* image, size_t len, uint16_t copies, PrintJob& out);

    // Number of blocks an image of imageLen bytes splits into
    static size_t blockCountFor(size_t imageLen);

    uint16_t blockCount() const { return static_cast<uint16_t>(m_blocks.size()); }
    uint16_t copies() const { return m_copies; }
    const Block& block(size_t index) const { return m_blocks[index]; }
    bool empty() const { return m_blocks.empty(); }

private:
    std::vector<Block> m_blocks;
    uint16_t m_copies = FrameCodec::DEFAULT_COPIES;
};
