#include "PrintJob.hpp"
#include "LxLog.hpp"
#include <algorithm>
#include <cstring>

size_t PrintJob::blockCountFor(size_t imageLen) {
    return (imageLen + FrameCodec::DATA_PAYLOAD_SIZE - 1) / FrameCodec::DATA_PAYLOAD_SIZE;
}

PrintError PrintJob::fromImage(const uint8_t* image, size_t len, uint16_t copies, PrintJob& out) {
    if (image == nullptr || len == 0) {
        LXPRINT_LOG_ERROR("PrintJob: empty image\n");
        return PrintError::EmptyImage;
    }

    size_t count = blockCountFor(len);
    if (count > FrameCodec::MAX_BLOCK_COUNT) {
        LXPRINT_LOG_ERROR("PrintJob: image of %lu bytes needs %lu blocks (max %lu)\n",
                          static_cast<unsigned long>(len), static_cast<unsigned long>(count),
                          static_cast<unsigned long>(FrameCodec::MAX_BLOCK_COUNT));
        return PrintError::ImageTooLarge;
    }

    PrintJob job;
    job.m_copies = copies;
    job.m_blocks.resize(count);

    for (size_t i = 0; i < count; i++) {
        size_t offset = i * FrameCodec::DATA_PAYLOAD_SIZE;
        size_t chunk = std::min(FrameCodec::DATA_PAYLOAD_SIZE, len - offset);
        Block& block = job.m_blocks[i];
        block.fill(0);
        memcpy(block.data(), image + offset, chunk);
    }

    LXPRINT_LOG_DEBUG("PrintJob: %lu bytes -> %lu blocks, copies %u\n",
                      static_cast<unsigned long>(len), static_cast<unsigned long>(count), static_cast<unsigned>(copies));

    out = std::move(job);
    return PrintError::None;
}
