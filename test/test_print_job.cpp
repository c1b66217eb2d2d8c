#include "PrintJob.hpp"
#include <gtest/gtest.h>
#include <vector>

TEST(PrintJobTest, BlockCountIsCeilingOfSixteenthLength) {
    EXPECT_EQ(PrintJob::blockCountFor(0), 0u);
    EXPECT_EQ(PrintJob::blockCountFor(1), 1u);
    EXPECT_EQ(PrintJob::blockCountFor(16), 1u);
    EXPECT_EQ(PrintJob::blockCountFor(17), 2u);
    EXPECT_EQ(PrintJob::blockCountFor(928), 58u);
}

TEST(PrintJobTest, SplitsImageIntoOrderedBlocks) {
    std::vector<uint8_t> image(928);
    for (size_t i = 0; i < image.size(); i++) {
        image[i] = static_cast<uint8_t>(i * 7);
    }

    PrintJob job;
    ASSERT_EQ(PrintJob::fromImage(image.data(), image.size(), 1, job), PrintError::None);
    ASSERT_EQ(job.blockCount(), 58);
    EXPECT_EQ(job.copies(), 1);
    EXPECT_FALSE(job.empty());

    for (size_t b = 0; b < job.blockCount(); b++) {
        for (size_t i = 0; i < 16; i++) {
            ASSERT_EQ(job.block(b)[i], image[b * 16 + i]) << "block " << b << " byte " << i;
        }
    }
}

TEST(PrintJobTest, LastBlockIsZeroPadded) {
    std::vector<uint8_t> image(20, 0xAB);

    PrintJob job;
    ASSERT_EQ(PrintJob::fromImage(image.data(), image.size(), 1, job), PrintError::None);
    ASSERT_EQ(job.blockCount(), 2);

    const PrintJob::Block& last = job.block(1);
    for (size_t i = 0; i < 4; i++) {
        EXPECT_EQ(last[i], 0xAB);
    }
    for (size_t i = 4; i < last.size(); i++) {
        EXPECT_EQ(last[i], 0x00);
    }
}

TEST(PrintJobTest, CarriesCopies) {
    const uint8_t image[] = {0xFF};

    PrintJob job;
    ASSERT_EQ(PrintJob::fromImage(image, sizeof(image), 3, job), PrintError::None);
    EXPECT_EQ(job.copies(), 3);
    EXPECT_EQ(job.blockCount(), 1);
}

TEST(PrintJobTest, RejectsEmptyImage) {
    const uint8_t image[] = {0x00};
    PrintJob job;

    EXPECT_EQ(PrintJob::fromImage(nullptr, 10, 1, job), PrintError::EmptyImage);
    EXPECT_EQ(PrintJob::fromImage(image, 0, 1, job), PrintError::EmptyImage);
    EXPECT_TRUE(job.empty());
}

TEST(PrintJobTest, AcceptsLargestIndexableImage) {
    std::vector<uint8_t> image(65535 * 16, 0x11);

    PrintJob job;
    ASSERT_EQ(PrintJob::fromImage(image.data(), image.size(), 1, job), PrintError::None);
    EXPECT_EQ(job.blockCount(), 65535);
}

TEST(PrintJobTest, RejectsImageNeedingMoreThan65535Blocks) {
    std::vector<uint8_t> image(65535 * 16 + 1, 0x11);

    PrintJob job;
    EXPECT_EQ(PrintJob::fromImage(image.data(), image.size(), 1, job), PrintError::ImageTooLarge);
    EXPECT_TRUE(job.empty());

    image.resize(65536 * 16);
    EXPECT_EQ(PrintJob::fromImage(image.data(), image.size(), 1, job), PrintError::ImageTooLarge);
}
