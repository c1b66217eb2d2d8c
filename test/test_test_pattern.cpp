#include "TestPattern.hpp"
#include "PrintJob.hpp"
#include <gtest/gtest.h>

TEST(TestPatternTest, SizeIsRowBytesTimesRows) {
    std::vector<uint8_t> raster = makeTestPattern(384, 120);
    EXPECT_EQ(raster.size(), 48u * 120u);
}

TEST(TestPatternTest, EmptyForDegenerateDimensions) {
    EXPECT_TRUE(makeTestPattern(0, 10).empty());
    EXPECT_TRUE(makeTestPattern(7, 10).empty());
    EXPECT_TRUE(makeTestPattern(384, 0).empty());
}

TEST(TestPatternTest, BorderRowsAndColumnsAreBlack) {
    const size_t rowBytes = 48;
    const size_t rows = 40;
    std::vector<uint8_t> raster = makeTestPattern(384, rows);

    for (size_t x = 0; x < rowBytes; x++) {
        EXPECT_EQ(raster[x], 0xFF);
        EXPECT_EQ(raster[(rows - 1) * rowBytes + x], 0xFF);
    }
    for (size_t y = 0; y < rows; y++) {
        EXPECT_EQ(raster[y * rowBytes] & 0x80, 0x80) << "row " << y;
        EXPECT_EQ(raster[y * rowBytes + rowBytes - 1] & 0x01, 0x01) << "row " << y;
    }
}

TEST(TestPatternTest, CheckerboardFlipsEveryEightRows) {
    const size_t rowBytes = 48;
    std::vector<uint8_t> raster = makeTestPattern(384, 40);

    EXPECT_EQ(raster[1 * rowBytes + 1], 0x00);
    EXPECT_EQ(raster[1 * rowBytes + 2], 0xFF);
    EXPECT_EQ(raster[8 * rowBytes + 1], 0xFF);
    EXPECT_EQ(raster[8 * rowBytes + 2], 0x00);
}

TEST(TestPatternTest, DefaultPageFitsOneJob) {
    std::vector<uint8_t> raster = makeTestPattern(384, 120);

    PrintJob job;
    ASSERT_EQ(PrintJob::fromImage(raster.data(), raster.size(), 1, job), PrintError::None);
    EXPECT_EQ(job.blockCount(), 360);
}
