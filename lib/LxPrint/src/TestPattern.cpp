#include "TestPattern.hpp"

std::vector<uint8_t> makeTestPattern(uint16_t widthDots, uint16_t rows) {
    const size_t rowBytes = widthDots / 8;
    std::vector<uint8_t> raster;
    if (rowBytes == 0 || rows == 0) {
        return raster;
    }

    raster.assign(rowBytes * rows, 0x00);

    for (size_t y = 0; y < rows; y++) {
        uint8_t* row = raster.data() + y * rowBytes;

        if (y == 0 || y + 1 == rows) {
            for (size_t x = 0; x < rowBytes; x++) {
                row[x] = 0xFF;
            }
            continue;
        }

        for (size_t x = 0; x < rowBytes; x++) {
            // Cell colour flips every byte and every 8 rows
            row[x] = (((x + y / 8) % 2) == 0) ? 0xFF : 0x00;
        }
        row[0] |= 0x80;
        row[rowBytes - 1] |= 0x01;
    }

    return raster;
}
