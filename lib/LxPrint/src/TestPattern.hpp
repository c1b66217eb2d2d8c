#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>

/**
 * Test raster for bring-up: 1 bit per dot, MSB first, 1 = black.
 *
 * The pattern is a black border around an 8x8-dot checkerboard,
 * which makes dropped or reordered blocks visible on paper.
 *
 * @param widthDots Print head width in dots (384 on 58 mm heads), rounded down to whole bytes
 * @param rows Number of raster rows
 * @return widthDots / 8 * rows bytes, empty if either dimension is zero
 */
std::vector<uint8_t> makeTestPattern(uint16_t widthDots, uint16_t rows);
