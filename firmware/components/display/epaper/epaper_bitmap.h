/**
 * @file epaper_bitmap.h
 * @brief Panel geometry and the packed 1-bit frame the driver sends.
 *
 * @details
 * Bitmap layout (same as the controller RAM):
 *
 *     byte 0        byte 1              byte W/8-1
 *     b7 ... b0     b7 ... b0    ...    b7 ... b0     <- row 0
 *     x=0   x=7     x=8  x=15                 x=W-1
 *
 *     bit = 1  -> white
 *     bit = 0  -> black
 *
 * Rows follow each other with no padding, so size = W/8 * H.
 */

#pragma once

#include <stddef.h>
#include <stdint.h>
#include <vector>


/**
 * @brief Pixel dimensions of a panel. Width must be a multiple of 8.
 */
struct PanelGeometry {
    uint32_t width;
    uint32_t height;

    bool isValid() const {
        return width > 0 && height > 0 && (width % 8) == 0;
    }

    size_t bytesPerRow() const { return width / 8; }

    size_t bufferSize() const { return bytesPerRow() * (size_t)height; }
};


/**
 * @brief The 7.5" panel this firmware targets.
 */
#define EPAPER_WIDTH    800
#define EPAPER_HEIGHT   480


/**
 * @brief A packed frame, row-major, MSB first, 1 = white.
 */
struct Bitmap {
    PanelGeometry geometry;
    std::vector<uint8_t> data;
};
