/**
 * @file frame_codec.h
 * @brief Decoded image -> packed 1-bit panel frame.
 *
 * @details
 * The panel only knows black and white. This component takes any decoded
 * image, scales it to the panel with nearest-neighbour sampling,
 * thresholds the luma and packs 8 pixels per byte.
 *
 * No I/O: same input gives the same bytes, every time. The driver's
 * double write depends on that (it sends ~frame then frame).
 */

/*
 * =============================================================================
 * BEGINNER'S GUIDE: FROM PIXELS TO BITS
 * =============================================================================
 *
 * 1. RESIZE (nearest neighbour)
 *
 *     Each panel pixel copies the source pixel under its centre:
 *
 *         srcX = ((2 * x + 1) * srcWidth) / (2 * panelWidth)
 *
 *     No smoothing, so the output is pixel-exact and predictable.
 *
 * 2. LUMA (ITU-R 601 weights, integers only)
 *
 *         luma = (299 * R + 587 * G + 114 * B) / 1000
 *
 *     16-bit samples are cut to 8 bits first (>> 8). Indexed pixels
 *     use their palette colour. Alpha is ignored.
 *
 * 3. THRESHOLD
 *
 *         white = (luma >= threshold)
 *         dark mode flips it: white = (luma < threshold)
 *
 * 4. PACK (MSB first, 1 = white)
 *
 *         pixels:  B W W W W W W W
 *         byte:    0 1 1 1 1 1 1 1  = 0x7F
 *
 * =============================================================================
 */

#pragma once

#include "epaper_bitmap.h"
#include <esp_err.h>
#include <stddef.h>
#include <stdint.h>
#include <vector>


/**
 * @brief Layout of pixel rows.
 *
 * 16-bit samples are big-endian. Indexed formats are packed MSB first
 * and look their colour up in an RGB palette. Rows never share a byte.
 */
enum PixelFormat {
    PIXEL_GRAY8,
    PIXEL_RGB888,
    PIXEL_RGBA8888,
    PIXEL_GRAY16,
    PIXEL_RGB161616,
    PIXEL_GRAYA88,
    PIXEL_BGR888,
    PIXEL_BGRA8888,
    PIXEL_INDEXED1,
    PIXEL_INDEXED2,
    PIXEL_INDEXED4,
    PIXEL_INDEXED8
};


/**
 * @brief An image already decoded from its container, row-major.
 *
 * Rows are pixelRowBytes(format, width) long with no extra padding.
 */
struct DecodedImage {
    uint32_t width;
    uint32_t height;
    PixelFormat format;
    std::vector<uint8_t> pixels;
    std::vector<uint8_t> palette;   ///< R, G, B per entry (indexed formats only)
};


/**
 * @brief Bits per pixel of a format, 0 if unknown.
 */
size_t pixelFormatBits(PixelFormat format);


/**
 * @brief Bytes in one unpadded row of `width` pixels.
 */
size_t pixelRowBytes(PixelFormat format, uint32_t width);


/**
 * @brief True for the palette formats.
 */
bool pixelFormatIndexed(PixelFormat format);


/**
 * @brief Indexed format for a bit depth of 1, 2, 4 or 8. False otherwise.
 */
bool pixelFormatForIndexDepth(uint32_t depth, PixelFormat* format);


/**
 * @brief Integer luma of an 8-bit RGB triple.
 */
uint8_t frameLuma(uint8_t r, uint8_t g, uint8_t b);


/*
 * =============================================================================
 * STREAMING ENCODER
 * =============================================================================
 *
 * Decoders hand over pixels in whatever pieces they produce: a BMP row
 * straight from the file, a PNG scanline, a JPEG block of MCUs. Each
 * piece is sampled into the frame at once, so the full source image is
 * never held in RAM.
 *
 *     FrameEncoder encoder(panel, 128, false, &frame);
 *     encoder.begin(srcWidth, srcHeight);
 *     encoder.pushRows(0, y, srcWidth, 1, row, 0, PIXEL_GRAY8);   // any order
 *
 * Panel pixels whose source pixel never arrives stay black.
 */
class FrameEncoder {

public:

    /**
     * @param target Panel geometry (width must be a multiple of 8).
     * @param threshold Luma at or above which a pixel is white.
     * @param invert Dark mode: swap black and white.
     * @param out Receives exactly target.bufferSize() bytes. Must outlive the encoder.
     */
    FrameEncoder(const PanelGeometry& target, uint8_t threshold, bool invert, Bitmap* out);


    /**
     * @brief Start a frame for a source of the given size.
     *
     * @return ESP_OK, or ESP_ERR_INVALID_ARG for a bad geometry, an empty
     *         source or a null out.
     */
    esp_err_t begin(uint32_t srcWidth, uint32_t srcHeight);


    /**
     * @brief Sample a rectangle of source pixels into the frame.
     *
     * @param x0,y0 Source position of the first pixel.
     * @param width,rows Size of the rectangle. Parts outside the source are ignored.
     * @param pixels First row of the rectangle.
     * @param stride Bytes from one row to the next (unused when rows is 1).
     * @param palette R, G, B per entry for indexed formats.
     * @param paletteEntries Entries in palette. Indices past the end read entry 0.
     *
     * @return ESP_OK,
     *         ESP_ERR_INVALID_STATE before begin(),
     *         ESP_ERR_INVALID_ARG for null pixels, an unknown format or an
     *         indexed format without a palette.
     */
    esp_err_t pushRows(uint32_t x0, uint32_t y0, uint32_t width, uint32_t rows,
                       const uint8_t* pixels, size_t stride, PixelFormat format,
                       const uint8_t* palette = nullptr, uint32_t paletteEntries = 0);


    uint32_t sourceWidth() const { return srcWidth; }

    uint32_t sourceHeight() const { return srcHeight; }


private:

    PanelGeometry target;
    uint8_t threshold;
    bool invert;
    Bitmap* out;

    uint32_t srcWidth;
    uint32_t srcHeight;

    // Source column / row under every panel column / row (non-decreasing).
    std::vector<uint32_t> srcColumn;
    std::vector<uint32_t> srcRow;
};


/**
 * @brief Convert a whole decoded image into a panel frame.
 *
 * @param image Source image, any size.
 * @param target Panel geometry (width must be a multiple of 8).
 * @param threshold Luma at or above which a pixel is white.
 * @param invert Dark mode: swap black and white.
 * @param out Receives exactly target.bufferSize() bytes.
 *
 * @return ESP_OK, or ESP_ERR_INVALID_ARG for a bad geometry, an empty
 *         image, a short pixel buffer, a missing palette or a null out.
 */
esp_err_t frameEncode(const DecodedImage& image, const PanelGeometry& target,
                      uint8_t threshold, bool invert, Bitmap* out);


/**
 * @brief Solid frame (all white or all black).
 */
void bitmapFill(const PanelGeometry& geometry, bool white, Bitmap* out);
