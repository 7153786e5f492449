/**
 * @file bmp_decoder.h
 * @brief In-memory Windows BMP decoder feeding the frame codec.
 *
 * @details
 * TRMNL servers render screens as 1-bit 800x480 BMP files. This decoder
 * reads a downloaded BMP either into a DecodedImage or, row by row,
 * straight into a FrameEncoder.
 *
 * Supported:
 * - 1, 4, 8-bit palettised, 24-bit and 32-bit pixels
 * - BI_RGB, and BI_BITFIELDS with the standard 8:8:8 masks (32-bit)
 * - bottom-up (positive height) and top-down (negative height) rows
 *
 * Palettised pixels stay packed (PIXEL_INDEXED1/4/8 plus the palette), so
 * a 1-bit 800x480 image decodes to 48000 bytes. 24/32-bit files decode to
 * PIXEL_BGR888 / PIXEL_BGRA8888.
 *
 * @note bmpStream() needs no pixel buffer at all. Prefer it on boards
 *       without PSRAM.
 */

#pragma once

#include "frame_codec.h"
#include <esp_err.h>
#include <stddef.h>
#include <stdint.h>


/**
 * @brief True if the buffer starts with the "BM" signature.
 */
bool bmpIsBitmap(const uint8_t* data, size_t len);


/**
 * @brief Decode a complete BMP file held in memory.
 *
 * @return ESP_OK,
 *         ESP_ERR_INVALID_ARG for null pointers or a missing signature,
 *         ESP_ERR_INVALID_SIZE for truncated data, header sizes past the
 *         end of the file or absurd dimensions,
 *         ESP_ERR_NOT_SUPPORTED for compression or bit depths not listed above,
 *         ESP_ERR_NO_MEM if the pixel buffer cannot be allocated.
 */
esp_err_t bmpDecode(const uint8_t* data, size_t len, DecodedImage* out);


/**
 * @brief Feed a complete BMP file to an encoder, one file row at a time.
 *
 * Calls encoder->begin() with the image size first.
 *
 * @return Same as bmpDecode() (never ESP_ERR_NO_MEM), or the encoder's error.
 */
esp_err_t bmpStream(const uint8_t* data, size_t len, FrameEncoder* encoder);
