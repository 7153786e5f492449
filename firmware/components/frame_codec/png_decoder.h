/**
 * @file png_decoder.h
 * @brief PNG files into a FrameEncoder, one scanline at a time (PNGdec).
 *
 * @details
 * Every PNG colour type at 8 bits, indexed and grayscale at 1/2/4 bits,
 * and grayscale or truecolour at 16 bits. Scanlines are passed on as
 * PNGdec produces them, so only PNGdec's own buffers are in RAM.
 *
 * @note PNGdec holds one decoded scanline in PNG_MAX_BUFFERED_PIXELS.
 *       Its default covers 800 pixels of RGB, not of RGBA.
 */

#pragma once

#include "frame_codec.h"
#include <esp_err.h>
#include <stddef.h>
#include <stdint.h>


/**
 * @brief True if the buffer starts with the 8-byte PNG signature.
 */
bool pngIsPng(const uint8_t* data, size_t len);


/**
 * @brief Decode a complete PNG file held in memory into an encoder.
 *
 * @return ESP_OK,
 *         ESP_ERR_INVALID_ARG for null pointers or a missing signature,
 *         ESP_ERR_NOT_SUPPORTED for 16-bit colour types with alpha,
 *         ESP_ERR_NO_MEM if the decoder cannot be allocated,
 *         ESP_FAIL if PNGdec rejects the data (code in the log),
 *         or the encoder's error.
 */
esp_err_t pngStream(const uint8_t* data, size_t len, FrameEncoder* encoder);
