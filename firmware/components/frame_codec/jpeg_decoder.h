/**
 * @file jpeg_decoder.h
 * @brief JPEG files into a FrameEncoder, one MCU block at a time (JPEGDEC).
 *
 * @details
 * Baseline JPEGs are decoded straight to 8-bit grayscale, which is all
 * the threshold needs. Progressive JPEGs are not supported by JPEGDEC.
 */

#pragma once

#include "frame_codec.h"
#include <esp_err.h>
#include <stddef.h>
#include <stdint.h>


/**
 * @brief True if the buffer starts with a JPEG SOI marker (FF D8 FF).
 */
bool jpegIsJpeg(const uint8_t* data, size_t len);


/**
 * @brief Decode a complete JPEG file held in memory into an encoder.
 *
 * @return ESP_OK,
 *         ESP_ERR_INVALID_ARG for null pointers or a missing signature,
 *         ESP_ERR_NO_MEM if the decoder cannot be allocated,
 *         ESP_FAIL if JPEGDEC rejects the data (code in the log),
 *         or the encoder's error.
 */
esp_err_t jpegStream(const uint8_t* data, size_t len, FrameEncoder* encoder);
