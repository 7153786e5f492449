/**
 * @file image_decoder.h
 * @brief Pick a decoder by file signature and stream the image into a frame.
 *
 * @details
 *     "BM"               -> bmpStream   (built in)
 *     89 50 4E 47 ...    -> pngStream   (PNGdec)
 *     FF D8 FF           -> jpegStream  (JPEGDEC)
 *     anything else      -> ESP_ERR_NOT_SUPPORTED
 *
 * The file extension or server-side filename is never trusted.
 */

#pragma once

#include "frame_codec.h"
#include <esp_err.h>
#include <stddef.h>
#include <stdint.h>


enum ImageFormat {
    IMAGE_UNKNOWN,
    IMAGE_BMP,
    IMAGE_PNG,
    IMAGE_JPEG
};


/**
 * @brief Container format from the first bytes of a file.
 */
ImageFormat imageSniff(const uint8_t* data, size_t len);


const char* imageFormatName(ImageFormat format);


/**
 * @brief Decode any supported image file into the encoder's frame.
 *
 * @return ESP_OK,
 *         ESP_ERR_INVALID_ARG for null pointers,
 *         ESP_ERR_NOT_SUPPORTED for an unrecognised signature,
 *         or the chosen decoder's error.
 */
esp_err_t imageStream(const uint8_t* data, size_t len, FrameEncoder* encoder);
