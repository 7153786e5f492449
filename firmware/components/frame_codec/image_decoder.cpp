/**
 * @file image_decoder.cpp
 * @brief Signature dispatch over the BMP, PNG and JPEG decoders (ESP-IDF).
 */

#include "image_decoder.h"
#include "bmp_decoder.h"
#include "jpeg_decoder.h"
#include "png_decoder.h"
#include <esp_log.h>


static const char* TAG = "IMAGE";


ImageFormat imageSniff(const uint8_t* data, size_t len) {
    if (bmpIsBitmap(data, len)) return IMAGE_BMP;
    if (pngIsPng(data, len)) return IMAGE_PNG;
    if (jpegIsJpeg(data, len)) return IMAGE_JPEG;
    return IMAGE_UNKNOWN;
}


const char* imageFormatName(ImageFormat format) {
    switch (format) {
        case IMAGE_BMP:  return "BMP";
        case IMAGE_PNG:  return "PNG";
        case IMAGE_JPEG: return "JPEG";
        default:         return "unknown";
    }
}


esp_err_t imageStream(const uint8_t* data, size_t len, FrameEncoder* encoder) {
    if (data == nullptr || encoder == nullptr) return ESP_ERR_INVALID_ARG;

    const ImageFormat format = imageSniff(data, len);
    ESP_LOGI(TAG, "%s image, %u bytes", imageFormatName(format), (unsigned)len);

    switch (format) {
        case IMAGE_BMP:  return bmpStream(data, len, encoder);
        case IMAGE_PNG:  return pngStream(data, len, encoder);
        case IMAGE_JPEG: return jpegStream(data, len, encoder);
        default:
            if (len >= 4) {
                ESP_LOGE(TAG, "Unrecognised image signature %02X %02X %02X %02X",
                         data[0], data[1], data[2], data[3]);
            } else {
                ESP_LOGE(TAG, "Image too short to recognise (%u bytes)", (unsigned)len);
            }
            return ESP_ERR_NOT_SUPPORTED;
    }
}
