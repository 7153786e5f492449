/**
 * @file frame_codec.cpp
 * @brief Resize, threshold and pack (ESP-IDF).
 */

#include "frame_codec.h"
#include <algorithm>
#include <esp_log.h>


static const char* TAG = "FRAME_CODEC";


size_t pixelFormatBits(PixelFormat format) {
    switch (format) {
        case PIXEL_GRAY8:      return 8;
        case PIXEL_RGB888:     return 24;
        case PIXEL_RGBA8888:   return 32;
        case PIXEL_GRAY16:     return 16;
        case PIXEL_RGB161616:  return 48;
        case PIXEL_GRAYA88:    return 16;
        case PIXEL_BGR888:     return 24;
        case PIXEL_BGRA8888:   return 32;
        case PIXEL_INDEXED1:   return 1;
        case PIXEL_INDEXED2:   return 2;
        case PIXEL_INDEXED4:   return 4;
        case PIXEL_INDEXED8:   return 8;
        default:               return 0;
    }
}


size_t pixelRowBytes(PixelFormat format, uint32_t width) {
    return ((size_t)width * pixelFormatBits(format) + 7) / 8;
}


bool pixelFormatIndexed(PixelFormat format) {
    return format == PIXEL_INDEXED1 || format == PIXEL_INDEXED2 ||
           format == PIXEL_INDEXED4 || format == PIXEL_INDEXED8;
}


bool pixelFormatForIndexDepth(uint32_t depth, PixelFormat* format) {
    switch (depth) {
        case 1:  *format = PIXEL_INDEXED1; return true;
        case 2:  *format = PIXEL_INDEXED2; return true;
        case 4:  *format = PIXEL_INDEXED4; return true;
        case 8:  *format = PIXEL_INDEXED8; return true;
        default: return false;
    }
}


uint8_t frameLuma(uint8_t r, uint8_t g, uint8_t b) {
    return (uint8_t)((299u * r + 587u * g + 114u * b) / 1000u);
}


/*
 * Luma of pixel i of a row. For 16-bit formats the high byte of each
 * big-endian sample is the sample >> 8.
 */
static uint8_t sampleLuma(const uint8_t* row, uint32_t i, PixelFormat format, size_t bits,
                          const uint8_t* palette, uint32_t paletteEntries) {
    if (pixelFormatIndexed(format)) {
        const size_t bitPos = (size_t)i * bits;
        const uint32_t shift = (uint32_t)(8 - bits - (bitPos % 8));
        uint32_t index = (row[bitPos / 8] >> shift) & ((1u << bits) - 1);
        if (index >= paletteEntries) index = 0;
        const uint8_t* rgb = palette + index * 3;
        return frameLuma(rgb[0], rgb[1], rgb[2]);
    }

    const uint8_t* p = row + (size_t)i * (bits / 8);
    switch (format) {
        case PIXEL_GRAY8:
        case PIXEL_GRAY16:
        case PIXEL_GRAYA88:
            return frameLuma(p[0], p[0], p[0]);
        case PIXEL_RGB888:
        case PIXEL_RGBA8888:
            return frameLuma(p[0], p[1], p[2]);
        case PIXEL_RGB161616:
            return frameLuma(p[0], p[2], p[4]);
        case PIXEL_BGR888:
        case PIXEL_BGRA8888:
            return frameLuma(p[2], p[1], p[0]);
        default:
            return 0;
    }
}


/*
 * =============================================================================
 * STREAMING ENCODER
 * =============================================================================
 */
FrameEncoder::FrameEncoder(const PanelGeometry& target, uint8_t threshold, bool invert, Bitmap* out)
    : target(target),
      threshold(threshold),
      invert(invert),
      out(out),
      srcWidth(0),
      srcHeight(0)
{
}


esp_err_t FrameEncoder::begin(uint32_t srcWidth, uint32_t srcHeight) {
    this->srcWidth = 0;
    this->srcHeight = 0;

    if (out == nullptr) return ESP_ERR_INVALID_ARG;

    if (!target.isValid()) {
        ESP_LOGE(TAG, "Invalid target %ux%u", (unsigned)target.width, (unsigned)target.height);
        return ESP_ERR_INVALID_ARG;
    }
    if (srcWidth == 0 || srcHeight == 0) {
        ESP_LOGE(TAG, "Empty source image");
        return ESP_ERR_INVALID_ARG;
    }

    out->geometry = target;
    out->data.assign(target.bufferSize(), 0x00);

    // srcX = ((2x + 1) * srcW) / (2 * panelW), computed once per axis.
    srcColumn.resize(target.width);
    for (uint32_t x = 0; x < target.width; x++) {
        srcColumn[x] = (uint32_t)(((uint64_t)(2 * (uint64_t)x + 1) * srcWidth) / (2 * (uint64_t)target.width));
    }
    srcRow.resize(target.height);
    for (uint32_t y = 0; y < target.height; y++) {
        srcRow[y] = (uint32_t)(((uint64_t)(2 * (uint64_t)y + 1) * srcHeight) / (2 * (uint64_t)target.height));
    }

    this->srcWidth = srcWidth;
    this->srcHeight = srcHeight;
    return ESP_OK;
}


esp_err_t FrameEncoder::pushRows(uint32_t x0, uint32_t y0, uint32_t width, uint32_t rows,
                                 const uint8_t* pixels, size_t stride, PixelFormat format,
                                 const uint8_t* palette, uint32_t paletteEntries) {
    if (srcWidth == 0) return ESP_ERR_INVALID_STATE;

    const size_t bits = pixelFormatBits(format);
    if (pixels == nullptr || bits == 0) return ESP_ERR_INVALID_ARG;
    if (pixelFormatIndexed(format) && (palette == nullptr || paletteEntries == 0)) {
        ESP_LOGE(TAG, "Indexed pixels without a palette");
        return ESP_ERR_INVALID_ARG;
    }
    if (width == 0 || rows == 0) return ESP_OK;

    const uint64_t xEnd = (uint64_t)x0 + width;
    const uint64_t yEnd = (uint64_t)y0 + rows;

    // Panel columns / rows whose source falls inside this rectangle
    const size_t firstX = std::lower_bound(srcColumn.begin(), srcColumn.end(), x0) - srcColumn.begin();
    const size_t firstY = std::lower_bound(srcRow.begin(), srcRow.end(), y0) - srcRow.begin();
    const size_t bytesPerRow = target.bytesPerRow();

    for (size_t y = firstY; y < srcRow.size() && srcRow[y] < yEnd; y++) {
        const uint8_t* src = pixels + (size_t)(srcRow[y] - y0) * stride;
        uint8_t* dstRow = out->data.data() + y * bytesPerRow;

        for (size_t x = firstX; x < srcColumn.size() && srcColumn[x] < xEnd; x++) {
            bool white = sampleLuma(src, srcColumn[x] - x0, format, bits, palette, paletteEntries) >= threshold;
            if (invert) white = !white;

            const uint8_t mask = (uint8_t)(0x80 >> (x % 8));
            if (white) {
                dstRow[x / 8] |= mask;
            } else {
                dstRow[x / 8] &= (uint8_t)~mask;
            }
        }
    }
    return ESP_OK;
}


/*
 * =============================================================================
 * WHOLE IMAGES
 * =============================================================================
 */
esp_err_t frameEncode(const DecodedImage& image, const PanelGeometry& target,
                      uint8_t threshold, bool invert, Bitmap* out) {
    if (pixelFormatBits(image.format) == 0) {
        ESP_LOGE(TAG, "Unknown pixel format %d", (int)image.format);
        return ESP_ERR_INVALID_ARG;
    }

    const size_t stride = pixelRowBytes(image.format, image.width);
    if (image.pixels.size() < stride * image.height) {
        ESP_LOGE(TAG, "Pixel buffer too short (%u < %u)",
                 (unsigned)image.pixels.size(), (unsigned)(stride * image.height));
        return ESP_ERR_INVALID_ARG;
    }

    FrameEncoder encoder(target, threshold, invert, out);
    esp_err_t err = encoder.begin(image.width, image.height);
    if (err != ESP_OK) return err;

    err = encoder.pushRows(0, 0, image.width, image.height, image.pixels.data(), stride, image.format,
                           image.palette.data(), (uint32_t)(image.palette.size() / 3));
    if (err != ESP_OK) return err;

    ESP_LOGD(TAG, "Encoded %ux%u -> %ux%u (threshold %u%s)",
             (unsigned)image.width, (unsigned)image.height,
             (unsigned)target.width, (unsigned)target.height,
             threshold, invert ? ", inverted" : "");
    return ESP_OK;
}


void bitmapFill(const PanelGeometry& geometry, bool white, Bitmap* out) {
    out->geometry = geometry;
    out->data.assign(geometry.bufferSize(), white ? 0xFF : 0x00);
}
