/**
 * @file bmp_decoder.cpp
 * @brief BMP parsing (ESP-IDF).
 */

/*
 * =============================================================================
 * BMP FILE LAYOUT (all fields little-endian)
 * =============================================================================
 *
 *     offset  size  field
 *     ──────  ────  ─────
 *      0       2    "BM"
 *     10       4    offset of pixel data
 *     14       4    info header size (40 = BITMAPINFOHEADER, 108, 124...)
 *     18       4    width
 *     22       4    height (negative = rows stored top-down)
 *     26       2    planes (1)
 *     28       2    bits per pixel
 *     30       4    compression (0 = BI_RGB, 3 = BI_BITFIELDS)
 *     46       4    colours used (0 = 2^bpp)
 *     54       ...  BI_BITFIELDS masks, then palette (B, G, R, 0 per entry)
 *
 *     Every pixel row is padded to a multiple of 4 bytes.
 *
 * =============================================================================
 */

#include "bmp_decoder.h"
#include <esp_heap_caps.h>
#include <esp_log.h>
#include <string.h>


static const char* TAG = "BMP";


#define BMP_FILE_HEADER_SIZE    14
#define BMP_INFO_HEADER_MIN     40
#define BMP_BI_RGB              0
#define BMP_BI_BITFIELDS        3
#define BMP_MAX_DIMENSION       8192


static uint16_t read16(const uint8_t* p) {
    return (uint16_t)(p[0] | (p[1] << 8));
}


static uint32_t read32(const uint8_t* p) {
    return (uint32_t)p[0] | ((uint32_t)p[1] << 8) | ((uint32_t)p[2] << 16) | ((uint32_t)p[3] << 24);
}


bool bmpIsBitmap(const uint8_t* data, size_t len) {
    return data != nullptr && len >= 2 && data[0] == 'B' && data[1] == 'M';
}


/**
 * @brief Where the rows are and how to read them, checked against len.
 */
struct BmpLayout {
    uint32_t width;
    uint32_t height;
    bool topDown;
    PixelFormat format;
    size_t dataOffset;
    size_t rowSize;                 ///< File row, padded to 4 bytes
    uint8_t palette[256 * 3];       ///< R, G, B per entry
    uint32_t paletteEntries;
};


static esp_err_t bmpParse(const uint8_t* data, size_t len, BmpLayout* layout) {
    if (!bmpIsBitmap(data, len)) {
        ESP_LOGE(TAG, "Not a BMP file");
        return ESP_ERR_INVALID_ARG;
    }
    if (len < BMP_FILE_HEADER_SIZE + BMP_INFO_HEADER_MIN) {
        ESP_LOGE(TAG, "Truncated header (%u bytes)", (unsigned)len);
        return ESP_ERR_INVALID_SIZE;
    }

    const uint32_t dataOffset  = read32(data + 10);
    const uint32_t infoSize    = read32(data + 14);
    const int32_t width        = (int32_t)read32(data + 18);
    const int32_t rawHeight    = (int32_t)read32(data + 22);
    const uint16_t depth       = read16(data + 28);
    const uint32_t compression = read32(data + 30);
    const uint32_t colorsUsed  = read32(data + 46);

    if (infoSize < BMP_INFO_HEADER_MIN) {
        ESP_LOGE(TAG, "OS/2 style header (%u) not supported", (unsigned)infoSize);
        return ESP_ERR_NOT_SUPPORTED;
    }
    // Checked before any offset is built from it
    if (infoSize > len - BMP_FILE_HEADER_SIZE) {
        ESP_LOGE(TAG, "Info header (%u bytes) runs past the file (%u bytes)",
                 (unsigned)infoSize, (unsigned)len);
        return ESP_ERR_INVALID_SIZE;
    }

    const bool topDown = rawHeight < 0;
    const int64_t absHeight = topDown ? -(int64_t)rawHeight : (int64_t)rawHeight;
    if (width <= 0 || absHeight == 0 || width > BMP_MAX_DIMENSION || absHeight > BMP_MAX_DIMENSION) {
        ESP_LOGE(TAG, "Bad dimensions %dx%d", (int)width, (int)rawHeight);
        return ESP_ERR_INVALID_SIZE;
    }

    /*
     * -------------------------------------------------------------------------
     * Pixel format
     * -------------------------------------------------------------------------
     */
    PixelFormat format;
    if (depth == 24) {
        format = PIXEL_BGR888;
    } else if (depth == 32) {
        format = PIXEL_BGRA8888;
    } else if (depth == 2 || !pixelFormatForIndexDepth(depth, &format)) {
        ESP_LOGE(TAG, "Unsupported depth %u", depth);
        return ESP_ERR_NOT_SUPPORTED;
    }

    if (compression == BMP_BI_BITFIELDS) {
        // Only the layout identical to BI_RGB 32-bit is accepted.
        if (depth != 32 || len < BMP_FILE_HEADER_SIZE + BMP_INFO_HEADER_MIN + 12 ||
            read32(data + 54) != 0x00FF0000 ||
            read32(data + 58) != 0x0000FF00 ||
            read32(data + 62) != 0x000000FF) {
            ESP_LOGE(TAG, "Unsupported BI_BITFIELDS masks");
            return ESP_ERR_NOT_SUPPORTED;
        }
    } else if (compression != BMP_BI_RGB) {
        ESP_LOGE(TAG, "Compressed BMP (%u) not supported", (unsigned)compression);
        return ESP_ERR_NOT_SUPPORTED;
    }

    /*
     * -------------------------------------------------------------------------
     * Palette (1/4/8-bit only)
     * -------------------------------------------------------------------------
     */
    layout->paletteEntries = 0;
    if (depth <= 8) {
        uint32_t entries = colorsUsed ? colorsUsed : (1u << depth);
        if (entries > (1u << depth)) entries = 1u << depth;

        const size_t paletteOffset = BMP_FILE_HEADER_SIZE + infoSize;
        if ((size_t)entries * 4 > len - paletteOffset) {
            ESP_LOGE(TAG, "Truncated palette");
            return ESP_ERR_INVALID_SIZE;
        }

        for (uint32_t i = 0; i < entries; i++) {
            const uint8_t* entry = data + paletteOffset + i * 4;
            layout->palette[i * 3 + 0] = entry[2];  // R
            layout->palette[i * 3 + 1] = entry[1];  // G
            layout->palette[i * 3 + 2] = entry[0];  // B
        }
        layout->paletteEntries = entries;
    }

    /*
     * -------------------------------------------------------------------------
     * Pixel rows
     * -------------------------------------------------------------------------
     */
    const size_t rowSize = (((size_t)width * depth + 31) / 32) * 4;
    const size_t height = (size_t)absHeight;
    if ((size_t)dataOffset > len || rowSize * height > len - dataOffset) {
        ESP_LOGE(TAG, "Truncated pixel data (need %u bytes at %u, have %u)",
                 (unsigned)(rowSize * height), (unsigned)dataOffset, (unsigned)len);
        return ESP_ERR_INVALID_SIZE;
    }

    layout->width = (uint32_t)width;
    layout->height = (uint32_t)height;
    layout->topDown = topDown;
    layout->format = format;
    layout->dataOffset = dataOffset;
    layout->rowSize = rowSize;
    return ESP_OK;
}


/* File row holding image row `row` (image rows count from the top). */
static const uint8_t* bmpRow(const uint8_t* data, const BmpLayout& layout, uint32_t row) {
    const uint32_t fileRow = layout.topDown ? row : (layout.height - 1 - row);
    return data + layout.dataOffset + (size_t)fileRow * layout.rowSize;
}


esp_err_t bmpDecode(const uint8_t* data, size_t len, DecodedImage* out) {
    if (out == nullptr) return ESP_ERR_INVALID_ARG;

    BmpLayout layout;
    esp_err_t err = bmpParse(data, len, &layout);
    if (err != ESP_OK) return err;

    // Components build without exceptions: check the heap before the vector grows.
    const size_t rowBytes = pixelRowBytes(layout.format, layout.width);
    const size_t pixelBytes = rowBytes * layout.height;
    out->pixels.clear();
    out->pixels.shrink_to_fit();
    if (heap_caps_get_largest_free_block(MALLOC_CAP_8BIT) < pixelBytes) {
        ESP_LOGE(TAG, "No memory for %ux%u image (%u bytes)",
                 (unsigned)layout.width, (unsigned)layout.height, (unsigned)pixelBytes);
        return ESP_ERR_NO_MEM;
    }
    out->pixels.resize(pixelBytes);

    // Indexed rows stay packed; only the 4-byte padding goes.
    for (uint32_t row = 0; row < layout.height; row++) {
        memcpy(out->pixels.data() + (size_t)row * rowBytes, bmpRow(data, layout, row), rowBytes);
    }

    out->width = layout.width;
    out->height = layout.height;
    out->format = layout.format;
    out->palette.assign(layout.palette, layout.palette + (size_t)layout.paletteEntries * 3);

    ESP_LOGI(TAG, "Decoded %ux%u, %u bytes of pixels",
             (unsigned)layout.width, (unsigned)layout.height, (unsigned)pixelBytes);
    return ESP_OK;
}


esp_err_t bmpStream(const uint8_t* data, size_t len, FrameEncoder* encoder) {
    if (encoder == nullptr) return ESP_ERR_INVALID_ARG;

    BmpLayout layout;
    esp_err_t err = bmpParse(data, len, &layout);
    if (err != ESP_OK) return err;

    err = encoder->begin(layout.width, layout.height);
    if (err != ESP_OK) return err;

    // Rows go straight from the file into the frame.
    for (uint32_t row = 0; row < layout.height; row++) {
        err = encoder->pushRows(0, row, layout.width, 1, bmpRow(data, layout, row), layout.rowSize,
                                layout.format, layout.palette, layout.paletteEntries);
        if (err != ESP_OK) return err;
    }

    ESP_LOGI(TAG, "Streamed %ux%u BMP into the frame", (unsigned)layout.width, (unsigned)layout.height);
    return ESP_OK;
}
