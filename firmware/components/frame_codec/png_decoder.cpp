/**
 * @file png_decoder.cpp
 * @brief PNG scanlines into the frame encoder (ESP-IDF, PNGdec).
 */

#include "png_decoder.h"
#include <new>
#include <PNGdec.h>
#include <esp_log.h>


static const char* TAG = "PNG";


static const uint8_t PNG_SIGNATURE[8] = { 0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A };


bool pngIsPng(const uint8_t* data, size_t len) {
    if (data == nullptr || len < sizeof(PNG_SIGNATURE)) return false;
    for (size_t i = 0; i < sizeof(PNG_SIGNATURE); i++) {
        if (data[i] != PNG_SIGNATURE[i]) return false;
    }
    return true;
}


/**
 * @brief State shared with the draw callback through PNGDRAW::pUser.
 */
struct PngContext {
    FrameEncoder* encoder;
    PixelFormat format;
    bool filePalette;               ///< Take the palette from PNGdec (colour type 3)
    uint8_t grayRamp[16 * 3];       ///< Palette for 1/2/4-bit grayscale
    uint32_t grayEntries;
    esp_err_t err;
};


/*
 * Pick the row format for a colour type and bit depth. Grayscale below
 * 8 bits reads as indexed pixels over an evenly spaced gray ramp.
 */
static esp_err_t pngRowFormat(int pixelType, int bitDepth, PngContext* ctx) {
    ctx->filePalette = false;
    ctx->grayEntries = 0;

    switch (pixelType) {
        case PNG_PIXEL_INDEXED:
            if (!pixelFormatForIndexDepth((uint32_t)bitDepth, &ctx->format)) break;
            ctx->filePalette = true;
            return ESP_OK;

        case PNG_PIXEL_GRAYSCALE:
            if (bitDepth == 8)  { ctx->format = PIXEL_GRAY8;  return ESP_OK; }
            if (bitDepth == 16) { ctx->format = PIXEL_GRAY16; return ESP_OK; }
            if (!pixelFormatForIndexDepth((uint32_t)bitDepth, &ctx->format)) break;

            ctx->grayEntries = 1u << bitDepth;
            for (uint32_t i = 0; i < ctx->grayEntries; i++) {
                const uint8_t level = (uint8_t)((i * 255) / (ctx->grayEntries - 1));
                ctx->grayRamp[i * 3 + 0] = level;
                ctx->grayRamp[i * 3 + 1] = level;
                ctx->grayRamp[i * 3 + 2] = level;
            }
            return ESP_OK;

        case PNG_PIXEL_TRUECOLOR:
            if (bitDepth == 8)  { ctx->format = PIXEL_RGB888;    return ESP_OK; }
            if (bitDepth == 16) { ctx->format = PIXEL_RGB161616; return ESP_OK; }
            break;

        case PNG_PIXEL_GRAY_ALPHA:
            if (bitDepth == 8) { ctx->format = PIXEL_GRAYA88; return ESP_OK; }
            break;

        case PNG_PIXEL_TRUECOLOR_ALPHA:
            if (bitDepth == 8) { ctx->format = PIXEL_RGBA8888; return ESP_OK; }
            break;

        default:
            break;
    }

    ESP_LOGE(TAG, "Colour type %d at %d bits not supported", pixelType, bitDepth);
    return ESP_ERR_NOT_SUPPORTED;
}


/* Called by PNGdec once per scanline. Returning 0 stops the decode. */
static int pngDraw(PNGDRAW* pDraw) {
    PngContext* ctx = (PngContext*)pDraw->pUser;

    const uint8_t* palette = nullptr;
    uint32_t entries = 0;
    if (ctx->filePalette) {
        palette = pDraw->pPalette;
        entries = 256;
    } else if (ctx->grayEntries != 0) {
        palette = ctx->grayRamp;
        entries = ctx->grayEntries;
    }

    ctx->err = ctx->encoder->pushRows(0, (uint32_t)pDraw->y, (uint32_t)pDraw->iWidth, 1,
                                      pDraw->pPixels, 0, ctx->format, palette, entries);
    return ctx->err == ESP_OK ? 1 : 0;
}


/*
 * =============================================================================
 * DECODE
 * =============================================================================
 */
static esp_err_t pngRun(PNG& png, const uint8_t* data, size_t len, FrameEncoder* encoder) {
    // PNGdec only reads through this pointer.
    int rc = png.openRAM(const_cast<uint8_t*>(data), (int)len, pngDraw);
    if (rc != PNG_SUCCESS) {
        ESP_LOGE(TAG, "PNGdec could not open the file (code %d)", rc);
        return ESP_FAIL;
    }

    const int width = png.getWidth();
    const int height = png.getHeight();
    ESP_LOGI(TAG, "Decoding %dx%d, colour type %d, %d-bit",
             width, height, png.getPixelType(), png.getBpp());

    PngContext ctx;
    ctx.encoder = encoder;
    ctx.err = ESP_OK;

    esp_err_t err = pngRowFormat(png.getPixelType(), png.getBpp(), &ctx);
    if (err == ESP_OK && (width <= 0 || height <= 0)) err = ESP_ERR_INVALID_SIZE;
    if (err == ESP_OK) err = encoder->begin((uint32_t)width, (uint32_t)height);
    if (err != ESP_OK) {
        png.close();
        return err;
    }

    rc = png.decode(&ctx, 0);
    const int lastError = png.getLastError();
    png.close();

    if (ctx.err != ESP_OK) return ctx.err;
    if (rc != PNG_SUCCESS) {
        ESP_LOGE(TAG, "PNGdec stopped (code %d)", lastError);
        return ESP_FAIL;
    }
    return ESP_OK;
}


esp_err_t pngStream(const uint8_t* data, size_t len, FrameEncoder* encoder) {
    if (encoder == nullptr || !pngIsPng(data, len)) {
        ESP_LOGE(TAG, "Not a PNG file");
        return ESP_ERR_INVALID_ARG;
    }

    // PNGdec keeps its inflate window inside the object: far too big for a task stack.
    PNG* png = new (std::nothrow) PNG();
    if (png == nullptr) {
        ESP_LOGE(TAG, "No memory for the PNG decoder (%u bytes)", (unsigned)sizeof(PNG));
        return ESP_ERR_NO_MEM;
    }

    esp_err_t err = pngRun(*png, data, len, encoder);
    delete png;
    return err;
}
