/**
 * @file jpeg_decoder.cpp
 * @brief JPEG blocks into the frame encoder (ESP-IDF, JPEGDEC).
 */

#include "jpeg_decoder.h"
#include <new>
#include <JPEGDEC.h>
#include <esp_log.h>


static const char* TAG = "JPEG";


bool jpegIsJpeg(const uint8_t* data, size_t len) {
    return data != nullptr && len >= 3 && data[0] == 0xFF && data[1] == 0xD8 && data[2] == 0xFF;
}


/**
 * @brief State shared with the draw callback through JPEGDRAW::pUser.
 */
struct JpegContext {
    FrameEncoder* encoder;
    esp_err_t err;
};


/*
 * Called by JPEGDEC once per block of MCUs. With EIGHT_BIT_GRAYSCALE the
 * block is one byte per pixel, iWidth bytes per row. Blocks on the right
 * and bottom edges can reach past the image; the encoder ignores that part.
 */
static int jpegDraw(JPEGDRAW* pDraw) {
    JpegContext* ctx = (JpegContext*)pDraw->pUser;

    const int width = pDraw->iWidthUsed > 0 ? pDraw->iWidthUsed : pDraw->iWidth;
    if (pDraw->x < 0 || pDraw->y < 0 || width <= 0 || pDraw->iHeight <= 0) return 1;

    ctx->err = ctx->encoder->pushRows((uint32_t)pDraw->x, (uint32_t)pDraw->y,
                                      (uint32_t)width, (uint32_t)pDraw->iHeight,
                                      (const uint8_t*)pDraw->pPixels, (size_t)pDraw->iWidth,
                                      PIXEL_GRAY8);
    return ctx->err == ESP_OK ? 1 : 0;
}


/*
 * =============================================================================
 * DECODE
 * =============================================================================
 */
static esp_err_t jpegRun(JPEGDEC& jpeg, const uint8_t* data, size_t len, FrameEncoder* encoder) {
    // JPEGDEC only reads through this pointer.
    if (jpeg.openRAM(const_cast<uint8_t*>(data), (int)len, jpegDraw) != 1) {
        ESP_LOGE(TAG, "JPEGDEC could not open the file (code %d)", jpeg.getLastError());
        return ESP_FAIL;
    }

    const int width = jpeg.getWidth();
    const int height = jpeg.getHeight();
    ESP_LOGI(TAG, "Decoding %dx%d", width, height);

    esp_err_t err = (width <= 0 || height <= 0) ? ESP_ERR_INVALID_SIZE
                                                : encoder->begin((uint32_t)width, (uint32_t)height);
    if (err != ESP_OK) {
        jpeg.close();
        return err;
    }

    JpegContext ctx;
    ctx.encoder = encoder;
    ctx.err = ESP_OK;

    jpeg.setPixelType(EIGHT_BIT_GRAYSCALE);
    jpeg.setUserPointer(&ctx);
    const int ok = jpeg.decode(0, 0, 0);
    const int lastError = jpeg.getLastError();
    jpeg.close();

    if (ctx.err != ESP_OK) return ctx.err;
    if (ok != 1) {
        ESP_LOGE(TAG, "JPEGDEC stopped (code %d)", lastError);
        return ESP_FAIL;
    }
    return ESP_OK;
}


esp_err_t jpegStream(const uint8_t* data, size_t len, FrameEncoder* encoder) {
    if (encoder == nullptr || !jpegIsJpeg(data, len)) {
        ESP_LOGE(TAG, "Not a JPEG file");
        return ESP_ERR_INVALID_ARG;
    }

    // JPEGDEC keeps its Huffman tables and MCU buffers inside the object.
    JPEGDEC* jpeg = new (std::nothrow) JPEGDEC();
    if (jpeg == nullptr) {
        ESP_LOGE(TAG, "No memory for the JPEG decoder (%u bytes)", (unsigned)sizeof(JPEGDEC));
        return ESP_ERR_NO_MEM;
    }

    esp_err_t err = jpegRun(*jpeg, data, len, encoder);
    delete jpeg;
    return err;
}
