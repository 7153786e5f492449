/**
 * @file spi_bus_transport.cpp
 * @brief Chunked data writes and BUSY polling (ESP-IDF).
 */

/*
 * =============================================================================
 * WHY CHUNKS?
 * =============================================================================
 *
 * An 800x480 frame is 48,000 bytes. The SPI master refuses anything
 * larger than the bus' max_transfer_sz (DMA descriptor limit), so a frame
 * goes out as a series of transactions:
 *
 *     offset 0      4096     8192            45056   48000
 *            |------|--------|---- ... ------|-------|
 *             chunk0  chunk1                  chunk11 (2944 bytes)
 *
 * DC stays HIGH for the whole run. The controller's RAM address counter
 * keeps advancing across transactions, so the split is invisible to it.
 *
 * =============================================================================
 */

#include "spi_bus_transport.h"
#include <esp_log.h>


static const char* TAG = "SPI_BUS";


SpiBusTransport::SpiBusTransport(size_t maxTransferSize)
    : maxChunk(maxTransferSize > 0 ? maxTransferSize : 1)
{
}


esp_err_t SpiBusTransport::writeCommandByte(uint8_t code) {
    esp_err_t err = setLine(LINE_DC, false);  // Command mode
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "DC line failed: %s", esp_err_to_name(err));
        return err;
    }

    err = transmit(&code, 1);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Command 0x%02X failed: %s", code, esp_err_to_name(err));
    }
    return err;
}


esp_err_t SpiBusTransport::writeDataChunk(const uint8_t* data, size_t len, size_t* written) {
    size_t offset = 0;
    if (written) *written = 0;

    if (len == 0) return ESP_OK;
    if (data == nullptr) return ESP_ERR_INVALID_ARG;

    esp_err_t err = setLine(LINE_DC, true);  // Data mode
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "DC line failed: %s", esp_err_to_name(err));
        return err;
    }

    while (offset < len) {
        size_t chunk = len - offset;
        if (chunk > maxChunk) chunk = maxChunk;

        err = transmit(data + offset, chunk);
        if (err != ESP_OK) {
            ESP_LOGE(TAG, "Data chunk at offset %u/%u failed: %s",
                     (unsigned)offset, (unsigned)len, esp_err_to_name(err));
            if (written) *written = offset;
            return err;
        }
        offset += chunk;
    }

    ESP_LOGD(TAG, "Sent %u bytes in %u chunk(s)",
             (unsigned)len, (unsigned)((len + maxChunk - 1) / maxChunk));
    if (written) *written = offset;
    return ESP_OK;
}


/*
 * BUSY is active-HIGH. We sample, sleep pollMs, and sample again. There is
 * no interrupt on this line, and a refresh takes seconds, so a 10ms poll
 * costs nothing and keeps the task from hogging the CPU.
 */
esp_err_t SpiBusTransport::waitWhileBusy(uint32_t pollMs, uint32_t timeoutMs) {
    uint32_t start = uptimeMs();

    ESP_LOGD(TAG, "Waiting for BUSY...");
    while (readBusyLine()) {
        if (uptimeMs() - start >= timeoutMs) {
            ESP_LOGE(TAG, "BUSY still high after %u ms", (unsigned)timeoutMs);
            return ESP_ERR_TIMEOUT;
        }
        delayMs(pollMs);
    }
    ESP_LOGD(TAG, "BUSY released after %u ms", (unsigned)(uptimeMs() - start));
    return ESP_OK;
}


esp_err_t SpiBusTransport::pulseReset(uint32_t settleMs) {
    esp_err_t err = setLine(LINE_RESET, false);
    if (err != ESP_OK) return err;
    delayMs(settleMs);

    err = setLine(LINE_RESET, true);
    if (err != ESP_OK) return err;
    delayMs(settleMs);

    return ESP_OK;
}


esp_err_t SpiBusTransport::setPowerEnable(bool on) {
    if (!hasPowerLine()) return ESP_OK;
    return setLine(LINE_POWER, on);
}
