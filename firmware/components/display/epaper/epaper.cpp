/**
 * @file epaper.cpp
 * @brief E-Paper panel driver implementation (ESP-IDF).
 *
 * @details
 * Implements the controller command protocol for 800x480 B/W panels:
 * init sequence, double-write full refresh and deep sleep.
 */

#include "epaper.h"
#include <esp_heap_caps.h>
#include <esp_log.h>


static const char* TAG = "EPAPER";


/*
 * =============================================================================
 * CONTROLLER COMMAND DEFINITIONS
 * =============================================================================
 *
 * Note that 0x10 and 0x12 mean different things depending on WHEN they
 * are sent: 0x12 right after reset is a soft reset, after the image data
 * it starts the refresh. 0x10 is the "previous image" plane while
 * writing, and deep sleep when followed by the 0x01 mode byte at the end.
 */

#define CMD_DRIVER_OUTPUT_CONTROL       0x01
#define CMD_GATE_DRIVING_VOLTAGE        0x03
#define CMD_SOURCE_DRIVING_VOLTAGE      0x04
#define CMD_DATA_ENTRY_MODE             0x11
#define CMD_SW_RESET                    0x12
#define CMD_SET_RAM_X_START_END         0x44
#define CMD_SET_RAM_Y_START_END         0x45
#define CMD_SET_RAM_X_ADDRESS           0x4E
#define CMD_SET_RAM_Y_ADDRESS           0x4F
#define CMD_WRITE_OLD_IMAGE             0x10
#define CMD_WRITE_NEW_IMAGE             0x13
#define CMD_DISPLAY_REFRESH             0x12
#define CMD_DEEP_SLEEP_MODE             0x10

#define GATE_VOLTAGE_VGH                0x17
#define DATA_ENTRY_X_INC_Y_INC          0x03
#define DEEP_SLEEP_MODE_1               0x01

#define POWER_SETTLE_MS                 10
#define RESET_SETTLE_MS                 10
#define SLEEP_SETTLE_MS                 100


const char* epaperErrToName(esp_err_t err) {
    switch (err) {
        case EPAPER_ERR_INIT_FAILED:     return "EPAPER_ERR_INIT_FAILED";
        case EPAPER_ERR_TRANSFER_FAILED: return "EPAPER_ERR_TRANSFER_FAILED";
        case EPAPER_ERR_REFRESH_TIMEOUT: return "EPAPER_ERR_REFRESH_TIMEOUT";
        case EPAPER_ERR_SLEEP_FAILED:    return "EPAPER_ERR_SLEEP_FAILED";
        default:                         return esp_err_to_name(err);
    }
}


/*
 * =============================================================================
 * CONSTRUCTOR / DESTRUCTOR
 * =============================================================================
 */
EPaper::EPaper(BusTransport& bus, const PanelGeometry& geometry)
    : bus(bus),
      panelGeometry(geometry),
      panelState(EPAPER_UNINITIALIZED),
      busError(ESP_OK)
{
}


EPaper::~EPaper() {
    if (panelState == EPAPER_AWAKE) {
        esp_err_t err = sleep();
        if (err != ESP_OK) {
            ESP_LOGW(TAG, "Sleep on teardown failed: %s", epaperErrToName(err));
        }
    }
}


/*
 * =============================================================================
 * INITIALIZATION
 * =============================================================================
 */
esp_err_t EPaper::init() {
    if (panelState == EPAPER_AWAKE) {
        ESP_LOGE(TAG, "init() called while awake");
        return ESP_ERR_INVALID_STATE;
    }
    if (!panelGeometry.isValid()) {
        ESP_LOGE(TAG, "Invalid geometry %ux%u (width must be a multiple of 8)",
                 (unsigned)panelGeometry.width, (unsigned)panelGeometry.height);
        return ESP_ERR_INVALID_ARG;
    }
    if (panelGeometry.width > MAX_DIMENSION || panelGeometry.height > MAX_DIMENSION) {
        ESP_LOGE(TAG, "Geometry %ux%u exceeds the controller's 16-bit RAM window",
                 (unsigned)panelGeometry.width, (unsigned)panelGeometry.height);
        return ESP_ERR_INVALID_ARG;
    }

    ESP_LOGI(TAG, "Initializing E-Paper %ux%u",
             (unsigned)panelGeometry.width, (unsigned)panelGeometry.height);

    // Whatever happens next, the old register setup is gone.
    panelState = EPAPER_UNINITIALIZED;
    busError = ESP_OK;

    /*
     * -------------------------------------------------------------------------
     * STEP 1: Power and hardware reset
     * -------------------------------------------------------------------------
     */
    esp_err_t err = bus.setPowerEnable(true);
    if (err != ESP_OK) return failInit("power enable", err);
    bus.delayMs(POWER_SETTLE_MS);

    err = bus.pulseReset(RESET_SETTLE_MS);
    if (err != ESP_OK) return failInit("reset pulse", err);

    /*
     * -------------------------------------------------------------------------
     * STEP 2: Soft reset, wait for the controller to come back
     * -------------------------------------------------------------------------
     */
    err = sendCommand(CMD_SW_RESET);
    if (err != ESP_OK) return failInit("soft reset", err);

    err = bus.waitWhileBusy(BUSY_POLL_MS, RESET_TIMEOUT_MS);
    if (err != ESP_OK) return failInit("busy after soft reset", err);

    /*
     * -------------------------------------------------------------------------
     * STEP 3: Register setup
     * -------------------------------------------------------------------------
     */
    err = configureController();
    if (err != ESP_OK) return failInit("register setup", err);

    panelState = EPAPER_AWAKE;
    ESP_LOGI(TAG, "E-Paper initialized (frame: %u bytes)", (unsigned)panelGeometry.bufferSize());
    return ESP_OK;
}


/*
 * Parameter bytes are fixed by the geometry: gate count (H-1), source
 * window 0..W-1 and gate window 0..H-1, both little-endian 16-bit.
 * For 800x480 that is DF 01 / 1F 03 / DF 01.
 */
esp_err_t EPaper::configureController() {
    // init() bounds both dimensions to MAX_DIMENSION
    const uint16_t lastX = (uint16_t)(panelGeometry.width - 1);
    const uint16_t lastY = (uint16_t)(panelGeometry.height - 1);

    // Driver output control: gate lines, scan direction
    const uint8_t driverOutput[] = {
        (uint8_t)(lastY & 0xFF), (uint8_t)(lastY >> 8), 0x00
    };
    esp_err_t err = sendCommand(CMD_DRIVER_OUTPUT_CONTROL, driverOutput, sizeof(driverOutput));
    if (err != ESP_OK) return err;

    // Gate / source driving voltages (VGH, VSH1, VSH2, VSL)
    const uint8_t gateVoltage[] = { GATE_VOLTAGE_VGH };
    err = sendCommand(CMD_GATE_DRIVING_VOLTAGE, gateVoltage, sizeof(gateVoltage));
    if (err != ESP_OK) return err;

    const uint8_t sourceVoltage[] = { 0x41, 0xA8, 0x32 };
    err = sendCommand(CMD_SOURCE_DRIVING_VOLTAGE, sourceVoltage, sizeof(sourceVoltage));
    if (err != ESP_OK) return err;

    // Data entry mode: X increment, Y increment
    const uint8_t entryMode[] = { DATA_ENTRY_X_INC_Y_INC };
    err = sendCommand(CMD_DATA_ENTRY_MODE, entryMode, sizeof(entryMode));
    if (err != ESP_OK) return err;

    // RAM X window (pixels)
    const uint8_t xWindow[] = {
        0x00, 0x00, (uint8_t)(lastX & 0xFF), (uint8_t)(lastX >> 8)
    };
    err = sendCommand(CMD_SET_RAM_X_START_END, xWindow, sizeof(xWindow));
    if (err != ESP_OK) return err;

    // RAM Y window
    const uint8_t yWindow[] = {
        0x00, 0x00, (uint8_t)(lastY & 0xFF), (uint8_t)(lastY >> 8)
    };
    err = sendCommand(CMD_SET_RAM_Y_START_END, yWindow, sizeof(yWindow));
    if (err != ESP_OK) return err;

    // Address counters to the origin
    const uint8_t origin[] = { 0x00, 0x00 };
    err = sendCommand(CMD_SET_RAM_X_ADDRESS, origin, sizeof(origin));
    if (err != ESP_OK) return err;

    return sendCommand(CMD_SET_RAM_Y_ADDRESS, origin, sizeof(origin));
}


esp_err_t EPaper::failInit(const char* step, esp_err_t err) {
    busError = err;
    panelState = EPAPER_UNINITIALIZED;
    ESP_LOGE(TAG, "Init failed at %s: %s", step, esp_err_to_name(err));

    esp_err_t powerErr = bus.setPowerEnable(false);
    if (powerErr != ESP_OK) {
        ESP_LOGW(TAG, "Power release failed: %s", esp_err_to_name(powerErr));
    }
    return EPAPER_ERR_INIT_FAILED;
}


/*
 * =============================================================================
 * LOW-LEVEL
 * =============================================================================
 */

esp_err_t EPaper::sendCommand(uint8_t cmd, const uint8_t* params, size_t len) {
    esp_err_t err = bus.writeCommandByte(cmd);
    if (err != ESP_OK || len == 0) return err;

    size_t written = 0;
    err = bus.writeDataChunk(params, len, &written);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Data for 0x%02X stopped at %u/%u bytes", cmd, (unsigned)written, (unsigned)len);
    }
    return err;
}


/*
 * =============================================================================
 * DISPLAY UPDATE
 * =============================================================================
 */

esp_err_t EPaper::displayFull(const Bitmap& bitmap) {
    if (panelState != EPAPER_AWAKE) {
        ESP_LOGE(TAG, "displayFull() needs an awake panel (call init() first)");
        return ESP_ERR_INVALID_STATE;
    }

    const size_t frameSize = panelGeometry.bufferSize();
    if (bitmap.data.size() != frameSize) {
        ESP_LOGE(TAG, "Bitmap is %u bytes, panel expects %u",
                 (unsigned)bitmap.data.size(), (unsigned)frameSize);
        return ESP_ERR_INVALID_SIZE;
    }

    ESP_LOGI(TAG, "Updating display (this takes several seconds)...");

    esp_err_t err = writePreviousPlane(bitmap);
    if (err == ESP_ERR_NO_MEM) return err;
    if (err != ESP_OK) {
        busError = err;
        return EPAPER_ERR_TRANSFER_FAILED;
    }

    err = sendCommand(CMD_WRITE_NEW_IMAGE, bitmap.data.data(), frameSize);
    if (err != ESP_OK) {
        busError = err;
        return EPAPER_ERR_TRANSFER_FAILED;
    }

    err = sendCommand(CMD_DISPLAY_REFRESH);
    if (err != ESP_OK) {
        busError = err;
        return EPAPER_ERR_TRANSFER_FAILED;
    }

    err = bus.waitWhileBusy(BUSY_POLL_MS, REFRESH_TIMEOUT_MS);
    if (err != ESP_OK) {
        busError = err;
        ESP_LOGE(TAG, "Refresh did not finish: %s", esp_err_to_name(err));
        return err == ESP_ERR_TIMEOUT ? EPAPER_ERR_REFRESH_TIMEOUT : EPAPER_ERR_TRANSFER_FAILED;
    }

    ESP_LOGI(TAG, "Display update complete");
    return ESP_OK;
}


/*
 * "Previous" plane = inverse of the frame, so every pixel gets driven.
 * The inverse is built one transfer-sized block at a time instead of as
 * a second full frame.
 */
esp_err_t EPaper::writePreviousPlane(const Bitmap& bitmap) {
    const size_t frameSize = bitmap.data.size();
    size_t blockSize = bus.maxTransferSize();
    if (blockSize == 0) blockSize = 1;
    if (blockSize > frameSize) blockSize = frameSize;

    uint8_t* block = (uint8_t*)heap_caps_malloc(blockSize, MALLOC_CAP_8BIT);
    if (block == nullptr) {
        ESP_LOGE(TAG, "No memory for a %u byte transfer block", (unsigned)blockSize);
        return ESP_ERR_NO_MEM;
    }

    esp_err_t err = bus.writeCommandByte(CMD_WRITE_OLD_IMAGE);

    size_t offset = 0;
    while (err == ESP_OK && offset < frameSize) {
        size_t len = frameSize - offset;
        if (len > blockSize) len = blockSize;

        const uint8_t* src = bitmap.data.data() + offset;
        for (size_t i = 0; i < len; i++) {
            block[i] = (uint8_t)~src[i];
        }

        size_t written = 0;
        err = bus.writeDataChunk(block, len, &written);
        if (err != ESP_OK) {
            ESP_LOGE(TAG, "Previous plane stopped at %u/%u bytes",
                     (unsigned)(offset + written), (unsigned)frameSize);
        }
        offset += len;
    }

    heap_caps_free(block);
    return err;
}


esp_err_t EPaper::clear() {
    Bitmap white;
    white.geometry = panelGeometry;
    white.data.assign(panelGeometry.bufferSize(), 0xFF);
    return displayFull(white);
}


/*
 * =============================================================================
 * SLEEP
 * =============================================================================
 */

esp_err_t EPaper::sleep() {
    if (panelState == EPAPER_ASLEEP) return ESP_OK;
    if (panelState != EPAPER_AWAKE) {
        ESP_LOGE(TAG, "sleep() called before init()");
        return ESP_ERR_INVALID_STATE;
    }

    const uint8_t mode[] = { DEEP_SLEEP_MODE_1 };
    esp_err_t err = sendCommand(CMD_DEEP_SLEEP_MODE, mode, sizeof(mode));
    if (err != ESP_OK) {
        busError = err;
        return EPAPER_ERR_SLEEP_FAILED;
    }

    // The controller is asleep from here on, even if the power line fails.
    panelState = EPAPER_ASLEEP;
    bus.delayMs(SLEEP_SETTLE_MS);

    err = bus.setPowerEnable(false);
    if (err != ESP_OK) {
        busError = err;
        ESP_LOGE(TAG, "Power off failed: %s", esp_err_to_name(err));
        return EPAPER_ERR_SLEEP_FAILED;
    }

    ESP_LOGI(TAG, "Display entering deep sleep");
    return ESP_OK;
}
