/**
 * @file main.cpp
 * @brief TRMNL display firmware: fetch, render, sleep, repeat (ESP-IDF).
 *
 * @details
 * One refresh cycle:
 *
 *     GET /api/display → image_url, refresh_rate
 *     GET image_url    → BMP / PNG / JPEG bytes
 *     imageStream      → 1-bit Bitmap (threshold, dark mode), decoded
 *                        piece by piece straight into the frame
 *     EPaper           → init (if asleep) → displayFull → sleep
 *     wait refresh_rate seconds
 *
 * Any failure logs, waits TRMNL_RETRY_DELAY_SEC and starts over. The
 * panel keeps showing the last good image in the meantime.
 */

#include <stdio.h>
#include <string>
#include <vector>
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"
#include "esp_log.h"
#include "app_config.h"
#include "api_key.h"
#include "epaper.h"
#include "esp_spi_bus.h"
#include "frame_codec.h"
#include "image_decoder.h"
#include "nvs_store.h"
#include "trmnl_client.h"
#include "wifi_station.h"


static const char* TAG = "TRMNL_APP";


/*
 * =============================================================================
 * ONE CYCLE
 * =============================================================================
 *
 * Returns how many seconds to wait before the next cycle.
 */
static int processNextImage(TrmnlClient& client, EPaper& display) {
    DisplayDescriptor descriptor;
    esp_err_t err = client.fetchDisplay(&descriptor);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Error fetching display: %s", esp_err_to_name(err));
        return TRMNL_RETRY_DELAY_SEC;
    }

    Bitmap frame;
    {
        std::vector<uint8_t> body;
        err = client.downloadImage(descriptor.imageUrl, &body);
        if (err != ESP_OK) {
            ESP_LOGE(TAG, "Error downloading image: %s", esp_err_to_name(err));
            return TRMNL_RETRY_DELAY_SEC;
        }

        FrameEncoder encoder(display.geometry(), TRMNL_THRESHOLD, TRMNL_DARK_MODE != 0, &frame);
        err = imageStream(body.data(), body.size(), &encoder);
        if (err != ESP_OK) {
            ESP_LOGE(TAG, "Error decoding %s: %s", descriptor.filename.c_str(), esp_err_to_name(err));
            return TRMNL_RETRY_DELAY_SEC;
        }
    }   // downloaded bytes freed here

    if (display.state() != EPAPER_AWAKE) {
        err = display.init();
        if (err != ESP_OK) {
            ESP_LOGE(TAG, "Error waking display: %s", epaperErrToName(err));
            return TRMNL_RETRY_DELAY_SEC;
        }
    }

    int waitSec = descriptor.refreshRateSec;
    err = display.displayFull(frame);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Error displaying image: %s (bus: %s)",
                 epaperErrToName(err), esp_err_to_name(display.lastBusError()));
        waitSec = TRMNL_RETRY_DELAY_SEC;
    } else {
        ESP_LOGI(TAG, "Image displayed");
    }

    // Deep sleep between refreshes. The image stays without power.
    esp_err_t sleepErr = display.sleep();
    if (sleepErr != ESP_OK) {
        ESP_LOGW(TAG, "Display sleep failed: %s", epaperErrToName(sleepErr));
    }

    return waitSec;
}


/*
 * One second per vTaskDelay, so no refresh_rate can overflow the tick math.
 */
static void waitSeconds(int seconds) {
    for (int i = 0; i < seconds; i++) {
        vTaskDelay(pdMS_TO_TICKS(1000));
    }
}


extern "C" void app_main(void) {
    ESP_LOGI(TAG, "=== trmnl-display %s ===", TRMNL_CLIENT_VERSION);
    ESP_LOGI(TAG, "Dark mode: %s, threshold: %d", TRMNL_DARK_MODE ? "on" : "off", TRMNL_THRESHOLD);

    /*
     * =========================================================================
     * SETTINGS
     * =========================================================================
     */
    esp_err_t err = NvsStore::initFlash();
    if (err != ESP_OK) return;

    std::string apiKey;
    {
        NvsStore store(NVS_STORE_NAMESPACE);
        err = store.begin();
        if (err != ESP_OK) return;

        err = apiKeyLoad(store, TRMNL_API_KEY, &apiKey);
        if (err != ESP_OK) {
            ESP_LOGE(TAG, "TRMNL API key not set (build once with -DTRMNL_API_KEY=\\\"...\\\")");
            return;
        }
    }

    /*
     * =========================================================================
     * NETWORK
     * =========================================================================
     */
    WifiStation wifi(TRMNL_WIFI_SSID, TRMNL_WIFI_PASSWORD);
    err = wifi.connect(TRMNL_WIFI_TIMEOUT_MS);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Wi-Fi failed: %s", esp_err_to_name(err));
        return;
    }

    /*
     * =========================================================================
     * PANEL
     * =========================================================================
     */
    EspSpiBusConfig busConfig = {};
    busConfig.pins.mosi = (gpio_num_t)EPAPER_MOSI;
    busConfig.pins.sck = (gpio_num_t)EPAPER_SCK;
    busConfig.pins.cs = (gpio_num_t)EPAPER_CS;
    busConfig.pins.dc = (gpio_num_t)EPAPER_DC;
    busConfig.pins.rst = (gpio_num_t)EPAPER_RST;
    busConfig.pins.busy = (gpio_num_t)EPAPER_BUSY;
    busConfig.pins.power = (gpio_num_t)EPAPER_PWR;
    busConfig.host = SPI2_HOST;
    busConfig.clockHz = ESP_SPI_BUS_DEFAULT_CLOCK_HZ;
    busConfig.maxTransferSize = ESP_SPI_BUS_MAX_TRANSFER_SIZE;

    EspSpiBus bus(busConfig);
    err = bus.begin();
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Display bus init failed: %s", esp_err_to_name(err));
        return;
    }

    EPaper display(bus, PanelGeometry{EPAPER_WIDTH, EPAPER_HEIGHT});
    err = display.init();
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Display init failed: %s (bus: %s)",
                 epaperErrToName(err), esp_err_to_name(display.lastBusError()));
        return;
    }

    ESP_LOGI(TAG, "Clearing e-ink display...");
    err = display.clear();
    if (err != ESP_OK) {
        ESP_LOGW(TAG, "Clear failed: %s", epaperErrToName(err));
    }

    /*
     * =========================================================================
     * MAIN LOOP
     * =========================================================================
     */
    TrmnlClient client(TRMNL_BASE_URL, apiKey.c_str());

    while (1) {
        int waitSec;
        if (wifi.isConnected()) {
            waitSec = processNextImage(client, display);
        } else {
            // The station reconnects on its own; skip this cycle.
            ESP_LOGW(TAG, "No Wi-Fi, skipping this refresh");
            waitSec = TRMNL_RETRY_DELAY_SEC;
        }
        ESP_LOGI(TAG, "Next refresh in %d s", waitSec);
        waitSeconds(waitSec);
    }
}
