/**
 * @file wifi_station.h
 * @brief Minimal Wi-Fi station bring-up for ESP32 (ESP-IDF).
 *
 * @details
 * Connects to one access point and waits for an IP address. Reconnects
 * on its own after a disconnect. Nothing more: the TRMNL client only
 * needs a working network interface.
 *
 * @par Usage
 *     WifiStation wifi("my-ssid", "secret");
 *     if (wifi.connect(20000) != ESP_OK) { ... }
 */

#pragma once

#include <esp_err.h>
#include <esp_event.h>
#include <freertos/FreeRTOS.h>
#include <freertos/event_groups.h>
#include <stdint.h>


/**
 * @class WifiStation
 * @brief One STA connection, event driven, blocking connect().
 */
class WifiStation {

public:

    WifiStation(const char* ssid, const char* password);

    ~WifiStation();

    /**
     * @brief Bring up netif, event loop and STA, then wait for an IP.
     *
     * NVS must already be initialised (NvsStore::initFlash()): the Wi-Fi
     * driver keeps its calibration data there.
     *
     * @param timeoutMs How long to wait for IP_EVENT_STA_GOT_IP.
     *
     * @return ESP_OK, ESP_ERR_TIMEOUT, or the esp_wifi/netif error.
     */
    esp_err_t connect(uint32_t timeoutMs);

    /**
     * @brief True while the station holds an IP address.
     */
    bool isConnected() const;


private:

    const char* ssid;
    const char* password;
    EventGroupHandle_t events;
    esp_event_handler_instance_t wifiHandler;
    esp_event_handler_instance_t ipHandler;
    bool started;


    /**
     * @brief Static trampoline for esp_event (arg = this).
     */
    static void eventHandler(void* arg, esp_event_base_t base, int32_t id, void* data);

    WifiStation(const WifiStation&) = delete;
    WifiStation& operator=(const WifiStation&) = delete;
};
