/**
 * @file wifi_station.cpp
 * @brief Wi-Fi station implementation (ESP-IDF).
 */

/*
 * =============================================================================
 * HOW THE CONNECT WORKS
 * =============================================================================
 *
 * ESP-IDF Wi-Fi is event driven. connect() starts the driver and then
 * sleeps on an event group bit:
 *
 *     esp_wifi_start()
 *         → WIFI_EVENT_STA_START        → esp_wifi_connect()
 *         → WIFI_EVENT_STA_CONNECTED
 *         → IP_EVENT_STA_GOT_IP         → set CONNECTED_BIT  → connect() returns
 *
 *     WIFI_EVENT_STA_DISCONNECTED       → clear bit, esp_wifi_connect() again
 *
 * =============================================================================
 */

#include "wifi_station.h"
#include <esp_log.h>
#include <esp_netif.h>
#include <esp_wifi.h>
#include <string.h>


static const char* TAG = "WIFI";

#define CONNECTED_BIT   BIT0


WifiStation::WifiStation(const char* ssid, const char* password)
    : ssid(ssid),
      password(password),
      events(nullptr),
      wifiHandler(nullptr),
      ipHandler(nullptr),
      started(false)
{
}


WifiStation::~WifiStation() {
    if (wifiHandler) esp_event_handler_instance_unregister(WIFI_EVENT, ESP_EVENT_ANY_ID, wifiHandler);
    if (ipHandler) esp_event_handler_instance_unregister(IP_EVENT, IP_EVENT_STA_GOT_IP, ipHandler);
    if (started) esp_wifi_stop();
    if (events) vEventGroupDelete(events);
}


esp_err_t WifiStation::connect(uint32_t timeoutMs) {
    ESP_LOGI(TAG, "Connecting to Wi-Fi: %s", ssid);

    /*
     * -------------------------------------------------------------------------
     * STEP 1: netif + default event loop
     * -------------------------------------------------------------------------
     * ESP_ERR_INVALID_STATE means someone already created the loop.
     */
    esp_err_t err = esp_netif_init();
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "netif init failed: %s", esp_err_to_name(err));
        return err;
    }

    err = esp_event_loop_create_default();
    if (err != ESP_OK && err != ESP_ERR_INVALID_STATE) {
        ESP_LOGE(TAG, "Event loop failed: %s", esp_err_to_name(err));
        return err;
    }

    if (esp_netif_create_default_wifi_sta() == nullptr) {
        ESP_LOGE(TAG, "STA netif creation failed");
        return ESP_FAIL;
    }

    if (events == nullptr) {
        events = xEventGroupCreate();
        if (events == nullptr) return ESP_ERR_NO_MEM;
    }

    /*
     * -------------------------------------------------------------------------
     * STEP 2: Wi-Fi driver in STA mode
     * -------------------------------------------------------------------------
     */
    wifi_init_config_t initConfig = WIFI_INIT_CONFIG_DEFAULT();
    err = esp_wifi_init(&initConfig);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Wi-Fi init failed: %s", esp_err_to_name(err));
        return err;
    }

    err = esp_event_handler_instance_register(WIFI_EVENT, ESP_EVENT_ANY_ID,
                                              &WifiStation::eventHandler, this, &wifiHandler);
    if (err == ESP_OK) {
        err = esp_event_handler_instance_register(IP_EVENT, IP_EVENT_STA_GOT_IP,
                                                  &WifiStation::eventHandler, this, &ipHandler);
    }
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Event handler registration failed: %s", esp_err_to_name(err));
        return err;
    }

    wifi_config_t wifiConfig = {};
    strncpy((char*)wifiConfig.sta.ssid, ssid, sizeof(wifiConfig.sta.ssid) - 1);
    strncpy((char*)wifiConfig.sta.password, password, sizeof(wifiConfig.sta.password) - 1);

    err = esp_wifi_set_mode(WIFI_MODE_STA);
    if (err == ESP_OK) err = esp_wifi_set_config(WIFI_IF_STA, &wifiConfig);
    if (err == ESP_OK) err = esp_wifi_start();
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Wi-Fi start failed: %s", esp_err_to_name(err));
        return err;
    }
    started = true;

    /*
     * -------------------------------------------------------------------------
     * STEP 3: Wait for an IP
     * -------------------------------------------------------------------------
     */
    EventBits_t bits = xEventGroupWaitBits(events, CONNECTED_BIT, pdFALSE, pdTRUE,
                                           pdMS_TO_TICKS(timeoutMs));
    if ((bits & CONNECTED_BIT) == 0) {
        ESP_LOGW(TAG, "Wi-Fi connection failed after %u ms", (unsigned)timeoutMs);
        return ESP_ERR_TIMEOUT;
    }

    ESP_LOGI(TAG, "Wi-Fi connected");
    return ESP_OK;
}


bool WifiStation::isConnected() const {
    return events != nullptr && (xEventGroupGetBits(events) & CONNECTED_BIT) != 0;
}


void WifiStation::eventHandler(void* arg, esp_event_base_t base, int32_t id, void* data) {
    WifiStation* self = static_cast<WifiStation*>(arg);

    if (base == WIFI_EVENT && (id == WIFI_EVENT_STA_START || id == WIFI_EVENT_STA_DISCONNECTED)) {
        if (id == WIFI_EVENT_STA_DISCONNECTED) {
            xEventGroupClearBits(self->events, CONNECTED_BIT);
            ESP_LOGW(TAG, "Disconnected, retrying");
        }
        esp_err_t err = esp_wifi_connect();
        if (err != ESP_OK) {
            ESP_LOGE(TAG, "esp_wifi_connect failed: %s", esp_err_to_name(err));
        }
    } else if (base == IP_EVENT && id == IP_EVENT_STA_GOT_IP) {
        const ip_event_got_ip_t* event = static_cast<const ip_event_got_ip_t*>(data);
        ESP_LOGI(TAG, "IP address: " IPSTR, IP2STR(&event->ip_info.ip));
        xEventGroupSetBits(self->events, CONNECTED_BIT);
    }
}
