/**
 * @file nvs_store.cpp
 * @brief NVS-backed settings (ESP-IDF).
 */

#include "nvs_store.h"
#include <esp_log.h>
#include <nvs_flash.h>


static const char* TAG = "NVS_STORE";


NvsStore::NvsStore(const char* nameSpace)
    : nameSpace(nameSpace),
      handle(0),
      opened(false)
{
}


NvsStore::~NvsStore() {
    if (opened) nvs_close(handle);
}


esp_err_t NvsStore::initFlash() {
    esp_err_t err = nvs_flash_init();
    if (err == ESP_ERR_NVS_NO_FREE_PAGES || err == ESP_ERR_NVS_NEW_VERSION_FOUND) {
        ESP_LOGW(TAG, "NVS partition needs erase");
        err = nvs_flash_erase();
        if (err == ESP_OK) err = nvs_flash_init();
    }
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "NVS init failed: %s", esp_err_to_name(err));
    }
    return err;
}


esp_err_t NvsStore::begin() {
    if (opened) return ESP_OK;

    esp_err_t err = nvs_open(nameSpace, NVS_READWRITE, &handle);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "nvs_open(%s) failed: %s", nameSpace, esp_err_to_name(err));
        return err;
    }
    opened = true;
    return ESP_OK;
}


esp_err_t NvsStore::getString(const char* key, std::string* out) {
    if (!opened) return ESP_ERR_INVALID_STATE;

    // First call gets the length including the terminator.
    size_t len = 0;
    esp_err_t err = nvs_get_str(handle, key, nullptr, &len);
    if (err == ESP_ERR_NVS_NOT_FOUND) return ESP_ERR_NOT_FOUND;
    if (err != ESP_OK) return err;

    std::string value(len, '\0');
    err = nvs_get_str(handle, key, &value[0], &len);
    if (err != ESP_OK) return err;

    value.resize(len > 0 ? len - 1 : 0);
    *out = value;
    return ESP_OK;
}


esp_err_t NvsStore::setString(const char* key, const char* value) {
    if (!opened) return ESP_ERR_INVALID_STATE;

    esp_err_t err = nvs_set_str(handle, key, value);
    if (err == ESP_OK) err = nvs_commit(handle);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Writing %s failed: %s", key, esp_err_to_name(err));
    }
    return err;
}
