/**
 * @file api_key.cpp
 * @brief API key lookup with write-back (ESP-IDF).
 */

#include "api_key.h"
#include <esp_log.h>


static const char* TAG = "API_KEY";


esp_err_t apiKeyLoad(KeyValueStore& store, const char* fallback, std::string* out,
                     ApiKeySource* source) {
    if (out == nullptr) return ESP_ERR_INVALID_ARG;

    std::string stored;
    esp_err_t err = store.getString(API_KEY_STORE_KEY, &stored);
    if (err == ESP_OK && !stored.empty()) {
        ESP_LOGI(TAG, "Using the saved API key");
        *out = stored;
        if (source) *source = API_KEY_FROM_STORE;
        return ESP_OK;
    }
    if (err != ESP_OK && err != ESP_ERR_NOT_FOUND) {
        ESP_LOGW(TAG, "Reading the saved API key failed: %s", esp_err_to_name(err));
    }

    if (fallback == nullptr || fallback[0] == '\0') {
        ESP_LOGE(TAG, "No API key saved and none built in");
        return ESP_ERR_NOT_FOUND;
    }

    *out = fallback;
    if (source) *source = API_KEY_FROM_FALLBACK;

    err = store.setString(API_KEY_STORE_KEY, fallback);
    if (err != ESP_OK) {
        ESP_LOGW(TAG, "Saving the API key failed: %s (using it for this boot only)",
                 esp_err_to_name(err));
    } else {
        ESP_LOGI(TAG, "Built-in API key saved");
    }
    return ESP_OK;
}
