/**
 * @file api_key.h
 * @brief Where the device access token comes from.
 *
 * @details
 *     1. The key saved in the store (survives reflashing the app).
 *     2. Otherwise the build-time fallback, which is then saved so the
 *        next boot finds it in the store.
 *     3. Neither: ESP_ERR_NOT_FOUND, the device cannot talk to the server.
 */

#pragma once

#include "key_value_store.h"
#include <esp_err.h>
#include <string>


#define API_KEY_STORE_KEY   "api_key"


enum ApiKeySource {
    API_KEY_FROM_STORE,
    API_KEY_FROM_FALLBACK
};


/**
 * @brief Resolve the API key.
 *
 * A fallback that cannot be saved is still used for this boot.
 *
 * @param fallback Build-time key, may be empty or null.
 * @param source Optional, receives where the key came from.
 *
 * @return ESP_OK, ESP_ERR_INVALID_ARG for a null out,
 *         ESP_ERR_NOT_FOUND if neither the store nor the fallback has a key.
 */
esp_err_t apiKeyLoad(KeyValueStore& store, const char* fallback, std::string* out,
                     ApiKeySource* source = nullptr);
