/**
 * @file nvs_store.h
 * @brief KeyValueStore on an NVS namespace (ESP-IDF).
 *
 * @par Usage
 *     NvsStore::initFlash();            // once, before Wi-Fi too
 *     NvsStore store("trmnl");
 *     if (store.begin() == ESP_OK) { ... }
 */

#pragma once

#include "key_value_store.h"
#include <nvs.h>


#define NVS_STORE_NAMESPACE     "trmnl"


class NvsStore : public KeyValueStore {

public:

    explicit NvsStore(const char* nameSpace);

    ~NvsStore() override;

    /**
     * @brief Initialise the default NVS partition, erasing it if its
     *        layout is full or from a newer IDF.
     */
    static esp_err_t initFlash();

    /**
     * @brief Open the namespace read/write.
     */
    esp_err_t begin();

    esp_err_t getString(const char* key, std::string* out) override;

    esp_err_t setString(const char* key, const char* value) override;


private:

    const char* nameSpace;
    nvs_handle_t handle;
    bool opened;

    NvsStore(const NvsStore&) = delete;
    NvsStore& operator=(const NvsStore&) = delete;
};
