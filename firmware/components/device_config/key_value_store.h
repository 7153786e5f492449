/**
 * @file key_value_store.h
 * @brief Abstract persistent string store.
 *
 * @details
 * The firmware keeps its settings in NVS (NvsStore). Settings logic is
 * written against this interface so it runs on the host against an
 * in-memory store as well.
 */

#pragma once

#include <esp_err.h>
#include <string>


class KeyValueStore {

public:

    virtual ~KeyValueStore() {}

    /**
     * @brief Read a string value.
     *
     * @return ESP_OK, ESP_ERR_NOT_FOUND if the key was never written,
     *         or a storage error.
     */
    virtual esp_err_t getString(const char* key, std::string* out) = 0;

    /**
     * @brief Write and commit a string value.
     */
    virtual esp_err_t setString(const char* key, const char* value) = 0;
};
