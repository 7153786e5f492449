/**
 * @file trmnl_client.h
 * @brief TRMNL display API client (ESP-IDF).
 *
 * @details
 * Two requests per refresh cycle:
 *
 *     1. GET {baseUrl}/api/display          (header: access-token)
 *        → {"image_url": "...", "filename": "...", "refresh_rate": 900}
 *
 *     2. GET image_url
 *        → BMP, PNG or JPEG bytes
 *
 * The client does not retry. Retry and back-off belong to the caller's
 * loop, which also decides when to ask again (refresh_rate).
 */

#pragma once

#include <esp_err.h>
#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>


#define TRMNL_CLIENT_VERSION            "0.1.0"
#define TRMNL_DEFAULT_REFRESH_SEC       60
#define TRMNL_MAX_REFRESH_SEC           (7 * 24 * 60 * 60)
#define TRMNL_DEFAULT_FILENAME          "display.bmp"
#define TRMNL_HTTP_TIMEOUT_MS           30000
#define TRMNL_MAX_DESCRIPTOR_BYTES      (16 * 1024)
#define TRMNL_MAX_IMAGE_BYTES           (2 * 1024 * 1024)


/**
 * @brief What the server wants shown next.
 */
struct DisplayDescriptor {
    std::string imageUrl;
    std::string filename;
    int refreshRateSec;
};


/**
 * @class TrmnlClient
 * @brief Fetches display descriptors and images over HTTP(S).
 */
class TrmnlClient {

public:

    /**
     * @param baseUrl Server root, e.g. "https://usetrmnl.com".
     * @param apiKey Device access token.
     */
    TrmnlClient(const char* baseUrl, const char* apiKey);


    /**
     * @brief Ask the server which image to show.
     *
     * @return ESP_OK,
     *         ESP_ERR_INVALID_RESPONSE on a non-200 status or bad JSON,
     *         or the esp_http_client error.
     */
    esp_err_t fetchDisplay(DisplayDescriptor* out);


    /**
     * @brief Download an image body into memory.
     *
     * @return ESP_OK,
     *         ESP_ERR_INVALID_RESPONSE on a non-200 status,
     *         ESP_ERR_INVALID_SIZE if the body exceeds TRMNL_MAX_IMAGE_BYTES,
     *         or the esp_http_client error.
     */
    esp_err_t downloadImage(const std::string& url, std::vector<uint8_t>* out);


    /**
     * @brief Parse a descriptor JSON document. Pure, no network.
     *
     * Missing filename -> TRMNL_DEFAULT_FILENAME.
     * Missing or non-positive refresh_rate -> TRMNL_DEFAULT_REFRESH_SEC.
     * Anything above TRMNL_MAX_REFRESH_SEC is capped to it.
     *
     * @return ESP_OK, or ESP_ERR_INVALID_RESPONSE if the JSON is invalid
     *         or image_url is missing.
     */
    static esp_err_t parseDescriptor(const char* json, DisplayDescriptor* out);


private:

    std::string baseUrl;
    std::string apiKey;


    /**
     * @brief One GET, whole body into out, at most maxBytes.
     */
    esp_err_t httpGet(const std::string& url, bool withToken, size_t maxBytes,
                      std::vector<uint8_t>* out);
};
