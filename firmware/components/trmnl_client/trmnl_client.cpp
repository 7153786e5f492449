/**
 * @file trmnl_client.cpp
 * @brief TRMNL API client implementation (ESP-IDF).
 */

#include "trmnl_client.h"
#include <cJSON.h>
#include <esp_crt_bundle.h>
#include <esp_http_client.h>
#include <esp_log.h>


static const char* TAG = "TRMNL";


TrmnlClient::TrmnlClient(const char* baseUrl, const char* apiKey)
    : baseUrl(baseUrl ? baseUrl : ""),
      apiKey(apiKey ? apiKey : "")
{
    // "https://host/" + "/api/display" would give a double slash
    while (!this->baseUrl.empty() && this->baseUrl[this->baseUrl.size() - 1] == '/') {
        this->baseUrl.erase(this->baseUrl.size() - 1);
    }
}


/*
 * =============================================================================
 * DESCRIPTOR
 * =============================================================================
 */

esp_err_t TrmnlClient::fetchDisplay(DisplayDescriptor* out) {
    if (out == nullptr) return ESP_ERR_INVALID_ARG;

    std::vector<uint8_t> body;
    esp_err_t err = httpGet(baseUrl + "/api/display", true, TRMNL_MAX_DESCRIPTOR_BYTES, &body);
    if (err != ESP_OK) return err;

    body.push_back('\0');
    return parseDescriptor((const char*)body.data(), out);
}


esp_err_t TrmnlClient::parseDescriptor(const char* json, DisplayDescriptor* out) {
    if (json == nullptr || out == nullptr) return ESP_ERR_INVALID_ARG;

    cJSON* root = cJSON_Parse(json);
    if (root == nullptr) {
        ESP_LOGE(TAG, "Descriptor is not valid JSON");
        return ESP_ERR_INVALID_RESPONSE;
    }

    const cJSON* imageUrl = cJSON_GetObjectItemCaseSensitive(root, "image_url");
    const cJSON* filename = cJSON_GetObjectItemCaseSensitive(root, "filename");
    const cJSON* refresh  = cJSON_GetObjectItemCaseSensitive(root, "refresh_rate");

    if (!cJSON_IsString(imageUrl) || imageUrl->valuestring == nullptr || imageUrl->valuestring[0] == '\0') {
        ESP_LOGE(TAG, "Descriptor has no image_url");
        cJSON_Delete(root);
        return ESP_ERR_INVALID_RESPONSE;
    }

    out->imageUrl = imageUrl->valuestring;

    if (cJSON_IsString(filename) && filename->valuestring && filename->valuestring[0] != '\0') {
        out->filename = filename->valuestring;
    } else {
        out->filename = TRMNL_DEFAULT_FILENAME;
    }

    out->refreshRateSec = TRMNL_DEFAULT_REFRESH_SEC;
    if (cJSON_IsNumber(refresh) && refresh->valueint > 0) {
        out->refreshRateSec = refresh->valueint;
        if (out->refreshRateSec > TRMNL_MAX_REFRESH_SEC) {
            ESP_LOGW(TAG, "refresh_rate %d capped to %d s", out->refreshRateSec, TRMNL_MAX_REFRESH_SEC);
            out->refreshRateSec = TRMNL_MAX_REFRESH_SEC;
        }
    }

    cJSON_Delete(root);

    ESP_LOGI(TAG, "Next image: %s (refresh in %d s)", out->filename.c_str(), out->refreshRateSec);
    return ESP_OK;
}


/*
 * =============================================================================
 * IMAGE
 * =============================================================================
 */

esp_err_t TrmnlClient::downloadImage(const std::string& url, std::vector<uint8_t>* out) {
    if (out == nullptr || url.empty()) return ESP_ERR_INVALID_ARG;

    esp_err_t err = httpGet(url, false, TRMNL_MAX_IMAGE_BYTES, out);
    if (err == ESP_OK) {
        ESP_LOGI(TAG, "Downloaded %u bytes", (unsigned)out->size());
    }
    return err;
}


/*
 * =============================================================================
 * HTTP
 * =============================================================================
 *
 * open → fetch_headers → read until 0 → close/cleanup.
 * Reading the stream ourselves lets us cap the body size instead of
 * trusting Content-Length (chunked responses don't send one).
 */

esp_err_t TrmnlClient::httpGet(const std::string& url, bool withToken, size_t maxBytes,
                               std::vector<uint8_t>* out) {
    out->clear();

    esp_http_client_config_t config = {};
    config.url = url.c_str();
    config.timeout_ms = TRMNL_HTTP_TIMEOUT_MS;
    config.crt_bundle_attach = esp_crt_bundle_attach;

    esp_http_client_handle_t client = esp_http_client_init(&config);
    if (client == nullptr) {
        ESP_LOGE(TAG, "HTTP client init failed");
        return ESP_FAIL;
    }

    esp_err_t err = esp_http_client_set_header(client, "User-Agent", "trmnl-display/" TRMNL_CLIENT_VERSION);
    if (err == ESP_OK && withToken) {
        err = esp_http_client_set_header(client, "access-token", apiKey.c_str());
    }
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Setting headers failed: %s", esp_err_to_name(err));
        esp_http_client_cleanup(client);
        return err;
    }

    err = esp_http_client_open(client, 0);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "GET %s failed: %s", url.c_str(), esp_err_to_name(err));
        esp_http_client_cleanup(client);
        return err;
    }

    int64_t contentLength = esp_http_client_fetch_headers(client);
    int status = esp_http_client_get_status_code(client);
    if (status != 200) {
        ESP_LOGE(TAG, "GET %s: status code %d", url.c_str(), status);
        esp_http_client_close(client);
        esp_http_client_cleanup(client);
        return ESP_ERR_INVALID_RESPONSE;
    }

    if (contentLength > (int64_t)maxBytes) {
        ESP_LOGE(TAG, "Body too large (%lld > %u)", (long long)contentLength, (unsigned)maxBytes);
        esp_http_client_close(client);
        esp_http_client_cleanup(client);
        return ESP_ERR_INVALID_SIZE;
    }
    if (contentLength > 0) out->reserve((size_t)contentLength);

    uint8_t chunk[1024];
    err = ESP_OK;
    while (true) {
        int n = esp_http_client_read(client, (char*)chunk, sizeof(chunk));
        if (n < 0) {
            ESP_LOGE(TAG, "Read error after %u bytes", (unsigned)out->size());
            err = ESP_FAIL;
            break;
        }
        if (n == 0) break;

        if (out->size() + (size_t)n > maxBytes) {
            ESP_LOGE(TAG, "Body exceeds %u bytes", (unsigned)maxBytes);
            err = ESP_ERR_INVALID_SIZE;
            break;
        }
        out->insert(out->end(), chunk, chunk + n);
    }

    esp_http_client_close(client);
    esp_http_client_cleanup(client);

    if (err != ESP_OK) out->clear();
    return err;
}
