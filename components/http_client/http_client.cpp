#include "http_client.h"

#include <vector>

extern "C" {
#include "esp_log.h"
#include "esp_http_client.h"
#include "esp_crt_bundle.h"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"
}

namespace fwupd {

static const char* TAG = "http_client";

static bool is_redirect(int status)
{
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

static bool retryable(esp_err_t err)
{
    // Only connectivity-ish failures are worth another attempt.
    return err == ESP_ERR_HTTP_CONNECT || err == ESP_FAIL;
}

static int compute_backoff_ms(const HttpConfig& cfg, int attempt)
{
    int backoff = cfg.backoff_start_ms;
    for (int i = 1; i < attempt; ++i) {
        if (backoff < cfg.backoff_max_ms / 2) backoff *= 2;
        else backoff = cfg.backoff_max_ms;
    }
    if (backoff > cfg.backoff_max_ms) backoff = cfg.backoff_max_ms;
    return backoff;
}

EspHttpClient::EspHttpClient(const HttpConfig& cfg) : cfg_(cfg) {}

esp_err_t EspHttpClient::get(const HttpRequest& req, HttpResponse& out)
{
    int attempt = 0;
    while (true) {
        attempt++;
        esp_err_t err = get_once(req, out);
        if (err == ESP_OK) return ESP_OK;

        if (attempt >= cfg_.max_attempts || !retryable(err)) {
            ESP_LOGE(TAG, "GET %s failed after %d attempt(s): %s",
                     req.url.c_str(), attempt, esp_err_to_name(err));
            return err;
        }

        const int backoff = compute_backoff_ms(cfg_, attempt);
        ESP_LOGW(TAG, "Retrying GET in %d ms...", backoff);
        vTaskDelay(pdMS_TO_TICKS(backoff));
    }
}

esp_err_t EspHttpClient::get_once(const HttpRequest& req, HttpResponse& out)
{
    out = HttpResponse{};

    esp_http_client_config_t cfg = {};
    cfg.url = req.url.c_str();
    cfg.timeout_ms = req.timeout_ms;
    cfg.crt_bundle_attach = esp_crt_bundle_attach;
    cfg.buffer_size = cfg_.rx_buffer_size;
    cfg.max_redirection_count = cfg_.max_redirects;

    esp_http_client_handle_t client = esp_http_client_init(&cfg);
    if (!client) {
        ESP_LOGE(TAG, "esp_http_client_init failed");
        return ESP_ERR_NO_MEM;
    }

    esp_http_client_set_method(client, HTTP_METHOD_GET);
    for (const auto& h : req.headers) {
        esp_http_client_set_header(client, h.first.c_str(), h.second.c_str());
    }

    // Use open/fetch_headers/read (do NOT mix perform + manual reads)
    esp_err_t err = ESP_OK;
    int status = 0;
    for (int hop = 0; ; ++hop) {
        err = esp_http_client_open(client, 0);
        if (err != ESP_OK) {
            ESP_LOGE(TAG, "HTTP open failed: %s (0x%x)", esp_err_to_name(err), (unsigned)err);
            esp_http_client_cleanup(client);
            return err;
        }

        if (esp_http_client_fetch_headers(client) < 0) {
            ESP_LOGE(TAG, "HTTP fetch headers failed");
            esp_http_client_close(client);
            esp_http_client_cleanup(client);
            return ESP_FAIL;
        }
        status = esp_http_client_get_status_code(client);

        if (!is_redirect(status)) break;
        if (hop >= cfg_.max_redirects) {
            ESP_LOGE(TAG, "Too many redirects for %s", req.url.c_str());
            esp_http_client_close(client);
            esp_http_client_cleanup(client);
            return ESP_ERR_HTTP_MAX_REDIRECT;
        }

        err = esp_http_client_set_redirection(client);
        esp_http_client_close(client);
        if (err != ESP_OK) {
            ESP_LOGE(TAG, "Redirect without location (status %d)", status);
            esp_http_client_cleanup(client);
            return ESP_ERR_INVALID_RESPONSE;
        }
    }

    out.status = status;
    if (status != 200) {
        // caller only needs the status; the body of an error response is discarded
        esp_http_client_close(client);
        esp_http_client_cleanup(client);
        return ESP_OK;
    }

    std::vector<char> buf(512);
    while (true) {
        int r = esp_http_client_read(client, buf.data(), (int)buf.size());
        if (r < 0) {
            ESP_LOGE(TAG, "HTTP read failed");
            err = ESP_FAIL;
            break;
        }
        if (r == 0) {
            if (!esp_http_client_is_complete_data_received(client)) {
                ESP_LOGE(TAG, "HTTP body truncated");
                err = ESP_FAIL;
            }
            break;
        }

        out.body.append(buf.data(), (size_t)r);
        if (out.body.size() > cfg_.max_body_bytes) {
            ESP_LOGE(TAG, "Body too large (> %u bytes)", (unsigned)cfg_.max_body_bytes);
            err = ESP_ERR_NO_MEM;
            break;
        }
    }

    esp_http_client_close(client);
    esp_http_client_cleanup(client);

    if (err != ESP_OK) {
        out.body.clear();
        return err;
    }
    return ESP_OK;
}

} // namespace fwupd
