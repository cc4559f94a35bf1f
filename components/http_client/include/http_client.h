#pragma once

#include <string>
#include <utility>
#include <vector>

extern "C" {
#include "esp_err.h"
}

#include "bridgefw_config.h"

namespace fwupd {

struct HttpRequest {
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    int timeout_ms = 10000;
};

struct HttpResponse {
    int status = 0;
    std::string body;
};

// GET-only client. A transport failure (connect, timeout, read error, body too
// large) is a non-ESP_OK return; any HTTP status is ESP_OK with out.status set.
class IHttpClient {
public:
    virtual ~IHttpClient() = default;
    virtual esp_err_t get(const HttpRequest& req, HttpResponse& out) = 0;
};

// esp_http_client over TLS (x509 certificate bundle), following redirects.
class EspHttpClient : public IHttpClient {
public:
    explicit EspHttpClient(const HttpConfig& cfg = HttpConfig{});

    esp_err_t get(const HttpRequest& req, HttpResponse& out) override;

private:
    esp_err_t get_once(const HttpRequest& req, HttpResponse& out);

    HttpConfig cfg_;
};

} // namespace fwupd
