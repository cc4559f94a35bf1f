#include "settings.h"

#include <vector>

extern "C" {
#include "esp_log.h"
#include "esp_check.h"
#include "nvs.h"
#include "nvs_flash.h"
}

static const char* TAG = "settings";

namespace {

// NVS namespace + keys
static constexpr const char* NVS_NS        = "bridgefw";
static constexpr const char* KEY_GH_OWNER  = "gh_owner";
static constexpr const char* KEY_GH_REPO   = "gh_repo";
static constexpr const char* KEY_GH_TOKEN  = "gh_token";
static constexpr const char* KEY_GH_MODE   = "gh_mode";
static constexpr const char* KEY_WIFI_SSID = "wifi_ssid";
static constexpr const char* KEY_WIFI_PASS = "wifi_pass";

static esp_err_t ensure_nvs_ready()
{
    esp_err_t err = nvs_flash_init();
    if (err == ESP_ERR_NVS_NO_FREE_PAGES || err == ESP_ERR_NVS_NEW_VERSION_FOUND) {
        ESP_RETURN_ON_ERROR(nvs_flash_erase(), TAG, "nvs erase failed");
        err = nvs_flash_init();
    }
    return err;
}

// Leaves `out` untouched when the key is absent.
static esp_err_t nvs_get_string(nvs_handle_t h, const char* key, std::string& out)
{
    size_t len = 0;
    esp_err_t err = nvs_get_str(h, key, nullptr, &len);
    if (err == ESP_ERR_NVS_NOT_FOUND) return ESP_OK;
    if (err != ESP_OK) return err;
    if (len == 0) return ESP_ERR_INVALID_SIZE;

    std::vector<char> buf(len);
    err = nvs_get_str(h, key, buf.data(), &len);
    if (err != ESP_OK) return err;
    out.assign(buf.data());
    return ESP_OK;
}

} // namespace

namespace settings {

esp_err_t load(Settings& out)
{
    ESP_RETURN_ON_ERROR(ensure_nvs_ready(), TAG, "nvs init failed");

    nvs_handle_t h = 0;
    esp_err_t err = nvs_open(NVS_NS, NVS_READONLY, &h);
    if (err == ESP_ERR_NVS_NOT_FOUND) {
        ESP_LOGW(TAG, "No stored settings; using defaults");
        return ESP_OK;
    }
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "nvs_open failed: 0x%x", (unsigned)err);
        return err;
    }

    std::string mode;
    struct {
        const char* key;
        std::string* dst;
    } const fields[] = {
        {KEY_GH_OWNER, &out.github.owner},
        {KEY_GH_REPO, &out.github.repo},
        {KEY_GH_TOKEN, &out.github.token},
        {KEY_GH_MODE, &mode},
        {KEY_WIFI_SSID, &out.wifi_ssid},
        {KEY_WIFI_PASS, &out.wifi_pass},
    };

    for (const auto& f : fields) {
        err = nvs_get_string(h, f.key, *f.dst);
        if (err != ESP_OK) {
            ESP_LOGE(TAG, "Reading %s failed: 0x%x", f.key, (unsigned)err);
            nvs_close(h);
            return err;
        }
    }
    nvs_close(h);

    if (mode == "tree") {
        out.github.mode = fwupd::GithubMode::TREE;
    } else if (!mode.empty() && mode != "assets") {
        ESP_LOGW(TAG, "Unknown gh_mode '%s'; using assets", mode.c_str());
    }

    ESP_LOGI(TAG, "Settings loaded: repo=%s/%s mode=%s token=%s ssid=%s",
             out.github.owner.c_str(), out.github.repo.c_str(),
             out.github.mode == fwupd::GithubMode::TREE ? "tree" : "assets",
             out.github.token.empty() ? "none" : "set",
             out.wifi_ssid.c_str());
    return ESP_OK;
}

} // namespace settings
