#include "version_store.h"

#include <cerrno>
#include <utility>

#include <unistd.h>

extern "C" {
#include "esp_log.h"
}

#include "bridgefw_config.h"
#include "fs_util.h"

namespace fwupd {

static const char* TAG = "version_store";

static constexpr uint32_t MAX_COMPONENT = 999999;

static bool parse_component(const char*& p, uint32_t& out)
{
    if (*p < '0' || *p > '9') return false;
    uint32_t val = 0;
    while (*p >= '0' && *p <= '9') {
        val = (val * 10) + static_cast<uint32_t>(*p - '0');
        if (val > MAX_COMPONENT) return false;
        p++;
    }
    out = val;
    return true;
}

static bool is_space(char c)
{
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

bool parse_version(const char* s, Version& out)
{
    if (!s) return false;
    while (is_space(*s)) s++;
    if (*s == 'v' || *s == 'V') s++;

    Version v;
    const char* p = s;
    if (!parse_component(p, v.major)) return false;

    uint32_t* rest[] = {&v.minor, &v.patch};
    for (uint32_t* slot : rest) {
        if (*p != '.') break;
        p++;
        if (!parse_component(p, *slot)) return false;
    }

    // "1.2.3.4": components past patch do not take part in ordering
    while (*p == '.') {
        p++;
        uint32_t ignored = 0;
        if (!parse_component(p, ignored)) return false;
    }

    if (*p == '-' || *p == '+') {
        // pre-release / build metadata, e.g. "1.2.3-rc1"
        out = v;
        return true;
    }

    while (is_space(*p)) p++;
    if (*p != '\0') return false;

    out = v;
    return true;
}

Version to_version(const char* s)
{
    Version v;
    if (!parse_version(s, v)) {
        return Version{};
    }
    return v;
}

int compare_versions(const Version& a, const Version& b)
{
    if (a.major != b.major) return (a.major < b.major) ? -1 : 1;
    if (a.minor != b.minor) return (a.minor < b.minor) ? -1 : 1;
    if (a.patch != b.patch) return (a.patch < b.patch) ? -1 : 1;
    return 0;
}

int compare_versions(const char* a, const char* b)
{
    return compare_versions(to_version(a), to_version(b));
}

VersionStore::VersionStore(std::string path) : path_(std::move(path)) {}

esp_err_t VersionStore::read(std::string& out) const
{
    std::string raw;
    if (fs::read_file(path_, raw) != ESP_OK) {
        return ESP_ERR_NOT_FOUND;
    }

    // single line; anything after the first newline is ignored
    const size_t nl = raw.find('\n');
    if (nl != std::string::npos) raw.resize(nl);

    std::string v = fs::trim(raw);
    if (v.empty()) {
        ESP_LOGW(TAG, "Version marker %s is empty", path_.c_str());
        return ESP_ERR_NOT_FOUND;
    }
    out = v;
    return ESP_OK;
}

std::string VersionStore::current() const
{
    std::string v;
    if (read(v) != ESP_OK) {
        return BASELINE_VERSION;
    }
    return v;
}

esp_err_t VersionStore::write(const std::string& version)
{
    esp_err_t err = fs::write_file(path_, version + "\n");
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Failed to persist version %s to %s", version.c_str(), path_.c_str());
        return err;
    }
    ESP_LOGI(TAG, "Version marker set to %s", version.c_str());
    return ESP_OK;
}

esp_err_t VersionStore::erase()
{
    if (!fs::exists(path_)) return ESP_OK;
    if (::unlink(path_.c_str()) != 0) {
        ESP_LOGE(TAG, "Failed to remove %s: errno=%d", path_.c_str(), errno);
        return ESP_FAIL;
    }
    ESP_LOGI(TAG, "Version marker removed");
    return ESP_OK;
}

} // namespace fwupd
