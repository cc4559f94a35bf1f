#include "source_sdcard.h"

extern "C" {
#include "esp_log.h"
}

#include "fs_util.h"

namespace fwupd {

static const char* TAG = "source_sdcard";

SdCardSource::SdCardSource(IVolume& volume, const SdCardConfig& cfg)
    : volume_(volume), cfg_(cfg) {}

std::string SdCardSource::update_path() const
{
    return fs::join(volume_.mount_point(), cfg_.update_dir);
}

bool SdCardSource::is_available()
{
    esp_err_t err = volume_.mount();
    if (err != ESP_OK) {
        ESP_LOGI(TAG, "No SD card (%s)", esp_err_to_name(err));
        return false;
    }
    if (!fs::is_dir(update_path())) {
        ESP_LOGI(TAG, "SD card has no %s directory", cfg_.update_dir.c_str());
        return false;
    }
    return true;
}

esp_err_t SdCardSource::latest_version(std::string& out)
{
    std::string raw;
    esp_err_t err = fs::read_file(fs::join(update_path(), cfg_.version_marker), raw);
    if (err != ESP_OK) {
        ESP_LOGW(TAG, "No version marker on SD card");
        return ESP_ERR_NOT_FOUND;
    }

    std::string v = fs::trim(raw.substr(0, raw.find('\n')));
    if (!v.empty() && (v[0] == 'v' || v[0] == 'V')) v.erase(0, 1);
    if (v.empty()) {
        ESP_LOGW(TAG, "Empty version marker on SD card");
        return ESP_ERR_NOT_FOUND;
    }

    out = v;
    ESP_LOGI(TAG, "SD card offers version %s", out.c_str());
    return ESP_OK;
}

esp_err_t SdCardSource::manifest(std::vector<ManifestEntry>& out)
{
    out.clear();
    const SdCardConfig& c = cfg_;
    auto filter = [&c](const std::string& rel, bool is_dir) -> bool {
        if (is_dir || rel.empty() || rel[0] == '.') return false;
        const std::string name = fs::to_lower(rel);
        if (name == fs::to_lower(c.secrets_file) || name == fs::to_lower(c.version_marker)) {
            return false;
        }
        return fs::ends_with(name, fs::to_lower(c.managed_ext));
    };

    const std::string dir = update_path();
    std::vector<std::string> names;
    esp_err_t err = fs::list_files(dir, false, filter, names);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Cannot list %s", dir.c_str());
        return err;
    }

    for (const auto& n : names) {
        out.push_back(ManifestEntry{n, fs::join(dir, n), ""});
    }
    ESP_LOGI(TAG, "SD manifest: %u files", (unsigned)out.size());
    return ESP_OK;
}

esp_err_t SdCardSource::fetch(const ManifestEntry& entry, std::string& out)
{
    esp_err_t err = fs::read_file(entry.locator, out);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Cannot read %s from SD card", entry.path.c_str());
    }
    return err;
}

void SdCardSource::release()
{
    if (volume_.mounted()) volume_.unmount();
}

} // namespace fwupd
