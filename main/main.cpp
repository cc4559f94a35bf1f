#include "wifi_sta.h"
#include "bridgefw_config.h"
#include "settings.h"
#include "version_store.h"
#include "backup_set.h"
#include "http_client.h"
#include "source_github.h"
#include "source_sdcard.h"
#include "sd_volume.h"
#include "update_supervisor.h"
#include "rollback_trigger.h"
#include "rollback_trigger_esp.h"

extern "C" {
#include "esp_log.h"
#include "esp_system.h"
#include "esp_vfs_fat.h"
#include "wear_levelling.h"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"
}

static const char* TAG = "APP";

static wl_handle_t s_wl_handle = WL_INVALID_HANDLE;

static esp_err_t mount_firmware_fs(const fwupd::FirmwareLayout& layout)
{
    esp_vfs_fat_mount_config_t mount_cfg = {};
    mount_cfg.format_if_mount_failed = false;
    mount_cfg.max_files = 6;
    mount_cfg.allocation_unit_size = CONFIG_WL_SECTOR_SIZE;

    esp_err_t err = esp_vfs_fat_spiflash_mount_rw_wl(layout.root.c_str(), fwupd::FLASH_PARTITION_LABEL,
                                                     &mount_cfg, &s_wl_handle);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Mounting %s (partition '%s') failed: %s",
                 layout.root.c_str(), fwupd::FLASH_PARTITION_LABEL, esp_err_to_name(err));
        return err;
    }
    ESP_LOGI(TAG, "Firmware tree mounted at %s", layout.root.c_str());
    return ESP_OK;
}

static void reboot()
{
    ESP_LOGW(TAG, "Restarting...");
    vTaskDelay(pdMS_TO_TICKS(200));
    esp_restart();
}

extern "C" void app_main(void)
{
    ESP_LOGI(TAG, "app_main entered");

    static fwupd::FirmwareLayout layout;
    ESP_ERROR_CHECK(mount_firmware_fs(layout));

    static fwupd::VersionStore versions(layout.version_path());
    static fwupd::BackupSet backup(layout);
    ESP_LOGI(TAG, "Running firmware version: %s", versions.current().c_str());

    static settings::Settings cfg;
    if (settings::load(cfg) != ESP_OK) {
        ESP_LOGW(TAG, "Settings unavailable; continuing with defaults");
    }

    // 1) Manual rollback has priority over everything else
    static fwupd::GpioInput button(fwupd::ROLLBACK_BUTTON_GPIO);
    static fwupd::EspClock clock;
    if (button.init() == ESP_OK) {
        fwupd::RollbackTrigger trigger(button, clock);
        if (trigger.detect()) {
            esp_err_t err = fwupd::perform_manual_rollback(backup, versions, reboot);
            ESP_LOGW(TAG, "Manual rollback not performed (%s); continuing boot", esp_err_to_name(err));
        }
    }

    // 2) Wi-Fi failure only takes the network source out of the probe
    const bool online = wifi_sta_start_and_wait(cfg.wifi_ssid.c_str(), cfg.wifi_pass.c_str(),
                                                fwupd::WIFI_CONNECT_TIMEOUT_MS);
    ESP_LOGI(TAG, "Network %s", online ? "up" : "down");

    static fwupd::EspHttpClient http;
    static fwupd::GithubReleaseSource github(http, cfg.github, []() { return wifi_sta_is_connected(); });

    static fwupd::SdCardConfig sd_cfg;
    static fwupd::SdSpiVolume sd_volume(sd_cfg);
    static fwupd::SdCardSource sdcard(sd_volume, sd_cfg);

    fwupd::UpdateSupervisor::Config ucfg;
    ucfg.sources = {&github, &sdcard};
    ucfg.versions = &versions;
    ucfg.backup = &backup;
    ucfg.layout = layout;
    ucfg.reboot = reboot;
    ucfg.on_status = [](const fwupd::Status& s) {
        ESP_LOGI(TAG, "Update status: %s reason=%s files=%u/%u",
                 fwupd::state_name(s.state), fwupd::fail_reason_name(s.reason),
                 (unsigned)s.files_applied, (unsigned)s.files_total);
    };

    static fwupd::UpdateSupervisor supervisor(ucfg);

    // 3) Undo an attempt that was cut short by a reset
    if (supervisor.recover_interrupted()) {
        ESP_LOGW(TAG, "Recovered from an interrupted update");
    }

    // 4) Returns only when no update was applied
    if (!supervisor.run()) {
        const fwupd::Status st = supervisor.status();
        ESP_LOGI(TAG, "No update applied (%s); starting application", fwupd::fail_reason_name(st.reason));
    }

    ESP_LOGI(TAG, "Firmware %s running", versions.current().c_str());
    while (true) {
        vTaskDelay(pdMS_TO_TICKS(1000));
    }
}
