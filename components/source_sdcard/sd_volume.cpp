#include "sd_volume.h"

extern "C" {
#include "esp_log.h"
#include "esp_vfs_fat.h"
#include "sdmmc_cmd.h"
#include "driver/sdspi_host.h"
#include "driver/spi_common.h"
}

namespace fwupd {

static const char* TAG = "sd_volume";

SdSpiVolume::SdSpiVolume(const SdCardConfig& cfg) : cfg_(cfg) {}

SdSpiVolume::~SdSpiVolume()
{
    unmount();
}

esp_err_t SdSpiVolume::mount()
{
    if (card_) return ESP_OK;

    sdmmc_host_t host = SDSPI_HOST_DEFAULT();
    host.max_freq_khz = cfg_.max_freq_khz;

    if (!bus_ready_) {
        spi_bus_config_t bus = {};
        bus.mosi_io_num = cfg_.pin_mosi;
        bus.miso_io_num = cfg_.pin_miso;
        bus.sclk_io_num = cfg_.pin_sck;
        bus.quadwp_io_num = -1;
        bus.quadhd_io_num = -1;
        bus.max_transfer_sz = 4000;

        esp_err_t err = spi_bus_initialize((spi_host_device_t)host.slot, &bus, SDSPI_DEFAULT_DMA);
        if (err != ESP_OK) {
            ESP_LOGE(TAG, "spi_bus_initialize failed: %s", esp_err_to_name(err));
            return err;
        }
        bus_ready_ = true;
        host_slot_ = host.slot;
    }

    sdspi_device_config_t slot = SDSPI_DEVICE_CONFIG_DEFAULT();
    slot.gpio_cs = (gpio_num_t)cfg_.pin_cs;
    slot.host_id = (spi_host_device_t)host.slot;

    esp_vfs_fat_sdmmc_mount_config_t mount_cfg = {};
    mount_cfg.format_if_mount_failed = false;
    mount_cfg.max_files = 4;
    mount_cfg.allocation_unit_size = 16 * 1024;

    esp_err_t err = esp_vfs_fat_sdspi_mount(cfg_.mount_point.c_str(), &host, &slot, &mount_cfg, &card_);
    if (err != ESP_OK) {
        card_ = nullptr;
        ESP_LOGW(TAG, "Failed to mount SD card (%s)", esp_err_to_name(err));
        spi_bus_free((spi_host_device_t)host_slot_);
        bus_ready_ = false;
        return err;
    }

    ESP_LOGI(TAG, "SD card mounted at %s", cfg_.mount_point.c_str());
    return ESP_OK;
}

void SdSpiVolume::unmount()
{
    if (card_) {
        esp_err_t err = esp_vfs_fat_sdcard_unmount(cfg_.mount_point.c_str(), card_);
        if (err != ESP_OK) {
            ESP_LOGW(TAG, "Unmount failed: %s", esp_err_to_name(err));
        } else {
            ESP_LOGI(TAG, "SD card unmounted");
        }
        card_ = nullptr;
    }
    if (bus_ready_) {
        spi_bus_free((spi_host_device_t)host_slot_);
        bus_ready_ = false;
    }
}

} // namespace fwupd
