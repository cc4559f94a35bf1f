#pragma once

#include <string>

#include "bridgefw_config.h"
#include "source_sdcard.h"

extern "C" {
#include "sdmmc_types.h"
}

namespace fwupd {

// FAT volume on an SD card wired to SPI.
class SdSpiVolume : public IVolume {
public:
    explicit SdSpiVolume(const SdCardConfig& cfg);
    ~SdSpiVolume() override;

    SdSpiVolume(const SdSpiVolume&) = delete;
    SdSpiVolume& operator=(const SdSpiVolume&) = delete;

    esp_err_t mount() override;
    void unmount() override;
    bool mounted() const override { return card_ != nullptr; }
    const std::string& mount_point() const override { return cfg_.mount_point; }

private:
    SdCardConfig cfg_;
    sdmmc_card_t* card_ = nullptr;
    int host_slot_ = -1;
    bool bus_ready_ = false;
};

} // namespace fwupd
