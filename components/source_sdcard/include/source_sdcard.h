#pragma once

#include <string>
#include <vector>

#include "bridgefw_config.h"
#include "update_source.h"

namespace fwupd {

// Removable volume exposed through the VFS once mounted.
class IVolume {
public:
    virtual ~IVolume() = default;

    // Idempotent: ESP_OK if already mounted.
    virtual esp_err_t mount() = 0;
    virtual void unmount() = 0;
    virtual bool mounted() const = 0;
    virtual const std::string& mount_point() const = 0;
};

// Update files dropped in <mount>/<update_dir> next to a version marker.
class SdCardSource : public IUpdateSource {
public:
    SdCardSource(IVolume& volume, const SdCardConfig& cfg);

    SourceKind kind() const override { return SourceKind::LOCAL; }
    const char* name() const override { return "sdcard"; }

    bool is_available() override;
    esp_err_t latest_version(std::string& out) override;
    esp_err_t manifest(std::vector<ManifestEntry>& out) override;
    esp_err_t fetch(const ManifestEntry& entry, std::string& out) override;
    void release() override;

private:
    std::string update_path() const;

    IVolume& volume_;
    SdCardConfig cfg_;
};

} // namespace fwupd
