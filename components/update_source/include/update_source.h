#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

extern "C" {
#include "esp_err.h"
}

#include "bridgefw_config.h"

namespace fwupd {

enum class SourceKind : uint8_t {
    NETWORK = 0,
    LOCAL
};

const char* source_kind_name(SourceKind k);

struct ManifestEntry {
    // Destination relative to the firmware root, '/'-separated. Also the backup key.
    std::string path;
    // Adapter-specific: download URL or source file path. Never persisted.
    std::string locator;
    // Optional git blob SHA-1 (hex) the fetched content must hash to.
    std::string blob_sha;
};

// Must not return when the platform can actually restart.
using RebootFn = std::function<void()>;

// A place updates come from. Every call is blocking and bounded by the
// adapter's own timeouts; any failure is reported as "nothing there".
class IUpdateSource {
public:
    virtual ~IUpdateSource() = default;

    virtual SourceKind kind() const = 0;
    virtual const char* name() const = 0;

    virtual bool is_available() = 0;

    // Newest version the source offers (no leading 'v').
    virtual esp_err_t latest_version(std::string& out) = 0;

    // Files offered for latest_version(). Order is unspecified.
    virtual esp_err_t manifest(std::vector<ManifestEntry>& out) = 0;

    virtual esp_err_t fetch(const ManifestEntry& entry, std::string& out) = 0;

    // Drop whatever the probe acquired (mounts, cached release data).
    virtual void release() {}
};

// Relative, '/'-separated, no empty/"."/".." segment, no leading '/',
// no backslash and no control bytes.
bool is_safe_manifest_path(const std::string& path);

// Paths the updater must never write: the secrets file (by basename), the version
// marker and anything inside the backup directory. Case-insensitive, as on FAT.
bool is_protected_path(const FirmwareLayout& layout, const std::string& path);

} // namespace fwupd
