#pragma once

#include <cstdint>
#include <string>

extern "C" {
#include "esp_err.h"
}

namespace fwupd {

struct Version {
    uint32_t major = 0;
    uint32_t minor = 0;
    uint32_t patch = 0;
};

// Accepts "1.2.3", "v1.2.3", "1.2", "1", surrounding whitespace, extra components
// (ignored) and a "-rc1"/"+build" suffix (ignored). Returns false for anything else.
bool parse_version(const char* s, Version& out);

// Like parse_version but an unparseable string degrades to 0.0.0.
Version to_version(const char* s);

// -1 if a < b, 0 if equal, 1 if a > b. Missing components compare as 0.
int compare_versions(const Version& a, const Version& b);
int compare_versions(const char* a, const char* b);

// Single-line version marker persisted on internal flash.
class VersionStore {
public:
    explicit VersionStore(std::string path);

    // ESP_ERR_NOT_FOUND when the marker was never written, is empty or unreadable.
    esp_err_t read(std::string& out) const;

    // Persisted value, or BASELINE_VERSION when absent.
    std::string current() const;

    // Overwrites the marker; flushed to storage before returning.
    esp_err_t write(const std::string& version);

    // Removes the marker. Already absent => ESP_OK.
    esp_err_t erase();

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace fwupd
