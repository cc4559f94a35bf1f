#pragma once

#include <string>
#include <vector>

extern "C" {
#include "esp_err.h"
}

#include "bridgefw_config.h"

namespace fwupd {

// Transient mirror of the live firmware files, kept under <root>/<backup_dir>
// for exactly as long as an update or rollback is in flight.
//
// Layout:
//   <backup>/files/<logical path>   verbatim copy of each live file
//   <backup>/journal                "version <v>" and "created <path>" lines
class BackupSet {
public:
    explicit BackupSet(const FirmwareLayout& layout);

    // Snapshot every eligible live file plus every manifest path that exists live.
    // Manifest paths absent from the live tree are journaled so restore() removes them,
    // together with any directory that had to be created for them.
    // On error nothing live has been touched and the partial set is removed.
    esp_err_t begin(const std::vector<std::string>& manifest_paths,
                    const std::string& prior_version = "");

    // Copy every backed-up file back over its live path and delete journaled
    // new files. Best effort: keeps going after a failure, ESP_FAIL if any failed.
    esp_err_t restore();

    // Delete the set. No set => no-op.
    void cleanup();

    bool exists() const;

    // Version recorded by begin(). ESP_ERR_NOT_FOUND if begin() had none to record,
    // ESP_ERR_INVALID_STATE if there is no readable journal.
    esp_err_t prior_version(std::string& out) const;

    // Live files that begin() would snapshot, relative to the firmware root.
    std::vector<std::string> eligible_live_files() const;

private:
    static constexpr const char* FILES_DIR = "files";
    static constexpr const char* JOURNAL = "journal";

    std::string files_path() const;
    std::string journal_path() const;

    esp_err_t read_journal(std::string& version, std::vector<std::string>& created) const;

    FirmwareLayout layout_;
};

} // namespace fwupd
