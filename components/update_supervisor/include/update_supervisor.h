#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

extern "C" {
#include "esp_err.h"
}

#include "backup_set.h"
#include "bridgefw_config.h"
#include "update_source.h"
#include "version_store.h"

namespace fwupd {

enum class State : uint8_t {
    IDLE = 0,
    PROBING,
    APPLYING,
    COMMITTED,
    ROLLED_BACK
};

enum class FailReason : uint16_t {
    NONE = 0,
    NO_UPDATE_AVAILABLE,
    MANIFEST_EMPTY,
    MANIFEST_REJECTED,
    BACKUP_FAILED,
    FETCH_FAILED,
    WRITE_FAILED,
};

const char* state_name(State s);
const char* fail_reason_name(FailReason r);

struct Status {
    State state = State::IDLE;
    FailReason reason = FailReason::NONE;
    esp_err_t last_err = ESP_OK;
    bool restore_failed = false;

    const char* source = nullptr;  // adapter name once one won the probe
    std::string target_version;
    uint32_t files_applied = 0;
    uint32_t files_total = 0;
};

// One update attempt; lives only inside run().
struct Attempt {
    IUpdateSource* source = nullptr;
    std::string prior_version;  // persisted value, empty if never written
    std::string target_version;
    std::vector<ManifestEntry> manifest;
    uint32_t files_applied = 0;
};

struct CheckResult {
    bool update_available = false;
    const char* source = nullptr;
    std::string current_version;
    std::string target_version;
};

// Boot-time update state machine:
//   IDLE -> PROBING -> APPLYING -> {COMMITTED | ROLLED_BACK} -> IDLE
//
// Sources are consulted in the order given; the first one that is available
// and offers a strictly newer version is the only one used this boot.
// Single-threaded: run() must not be called twice in one boot.
class UpdateSupervisor {
public:
    using StatusCb = std::function<void(const Status&)>;

    struct Config {
        std::vector<IUpdateSource*> sources;  // priority order
        VersionStore* versions = nullptr;
        BackupSet* backup = nullptr;
        FirmwareLayout layout;
        RebootFn reboot = nullptr;
        StatusCb on_status = nullptr;  // optional, called on every transition
    };

    explicit UpdateSupervisor(const Config& cfg);

    // true => update committed and reboot requested (the call normally does not return).
    // false => no update applied; boot continues on the live files.
    bool run();

    // Probe only: nothing is backed up, written or rebooted.
    esp_err_t check(CheckResult& out);

    // Restore a Backup Set left behind by an interrupted attempt and reset the
    // persisted version to what it was before that attempt. Never reboots.
    // true => a set was found (and restored as far as possible).
    bool recover_interrupted();

    Status status() const { return status_; }

private:
    bool valid_config() const;
    IUpdateSource* probe(const std::string& current, std::string& target,
                         std::vector<IUpdateSource*>& probed);
    static void release_all(std::vector<IUpdateSource*>& probed);

    bool prepare(Attempt& a);
    bool apply(Attempt& a);
    void commit(Attempt& a);
    void roll_back();

    void set_state(State s);
    void fail(FailReason r, esp_err_t e);
    void publish();

    Config cfg_;
    Status status_;
};

} // namespace fwupd
