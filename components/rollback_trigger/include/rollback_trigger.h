#pragma once

#include <cstdint>

extern "C" {
#include "esp_err.h"
}

#include "backup_set.h"
#include "bridgefw_config.h"
#include "update_source.h"
#include "version_store.h"

namespace fwupd {

class IDigitalInput {
public:
    virtual ~IDigitalInput() = default;
    // true while the button is pressed
    virtual bool is_asserted() = 0;
};

class IClock {
public:
    virtual ~IClock() = default;
    virtual uint32_t now_ms() = 0;
    virtual void sleep_ms(uint32_t ms) = 0;
};

// Press, release, press again: evaluated once at boot, before any update logic.
class RollbackTrigger {
public:
    RollbackTrigger(IDigitalInput& input, IClock& clock, const TriggerTiming& timing = TriggerTiming{});

    // false immediately when the button is not pressed at call time. Otherwise
    // polls until a double press is seen or a window closes, never for longer
    // than timing.budget_ms (plus one poll interval).
    bool detect();

private:
    // Polls until the input reads `asserted` or the deadline passes.
    bool wait_for(bool asserted, uint32_t deadline);
    void sleep_until_or(uint32_t ms, uint32_t deadline);

    IDigitalInput& input_;
    IClock& clock_;
    TriggerTiming timing_;
};

// Restore the Backup Set, drop it, erase the version marker and reboot.
// ESP_ERR_NOT_FOUND (and no reboot) when there is nothing to restore.
esp_err_t perform_manual_rollback(BackupSet& backup, VersionStore& versions, const RebootFn& reboot);

} // namespace fwupd
