#include "rollback_trigger.h"

extern "C" {
#include "esp_log.h"
}

namespace fwupd {

static const char* TAG = "rollback_trigger";

// Wrap-safe "t is before deadline".
static bool before(uint32_t t, uint32_t deadline)
{
    return (int32_t)(t - deadline) < 0;
}

static uint32_t earlier(uint32_t a, uint32_t b)
{
    return before(a, b) ? a : b;
}

RollbackTrigger::RollbackTrigger(IDigitalInput& input, IClock& clock, const TriggerTiming& timing)
    : input_(input), clock_(clock), timing_(timing) {}

void RollbackTrigger::sleep_until_or(uint32_t ms, uint32_t deadline)
{
    const uint32_t now = clock_.now_ms();
    if (!before(now, deadline)) return;
    const uint32_t left = deadline - now;
    clock_.sleep_ms(ms < left ? ms : left);
}

bool RollbackTrigger::wait_for(bool asserted, uint32_t deadline)
{
    while (true) {
        if (input_.is_asserted() == asserted) return true;
        if (!before(clock_.now_ms(), deadline)) return false;
        sleep_until_or(timing_.poll_ms, deadline);
    }
}

bool RollbackTrigger::detect()
{
    if (!input_.is_asserted()) return false;

    const uint32_t start = clock_.now_ms();
    const uint32_t budget_end = start + timing_.budget_ms;
    ESP_LOGI(TAG, "Button held at boot; watching for double press");

    sleep_until_or(timing_.debounce_ms, budget_end);
    if (!input_.is_asserted()) {
        ESP_LOGI(TAG, "Bounce, ignoring");
        return false;
    }

    if (!wait_for(false, earlier(start + timing_.release_window_ms, budget_end))) {
        ESP_LOGI(TAG, "Button not released in time; no rollback");
        return false;
    }

    const uint32_t released = clock_.now_ms();
    sleep_until_or(timing_.debounce_ms, budget_end);

    if (!wait_for(true, earlier(released + timing_.second_window_ms, budget_end))) {
        ESP_LOGI(TAG, "No second press; no rollback");
        return false;
    }

    sleep_until_or(timing_.debounce_ms, budget_end);
    if (!input_.is_asserted()) {
        ESP_LOGI(TAG, "Second press too short; no rollback");
        return false;
    }

    ESP_LOGW(TAG, "Double press detected after %u ms", (unsigned)(clock_.now_ms() - start));
    return true;
}

esp_err_t perform_manual_rollback(BackupSet& backup, VersionStore& versions, const RebootFn& reboot)
{
    if (!backup.exists()) {
        ESP_LOGW(TAG, "Manual rollback requested but no backup exists");
        return ESP_ERR_NOT_FOUND;
    }

    ESP_LOGW(TAG, "Manual rollback: restoring backup");
    esp_err_t err = backup.restore();
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Restore incomplete (0x%x); rebooting anyway", (unsigned)err);
    }
    backup.cleanup();

    esp_err_t verr = versions.erase();
    if (verr != ESP_OK) {
        ESP_LOGE(TAG, "Cannot erase version marker (0x%x)", (unsigned)verr);
    }

    ESP_LOGW(TAG, "Rebooting after manual rollback...");
    if (reboot) reboot();
    return err;
}

} // namespace fwupd
