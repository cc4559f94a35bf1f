#include "update_supervisor.h"

extern "C" {
#include "esp_log.h"
}

#include "fs_util.h"

namespace fwupd {

static const char* TAG = "update_supervisor";

const char* state_name(State s)
{
    switch (s) {
        case State::IDLE:        return "IDLE";
        case State::PROBING:     return "PROBING";
        case State::APPLYING:    return "APPLYING";
        case State::COMMITTED:   return "COMMITTED";
        case State::ROLLED_BACK: return "ROLLED_BACK";
    }
    return "?";
}

const char* fail_reason_name(FailReason r)
{
    switch (r) {
        case FailReason::NONE:                return "NONE";
        case FailReason::NO_UPDATE_AVAILABLE: return "NO_UPDATE_AVAILABLE";
        case FailReason::MANIFEST_EMPTY:      return "MANIFEST_EMPTY";
        case FailReason::MANIFEST_REJECTED:   return "MANIFEST_REJECTED";
        case FailReason::BACKUP_FAILED:       return "BACKUP_FAILED";
        case FailReason::FETCH_FAILED:        return "FETCH_FAILED";
        case FailReason::WRITE_FAILED:        return "WRITE_FAILED";
    }
    return "?";
}

UpdateSupervisor::UpdateSupervisor(const Config& cfg) : cfg_(cfg) {
    status_ = {};
}

bool UpdateSupervisor::valid_config() const
{
    if (!cfg_.versions || !cfg_.backup || !cfg_.reboot) {
        ESP_LOGE(TAG, "Missing dependencies (versions/backup/reboot)");
        return false;
    }
    return true;
}

void UpdateSupervisor::publish()
{
    if (cfg_.on_status) cfg_.on_status(status_);
}

void UpdateSupervisor::set_state(State s)
{
    status_.state = s;
    ESP_LOGI(TAG, "State -> %s", state_name(s));
    publish();
}

void UpdateSupervisor::fail(FailReason r, esp_err_t e)
{
    status_.reason = r;
    status_.last_err = e;
    ESP_LOGW(TAG, "Attempt ended: reason=%s err=0x%x", fail_reason_name(r), (unsigned)e);
}

void UpdateSupervisor::release_all(std::vector<IUpdateSource*>& probed)
{
    for (auto* src : probed) src->release();
    probed.clear();
}

IUpdateSource* UpdateSupervisor::probe(const std::string& current, std::string& target,
                                       std::vector<IUpdateSource*>& probed)
{
    for (auto* src : cfg_.sources) {
        if (!src) continue;
        probed.push_back(src);

        if (!src->is_available()) {
            ESP_LOGI(TAG, "[%s] not available", src->name());
            continue;
        }

        std::string latest;
        if (src->latest_version(latest) != ESP_OK) {
            ESP_LOGI(TAG, "[%s] no version offered", src->name());
            continue;
        }

        if (compare_versions(latest.c_str(), current.c_str()) <= 0) {
            ESP_LOGI(TAG, "[%s] offers %s, current %s: nothing newer",
                     src->name(), latest.c_str(), current.c_str());
            continue;
        }

        ESP_LOGI(TAG, "[%s] update available: %s -> %s",
                 src->name(), current.c_str(), latest.c_str());
        target = latest;
        return src;
    }
    return nullptr;
}

esp_err_t UpdateSupervisor::check(CheckResult& out)
{
    out = CheckResult{};
    if (!valid_config()) return ESP_ERR_INVALID_ARG;

    out.current_version = cfg_.versions->current();

    std::vector<IUpdateSource*> probed;
    IUpdateSource* winner = probe(out.current_version, out.target_version, probed);
    if (winner) {
        out.update_available = true;
        out.source = winner->name();
    }
    release_all(probed);

    ESP_LOGI(TAG, "Check: %s", out.update_available ? "update available" : "no update");
    return ESP_OK;
}

bool UpdateSupervisor::recover_interrupted()
{
    if (!cfg_.versions || !cfg_.backup) return false;
    BackupSet& backup = *cfg_.backup;
    if (!backup.exists()) return false;

    ESP_LOGW(TAG, "Backup left by an interrupted attempt; restoring");

    std::string prior;
    const esp_err_t jerr = backup.prior_version(prior);

    esp_err_t err = backup.restore();
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Recovery restore incomplete (0x%x)", (unsigned)err);
    }
    backup.cleanup();

    if (jerr == ESP_OK) {
        err = cfg_.versions->write(prior);
    } else if (jerr == ESP_ERR_NOT_FOUND) {
        err = cfg_.versions->erase();
    } else {
        // no journal: the attempt never reached a destructive write
        err = ESP_OK;
    }
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Cannot reset version marker (0x%x)", (unsigned)err);
    }

    ESP_LOGI(TAG, "Recovery done; version is %s", cfg_.versions->current().c_str());
    return true;
}

bool UpdateSupervisor::prepare(Attempt& a)
{
    esp_err_t err = a.source->manifest(a.manifest);
    if (err != ESP_OK || a.manifest.empty()) {
        ESP_LOGW(TAG, "[%s] offered no files; not trusted", a.source->name());
        fail(FailReason::MANIFEST_EMPTY, err == ESP_OK ? ESP_ERR_NOT_FOUND : err);
        return false;
    }

    std::vector<std::string> paths;
    for (const auto& e : a.manifest) {
        if (!is_safe_manifest_path(e.path)) {
            ESP_LOGE(TAG, "Unsafe manifest path '%s'; rejecting manifest", e.path.c_str());
            fail(FailReason::MANIFEST_REJECTED, ESP_ERR_INVALID_ARG);
            return false;
        }
        if (is_protected_path(cfg_.layout, e.path)) continue;
        paths.push_back(e.path);
    }
    if (paths.empty()) {
        ESP_LOGW(TAG, "Manifest holds only protected files");
        fail(FailReason::MANIFEST_EMPTY, ESP_ERR_NOT_FOUND);
        return false;
    }
    status_.files_total = (uint32_t)paths.size();

    err = cfg_.backup->begin(paths, a.prior_version);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Backup failed; live files untouched");
        fail(FailReason::BACKUP_FAILED, err);
        return false;
    }
    return true;
}

bool UpdateSupervisor::apply(Attempt& a)
{
    for (const auto& e : a.manifest) {
        if (is_protected_path(cfg_.layout, e.path)) {
            ESP_LOGW(TAG, "Skipping protected file %s", e.path.c_str());
            continue;
        }

        std::string content;
        esp_err_t err = a.source->fetch(e, content);
        if (err != ESP_OK) {
            ESP_LOGE(TAG, "Fetch failed: %s (0x%x)", e.path.c_str(), (unsigned)err);
            fail(FailReason::FETCH_FAILED, err);
            return false;
        }

        err = fs::write_file(cfg_.layout.live_path(e.path), content);
        if (err != ESP_OK) {
            ESP_LOGE(TAG, "Write failed: %s (0x%x)", e.path.c_str(), (unsigned)err);
            fail(FailReason::WRITE_FAILED, err);
            return false;
        }

        a.files_applied++;
        status_.files_applied = a.files_applied;
        ESP_LOGI(TAG, "Applied %s (%u/%u)", e.path.c_str(),
                 (unsigned)a.files_applied, (unsigned)status_.files_total);
    }

    // The marker is written last so an interrupted attempt never reports it.
    esp_err_t err = cfg_.versions->write(a.target_version);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Cannot persist version %s", a.target_version.c_str());
        fail(FailReason::WRITE_FAILED, err);
        return false;
    }
    return true;
}

void UpdateSupervisor::commit(Attempt& a)
{
    set_state(State::COMMITTED);
    cfg_.backup->cleanup();
    ESP_LOGI(TAG, "Update to %s committed (%u files); rebooting",
             a.target_version.c_str(), (unsigned)a.files_applied);
}

void UpdateSupervisor::roll_back()
{
    set_state(State::ROLLED_BACK);

    esp_err_t err = cfg_.backup->restore();
    if (err != ESP_OK) {
        status_.restore_failed = true;
        ESP_LOGE(TAG, "Restore incomplete (0x%x); live tree may be mixed", (unsigned)err);
    }
    cfg_.backup->cleanup();
}

bool UpdateSupervisor::run()
{
    status_ = {};
    if (!valid_config()) return false;

    if (cfg_.backup->exists()) recover_interrupted();

    set_state(State::PROBING);

    Attempt a;
    if (cfg_.versions->read(a.prior_version) != ESP_OK) a.prior_version.clear();
    const std::string current = a.prior_version.empty() ? BASELINE_VERSION : a.prior_version;

    std::vector<IUpdateSource*> probed;
    a.source = probe(current, a.target_version, probed);
    if (!a.source) {
        fail(FailReason::NO_UPDATE_AVAILABLE, ESP_OK);
        release_all(probed);
        set_state(State::IDLE);
        return false;
    }
    status_.source = a.source->name();
    status_.target_version = a.target_version;

    if (!prepare(a)) {
        release_all(probed);
        set_state(State::IDLE);
        return false;
    }

    set_state(State::APPLYING);
    if (!apply(a)) {
        roll_back();
        release_all(probed);
        set_state(State::IDLE);
        return false;
    }

    commit(a);
    release_all(probed);
    cfg_.reboot();
    return true;
}

} // namespace fwupd
