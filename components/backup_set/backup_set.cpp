#include "backup_set.h"

#include <set>

extern "C" {
#include "esp_log.h"
}

#include "fs_util.h"
#include "update_source.h"

namespace fwupd {

static const char* TAG = "backup_set";

static constexpr const char* VERSION_KEY = "version ";
static constexpr const char* CREATED_KEY = "created ";

static bool starts_with(const std::string& s, const char* prefix)
{
    return s.compare(0, std::char_traits<char>::length(prefix), prefix) == 0;
}

// Outermost ancestor of rel (or rel itself) that does not exist live.
// Removing it undoes every directory the update had to create for rel.
static std::string first_missing(const FirmwareLayout& l, const std::string& rel)
{
    std::string top = rel;
    for (std::string up = fs::dirname(rel); !up.empty(); up = fs::dirname(up)) {
        if (fs::exists(l.live_path(up))) break;
        top = up;
    }
    return top;
}

BackupSet::BackupSet(const FirmwareLayout& layout) : layout_(layout) {}

std::string BackupSet::files_path() const
{
    return fs::join(layout_.backup_path(), FILES_DIR);
}

std::string BackupSet::journal_path() const
{
    return fs::join(layout_.backup_path(), JOURNAL);
}

bool BackupSet::exists() const
{
    return fs::is_dir(layout_.backup_path());
}

std::vector<std::string> BackupSet::eligible_live_files() const
{
    const FirmwareLayout& l = layout_;
    auto filter = [&l](const std::string& rel, bool is_dir) -> bool {
        const std::string name = fs::basename(rel);
        if (name.empty() || name[0] == '.') return false;
        if (is_dir) {
            return fs::to_lower(rel) != fs::to_lower(l.backup_dir) &&
                   fs::to_lower(name) != "__pycache__";
        }
        if (is_protected_path(l, rel)) return false;
        return fs::ends_with(name, l.managed_ext);
    };

    std::vector<std::string> files;
    if (fs::list_files(l.root, true, filter, files) != ESP_OK) {
        ESP_LOGW(TAG, "Cannot list firmware root %s", l.root.c_str());
        files.clear();
    }
    return files;
}

esp_err_t BackupSet::begin(const std::vector<std::string>& manifest_paths,
                           const std::string& prior_version)
{
    const std::string backup = layout_.backup_path();

    if (exists()) {
        ESP_LOGW(TAG, "Removing stale backup at %s", backup.c_str());
        cleanup();
    }

    std::set<std::string> to_copy;
    for (const auto& rel : eligible_live_files()) to_copy.insert(rel);

    std::set<std::string> created;
    for (const auto& rel : manifest_paths) {
        if (!is_safe_manifest_path(rel) || is_protected_path(layout_, rel)) continue;
        const std::string live = layout_.live_path(rel);
        if (fs::is_file(live)) {
            to_copy.insert(rel);
        } else if (!fs::exists(live)) {
            created.insert(first_missing(layout_, rel));
        }
    }

    esp_err_t err = fs::make_dirs(files_path());
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Cannot create backup directory %s", backup.c_str());
        return err;
    }

    // Journal goes first so an interrupted snapshot still knows what to undo.
    std::string journal;
    if (!prior_version.empty()) {
        journal += VERSION_KEY;
        journal += prior_version;
        journal += "\n";
    }
    for (const auto& rel : created) {
        journal += CREATED_KEY;
        journal += rel;
        journal += "\n";
    }
    err = fs::write_file(journal_path(), journal);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Cannot write backup journal");
        cleanup();
        return err;
    }

    for (const auto& rel : to_copy) {
        err = fs::copy_file(layout_.live_path(rel), fs::join(files_path(), rel));
        if (err != ESP_OK) {
            ESP_LOGE(TAG, "Backup of %s failed (0x%x); discarding partial backup",
                     rel.c_str(), (unsigned)err);
            cleanup();
            return ESP_FAIL;
        }
    }

    ESP_LOGI(TAG, "Backup created (%u files, %u new paths journaled)",
             (unsigned)to_copy.size(), (unsigned)created.size());
    return ESP_OK;
}

esp_err_t BackupSet::read_journal(std::string& version, std::vector<std::string>& created) const
{
    version.clear();
    created.clear();

    std::string raw;
    esp_err_t err = fs::read_file(journal_path(), raw);
    if (err != ESP_OK) return err;

    size_t start = 0;
    while (start < raw.size()) {
        size_t end = raw.find('\n', start);
        if (end == std::string::npos) end = raw.size();
        const std::string line = raw.substr(start, end - start);
        start = end + 1;

        if (starts_with(line, VERSION_KEY)) {
            version = fs::trim(line.substr(std::char_traits<char>::length(VERSION_KEY)));
        } else if (starts_with(line, CREATED_KEY)) {
            created.push_back(line.substr(std::char_traits<char>::length(CREATED_KEY)));
        }
    }
    return ESP_OK;
}

esp_err_t BackupSet::prior_version(std::string& out) const
{
    std::string version;
    std::vector<std::string> created;
    if (read_journal(version, created) != ESP_OK) return ESP_ERR_INVALID_STATE;
    if (version.empty()) return ESP_ERR_NOT_FOUND;
    out = version;
    return ESP_OK;
}

esp_err_t BackupSet::restore()
{
    if (!exists()) {
        ESP_LOGW(TAG, "No backup to restore");
        return ESP_ERR_NOT_FOUND;
    }

    std::string version;
    std::vector<std::string> created;
    if (read_journal(version, created) != ESP_OK) {
        ESP_LOGW(TAG, "Backup journal missing; restoring files only");
    }

    auto filter = [](const std::string& rel, bool is_dir) -> bool {
        return is_dir || !fs::ends_with(rel, ".tmp");
    };

    const std::string mirror = files_path();
    std::vector<std::string> files;
    esp_err_t err = ESP_OK;
    if (fs::is_dir(mirror)) {
        err = fs::list_files(mirror, true, filter, files);
    }
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Cannot list backup at %s", mirror.c_str());
        return err;
    }

    esp_err_t result = ESP_OK;
    size_t restored = 0;
    for (const auto& rel : files) {
        err = fs::copy_file(fs::join(mirror, rel), layout_.live_path(rel));
        if (err != ESP_OK) {
            ESP_LOGE(TAG, "Restore error: %s (0x%x)", rel.c_str(), (unsigned)err);
            result = ESP_FAIL;
            continue;
        }
        restored++;
    }

    for (const auto& rel : created) {
        if (!is_safe_manifest_path(rel) || is_protected_path(layout_, rel)) continue;
        if (fs::remove_tree(layout_.live_path(rel)) != ESP_OK) {
            ESP_LOGE(TAG, "Cannot remove file added by update: %s", rel.c_str());
            result = ESP_FAIL;
        }
    }

    if (result == ESP_OK) {
        ESP_LOGI(TAG, "Backup restored (%u files)", (unsigned)restored);
    } else {
        ESP_LOGE(TAG, "Backup restored with errors (%u of %u files)",
                 (unsigned)restored, (unsigned)files.size());
    }
    return result;
}

void BackupSet::cleanup()
{
    if (!exists()) return;
    if (fs::remove_tree(layout_.backup_path()) != ESP_OK) {
        ESP_LOGW(TAG, "Backup cleanup incomplete at %s", layout_.backup_path().c_str());
        return;
    }
    ESP_LOGI(TAG, "Backup removed");
}

} // namespace fwupd
