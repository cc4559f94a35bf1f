#pragma once

#include <functional>
#include <string>
#include <vector>

extern "C" {
#include "esp_err.h"
}

// Small POSIX/VFS helpers shared by the backup set and the update sources.
// Paths are absolute VFS paths ("/fw/main.py", "/sd/update/x.py").
namespace fwupd {
namespace fs {

std::string join(const std::string& dir, const std::string& name);
std::string basename(const std::string& path);
std::string dirname(const std::string& path);
std::string trim(const std::string& s);
bool ends_with(const std::string& s, const std::string& suffix);
// ASCII only; FAT compares long names case-insensitively.
std::string to_lower(std::string s);

bool exists(const std::string& path);
bool is_dir(const std::string& path);
bool is_file(const std::string& path);

// mkdir -p; succeeds if the directory already exists.
esp_err_t make_dirs(const std::string& dir);

esp_err_t read_file(const std::string& path, std::string& out);

// Writes to "<path>.tmp", flushes + fsyncs, then replaces <path>.
// Parent directories are created as needed. On failure <path> is untouched.
esp_err_t write_file(const std::string& path, const std::string& data);

esp_err_t copy_file(const std::string& src, const std::string& dst);

// Removes a file or a whole directory tree. Absent path => ESP_OK.
esp_err_t remove_tree(const std::string& path);

// Visitor decides per entry: files are collected when it returns true,
// directories are descended into when it returns true (recursive mode only).
using EntryFilter = std::function<bool(const std::string& rel, bool is_dir)>;

// Lists regular files below dir as paths relative to dir ("sensors/ds18b20.py").
// Missing/unreadable dir => ESP_ERR_NOT_FOUND.
esp_err_t list_files(const std::string& dir, bool recursive, const EntryFilter& filter,
                     std::vector<std::string>& out_rel);

} // namespace fs
} // namespace fwupd
