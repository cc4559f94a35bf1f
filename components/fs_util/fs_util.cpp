#include "fs_util.h"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>

#include <dirent.h>
#include <sys/stat.h>
#include <unistd.h>

extern "C" {
#include "esp_log.h"
}

namespace fwupd {
namespace fs {

static const char* TAG = "fs_util";

static constexpr size_t COPY_CHUNK = 1024;

std::string join(const std::string& dir, const std::string& name)
{
    if (dir.empty()) return name;
    if (name.empty()) return dir;
    if (dir.back() == '/') return dir + name;
    return dir + "/" + name;
}

std::string basename(const std::string& path)
{
    const size_t pos = path.find_last_of('/');
    return (pos == std::string::npos) ? path : path.substr(pos + 1);
}

std::string dirname(const std::string& path)
{
    const size_t pos = path.find_last_of('/');
    if (pos == std::string::npos) return "";
    if (pos == 0) return "/";
    return path.substr(0, pos);
}

std::string trim(const std::string& s)
{
    static const char* ws = " \t\r\n";
    const size_t b = s.find_first_not_of(ws);
    if (b == std::string::npos) return "";
    const size_t e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

bool ends_with(const std::string& s, const std::string& suffix)
{
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string to_lower(std::string s)
{
    for (auto& c : s) {
        if (c >= 'A' && c <= 'Z') c = (char)(c - 'A' + 'a');
    }
    return s;
}

bool exists(const std::string& path)
{
    struct stat st;
    return ::stat(path.c_str(), &st) == 0;
}

bool is_dir(const std::string& path)
{
    struct stat st;
    return ::stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

bool is_file(const std::string& path)
{
    struct stat st;
    return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

esp_err_t make_dirs(const std::string& dir)
{
    if (dir.empty() || dir == "/") return ESP_OK;
    if (is_dir(dir)) return ESP_OK;

    const std::string parent = dirname(dir);
    if (!parent.empty() && parent != dir) {
        esp_err_t err = make_dirs(parent);
        if (err != ESP_OK) return err;
    }

    if (::mkdir(dir.c_str(), 0775) != 0 && !(errno == EEXIST && is_dir(dir))) {
        ESP_LOGE(TAG, "mkdir %s failed: errno=%d", dir.c_str(), errno);
        return ESP_FAIL;
    }
    return ESP_OK;
}

esp_err_t read_file(const std::string& path, std::string& out)
{
    FILE* f = std::fopen(path.c_str(), "rb");
    if (!f) return ESP_ERR_NOT_FOUND;

    out.clear();
    char buf[COPY_CHUNK];
    size_t n = 0;
    while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) {
        out.append(buf, n);
    }
    const bool failed = std::ferror(f) != 0;
    std::fclose(f);

    if (failed) {
        ESP_LOGE(TAG, "read %s failed", path.c_str());
        return ESP_FAIL;
    }
    return ESP_OK;
}

esp_err_t write_file(const std::string& path, const std::string& data)
{
    esp_err_t err = make_dirs(dirname(path));
    if (err != ESP_OK) return err;

    const std::string tmp = path + ".tmp";
    FILE* f = std::fopen(tmp.c_str(), "wb");
    if (!f) {
        ESP_LOGE(TAG, "open %s for write failed: errno=%d", tmp.c_str(), errno);
        return ESP_FAIL;
    }

    bool ok = data.empty() || std::fwrite(data.data(), 1, data.size(), f) == data.size();
    ok = ok && std::fflush(f) == 0;
    ok = ok && ::fsync(fileno(f)) == 0;
    ok = (std::fclose(f) == 0) && ok;

    if (!ok) {
        ESP_LOGE(TAG, "write %s failed: errno=%d", tmp.c_str(), errno);
        ::unlink(tmp.c_str());
        return ESP_FAIL;
    }

    // FAT refuses to rename over an existing file
    if (exists(path) && ::unlink(path.c_str()) != 0) {
        ESP_LOGE(TAG, "unlink %s failed: errno=%d", path.c_str(), errno);
        ::unlink(tmp.c_str());
        return ESP_FAIL;
    }
    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        ESP_LOGE(TAG, "rename %s failed: errno=%d", tmp.c_str(), errno);
        ::unlink(tmp.c_str());
        return ESP_FAIL;
    }
    return ESP_OK;
}

esp_err_t copy_file(const std::string& src, const std::string& dst)
{
    std::string content;
    esp_err_t err = read_file(src, content);
    if (err != ESP_OK) return err;
    return write_file(dst, content);
}

esp_err_t remove_tree(const std::string& path)
{
    struct stat st;
    if (::stat(path.c_str(), &st) != 0) return ESP_OK;

    if (!S_ISDIR(st.st_mode)) {
        if (::unlink(path.c_str()) != 0) {
            ESP_LOGW(TAG, "unlink %s failed: errno=%d", path.c_str(), errno);
            return ESP_FAIL;
        }
        return ESP_OK;
    }

    DIR* d = ::opendir(path.c_str());
    if (!d) return ESP_FAIL;

    std::vector<std::string> children;
    while (dirent* e = ::readdir(d)) {
        if (std::strcmp(e->d_name, ".") == 0 || std::strcmp(e->d_name, "..") == 0) continue;
        children.push_back(join(path, e->d_name));
    }
    ::closedir(d);

    esp_err_t result = ESP_OK;
    for (const auto& child : children) {
        if (remove_tree(child) != ESP_OK) result = ESP_FAIL;
    }
    if (::rmdir(path.c_str()) != 0) {
        ESP_LOGW(TAG, "rmdir %s failed: errno=%d", path.c_str(), errno);
        result = ESP_FAIL;
    }
    return result;
}

static esp_err_t scan(const std::string& base, const std::string& rel, bool recursive,
                      const EntryFilter& filter, std::vector<std::string>& out)
{
    const std::string dir = rel.empty() ? base : join(base, rel);
    DIR* d = ::opendir(dir.c_str());
    if (!d) return ESP_ERR_NOT_FOUND;

    std::vector<std::string> names;
    while (dirent* e = ::readdir(d)) {
        if (std::strcmp(e->d_name, ".") == 0 || std::strcmp(e->d_name, "..") == 0) continue;
        names.emplace_back(e->d_name);
    }
    ::closedir(d);
    std::sort(names.begin(), names.end());

    for (const auto& name : names) {
        const std::string child_rel = rel.empty() ? name : join(rel, name);
        const bool dir_entry = is_dir(join(base, child_rel));

        if (!filter(child_rel, dir_entry)) continue;

        if (dir_entry) {
            if (recursive) {
                // a subdirectory vanishing mid-scan is not fatal for the listing
                (void)scan(base, child_rel, recursive, filter, out);
            }
        } else {
            out.push_back(child_rel);
        }
    }
    return ESP_OK;
}

esp_err_t list_files(const std::string& dir, bool recursive, const EntryFilter& filter,
                     std::vector<std::string>& out_rel)
{
    out_rel.clear();
    return scan(dir, "", recursive, filter, out_rel);
}

} // namespace fs
} // namespace fwupd
