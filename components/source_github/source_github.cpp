#include "source_github.h"

#include <cstdio>
#include <cstring>
#include <utility>

extern "C" {
#include "esp_log.h"
#include "cJSON.h"
#include "mbedtls/sha1.h"
}

#include "fs_util.h"

namespace fwupd {

static const char* TAG = "source_github";

std::string git_blob_sha1_hex(const std::string& content)
{
    char header[32];
    const int hlen = std::snprintf(header, sizeof(header), "blob %u", (unsigned)content.size());

    uint8_t digest[20];
    mbedtls_sha1_context ctx;
    mbedtls_sha1_init(&ctx);
    mbedtls_sha1_starts(&ctx);
    // header includes its terminating NUL
    mbedtls_sha1_update(&ctx, reinterpret_cast<const unsigned char*>(header), (size_t)hlen + 1);
    mbedtls_sha1_update(&ctx, reinterpret_cast<const unsigned char*>(content.data()), content.size());
    mbedtls_sha1_finish(&ctx, digest);
    mbedtls_sha1_free(&ctx);

    static const char* hex = "0123456789abcdef";
    std::string out(40, '0');
    for (int i = 0; i < 20; ++i) {
        out[i * 2]     = hex[(digest[i] >> 4) & 0xF];
        out[i * 2 + 1] = hex[digest[i] & 0xF];
    }
    return out;
}

static std::string strip_v(const std::string& tag)
{
    if (!tag.empty() && (tag[0] == 'v' || tag[0] == 'V')) return tag.substr(1);
    return tag;
}

static const char* json_string(const cJSON* obj, const char* key)
{
    const cJSON* j = cJSON_GetObjectItemCaseSensitive(obj, key);
    if (!cJSON_IsString(j) || !j->valuestring) return nullptr;
    return j->valuestring;
}

GithubReleaseSource::GithubReleaseSource(IHttpClient& http, const GithubConfig& cfg, LinkUpFn link_up)
    : http_(http), cfg_(cfg), link_up_(std::move(link_up)) {}

bool GithubReleaseSource::is_available()
{
    if (cfg_.owner.empty() || cfg_.repo.empty()) {
        ESP_LOGW(TAG, "Repository not configured");
        return false;
    }
    return link_up_ && link_up_();
}

std::vector<std::pair<std::string, std::string>> GithubReleaseSource::headers(bool api) const
{
    std::vector<std::pair<std::string, std::string>> h;
    if (api) h.emplace_back("Accept", "application/vnd.github+json");
    h.emplace_back("User-Agent", cfg_.user_agent);
    if (!cfg_.token.empty()) h.emplace_back("Authorization", "token " + cfg_.token);
    return h;
}

esp_err_t GithubReleaseSource::api_get(const std::string& url, int timeout_ms, std::string& body)
{
    HttpRequest req;
    req.url = url;
    req.headers = headers(true);
    req.timeout_ms = timeout_ms;

    HttpResponse resp;
    esp_err_t err = http_.get(req, resp);
    if (err != ESP_OK) {
        ESP_LOGW(TAG, "Request failed: %s", esp_err_to_name(err));
        return err;
    }

    switch (resp.status) {
        case 200:
            body.swap(resp.body);
            return ESP_OK;
        case 403:
        case 429:
            ESP_LOGW(TAG, "GitHub API rate limited (HTTP %d)%s", resp.status,
                     cfg_.token.empty() ? "; configure a token" : "");
            return ESP_ERR_INVALID_STATE;
        case 404:
            ESP_LOGW(TAG, "No release found for %s/%s", cfg_.owner.c_str(), cfg_.repo.c_str());
            return ESP_ERR_NOT_FOUND;
        default:
            ESP_LOGW(TAG, "GitHub API error: HTTP %d", resp.status);
            return ESP_ERR_INVALID_RESPONSE;
    }
}

esp_err_t GithubReleaseSource::latest_version(std::string& out)
{
    release();

    const std::string url = cfg_.api_base + "/repos/" + cfg_.owner + "/" + cfg_.repo + "/releases/latest";
    std::string body;
    esp_err_t err = api_get(url, cfg_.meta_timeout_ms, body);
    if (err != ESP_OK) return err;

    cJSON* root = cJSON_Parse(body.c_str());
    if (!root) {
        ESP_LOGE(TAG, "Release JSON parse failed. First 120 bytes: %.120s", body.c_str());
        return ESP_ERR_INVALID_RESPONSE;
    }

    const char* tag = json_string(root, "tag_name");
    if (!tag || !*tag) {
        ESP_LOGE(TAG, "Release has no tag_name");
        cJSON_Delete(root);
        return ESP_ERR_INVALID_RESPONSE;
    }

    std::vector<Asset> assets;
    const cJSON* j_assets = cJSON_GetObjectItemCaseSensitive(root, "assets");
    if (cJSON_IsArray(j_assets)) {
        const cJSON* a = nullptr;
        cJSON_ArrayForEach(a, j_assets) {
            const char* name = json_string(a, "name");
            const char* dl = json_string(a, "browser_download_url");
            if (name && dl) assets.push_back(Asset{name, dl});
        }
    }

    std::string tag_str = tag;
    cJSON_Delete(root);

    if (cfg_.mode == GithubMode::ASSETS && assets.empty()) {
        ESP_LOGW(TAG, "Release %s has no assets", tag_str.c_str());
        return ESP_ERR_NOT_FOUND;
    }

    tag_ = tag_str;
    assets_.swap(assets);
    probed_ = true;
    out = strip_v(tag_);

    ESP_LOGI(TAG, "Latest release: %s (%u assets)", tag_.c_str(), (unsigned)assets_.size());
    return ESP_OK;
}

bool GithubReleaseSource::wanted_file(const std::string& path) const
{
    const std::string name = fs::to_lower(fs::basename(path));
    if (name == fs::to_lower(cfg_.secrets_file)) return false;
    if (name == fs::to_lower(cfg_.version_marker)) return true;
    return fs::ends_with(name, fs::to_lower(cfg_.managed_ext));
}

esp_err_t GithubReleaseSource::assets_manifest(std::vector<ManifestEntry>& out)
{
    for (const auto& a : assets_) {
        if (!wanted_file(a.name)) continue;
        out.push_back(ManifestEntry{a.name, a.url, ""});
    }
    return ESP_OK;
}

esp_err_t GithubReleaseSource::tree_manifest(std::vector<ManifestEntry>& out)
{
    const std::string url = cfg_.api_base + "/repos/" + cfg_.owner + "/" + cfg_.repo +
                            "/git/trees/" + tag_ + "?recursive=1";
    std::string body;
    esp_err_t err = api_get(url, cfg_.meta_timeout_ms, body);
    if (err != ESP_OK) return err;

    cJSON* root = cJSON_Parse(body.c_str());
    if (!root) {
        ESP_LOGE(TAG, "Tree JSON parse failed");
        return ESP_ERR_INVALID_RESPONSE;
    }

    if (cJSON_IsTrue(cJSON_GetObjectItemCaseSensitive(root, "truncated"))) {
        ESP_LOGE(TAG, "Tree listing for %s is truncated", tag_.c_str());
        cJSON_Delete(root);
        return ESP_ERR_INVALID_SIZE;
    }

    const cJSON* tree = cJSON_GetObjectItemCaseSensitive(root, "tree");
    if (!cJSON_IsArray(tree)) {
        ESP_LOGE(TAG, "Tree listing has no tree array");
        cJSON_Delete(root);
        return ESP_ERR_INVALID_RESPONSE;
    }

    const cJSON* item = nullptr;
    cJSON_ArrayForEach(item, tree) {
        const char* type = json_string(item, "type");
        const char* path = json_string(item, "path");
        if (!type || !path || std::strcmp(type, "blob") != 0) continue;

        const std::string p = path;
        bool skip = false;
        size_t start = 0;
        while (start < p.size()) {
            size_t end = p.find('/', start);
            if (end == std::string::npos) end = p.size();
            if (p[start] == '.' || p.compare(start, end - start, "__pycache__") == 0) {
                skip = true;
                break;
            }
            start = end + 1;
        }
        if (skip || !wanted_file(p)) continue;

        const char* sha = json_string(item, "sha");
        out.push_back(ManifestEntry{
            p,
            cfg_.raw_base + "/" + cfg_.owner + "/" + cfg_.repo + "/" + tag_ + "/" + p,
            sha ? fs::to_lower(sha) : ""});
    }

    cJSON_Delete(root);
    return ESP_OK;
}

esp_err_t GithubReleaseSource::manifest(std::vector<ManifestEntry>& out)
{
    out.clear();
    if (!probed_) {
        std::string ignored;
        esp_err_t err = latest_version(ignored);
        if (err != ESP_OK) return err;
    }

    esp_err_t err = (cfg_.mode == GithubMode::TREE) ? tree_manifest(out) : assets_manifest(out);
    if (err != ESP_OK) {
        out.clear();
        return err;
    }

    ESP_LOGI(TAG, "Manifest for %s: %u files", tag_.c_str(), (unsigned)out.size());
    return ESP_OK;
}

esp_err_t GithubReleaseSource::fetch(const ManifestEntry& entry, std::string& out)
{
    HttpRequest req;
    req.url = entry.locator;
    req.headers = headers(false);
    req.timeout_ms = cfg_.content_timeout_ms;

    HttpResponse resp;
    esp_err_t err = http_.get(req, resp);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Download of %s failed: %s", entry.path.c_str(), esp_err_to_name(err));
        return err;
    }
    if (resp.status != 200) {
        ESP_LOGE(TAG, "Download of %s failed: HTTP %d", entry.path.c_str(), resp.status);
        return ESP_ERR_INVALID_RESPONSE;
    }

    if (!entry.blob_sha.empty()) {
        const std::string actual = git_blob_sha1_hex(resp.body);
        if (actual != entry.blob_sha) {
            ESP_LOGE(TAG, "Integrity mismatch for %s (expected %s, got %s)",
                     entry.path.c_str(), entry.blob_sha.c_str(), actual.c_str());
            return ESP_ERR_INVALID_CRC;
        }
    }

    out.swap(resp.body);
    ESP_LOGI(TAG, "Downloaded %s (%u bytes)", entry.path.c_str(), (unsigned)out.size());
    return ESP_OK;
}

void GithubReleaseSource::release()
{
    probed_ = false;
    tag_.clear();
    assets_.clear();
}

} // namespace fwupd
