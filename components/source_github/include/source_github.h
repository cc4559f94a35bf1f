#pragma once

#include <functional>
#include <string>
#include <vector>

#include "bridgefw_config.h"
#include "http_client.h"
#include "update_source.h"

namespace fwupd {

// Git object id of a blob: SHA-1 over "blob <len>\0" + content, lowercase hex.
std::string git_blob_sha1_hex(const std::string& content);

// Latest GitHub release of owner/repo. The release probed by latest_version()
// is cached until release() so manifest() lists files of that same tag.
class GithubReleaseSource : public IUpdateSource {
public:
    using LinkUpFn = std::function<bool()>;

    GithubReleaseSource(IHttpClient& http, const GithubConfig& cfg, LinkUpFn link_up);

    SourceKind kind() const override { return SourceKind::NETWORK; }
    const char* name() const override { return "github"; }

    bool is_available() override;
    esp_err_t latest_version(std::string& out) override;
    esp_err_t manifest(std::vector<ManifestEntry>& out) override;
    esp_err_t fetch(const ManifestEntry& entry, std::string& out) override;
    void release() override;

private:
    struct Asset {
        std::string name;
        std::string url;
    };

    esp_err_t api_get(const std::string& url, int timeout_ms, std::string& body);
    std::vector<std::pair<std::string, std::string>> headers(bool api) const;

    bool wanted_file(const std::string& path) const;
    esp_err_t assets_manifest(std::vector<ManifestEntry>& out);
    esp_err_t tree_manifest(std::vector<ManifestEntry>& out);

    IHttpClient& http_;
    GithubConfig cfg_;
    LinkUpFn link_up_;

    bool probed_ = false;
    std::string tag_;
    std::vector<Asset> assets_;
};

} // namespace fwupd
