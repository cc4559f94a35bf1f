#pragma once

#include <cstdint>
#include <string>

namespace fwupd {

// Baseline reported when no version marker has ever been written.
static constexpr const char* BASELINE_VERSION = "0.0";

// Live firmware tree on internal flash (FAT partition "storage").
struct FirmwareLayout {
    std::string root = "/fw";
    std::string version_file = ".version";
    std::string backup_dir = "backup";
    std::string secrets_file = "secrets.py";
    std::string managed_ext = ".py";

    std::string version_path() const { return root + "/" + version_file; }
    std::string backup_path() const { return root + "/" + backup_dir; }
    std::string live_path(const std::string& rel) const { return root + "/" + rel; }
};

enum class GithubMode : uint8_t {
    ASSETS = 0,  // files attached to the latest release
    TREE         // recursive repository listing at the release tag
};

struct GithubConfig {
    std::string owner = "exploreborders";
    std::string repo = "explorePico";
    std::string token;  // empty => unauthenticated (stricter rate limit)
    GithubMode mode = GithubMode::ASSETS;

    std::string api_base = "https://api.github.com";
    std::string raw_base = "https://raw.githubusercontent.com";
    std::string user_agent = "bridgefw-updater";

    // Files of interest on the remote side.
    std::string managed_ext = ".py";
    std::string version_marker = "version.txt";
    std::string secrets_file = "secrets.py";

    int meta_timeout_ms = 10000;
    int content_timeout_ms = 30000;
};

struct SdCardConfig {
    std::string mount_point = "/sd";
    std::string update_dir = "update";
    std::string version_marker = "version.txt";
    std::string managed_ext = ".py";
    std::string secrets_file = "secrets.py";

    // SPI wiring of the card slot
    int pin_sck = 14;
    int pin_mosi = 15;
    int pin_miso = 12;
    int pin_cs = 13;
    int max_freq_khz = 400;
};

struct TriggerTiming {
    uint32_t debounce_ms = 100;
    uint32_t release_window_ms = 2000;   // first press must be released within this
    uint32_t second_window_ms = 1000;    // second press must start within this after release
    uint32_t budget_ms = 3000;           // hard cap for the whole detection
    uint32_t poll_ms = 10;
};

struct HttpConfig {
    int max_attempts = 3;          // connection-level retries only
    int backoff_start_ms = 1000;
    int backoff_max_ms = 8000;
    int max_redirects = 5;
    size_t max_body_bytes = 256 * 1024;
    int rx_buffer_size = 2048;
};

static constexpr int ROLLBACK_BUTTON_GPIO = 10;
static constexpr int WIFI_CONNECT_TIMEOUT_MS = 15000;
static constexpr int WIFI_MAX_RETRY = 10;

static constexpr const char* FLASH_PARTITION_LABEL = "storage";

} // namespace fwupd
