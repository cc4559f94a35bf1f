#pragma once

#include <string>

extern "C" {
#include "esp_err.h"
}

#include "bridgefw_config.h"

namespace settings {

struct Settings {
    fwupd::GithubConfig github;
    std::string wifi_ssid;
    std::string wifi_pass;
};

// Initializes NVS (erasing it on layout/version mismatch) and overlays the
// values found in the "bridgefw" namespace on the compiled-in defaults.
// A missing namespace or key is not an error.
esp_err_t load(Settings& out);

} // namespace settings
