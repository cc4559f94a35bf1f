#pragma once

// Connects in station mode and waits up to timeout_ms for an IP address.
// NVS must already be initialized. Returns false on timeout, retry
// exhaustion or an empty SSID; the device keeps booting either way.
bool wifi_sta_start_and_wait(const char* ssid, const char* pass, int timeout_ms);

bool wifi_sta_is_connected(void);
