#pragma once

#include "rollback_trigger.h"

namespace fwupd {

// Active-low push button with the internal pull-up enabled.
class GpioInput : public IDigitalInput {
public:
    explicit GpioInput(int gpio);

    esp_err_t init();
    bool is_asserted() override;

private:
    int gpio_;
};

// esp_timer time base, FreeRTOS delay.
class EspClock : public IClock {
public:
    uint32_t now_ms() override;
    void sleep_ms(uint32_t ms) override;
};

} // namespace fwupd
