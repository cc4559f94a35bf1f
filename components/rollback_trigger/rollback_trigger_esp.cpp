#include "rollback_trigger_esp.h"

extern "C" {
#include "esp_log.h"
#include "esp_timer.h"
#include "driver/gpio.h"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"
}

namespace fwupd {

static const char* TAG = "rollback_trigger";

GpioInput::GpioInput(int gpio) : gpio_(gpio) {}

esp_err_t GpioInput::init()
{
    gpio_config_t io = {};
    io.pin_bit_mask = 1ULL << gpio_;
    io.mode = GPIO_MODE_INPUT;
    io.pull_up_en = GPIO_PULLUP_ENABLE;
    io.pull_down_en = GPIO_PULLDOWN_DISABLE;
    io.intr_type = GPIO_INTR_DISABLE;

    esp_err_t err = gpio_config(&io);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "gpio_config(%d) failed: %s", gpio_, esp_err_to_name(err));
    }
    return err;
}

bool GpioInput::is_asserted()
{
    return gpio_get_level((gpio_num_t)gpio_) == 0;
}

uint32_t EspClock::now_ms()
{
    return (uint32_t)(esp_timer_get_time() / 1000);
}

void EspClock::sleep_ms(uint32_t ms)
{
    TickType_t ticks = pdMS_TO_TICKS(ms);
    vTaskDelay(ticks > 0 ? ticks : 1);
}

} // namespace fwupd
