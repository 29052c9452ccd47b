#include "freertos/FreeRTOS.h"
#include "freertos/task.h"

#include "esp_log.h"

#include "M5Unified.h"

#include <cmath>
#include <cstddef>
#include <memory>
#include <utility>

#include "config.hpp"
#include "settings.hpp"
#include "screen/canvas_backend.hpp"
#include "screen/frame_controller.hpp"
#include "screen/scenes.hpp"

static const char* TAG_ = "app";

/**
 * @brief Synthetic sensor readings for the carousel
 * @details Slow waveforms over the uptime so every scene moves a little.
 */
struct DemoSensors {
    float light[roundscreen::LIGHT_HISTORY_MAX_] = {};
    size_t light_count = 0;
    uint32_t last_light_ms = 0;
    float heading = 0.0f;
    uint32_t last_tick_ms = 0;
};

static void updateSensors_(DemoSensors& sensors, uint32_t now_ms, roundscreen::SceneInputs& in) noexcept
{
    const float t = static_cast<float>(now_ms) / 1000.0f;

    in.temperature_c = 22.0f + 4.0f * std::sin(t / 20.0f);
    in.humidity_pct = 45.0f + 20.0f * std::sin(t / 33.0f);
    in.battery_pct = 100 - static_cast<int32_t>((now_ms / 6000u) % 101u);
    in.battery_mv = 3300 + in.battery_pct * 9;
    in.distance_mm = 250.0f + 240.0f * std::sin(t / 5.0f);

    if (sensors.light_count == 0 || now_ms - sensors.last_light_ms >= LIGHT_SAMPLE_PERIOD_MS_) {
        const float lux = 500.0f + 400.0f * std::sin(t / 4.0f);
        if (sensors.light_count < roundscreen::LIGHT_HISTORY_MAX_) {
            sensors.light[sensors.light_count++] = lux;
        } else {
            for (size_t i = 1; i < roundscreen::LIGHT_HISTORY_MAX_; ++i) {
                sensors.light[i - 1] = sensors.light[i];
            }
            sensors.light[roundscreen::LIGHT_HISTORY_MAX_ - 1] = lux;
        }
        sensors.last_light_ms = now_ms;
    }
    in.light_history = sensors.light;
    in.light_count = sensors.light_count;

    const float dt = static_cast<float>(now_ms - sensors.last_tick_ms) / 1000.0f;
    sensors.heading = std::fmod(sensors.heading + COMPASS_RATE_DEG_S_ * dt, 360.0f);
    sensors.last_tick_ms = now_ms;
    in.heading_deg = sensors.heading;

    // Clock starts at 10:08:00 on boot
    const uint32_t clock_s = 10u * 3600u + 8u * 60u + now_ms / 1000u;
    in.hours = static_cast<int32_t>((clock_s / 3600u) % 24u);
    in.minutes = static_cast<int32_t>((clock_s / 60u) % 60u);
    in.seconds = static_cast<int32_t>(clock_s % 60u);

    size_t menu_items = 0;
    (void)roundscreen::MenuSceneItems(menu_items);
    in.menu_selected = static_cast<int32_t>((now_ms / 1000u) % menu_items);
}

static uint32_t uptimeMs_() noexcept
{
    return static_cast<uint32_t>(xTaskGetTickCount()) * portTICK_PERIOD_MS;
}

extern "C" void app_main(void)
{
    ESP_LOGI(TAG_, "Booting round screen demo...");

    Settings settings{};
    if (SettingsStore::Init()) {
        settings = SettingsStore::Load();
    } else {
        ESP_LOGW(TAG_, "Settings storage unavailable; running with defaults");
    }

    // Initialize M5Unified with M5Dial board
    auto cfg = M5.config();
    cfg.fallback_board = m5gfx::board_t::board_M5Dial;
    cfg.clear_display = true;
    M5.begin(cfg);

    M5.Display.setBrightness(settings.display.brightness);
    M5.Display.setRotation(settings.display.orientation_flipped ? 2 : 0);

    // Pick the layout profile from the panel the board reports
    const int16_t panel_width = static_cast<int16_t>(M5.Display.width());
    const bool color_panel = panel_width >= COLOR_PANEL_MIN_WIDTH_;
    const roundscreen::GeometryProfile& profile = color_panel ? roundscreen::kRound240 : roundscreen::kRound128;
    const roundscreen::ColorDepth depth =
        color_panel ? roundscreen::ColorDepth::Rgb565 : roundscreen::ColorDepth::Grayscale4;

    std::unique_ptr<roundscreen::CanvasBackend> canvas(new roundscreen::CanvasBackend(&M5.Display, depth));
    if (!canvas->Init(profile.width, profile.height)) {
        ESP_LOGE(TAG_, "Canvas init failed; halting");
        return;
    }
    roundscreen::FrameController frame(profile, std::move(canvas));

    DemoSensors sensors{};
    roundscreen::SceneInputs inputs{};
    uint8_t scene = static_cast<uint8_t>(settings.demo.start_scene % roundscreen::SCENE_COUNT_);
    uint32_t scene_started_ms = uptimeMs_();
    sensors.last_tick_ms = scene_started_ms;

    ESP_LOGI(TAG_, "Starting carousel at scene '%s'", roundscreen::SceneName(static_cast<roundscreen::Scene>(scene)));

    while (true) {
        M5.update();
        const uint32_t now_ms = uptimeMs_();

        const bool advance = settings.demo.auto_advance && (now_ms - scene_started_ms >= settings.demo.scene_dwell_ms);
        const bool pressed = M5.BtnA.wasPressed();
        if (advance || pressed) {
            scene = static_cast<uint8_t>((scene + 1) % roundscreen::SCENE_COUNT_);
            scene_started_ms = now_ms;
            ESP_LOGI(TAG_, "Scene -> %s", roundscreen::SceneName(static_cast<roundscreen::Scene>(scene)));
            if (pressed) {
                settings.demo.start_scene = scene;
                if (!SettingsStore::Save(settings)) {
                    ESP_LOGW(TAG_, "Could not persist start scene");
                }
            }
        }

        updateSensors_(sensors, now_ms, inputs);

        frame.Clear();
        const roundscreen::Status st = roundscreen::RenderScene(frame, static_cast<roundscreen::Scene>(scene), inputs);
        if (st != roundscreen::Status::Ok) {
            ESP_LOGW(TAG_, "Scene %s: %s", roundscreen::SceneName(static_cast<roundscreen::Scene>(scene)),
                     roundscreen::StatusToName(st));
        }
        frame.Present();

        vTaskDelay(pdMS_TO_TICKS(FRAME_PERIOD_MS_));
    }
}
