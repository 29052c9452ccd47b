/**
 * @file settings.cpp
 * @brief NVS blob storage for the display and carousel settings
 * @details Blob layout: {version, Settings, crc32}. The CRC covers the
 *          version and the settings, so a blob written by another layout
 *          version fails the size or version check and falls back to
 *          defaults instead of being misread.
 */

#include "settings.hpp"

#include "esp_log.h"
#include "nvs.h"
#include "nvs_flash.h"

#include <cstddef>

#include "screen/crc32.hpp"
#include "screen/scenes.hpp"

static const char* TAG_ = "settings";

#pragma pack(push, 1)
struct StoredSettings {
    uint16_t version;
    Settings settings;
    uint32_t crc32;
};
#pragma pack(pop)

static constexpr size_t CRC_SPAN_ = offsetof(StoredSettings, crc32);

static uint32_t storedCrc(const StoredSettings& stored) noexcept
{
    return roundscreen::Crc32Ieee(reinterpret_cast<const uint8_t*>(&stored), CRC_SPAN_);
}

/// Replace out-of-range fields with their defaults
static Settings sanitize(const Settings& in) noexcept
{
    const Settings defaults{};
    Settings out = in;
    if (out.demo.start_scene >= roundscreen::SCENE_COUNT_) {
        ESP_LOGW(TAG_, "Stored start scene %u out of range", out.demo.start_scene);
        out.demo.start_scene = defaults.demo.start_scene;
    }
    if (out.demo.scene_dwell_ms < SCENE_DWELL_MIN_MS_) {
        ESP_LOGW(TAG_, "Stored dwell %ums below %ums", static_cast<unsigned>(out.demo.scene_dwell_ms),
                 static_cast<unsigned>(SCENE_DWELL_MIN_MS_));
        out.demo.scene_dwell_ms = defaults.demo.scene_dwell_ms;
    }
    return out;
}

bool SettingsStore::Init() noexcept
{
    esp_err_t err = nvs_flash_init();
    if (err == ESP_ERR_NVS_NO_FREE_PAGES || err == ESP_ERR_NVS_NEW_VERSION_FOUND) {
        ESP_LOGW(TAG_, "NVS partition needs erase (%s)", esp_err_to_name(err));
        err = nvs_flash_erase();
        if (err == ESP_OK) {
            err = nvs_flash_init();
        }
    }
    if (err != ESP_OK) {
        ESP_LOGE(TAG_, "NVS unavailable: %s", esp_err_to_name(err));
        return false;
    }
    return true;
}

Settings SettingsStore::Load() noexcept
{
    nvs_handle_t handle;
    esp_err_t err = nvs_open(NVS_NAMESPACE_, NVS_READONLY, &handle);
    if (err != ESP_OK) {
        ESP_LOGI(TAG_, "No stored settings (%s); using defaults", esp_err_to_name(err));
        return Settings{};
    }

    StoredSettings stored{};
    size_t length = sizeof(stored);
    err = nvs_get_blob(handle, NVS_KEY_BLOB_, &stored, &length);
    nvs_close(handle);

    if (err != ESP_OK || length != sizeof(stored)) {
        ESP_LOGW(TAG_, "Stored settings unreadable (%s, %u bytes); using defaults", esp_err_to_name(err),
                 static_cast<unsigned>(length));
        return Settings{};
    }
    if (storedCrc(stored) != stored.crc32) {
        ESP_LOGW(TAG_, "Stored settings fail CRC; using defaults");
        return Settings{};
    }
    if (stored.version != SETTINGS_VERSION_) {
        ESP_LOGW(TAG_, "Stored settings v%u, expected v%u; using defaults", stored.version, SETTINGS_VERSION_);
        return Settings{};
    }

    const Settings loaded = sanitize(stored.settings);
    ESP_LOGI(TAG_, "Loaded: brightness=%u flipped=%d scene=%u dwell=%ums auto=%d", loaded.display.brightness,
             loaded.display.orientation_flipped ? 1 : 0, loaded.demo.start_scene,
             static_cast<unsigned>(loaded.demo.scene_dwell_ms), loaded.demo.auto_advance ? 1 : 0);
    return loaded;
}

bool SettingsStore::Save(const Settings& settings) noexcept
{
    StoredSettings stored{};
    stored.version = SETTINGS_VERSION_;
    stored.settings = settings;
    stored.crc32 = storedCrc(stored);

    nvs_handle_t handle;
    esp_err_t err = nvs_open(NVS_NAMESPACE_, NVS_READWRITE, &handle);
    if (err != ESP_OK) {
        ESP_LOGE(TAG_, "Cannot open '%s' for writing: %s", NVS_NAMESPACE_, esp_err_to_name(err));
        return false;
    }
    err = nvs_set_blob(handle, NVS_KEY_BLOB_, &stored, sizeof(stored));
    if (err == ESP_OK) {
        err = nvs_commit(handle);
    }
    nvs_close(handle);

    if (err != ESP_OK) {
        ESP_LOGE(TAG_, "Writing settings failed: %s", esp_err_to_name(err));
        return false;
    }
    ESP_LOGD(TAG_, "Saved settings (start scene %u)", settings.demo.start_scene);
    return true;
}
