/**
 * @file settings.hpp
 * @brief Panel and carousel settings kept across reboots.
 */

#pragma once

#include <cstdint>

#include "config.hpp"

struct DisplaySettings {
    bool orientation_flipped = false;                 ///< Rotate the panel by 180 degrees
    uint8_t brightness = 128;                         ///< Backlight level, 0-255
};

struct DemoSettings {
    uint32_t scene_dwell_ms = SCENE_DWELL_MS_;        ///< Time per scene when auto_advance is set
    uint8_t start_scene = 0;                          ///< Scene shown after boot (last one picked with the button)
    bool auto_advance = true;                         ///< Rotate scenes on a timer
};

struct Settings {
    DisplaySettings display;
    DemoSettings demo;
};

/**
 * @brief Versioned, CRC-checked settings blob in NVS
 * @details Any read problem (missing key, size, CRC or version mismatch)
 *          yields default settings; out-of-range fields are reset one by one.
 */
class SettingsStore {
public:
    /**
     * @brief Bring up the NVS partition, erasing it if its format is stale
     * @return false if NVS stays unusable
     */
    static bool Init() noexcept;

    static Settings Load() noexcept;

    /**
     * @return false if the blob could not be written or committed
     */
    static bool Save(const Settings& settings) noexcept;
};
