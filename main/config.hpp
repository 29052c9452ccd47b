/**
 * @file config.hpp
 * @brief Round screen demo firmware configuration.
 * @details Render loop timing, scene carousel defaults and storage names.
 */

#pragma once

#include <cstdint>

// ------------- RENDER CONFIG -------------

/**
 * @brief Render loop period
 * @details ~60 Hz, the task yields for this long after each Present().
 */
static constexpr uint32_t FRAME_PERIOD_MS_ = 16;

/**
 * @brief Panel width at or above which the 240px color profile is used
 */
static constexpr int16_t COLOR_PANEL_MIN_WIDTH_ = 240;

// ------------- DEMO CONFIG -------------

/**
 * @brief Default time each scene stays on screen before the carousel advances
 */
static constexpr uint32_t SCENE_DWELL_MS_ = 4000;

/**
 * @brief Shortest dwell accepted from stored settings
 */
static constexpr uint32_t SCENE_DWELL_MIN_MS_ = 500;

/**
 * @brief Interval between two samples of the synthetic light sensor
 */
static constexpr uint32_t LIGHT_SAMPLE_PERIOD_MS_ = 1000;

/**
 * @brief Synthetic gyro rate driving the compass scene (degrees per second)
 */
static constexpr float COMPASS_RATE_DEG_S_ = 30.0f;

// ------------- STORAGE CONFIG -------------

static constexpr const char* NVS_NAMESPACE_ = "roundscreen";  ///< NVS namespace for settings
static constexpr const char* NVS_KEY_BLOB_ = "settings";      ///< NVS key for settings blob
static constexpr uint16_t SETTINGS_VERSION_ = 1;              ///< Bump when Settings changes layout
