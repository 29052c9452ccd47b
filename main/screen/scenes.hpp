/**
 * @file scenes.hpp
 * @brief Reference screens built from the widget catalog.
 * @details Each scene is a deterministic function of its readings: the same
 *          inputs always produce the same frame. Scenes draw into a frame the
 *          caller has cleared and leave presenting to the caller.
 */

#pragma once

#include <cstddef>
#include <cstdint>

#include "frame_controller.hpp"

namespace roundscreen {

enum class Scene : uint8_t {
    Temperature = 0,   ///< Title, one-decimal value with unit, sensor subtitle
    Battery,           ///< Percentage value over a green bar
    Comfort,           ///< Two side-by-side values and a comfort verdict
    DistanceGauge,     ///< 0-500 mm gauge
    LightGraph,        ///< Scrolling lux history
    Menu,              ///< Sensor menu with a caller-held selection
    Compass,           ///< Full-screen compass
    Mood,              ///< Compact face chosen from a distance reading
    Watch,             ///< Full-screen analog watch
};

static constexpr uint8_t SCENE_COUNT_ = 9;
static constexpr size_t LIGHT_HISTORY_MAX_ = 20;  ///< Samples kept by the light graph scene

/**
 * @brief Sensor readings and UI state consumed by the scenes
 */
struct SceneInputs {
    float temperature_c = 22.5f;
    float humidity_pct = 45.0f;
    int32_t battery_pct = 87;
    int32_t battery_mv = 3950;
    float distance_mm = 120.0f;
    const float* light_history = nullptr;   ///< Lux samples, newest last
    size_t light_count = 0;
    int32_t menu_selected = 0;
    float heading_deg = 0.0f;
    int32_t hours = 10;
    int32_t minutes = 8;
    int32_t seconds = 30;
};

/**
 * @brief Comfort verdict for a temperature / humidity pair
 * @return "Ideal", "Dry/cold" or "Poor"
 */
const char* ComfortLabel(float temperature_c, float humidity_pct) noexcept;

/**
 * @brief Face shown by the mood scene for a distance reading
 * @param distance_mm Distance in millimetres
 * @param label Receives the uppercase caption
 * @param color Receives the face color
 */
Expression MoodForDistance(float distance_mm, const char*& label, Rgb& color) noexcept;

/// Items of the menu scene
const char* const* MenuSceneItems(size_t& count) noexcept;

const char* SceneName(Scene scene) noexcept;

/**
 * @brief Draw a scene into the current frame
 * @return First failing widget status, or Status::Ok
 */
Status RenderScene(FrameController& frame, Scene scene, const SceneInputs& inputs) noexcept;

} // namespace roundscreen
