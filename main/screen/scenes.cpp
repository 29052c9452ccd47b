#include "scenes.hpp"

#include <cmath>
#include <cstdio>

namespace {

using roundscreen::Status;

const char* const MENU_ITEMS_[] = {
    "Temperature", "Humidity", "Distance", "Light", "Battery", "Proximity",
};

const char* const SCENE_NAMES_[roundscreen::SCENE_COUNT_] = {
    "temperature", "battery", "comfort", "distance", "light", "menu", "compass", "mood", "watch",
};

/// Remember the first failure, keep drawing the rest of the scene
inline void keepFirst(Status& first, Status st) noexcept
{
    if (first == Status::Ok) {
        first = st;
    }
}

inline float roundTo(float value, int decimals) noexcept
{
    const float scale = std::pow(10.0f, static_cast<float>(decimals));
    return std::round(value * scale) / scale;
}

Status renderTemperature(roundscreen::FrameController& frame, const roundscreen::SceneInputs& in) noexcept
{
    Status first = Status::Ok;
    keepFirst(first, frame.Title("Temperature"));

    roundscreen::ValueSpec value{};
    value.value = in.temperature_c;
    value.decimals = 1;
    value.unit = "C";
    keepFirst(first, frame.Value(value));

    keepFirst(first, frame.Subtitle("HTS221"));
    return first;
}

Status renderBattery(roundscreen::FrameController& frame, const roundscreen::SceneInputs& in) noexcept
{
    Status first = Status::Ok;
    keepFirst(first, frame.Title("Battery"));

    char percent[16];
    std::snprintf(percent, sizeof(percent), "%d%%", static_cast<int>(in.battery_pct));
    roundscreen::ValueSpec value{};
    value.text = percent;
    value.y_offset = -15;
    keepFirst(first, frame.Value(value));

    roundscreen::BarSpec bar{};
    bar.value = static_cast<float>(in.battery_pct);
    bar.y_offset = -12;
    bar.color = roundscreen::colors::green;
    keepFirst(first, frame.Bar(bar));

    char millivolts[24];
    std::snprintf(millivolts, sizeof(millivolts), "%d mV", static_cast<int>(in.battery_mv));
    keepFirst(first, frame.Subtitle(millivolts));
    return first;
}

Status renderComfort(roundscreen::FrameController& frame, const roundscreen::SceneInputs& in) noexcept
{
    const roundscreen::GeometryProfile& geo = frame.Geometry();
    const float temperature = roundTo(in.temperature_c, 1);
    const float humidity = roundTo(in.humidity_pct, 0);

    Status first = Status::Ok;
    keepFirst(first, frame.Title("Comfort"));
    keepFirst(first, frame.Line(geo.center.x, static_cast<int16_t>(geo.ContentTop() + 4), geo.center.x,
                                static_cast<int16_t>(geo.height * 3 / 4), roundscreen::colors::dark));

    roundscreen::ValueSpec temp{};
    temp.value = temperature;
    temp.decimals = 1;
    temp.unit = "C";
    temp.label = "TEMP";
    temp.at = roundscreen::ValueAnchor::West;
    keepFirst(first, frame.Value(temp));

    roundscreen::ValueSpec hum{};
    hum.value = humidity;
    hum.unit = "%";
    hum.label = "HUM";
    hum.at = roundscreen::ValueAnchor::East;
    keepFirst(first, frame.Value(hum));

    keepFirst(first, frame.Subtitle(roundscreen::ComfortLabel(temperature, humidity), roundscreen::colors::green));
    return first;
}

Status renderDistanceGauge(roundscreen::FrameController& frame, const roundscreen::SceneInputs& in) noexcept
{
    Status first = Status::Ok;
    roundscreen::GaugeSpec gauge{};
    gauge.value = in.distance_mm;
    gauge.min_value = 0.0f;
    gauge.max_value = 500.0f;
    gauge.unit = "mm";
    keepFirst(first, frame.Gauge(gauge));
    keepFirst(first, frame.Title("Distance"));
    keepFirst(first, frame.Subtitle("VL53L1X"));
    return first;
}

Status renderLightGraph(roundscreen::FrameController& frame, const roundscreen::SceneInputs& in) noexcept
{
    Status first = Status::Ok;
    keepFirst(first, frame.Title("Light (lux)"));

    roundscreen::GraphSpec graph{};
    const size_t count = (in.light_history == nullptr) ? 0 : in.light_count;
    const size_t window = (count > roundscreen::LIGHT_HISTORY_MAX_) ? roundscreen::LIGHT_HISTORY_MAX_ : count;
    graph.data = (window > 0) ? in.light_history + (count - window) : nullptr;
    graph.count = window;
    graph.min_value = 0.0f;
    graph.max_value = 1000.0f;
    keepFirst(first, frame.Graph(graph));

    keepFirst(first, frame.Subtitle("APDS9960"));
    return first;
}

Status renderMenu(roundscreen::FrameController& frame, const roundscreen::SceneInputs& in) noexcept
{
    Status first = Status::Ok;
    keepFirst(first, frame.Title("Menu"));

    roundscreen::MenuSpec menu{};
    menu.items = roundscreen::MenuSceneItems(menu.count);
    menu.selected = in.menu_selected;
    keepFirst(first, frame.Menu(menu));
    return first;
}

Status renderMood(roundscreen::FrameController& frame, const roundscreen::SceneInputs& in) noexcept
{
    const char* label = nullptr;
    roundscreen::FaceSpec face{};
    face.expression = roundscreen::MoodForDistance(in.distance_mm, label, face.color);
    face.compact = true;

    Status first = Status::Ok;
    keepFirst(first, frame.Title("Mood"));
    keepFirst(first, frame.Face(face));
    keepFirst(first, frame.Subtitle(label));
    return first;
}

} // namespace

const char* roundscreen::ComfortLabel(float temperature_c, float humidity_pct) noexcept
{
    if (temperature_c >= 20.0f && temperature_c <= 26.0f && humidity_pct >= 30.0f && humidity_pct <= 60.0f) {
        return "Ideal";
    }
    if (temperature_c < 18.0f || humidity_pct < 20.0f) {
        return "Dry/cold";
    }
    return "Poor";
}

roundscreen::Expression roundscreen::MoodForDistance(float distance_mm, const char*& label, Rgb& color) noexcept
{
    if (distance_mm < 50.0f) {
        label = "SURPRISED";
        color = colors::yellow;
        return Expression::Surprised;
    }
    if (distance_mm < 150.0f) {
        label = "HAPPY";
        color = colors::green;
        return Expression::Happy;
    }
    if (distance_mm < 300.0f) {
        label = "SLEEPING";
        color = colors::light;
        return Expression::Sleeping;
    }
    label = "SAD";
    color = colors::red;
    return Expression::Sad;
}

const char* const* roundscreen::MenuSceneItems(size_t& count) noexcept
{
    count = sizeof(MENU_ITEMS_) / sizeof(MENU_ITEMS_[0]);
    return MENU_ITEMS_;
}

const char* roundscreen::SceneName(Scene scene) noexcept
{
    const uint8_t i = static_cast<uint8_t>(scene);
    return (i < SCENE_COUNT_) ? SCENE_NAMES_[i] : "unknown";
}

roundscreen::Status roundscreen::RenderScene(FrameController& frame, Scene scene, const SceneInputs& inputs) noexcept
{
    switch (scene) {
        case Scene::Temperature:
            return renderTemperature(frame, inputs);
        case Scene::Battery:
            return renderBattery(frame, inputs);
        case Scene::Comfort:
            return renderComfort(frame, inputs);
        case Scene::DistanceGauge:
            return renderDistanceGauge(frame, inputs);
        case Scene::LightGraph:
            return renderLightGraph(frame, inputs);
        case Scene::Menu:
            return renderMenu(frame, inputs);
        case Scene::Compass: {
            CompassSpec compass{};
            compass.heading = inputs.heading_deg;
            return frame.Compass(compass);
        }
        case Scene::Mood:
            return renderMood(frame, inputs);
        case Scene::Watch: {
            WatchSpec watch{};
            watch.hours = inputs.hours;
            watch.minutes = inputs.minutes;
            watch.seconds = inputs.seconds;
            return frame.Watch(watch);
        }
        default:
            return Status::InvalidRange;
    }
}
