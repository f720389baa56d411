#include <chatviz/config/visualizer_config.h>

#include <cmath>
#include <iostream>
#include <optional>
#include <stdexcept>

namespace chatviz {
namespace config {

const char* const kThemeKey = "theme";
const char* const kLinkDistanceKey = "graph.link_distance";
const char* const kLinkStrengthKey = "graph.link_strength";
const char* const kChargeStrengthKey = "graph.charge_strength";
const char* const kCollisionRadiusKey = "graph.collision_radius";
const char* const kVelocityDecayKey = "graph.velocity_decay";
const char* const kDoubleTapScopeKey = "gesture.double_tap_scope";

namespace {

void WarnInvalid(const std::string& key, const std::string& value) {
    std::cerr << "Warning: ignoring invalid setting " << key << "=\"" << value << "\", using default" << std::endl;
}

// Reads a float setting into target when it parses and satisfies the range check.
template <typename Valid>
void LoadFloat(db::SettingsStore& store, const char* key, float& target, Valid valid) {
    std::optional<std::string> text = store.loadSetting(key);
    if (!text) return;
    try {
        std::size_t consumed = 0;
        float value = std::stof(*text, &consumed);
        if (consumed != text->size() || !valid(value)) {
            WarnInvalid(key, *text);
            return;
        }
        target = value;
    } catch (const std::logic_error&) {
        WarnInvalid(key, *text);
    }
}

} // anonymous namespace

const char* ThemeName(ThemeType theme) {
    return theme == ThemeType::WHITE ? "white" : "dark";
}

const char* DoubleTapScopeName(graph::DoubleTapScope scope) {
    return scope == graph::DoubleTapScope::kAnywhere ? "anywhere" : "empty_space";
}

VisualizerConfig VisualizerConfig::Load(db::SettingsStore& store) {
    VisualizerConfig config;

    if (auto theme = store.loadSetting(kThemeKey)) {
        if (*theme == "dark") {
            config.theme = ThemeType::DARK;
        } else if (*theme == "white") {
            config.theme = ThemeType::WHITE;
        } else {
            WarnInvalid(kThemeKey, *theme);
        }
    }

    LoadFloat(store, kLinkDistanceKey, config.physics.link_distance,
              [](float v) { return std::isfinite(v) && v > 0.0f; });
    // Stiffness above 1 overshoots: the link correction would exceed the error.
    LoadFloat(store, kLinkStrengthKey, config.physics.link_strength,
              [](float v) { return v > 0.0f && v <= 1.0f; });
    LoadFloat(store, kChargeStrengthKey, config.physics.charge_strength,
              [](float v) { return std::isfinite(v) && v <= 0.0f; });
    LoadFloat(store, kCollisionRadiusKey, config.physics.collision_radius,
              [](float v) { return std::isfinite(v) && v > 0.0f; });
    LoadFloat(store, kVelocityDecayKey, config.physics.velocity_decay,
              [](float v) { return v >= 0.0f && v <= 1.0f; });

    if (auto scope = store.loadSetting(kDoubleTapScopeKey)) {
        if (*scope == "empty_space") {
            config.gestures.double_tap_scope = graph::DoubleTapScope::kEmptySpace;
        } else if (*scope == "anywhere") {
            config.gestures.double_tap_scope = graph::DoubleTapScope::kAnywhere;
        } else {
            WarnInvalid(kDoubleTapScopeKey, *scope);
        }
    }
    return config;
}

void VisualizerConfig::Save(db::SettingsStore& store) const {
    store.saveSetting(kThemeKey, ThemeName(theme));
    store.saveSetting(kLinkDistanceKey, std::to_string(physics.link_distance));
    store.saveSetting(kLinkStrengthKey, std::to_string(physics.link_strength));
    store.saveSetting(kChargeStrengthKey, std::to_string(physics.charge_strength));
    store.saveSetting(kCollisionRadiusKey, std::to_string(physics.collision_radius));
    store.saveSetting(kVelocityDecayKey, std::to_string(physics.velocity_decay));
    store.saveSetting(kDoubleTapScopeKey, DoubleTapScopeName(gestures.double_tap_scope));
}

} // namespace config
} // namespace chatviz
