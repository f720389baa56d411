#ifndef CHATVIZ_VISUALIZER_CONFIG_H
#define CHATVIZ_VISUALIZER_CONFIG_H

#include <chatviz/db/settings_store.h>
#include <chatviz/graph/interaction/gesture_recognizer.h>
#include <chatviz/graph/layout/force_simulation.h>

#include <string>

namespace chatviz {

enum class ThemeType {
    DARK,
    WHITE
};

namespace config {

// Setting keys in the `settings` table.
extern const char* const kThemeKey;
extern const char* const kLinkDistanceKey;
extern const char* const kLinkStrengthKey;
extern const char* const kChargeStrengthKey;
extern const char* const kCollisionRadiusKey;
extern const char* const kVelocityDecayKey;
extern const char* const kDoubleTapScopeKey;

const char* ThemeName(ThemeType theme);
const char* DoubleTapScopeName(graph::DoubleTapScope scope);

/*
 * User-tunable settings persisted through SettingsStore.
 * Values that fail to parse or fall outside their range are reported on
 * std::cerr and replaced by the defaults.
 */
struct VisualizerConfig {
    ThemeType theme = ThemeType::DARK;
    graph::ForceSimulation::Params physics;
    graph::GestureRecognizer::Options gestures;

    static VisualizerConfig Load(db::SettingsStore& store);
    void Save(db::SettingsStore& store) const;
};

} // namespace config
} // namespace chatviz

#endif // CHATVIZ_VISUALIZER_CONFIG_H
