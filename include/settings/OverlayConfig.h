#pragma once

#include <QColor>
#include <QMap>
#include <QString>

namespace Glowpoint {

struct SpotlightConfig {
    static constexpr int kDefaultRadius = 80;
    static constexpr int kDefaultRingRadius = 40;
    static constexpr qreal kDefaultOpacity = 0.7;

    bool enabled = true;
    int radius = kDefaultRadius;
    int ringRadius = kDefaultRingRadius;
    qreal opacity = kDefaultOpacity;
    QColor color = QColor(0xFF, 0xFF, 0x64);

    bool operator==(const SpotlightConfig& other) const
    {
        return enabled == other.enabled && radius == other.radius
            && ringRadius == other.ringRadius && qFuzzyCompare(1.0 + opacity, 1.0 + other.opacity)
            && color == other.color;
    }
    bool operator!=(const SpotlightConfig& other) const { return !(*this == other); }
};

struct DrawingConfig {
    static constexpr int kDefaultLineWidth = 4;

    int lineWidth = kDefaultLineWidth;
    QMap<QString, QColor> colors;          // color name -> value
    QMap<QString, QString> toolShortcuts;  // tool config key -> single key
};

/**
 * @brief Immutable snapshot of the configuration document.
 *
 * shortcuts maps an action name ("toggle_spotlight", "draw_blue", ...)
 * to a chord in config syntax ("<ctrl>+<shift>+s"). Empty chords are
 * unbound.
 */
struct OverlayConfig {
    QMap<QString, QString> shortcuts;
    SpotlightConfig spotlight;
    DrawingConfig drawing;

    static OverlayConfig defaults();
};

inline OverlayConfig OverlayConfig::defaults()
{
    OverlayConfig config;
    config.shortcuts = {
        { "toggle_spotlight", "<ctrl>+<shift>+s" },
        { "draw_blue", "<ctrl>+<shift>+b" },
        { "draw_red", "<ctrl>+<shift>+r" },
        { "draw_yellow", "<ctrl>+<shift>+y" },
        { "draw_green", "<ctrl>+<shift>+g" },
        { "clear_screen", "<ctrl>+<shift>+c" },
        { "quit", "<ctrl>+<shift>+q" },
        { "undo", "" },
        { "redo", "" },
    };
    config.drawing.colors = {
        { "blue", QColor("#2196F3") },
        { "red", QColor("#F44336") },
        { "yellow", QColor("#FFEB3B") },
        { "green", QColor("#4CAF50") },
    };
    config.drawing.toolShortcuts = {
        { "freehand", "1" },
        { "line", "2" },
        { "rectangle", "3" },
        { "arrow", "4" },
        { "circle", "5" },
    };
    return config;
}

} // namespace Glowpoint
