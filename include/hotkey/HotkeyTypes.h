/**
 * @file HotkeyTypes.h
 * @brief Hotkey system type definitions
 *
 * Defines hotkey registration status, the runtime binding record and
 * compile-time metadata for the configurable actions.
 */

#pragma once

#include <QKeySequence>
#include <QObject>
#include <QString>

namespace Glowpoint {

/**
 * @brief Hotkey registration status.
 */
enum class HotkeyStatus {
    Unset,      ///< Binding added but not yet registered
    Registered, ///< Successfully registered with the OS
    Failed,     ///< Registration failed (conflict, permission, unsupported platform)
};

/**
 * @brief Runtime record for a single registered chord.
 */
struct HotkeyBinding {
    int id = -1;
    QString chord;          ///< As written in the configuration ("<ctrl>+<shift>+s")
    QKeySequence sequence;  ///< Parsed sequence handed to the OS
    HotkeyStatus status = HotkeyStatus::Unset;
};

/**
 * @brief Compile-time metadata for configurable actions.
 *
 * Color actions ("draw_<color>") are open-ended and described by
 * actionDisplayName() instead.
 */
struct HotkeyMetadata {
    const char* actionName;
    const char* displayName;
};

inline constexpr HotkeyMetadata kHotkeyActions[] = {
    { "toggle_spotlight", "Toggle Spotlight" },
    { "clear_screen", "Clear Drawings" },
    { "undo", "Undo" },
    { "redo", "Redo" },
    { "quit", "Quit" },
};

// Prefix of the open-ended color actions ("draw_blue", "draw_red", ...)
inline constexpr const char* kDrawActionPrefix = "draw_";

/**
 * @brief User-visible name for an action name from the configuration.
 */
inline QString actionDisplayName(const QString& actionName)
{
    for (const HotkeyMetadata& meta : kHotkeyActions) {
        if (actionName == QLatin1String(meta.actionName)) {
            return QObject::tr(meta.displayName);
        }
    }
    const QString prefix = QString::fromLatin1(kDrawActionPrefix);
    if (actionName.startsWith(prefix)) {
        QString color = actionName.mid(prefix.size());
        if (!color.isEmpty()) {
            color[0] = color[0].toUpper();
        }
        return QObject::tr("Draw %1").arg(color);
    }
    return actionName;
}

}  // namespace Glowpoint
