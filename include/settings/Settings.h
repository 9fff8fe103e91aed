#pragma once

#include <QSettings>
#include "version.h"

namespace Glowpoint {

inline constexpr const char* kOrganizationName = "Glowpoint";
inline constexpr const char* kApplicationName = GLOWPOINT_APP_NAME;

// Drawing state keys
inline constexpr const char* kSettingsGroupThickness = "drawing/thickness";
inline constexpr const char* kSettingsKeyLastTool = "drawing/lastTool";

inline QString windowsSettingsPath()
{
    return QStringLiteral("HKEY_CURRENT_USER\\Software\\Glowpoint");
}

inline QSettings getSettings()
{
#if defined(Q_OS_WIN)
    return QSettings(windowsSettingsPath(), QSettings::NativeFormat);
#else
    return QSettings(kOrganizationName, kApplicationName);
#endif
}

} // namespace Glowpoint
