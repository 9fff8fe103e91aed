#include "settings/DrawingSettingsManager.h"
#include "settings/Settings.h"
#include "tools/ToolRegistry.h"
#include <QSettings>

DrawingSettingsManager& DrawingSettingsManager::instance()
{
    static DrawingSettingsManager instance;
    return instance;
}

int DrawingSettingsManager::loadThickness(const QString& colorName, int fallback) const
{
    auto settings = Glowpoint::getSettings();
    settings.beginGroup(Glowpoint::kSettingsGroupThickness);
    const int value = settings.value(colorName, fallback).toInt();
    settings.endGroup();
    return value > 0 ? value : fallback;
}

void DrawingSettingsManager::saveThickness(const QString& colorName, int thickness)
{
    auto settings = Glowpoint::getSettings();
    settings.beginGroup(Glowpoint::kSettingsGroupThickness);
    settings.setValue(colorName, thickness);
    settings.endGroup();
}

QMap<QString, int> DrawingSettingsManager::loadAllThicknesses() const
{
    QMap<QString, int> result;
    auto settings = Glowpoint::getSettings();
    settings.beginGroup(Glowpoint::kSettingsGroupThickness);
    const QStringList keys = settings.childKeys();
    for (const QString& key : keys) {
        const int value = settings.value(key).toInt();
        if (value > 0) {
            result.insert(key, value);
        }
    }
    settings.endGroup();
    return result;
}

ToolId DrawingSettingsManager::loadTool() const
{
    auto settings = Glowpoint::getSettings();
    const QString key = settings.value(Glowpoint::kSettingsKeyLastTool).toString();
    return ToolRegistry::instance().fromConfigKey(key).value_or(kDefaultTool);
}

void DrawingSettingsManager::saveTool(ToolId tool)
{
    auto settings = Glowpoint::getSettings();
    settings.setValue(Glowpoint::kSettingsKeyLastTool, ToolRegistry::instance().get(tool).configKey);
}
