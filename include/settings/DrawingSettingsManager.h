#ifndef DRAWINGSETTINGSMANAGER_H
#define DRAWINGSETTINGSMANAGER_H

#include <QMap>
#include <QString>

#include "tools/ToolId.h"

/**
 * @brief Singleton class for persisting per-user drawing state.
 *
 * Remembers the thickness chosen for each color name and the last used
 * tool across sessions.
 */
class DrawingSettingsManager
{
public:
    static DrawingSettingsManager& instance();

    // Thickness per color name
    int loadThickness(const QString& colorName, int fallback) const;
    void saveThickness(const QString& colorName, int thickness);
    QMap<QString, int> loadAllThicknesses() const;

    // Last selected tool
    ToolId loadTool() const;
    void saveTool(ToolId tool);

    static constexpr ToolId kDefaultTool = ToolId::Freehand;

private:
    DrawingSettingsManager() = default;
    DrawingSettingsManager(const DrawingSettingsManager&) = delete;
    DrawingSettingsManager& operator=(const DrawingSettingsManager&) = delete;
};

#endif // DRAWINGSETTINGSMANAGER_H
