#ifndef TOOLDEFINITION_H
#define TOOLDEFINITION_H

#include <QString>
#include "ToolId.h"

/**
 * @brief Static metadata for a drawing tool.
 *
 * configKey is the name used in the configuration document
 * ("freehand", "line", ...); defaultShortcut is the single key that
 * selects the tool while drawing.
 */
struct ToolDefinition {
    ToolId id;
    QString configKey;
    QString displayName;
    QString defaultShortcut;

    // Shape tools are defined by two anchors; freehand keeps every point
    bool isShape = true;
};

#endif // TOOLDEFINITION_H
