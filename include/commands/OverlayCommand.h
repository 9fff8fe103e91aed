#ifndef OVERLAYCOMMAND_H
#define OVERLAYCOMMAND_H

#include <QMetaType>
#include <QString>
#include <optional>

#include "tools/ToolId.h"

/**
 * @brief A command addressed to the overlay controller.
 *
 * Produced by hotkeys, the toolbar, the tray menu and local keys, and
 * executed on the control thread.
 */
struct OverlayCommand {
    enum class Type {
        ToggleSpotlight,
        DrawColor,
        ExitDrawing,
        ClearAll,
        Undo,
        Redo,
        Quit,
        SetTool,
        AdjustThickness
    };

    Type type = Type::ToggleSpotlight;
    QString colorName;            // DrawColor
    ToolId tool = ToolId::Freehand;  // SetTool
    int delta = 0;                // AdjustThickness

    static OverlayCommand toggleSpotlight() { return { Type::ToggleSpotlight }; }
    static OverlayCommand drawColor(const QString& name) { return { Type::DrawColor, name }; }
    static OverlayCommand exitDrawing() { return { Type::ExitDrawing }; }
    static OverlayCommand clearAll() { return { Type::ClearAll }; }
    static OverlayCommand undo() { return { Type::Undo }; }
    static OverlayCommand redo() { return { Type::Redo }; }
    static OverlayCommand quit() { return { Type::Quit }; }
    static OverlayCommand setTool(ToolId tool) { return { Type::SetTool, QString(), tool }; }
    static OverlayCommand adjustThickness(int delta) { return { Type::AdjustThickness, QString(), ToolId::Freehand, delta }; }

    /**
     * @brief Map a configuration action name to a command.
     *
     * Recognizes "toggle_spotlight", "draw_<color>", "clear_screen",
     * "undo", "redo" and "quit". Color names are not validated here.
     */
    static std::optional<OverlayCommand> fromActionName(const QString& action);

    QString describe() const;

    bool operator==(const OverlayCommand& other) const
    {
        return type == other.type && colorName == other.colorName
            && tool == other.tool && delta == other.delta;
    }
};

Q_DECLARE_METATYPE(OverlayCommand)

#endif // OVERLAYCOMMAND_H
