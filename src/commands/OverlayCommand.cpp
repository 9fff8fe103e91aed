#include "commands/OverlayCommand.h"
#include "hotkey/HotkeyTypes.h"
#include "tools/ToolRegistry.h"

std::optional<OverlayCommand> OverlayCommand::fromActionName(const QString& action)
{
    const QString name = action.trimmed().toLower();

    if (name == QLatin1String("toggle_spotlight")) {
        return toggleSpotlight();
    }
    if (name == QLatin1String("clear_screen")) {
        return clearAll();
    }
    if (name == QLatin1String("undo")) {
        return undo();
    }
    if (name == QLatin1String("redo")) {
        return redo();
    }
    if (name == QLatin1String("quit")) {
        return quit();
    }
    const QLatin1String drawPrefix(Glowpoint::kDrawActionPrefix);
    if (name.startsWith(drawPrefix) && name.size() > drawPrefix.size()) {
        return drawColor(name.mid(drawPrefix.size()));
    }
    return std::nullopt;
}

QString OverlayCommand::describe() const
{
    switch (type) {
    case Type::ToggleSpotlight:
        return QStringLiteral("toggle-spotlight");
    case Type::DrawColor:
        return QStringLiteral("draw-color(%1)").arg(colorName);
    case Type::ExitDrawing:
        return QStringLiteral("exit-drawing");
    case Type::ClearAll:
        return QStringLiteral("clear-all");
    case Type::Undo:
        return QStringLiteral("undo");
    case Type::Redo:
        return QStringLiteral("redo");
    case Type::Quit:
        return QStringLiteral("quit");
    case Type::SetTool:
        return QStringLiteral("set-tool(%1)").arg(ToolRegistry::instance().get(tool).configKey);
    case Type::AdjustThickness:
        return QStringLiteral("adjust-thickness(%1)").arg(delta);
    }
    return QString();
}
