#ifndef MODESTATEMACHINE_H
#define MODESTATEMACHINE_H

#include <QColor>
#include <QMap>
#include <QObject>
#include <QString>

#include "tools/ToolId.h"

/**
 * @brief Application mode and drawing tool state.
 *
 * Modes:
 *   Idle <-> SpotlightOnly via toggleSpotlight()
 *   Idle/SpotlightOnly -> Drawing(color) via drawColor(color)
 *   Drawing(color) -> previous non-drawing mode via drawColor(color) or exitDrawing()
 *   Drawing(A) -> Drawing(B) via drawColor(B)
 *
 * Thickness is tracked per color name and clamped to [1, 20].
 * Every command returns whether it changed or was accepted; rejected
 * commands are logged and leave the state untouched.
 */
class ModeStateMachine : public QObject
{
    Q_OBJECT

public:
    enum class Mode {
        Idle,
        SpotlightOnly,
        Drawing
    };
    Q_ENUM(Mode)

    static constexpr int kMinThickness = 1;
    static constexpr int kMaxThickness = 20;
    static constexpr int kDefaultThickness = 4;

    explicit ModeStateMachine(QObject *parent = nullptr);
    ~ModeStateMachine() override;

    // Configuration
    void setColorCatalog(const QMap<QString, QColor> &colors);
    QMap<QString, QColor> colorCatalog() const { return m_colors; }
    void setDefaultThickness(int thickness);
    void restoreThicknesses(const QMap<QString, int> &thicknesses);
    void restoreTool(ToolId tool);

    // State
    Mode mode() const { return m_mode; }
    Mode restingMode() const { return m_restingMode; }
    bool isDrawing() const { return m_mode == Mode::Drawing; }
    bool isSpotlightActive() const;

    QString drawingColorName() const { return m_colorName; }
    QColor drawingColor() const;
    ToolId tool() const { return m_tool; }
    int thickness() const;
    int thicknessFor(const QString &colorName) const;

    // Commands
    bool toggleSpotlight();
    bool drawColor(const QString &colorName);
    bool exitDrawing();
    bool setTool(ToolId tool);
    bool adjustThickness(int delta);

    /**
     * @brief Whether undo/redo may run in the current mode.
     *
     * Accepted while drawing, or while idle when there is history to act on.
     */
    bool acceptsHistoryCommand(bool hasHistory) const;

signals:
    void modeChanged(ModeStateMachine::Mode mode, ModeStateMachine::Mode previous);
    void spotlightChanged(bool active);
    void drawingColorChanged(const QString &colorName, const QColor &color);
    void toolChanged(ToolId tool);
    void thicknessChanged(const QString &colorName, int thickness);

private:
    void setMode(Mode mode);

    Mode m_mode = Mode::Idle;
    Mode m_restingMode = Mode::Idle;  // mode to return to when drawing ends
    QString m_colorName;
    ToolId m_tool = ToolId::Freehand;
    int m_defaultThickness = kDefaultThickness;
    QMap<QString, QColor> m_colors;
    QMap<QString, int> m_thickness;
};

#endif // MODESTATEMACHINE_H
