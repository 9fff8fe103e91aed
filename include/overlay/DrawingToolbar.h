#ifndef DRAWINGTOOLBAR_H
#define DRAWINGTOOLBAR_H

#include <QColor>
#include <QMap>
#include <QRect>
#include <QVector>
#include <QWidget>

#include "commands/OverlayCommand.h"
#include "tools/ToolId.h"

/**
 * @brief Floating toolbar shown while drawing.
 *
 * Offers tools, colors, thickness, undo/redo, clear and exit. Clicking a
 * button emits the same command a shortcut would; the toolbar holds no
 * state of its own beyond what setActiveState() mirrors for highlighting.
 */
class DrawingToolbar : public QWidget
{
    Q_OBJECT

public:
    explicit DrawingToolbar(QWidget *parent = nullptr);
    ~DrawingToolbar() override;

    void setColors(const QMap<QString, QColor> &colors);
    void setActiveState(ToolId tool, const QString &colorName, int thickness);

    /**
     * @brief Center the toolbar near the bottom of the given screen area.
     */
    void placeOnScreen(const QRect &availableGeometry);

    int buttonCount() const { return m_buttons.size(); }
    int buttonAt(const QPoint &pos) const;
    QRect buttonRect(int index) const;
    OverlayCommand commandAt(int index) const;
    QString tooltipAt(int index) const;

    /**
     * @brief Index of the first button that issues the given command, or -1.
     */
    int indexOf(const OverlayCommand &command) const;

signals:
    void commandRequested(const OverlayCommand &command);

protected:
    void paintEvent(QPaintEvent *event) override;
    void mousePressEvent(QMouseEvent *event) override;
    void mouseMoveEvent(QMouseEvent *event) override;
    void leaveEvent(QEvent *event) override;

private:
    enum class ButtonKind {
        Tool,
        Color,
        Action
    };

    struct Button {
        ButtonKind kind = ButtonKind::Action;
        OverlayCommand command;
        QString tooltip;
        QColor swatch;
        bool separatorBefore = false;
        QRect rect;
    };

    void rebuildButtons();
    void layoutButtons();
    bool isButtonActive(const Button &button) const;
    void drawButtonIcon(QPainter &painter, const Button &button, const QColor &iconColor) const;
    void drawToolIcon(QPainter &painter, const QRect &rect, ToolId tool, const QColor &color) const;
    void drawActionIcon(QPainter &painter, const QRect &rect, OverlayCommand::Type type,
                        int delta, const QColor &color) const;

    QVector<Button> m_buttons;
    QMap<QString, QColor> m_colors;
    ToolId m_activeTool = ToolId::Freehand;
    QString m_activeColor;
    int m_thickness = 0;
    int m_hoveredButton = -1;

    static constexpr int kButtonSize = 32;
    static constexpr int kButtonSpacing = 2;
    static constexpr int kSeparatorWidth = 9;
    static constexpr int kPadding = 8;
    static constexpr int kBottomMargin = 30;
};

#endif // DRAWINGTOOLBAR_H
