#include "overlay/DrawingToolbar.h"
#include "tools/ToolRegistry.h"

#include <QMouseEvent>
#include <QPainter>
#include <QPainterPath>
#include <QToolTip>

namespace {

const QColor kPanelColor(30, 30, 34, 230);
const QColor kPanelBorderColor(255, 255, 255, 40);
const QColor kHoverColor(255, 255, 255, 30);
const QColor kActiveColor(255, 255, 255, 60);
const QColor kIconColor(230, 230, 230);
const QColor kIconActiveColor(255, 255, 255);
const QColor kClearIconColor(255, 180, 100);
const QColor kExitIconColor(255, 100, 100);

} // namespace

DrawingToolbar::DrawingToolbar(QWidget *parent)
    : QWidget(parent, Qt::Tool | Qt::FramelessWindowHint | Qt::WindowStaysOnTopHint
                      | Qt::WindowDoesNotAcceptFocus)
{
    setAttribute(Qt::WA_TranslucentBackground);
    setAttribute(Qt::WA_ShowWithoutActivating);
    setMouseTracking(true);
    setFocusPolicy(Qt::NoFocus);

    rebuildButtons();
}

DrawingToolbar::~DrawingToolbar() = default;

void DrawingToolbar::setColors(const QMap<QString, QColor> &colors)
{
    if (m_colors == colors) {
        return;
    }
    m_colors = colors;
    rebuildButtons();
}

void DrawingToolbar::setActiveState(ToolId tool, const QString &colorName, int thickness)
{
    m_activeTool = tool;
    m_activeColor = colorName;
    m_thickness = thickness;
    update();
}

void DrawingToolbar::placeOnScreen(const QRect &availableGeometry)
{
    const int x = availableGeometry.left() + (availableGeometry.width() - width()) / 2;
    const int y = availableGeometry.bottom() - height() - kBottomMargin;
    move(x, y);
}

void DrawingToolbar::rebuildButtons()
{
    m_buttons.clear();
    m_hoveredButton = -1;

    const ToolRegistry &registry = ToolRegistry::instance();
    for (ToolId tool : registry.tools()) {
        const ToolDefinition &def = registry.get(tool);
        Button button;
        button.kind = ButtonKind::Tool;
        button.command = OverlayCommand::setTool(tool);
        button.tooltip = QString("%1 (%2)").arg(def.displayName, def.defaultShortcut);
        m_buttons.append(button);
    }

    bool first = true;
    for (auto it = m_colors.cbegin(); it != m_colors.cend(); ++it) {
        Button button;
        button.kind = ButtonKind::Color;
        button.command = OverlayCommand::drawColor(it.key());
        button.tooltip = it.key();
        button.swatch = it.value();
        button.separatorBefore = first;
        first = false;
        m_buttons.append(button);
    }

    auto addAction = [this](const OverlayCommand &command, const QString &tooltip, bool separator) {
        Button button;
        button.command = command;
        button.tooltip = tooltip;
        button.separatorBefore = separator;
        m_buttons.append(button);
    };
    addAction(OverlayCommand::adjustThickness(-1), tr("Thinner (Wheel)"), true);
    addAction(OverlayCommand::adjustThickness(1), tr("Thicker (Wheel)"), false);
    addAction(OverlayCommand::undo(), tr("Undo (Ctrl+Z)"), true);
    addAction(OverlayCommand::redo(), tr("Redo (Ctrl+Shift+Z)"), false);
    addAction(OverlayCommand::clearAll(), tr("Clear All"), false);
    addAction(OverlayCommand::exitDrawing(), tr("Exit (Esc)"), true);

    layoutButtons();
    update();
}

void DrawingToolbar::layoutButtons()
{
    int x = kPadding;
    for (Button &button : m_buttons) {
        if (button.separatorBefore) {
            x += kSeparatorWidth;
        }
        button.rect = QRect(x, kPadding, kButtonSize, kButtonSize);
        x += kButtonSize + kButtonSpacing;
    }
    setFixedSize(x - kButtonSpacing + kPadding, kButtonSize + 2 * kPadding);
}

int DrawingToolbar::buttonAt(const QPoint &pos) const
{
    for (int i = 0; i < m_buttons.size(); ++i) {
        if (m_buttons[i].rect.contains(pos)) {
            return i;
        }
    }
    return -1;
}

QRect DrawingToolbar::buttonRect(int index) const
{
    return (index >= 0 && index < m_buttons.size()) ? m_buttons[index].rect : QRect();
}

OverlayCommand DrawingToolbar::commandAt(int index) const
{
    return (index >= 0 && index < m_buttons.size()) ? m_buttons[index].command : OverlayCommand();
}

QString DrawingToolbar::tooltipAt(int index) const
{
    return (index >= 0 && index < m_buttons.size()) ? m_buttons[index].tooltip : QString();
}

int DrawingToolbar::indexOf(const OverlayCommand &command) const
{
    for (int i = 0; i < m_buttons.size(); ++i) {
        if (m_buttons[i].command == command) {
            return i;
        }
    }
    return -1;
}

bool DrawingToolbar::isButtonActive(const Button &button) const
{
    switch (button.kind) {
    case ButtonKind::Tool:
        return button.command.tool == m_activeTool;
    case ButtonKind::Color:
        return button.command.colorName == m_activeColor;
    case ButtonKind::Action:
        break;
    }
    return false;
}

void DrawingToolbar::paintEvent(QPaintEvent *)
{
    QPainter painter(this);
    painter.setRenderHint(QPainter::Antialiasing);

    QPainterPath panel;
    panel.addRoundedRect(QRectF(rect()).adjusted(0.5, 0.5, -0.5, -0.5), 10, 10);
    painter.fillPath(panel, kPanelColor);
    painter.setPen(kPanelBorderColor);
    painter.drawPath(panel);

    for (int i = 0; i < m_buttons.size(); ++i) {
        const Button &button = m_buttons[i];
        const bool active = isButtonActive(button);

        if (button.separatorBefore) {
            painter.setPen(kPanelBorderColor);
            const int sx = button.rect.left() - kSeparatorWidth / 2 - 1;
            painter.drawLine(sx, button.rect.top() + 6, sx, button.rect.bottom() - 6);
        }

        if (active || i == m_hoveredButton) {
            painter.setPen(Qt::NoPen);
            painter.setBrush(active ? kActiveColor : kHoverColor);
            painter.drawRoundedRect(button.rect.adjusted(2, 2, -2, -2), 6, 6);
        }

        QColor iconColor = active ? kIconActiveColor : kIconColor;
        if (button.command.type == OverlayCommand::Type::ClearAll) {
            iconColor = kClearIconColor;
        } else if (button.command.type == OverlayCommand::Type::ExitDrawing) {
            iconColor = kExitIconColor;
        }
        drawButtonIcon(painter, button, iconColor);
    }
}

void DrawingToolbar::drawButtonIcon(QPainter &painter, const Button &button, const QColor &iconColor) const
{
    const QRect iconRect = button.rect.adjusted(8, 8, -8, -8);

    switch (button.kind) {
    case ButtonKind::Tool:
        drawToolIcon(painter, iconRect, button.command.tool, iconColor);
        break;
    case ButtonKind::Color:
        painter.setPen(QPen(QColor(255, 255, 255, 180), 1.5));
        painter.setBrush(button.swatch);
        painter.drawEllipse(iconRect);
        break;
    case ButtonKind::Action:
        drawActionIcon(painter, iconRect, button.command.type, button.command.delta, iconColor);
        break;
    }
}

void DrawingToolbar::drawToolIcon(QPainter &painter, const QRect &rect, ToolId tool, const QColor &color) const
{
    painter.setPen(QPen(color, 2, Qt::SolidLine, Qt::RoundCap, Qt::RoundJoin));
    painter.setBrush(Qt::NoBrush);

    const QRectF r(rect);
    switch (tool) {
    case ToolId::Freehand: {
        QPainterPath path(QPointF(r.left(), r.bottom() - 2));
        path.cubicTo(QPointF(r.left() + r.width() * 0.3, r.top()),
                     QPointF(r.left() + r.width() * 0.6, r.bottom()),
                     QPointF(r.right(), r.top() + 2));
        painter.drawPath(path);
        break;
    }
    case ToolId::Line:
        painter.drawLine(r.bottomLeft(), r.topRight());
        break;
    case ToolId::Rectangle:
        painter.drawRect(r.adjusted(0, 2, 0, -2));
        break;
    case ToolId::Arrow: {
        painter.drawLine(r.bottomLeft(), r.topRight());
        QPainterPath head(r.topRight());
        head.lineTo(r.topRight() + QPointF(-7, 1));
        head.moveTo(r.topRight());
        head.lineTo(r.topRight() + QPointF(-1, 7));
        painter.drawPath(head);
        break;
    }
    case ToolId::Circle:
    case ToolId::Count:
        painter.drawEllipse(r);
        break;
    }
}

void DrawingToolbar::drawActionIcon(QPainter &painter, const QRect &rect, OverlayCommand::Type type,
                                    int delta, const QColor &color) const
{
    painter.setPen(QPen(color, 2, Qt::SolidLine, Qt::RoundCap, Qt::RoundJoin));
    painter.setBrush(Qt::NoBrush);
    const QRectF r(rect);
    const QPointF c = r.center();

    switch (type) {
    case OverlayCommand::Type::AdjustThickness: {
        // Dot sized by direction, with the current thickness as a hint
        const qreal radius = delta < 0 ? 2.5 : 5.5;
        painter.setPen(Qt::NoPen);
        painter.setBrush(color);
        painter.drawEllipse(c, radius, radius);
        if (delta > 0 && m_thickness > 0) {
            painter.setPen(color);
            QFont f = painter.font();
            f.setPixelSize(8);
            painter.setFont(f);
            painter.drawText(r.adjusted(0, 0, 4, 6), Qt::AlignRight | Qt::AlignBottom,
                             QString::number(m_thickness));
        }
        break;
    }
    case OverlayCommand::Type::Undo:
    case OverlayCommand::Type::Redo: {
        const bool undo = (type == OverlayCommand::Type::Undo);
        QPainterPath arc;
        arc.arcMoveTo(r.adjusted(2, 2, -2, -2), undo ? 150 : 30);
        arc.arcTo(r.adjusted(2, 2, -2, -2), undo ? 150 : 30, undo ? -240 : 240);
        painter.drawPath(arc);
        const QPointF tip = arc.pointAtPercent(0);
        painter.drawLine(tip, tip + QPointF(0, -5));
        painter.drawLine(tip, tip + QPointF(undo ? 5 : -5, 0));
        break;
    }
    case OverlayCommand::Type::ClearAll:
        painter.drawRect(r.adjusted(3, 4, -3, 0));
        painter.drawLine(QPointF(r.left(), r.top() + 2), QPointF(r.right(), r.top() + 2));
        painter.drawLine(QPointF(c.x() - 2, r.top() + 8), QPointF(c.x() - 2, r.bottom() - 3));
        painter.drawLine(QPointF(c.x() + 2, r.top() + 8), QPointF(c.x() + 2, r.bottom() - 3));
        break;
    case OverlayCommand::Type::ExitDrawing:
        painter.drawLine(r.topLeft() + QPointF(2, 2), r.bottomRight() - QPointF(2, 2));
        painter.drawLine(r.topRight() + QPointF(-2, 2), r.bottomLeft() + QPointF(2, -2));
        break;
    default:
        break;
    }
}

void DrawingToolbar::mousePressEvent(QMouseEvent *event)
{
    if (event->button() != Qt::LeftButton) {
        event->ignore();
        return;
    }

    const int index = buttonAt(event->position().toPoint());
    if (index >= 0) {
        emit commandRequested(m_buttons[index].command);
    }
    event->accept();
}

void DrawingToolbar::mouseMoveEvent(QMouseEvent *event)
{
    const int index = buttonAt(event->position().toPoint());
    if (index != m_hoveredButton) {
        m_hoveredButton = index;
        if (index >= 0) {
            QToolTip::showText(event->globalPosition().toPoint(), m_buttons[index].tooltip, this);
        } else {
            QToolTip::hideText();
        }
        update();
    }
}

void DrawingToolbar::leaveEvent(QEvent *event)
{
    m_hoveredButton = -1;
    QToolTip::hideText();
    update();
    QWidget::leaveEvent(event);
}
