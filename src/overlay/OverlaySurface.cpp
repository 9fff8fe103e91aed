#include "overlay/OverlaySurface.h"
#include "platform/WindowLevel.h"

#include <QDebug>
#include <QKeyEvent>
#include <QMouseEvent>
#include <QPaintEvent>
#include <QPainter>
#include <QWheelEvent>

OverlaySurface::OverlaySurface(QWidget *parent)
    : QWidget(parent)
{
    setWindowFlags(Qt::FramelessWindowHint | Qt::WindowStaysOnTopHint | Qt::Tool
                   | Qt::WindowTransparentForInput);
    setAttribute(Qt::WA_TranslucentBackground);
    setAttribute(Qt::WA_ShowWithoutActivating);
    setAttribute(Qt::WA_NoSystemBackground);
    setMouseTracking(true);
    setFocusPolicy(Qt::StrongFocus);
}

OverlaySurface::~OverlaySurface() = default;

void OverlaySurface::setMonitorLayout(const MonitorLayout &layout)
{
    m_layout = layout;
    setGeometry(layout.bounds());
    applyCoveredMask();
    update();
}

void OverlaySurface::applyCoveredMask()
{
    const QRegion covered = m_layout.coveredRegion();
    if (m_layout.isEmpty() || QRegion(m_layout.bounds()).subtracted(covered).isEmpty()) {
        clearMask();
        return;
    }
    setMask(covered.translated(-m_layout.bounds().topLeft()));
}

void OverlaySurface::setInputMode(InputMode mode)
{
    if (m_inputMode == mode) {
        return;
    }
    m_inputMode = mode;

    const bool capture = (mode == InputMode::Capture);
    setWindowClickThrough(this, !capture);
    setCursor(capture ? Qt::CrossCursor : Qt::ArrowCursor);
    m_wheelRemainder = 0;

    if (capture && isVisible()) {
        activateOverlayWindow(this);
    }
    qDebug() << "OverlaySurface: Input mode" << (capture ? "capture" : "click-through");
}

void OverlaySurface::setPaintDelegate(PaintDelegate delegate)
{
    m_paintDelegate = std::move(delegate);
    update();
}

void OverlaySurface::updateGlobalRect(const QRectF &globalRect)
{
    update(QRectF(m_layout.toSurface(globalRect.topLeft()), globalRect.size()).toAlignedRect());
}

QPointF OverlaySurface::toGlobal(const QPointF &localPos) const
{
    return m_layout.toGlobal(localPos);
}

void OverlaySurface::paintEvent(QPaintEvent *event)
{
    QPainter painter(this);
    painter.setCompositionMode(QPainter::CompositionMode_Source);
    painter.fillRect(event->rect(), Qt::transparent);
    painter.setCompositionMode(QPainter::CompositionMode_SourceOver);

    if (!m_paintDelegate) {
        return;
    }

    painter.translate(-QPointF(m_layout.bounds().topLeft()));
    m_paintDelegate(painter);
}

void OverlaySurface::mousePressEvent(QMouseEvent *event)
{
    if (m_inputMode != InputMode::Capture) {
        event->ignore();
        return;
    }
    const QPointF globalPos = toGlobal(event->position());
    if (!m_layout.contains(globalPos.toPoint())) {
        // Masked out; only reachable where the platform ignores input masks
        event->ignore();
        return;
    }
    emit pointerPressed(globalPos, event->button(), event->modifiers());
    event->accept();
}

void OverlaySurface::mouseMoveEvent(QMouseEvent *event)
{
    emit pointerMoved(toGlobal(event->position()));
    event->accept();
}

void OverlaySurface::mouseReleaseEvent(QMouseEvent *event)
{
    if (m_inputMode != InputMode::Capture) {
        event->ignore();
        return;
    }
    emit pointerReleased(toGlobal(event->position()), event->button());
    event->accept();
}

void OverlaySurface::wheelEvent(QWheelEvent *event)
{
    if (m_inputMode != InputMode::Capture) {
        event->ignore();
        return;
    }

    // Accumulate high-resolution wheels until a full notch (120)
    m_wheelRemainder += event->angleDelta().y();
    const int steps = m_wheelRemainder / 120;
    if (steps != 0) {
        m_wheelRemainder -= steps * 120;
        emit wheelScrolled(steps);
    }
    event->accept();
}

void OverlaySurface::keyPressEvent(QKeyEvent *event)
{
    if (m_inputMode != InputMode::Capture) {
        QWidget::keyPressEvent(event);
        return;
    }
    emit keyPressed(event->key(), event->modifiers(), event->text());
    event->accept();
}
