#include "spotlight/SpotlightRenderer.h"

#include <QPainter>
#include <QRectF>

SpotlightRenderer::SpotlightRenderer(QObject *parent)
    : QObject(parent)
{
    rebuildPaintResources();
}

SpotlightRenderer::~SpotlightRenderer() = default;

void SpotlightRenderer::applyConfig(const Glowpoint::SpotlightConfig &config)
{
    Glowpoint::SpotlightConfig sanitized = config;
    sanitized.radius = qMax(1, config.radius);
    sanitized.ringRadius = qMax(0, config.ringRadius);
    sanitized.opacity = qBound(0.0, config.opacity, 1.0);

    if (sanitized == m_config) {
        return;
    }

    m_config = sanitized;
    rebuildPaintResources();
    emit needsRepaint();
}

void SpotlightRenderer::rebuildPaintResources()
{
    const qreal opacity = m_config.opacity;
    const QColor base = m_config.color;

    auto tinted = [&base](qreal alpha) {
        QColor c = base;
        c.setAlpha(qBound(0, qRound(alpha), 255));
        return c;
    };

    m_glowGradient = QRadialGradient(QPointF(0, 0), m_config.radius);
    m_glowGradient.setColorAt(0.0, tinted(180 * opacity));
    m_glowGradient.setColorAt(0.3, tinted(120 * opacity));
    m_glowGradient.setColorAt(0.7, tinted(60 * opacity));
    m_glowGradient.setColorAt(1.0, tinted(0));
    m_glowBrush = QBrush(m_glowGradient);

    m_ringPen = QPen(tinted(200 * opacity), kRingPenWidth);
    m_ringPen.setCosmetic(false);
}

void SpotlightRenderer::update(const QPointF &cursorPosition)
{
    if (m_hasPosition && m_cursorPos == cursorPosition) {
        return;
    }
    m_cursorPos = cursorPosition;
    m_hasPosition = true;
    emit needsRepaint();
}

void SpotlightRenderer::render(QPainter &painter) const
{
    if (!m_hasPosition) {
        return;
    }

    const qreal radius = m_config.radius;

    painter.save();
    painter.setRenderHint(QPainter::Antialiasing, true);
    painter.translate(m_cursorPos);

    painter.setPen(Qt::NoPen);
    painter.setBrush(m_glowBrush);
    painter.drawEllipse(QPointF(0, 0), radius, radius);

    if (m_config.ringRadius > 0) {
        painter.setPen(m_ringPen);
        painter.setBrush(Qt::NoBrush);
        painter.drawEllipse(QPointF(0, 0), m_config.ringRadius, m_config.ringRadius);
    }

    painter.restore();
}

SpotlightRenderer::Geometry SpotlightRenderer::geometry() const
{
    Geometry g;
    g.center = m_cursorPos;
    g.ringRadius = m_config.ringRadius;
    g.outerRadius = m_config.radius;
    g.visible = m_hasPosition;
    return g;
}

QRectF SpotlightRenderer::dirtyRect(const QPointF &previousPosition) const
{
    const qreal extent = qMax<qreal>(m_config.radius, m_config.ringRadius + kRingPenWidth) + 2.0;
    const QRectF previous(previousPosition.x() - extent, previousPosition.y() - extent,
                          extent * 2, extent * 2);
    const QRectF current(m_cursorPos.x() - extent, m_cursorPos.y() - extent,
                         extent * 2, extent * 2);
    return previous.united(current);
}
