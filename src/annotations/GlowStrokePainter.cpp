#include "annotations/GlowStrokePainter.h"
#include "annotations/Stroke.h"

#include <QPainter>
#include <QPainterPath>
#include <QPen>

void GlowStrokePainter::drawStroke(QPainter& painter, const Stroke& stroke)
{
    drawGlowPath(painter, stroke.path(), stroke.color, stroke.thickness);

    if (stroke.tool() == ToolId::Arrow) {
        drawGlowFill(painter, stroke.arrowHeadPath(), stroke.color, stroke.thickness);
    }
}

void GlowStrokePainter::drawGlowPath(QPainter& painter, const QPainterPath& path,
                                     const QColor& color, int thickness)
{
    if (path.isEmpty()) {
        return;
    }

    painter.save();
    painter.setRenderHint(QPainter::Antialiasing, true);
    painter.setBrush(Qt::NoBrush);

    for (const GlowLayer& layer : kGlowLayers) {
        QColor glowColor = color;
        glowColor.setAlphaF(color.alphaF() * layer.alpha);
        painter.setPen(QPen(glowColor, thickness + layer.extraWidth,
                            Qt::SolidLine, Qt::RoundCap, Qt::RoundJoin));
        painter.drawPath(path);
    }

    painter.setPen(QPen(color, thickness, Qt::SolidLine, Qt::RoundCap, Qt::RoundJoin));
    painter.drawPath(path);

    painter.restore();
}

void GlowStrokePainter::drawGlowFill(QPainter& painter, const QPainterPath& path,
                                     const QColor& color, int thickness)
{
    if (path.isEmpty()) {
        return;
    }

    painter.save();
    painter.setRenderHint(QPainter::Antialiasing, true);

    for (const GlowLayer& layer : kGlowLayers) {
        QColor glowColor = color;
        glowColor.setAlphaF(color.alphaF() * layer.alpha);
        painter.setPen(QPen(glowColor, layer.extraWidth, Qt::SolidLine, Qt::RoundCap, Qt::RoundJoin));
        painter.setBrush(Qt::NoBrush);
        painter.drawPath(path);
    }

    painter.setPen(QPen(color, qMax(1, thickness / 2), Qt::SolidLine, Qt::RoundCap, Qt::RoundJoin));
    painter.setBrush(color);
    painter.drawPath(path);

    painter.restore();
}
