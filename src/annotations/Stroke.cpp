#include "annotations/Stroke.h"

#include <QLineF>
#include <QPainterPath>
#include <QPolygonF>
#include <QtMath>

namespace {

template <class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

QPainterPath polylinePath(const QVector<QPointF>& points)
{
    QPainterPath path;
    if (points.isEmpty()) {
        return path;
    }
    path.moveTo(points.first());
    for (int i = 1; i < points.size(); ++i) {
        path.lineTo(points[i]);
    }
    return path;
}

} // namespace

ToolId Stroke::tool() const
{
    return std::visit(Overloaded{
        [](const FreehandGeometry&) { return ToolId::Freehand; },
        [](const LineGeometry&) { return ToolId::Line; },
        [](const RectangleGeometry&) { return ToolId::Rectangle; },
        [](const ArrowGeometry&) { return ToolId::Arrow; },
        [](const CircleGeometry&) { return ToolId::Circle; },
    }, geometry);
}

QPointF Stroke::endAnchor() const
{
    return std::visit(Overloaded{
        [](const FreehandGeometry& g) {
            return g.controlPoints.isEmpty() ? QPointF() : g.controlPoints.last();
        },
        [](const LineGeometry& g) { return g.end; },
        [](const RectangleGeometry& g) { return g.corner2; },
        [](const ArrowGeometry& g) { return g.end; },
        [](const CircleGeometry& g) { return g.center + QPointF(g.radius, 0.0); },
    }, geometry);
}

QRectF Stroke::boundingRect() const
{
    QRectF rect = path().boundingRect();
    if (tool() == ToolId::Arrow) {
        rect = rect.united(arrowHeadPath().boundingRect());
    }
    const qreal margin = thickness / 2.0 + 1.0;
    return rect.adjusted(-margin, -margin, margin, margin);
}

QPainterPath Stroke::path() const
{
    return std::visit(Overloaded{
        [](const FreehandGeometry& g) {
            return polylinePath(g.smoothedPoints.isEmpty() ? g.controlPoints : g.smoothedPoints);
        },
        [](const LineGeometry& g) {
            QPainterPath p(g.start);
            p.lineTo(g.end);
            return p;
        },
        [](const RectangleGeometry& g) {
            QPainterPath p;
            p.addRect(g.rect());
            return p;
        },
        [](const ArrowGeometry& g) {
            QPainterPath p(g.start);
            p.lineTo(g.shaftEnd());
            return p;
        },
        [](const CircleGeometry& g) {
            QPainterPath p;
            p.addEllipse(g.center, g.radius, g.radius);
            return p;
        },
    }, geometry);
}

QPainterPath Stroke::arrowHeadPath() const
{
    QPainterPath head;
    if (const auto* arrow = std::get_if<ArrowGeometry>(&geometry)) {
        head.moveTo(arrow->end);
        head.lineTo(arrow->headLeft);
        head.lineTo(arrow->headRight);
        head.closeSubpath();
    }
    return head;
}

namespace StrokeGeometryBuilder {

qreal arrowHeadLength(int thickness)
{
    return qMax(kArrowHeadMinLength, thickness * kArrowHeadLengthPerThickness);
}

ArrowGeometry makeArrow(const QPointF& start, const QPointF& end, int thickness)
{
    ArrowGeometry arrow;
    arrow.start = start;
    arrow.end = end;

    const QLineF shaft(start, end);
    const qreal length = shaft.length();
    if (length <= 0.0) {
        arrow.headLeft = end;
        arrow.headRight = end;
        return arrow;
    }

    // Short arrows keep a head no longer than the shaft
    const qreal headLength = qMin(arrowHeadLength(thickness), length);
    const qreal angle = qAtan2(end.y() - start.y(), end.x() - start.x());

    arrow.headLeft = QPointF(end.x() - headLength * qCos(angle - kArrowHeadHalfAngle),
                             end.y() - headLength * qSin(angle - kArrowHeadHalfAngle));
    arrow.headRight = QPointF(end.x() - headLength * qCos(angle + kArrowHeadHalfAngle),
                              end.y() - headLength * qSin(angle + kArrowHeadHalfAngle));
    return arrow;
}

CircleGeometry makeCircle(const QPointF& center, const QPointF& rimPoint)
{
    return CircleGeometry{ center, QLineF(center, rimPoint).length() };
}

} // namespace StrokeGeometryBuilder
