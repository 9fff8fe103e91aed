#ifndef STROKE_H
#define STROKE_H

#include <QColor>
#include <QPointF>
#include <QRectF>
#include <QVector>
#include <QtGlobal>
#include <variant>

#include "tools/ToolId.h"

class QPainterPath;

// Raw input points are kept next to the interpolated curve so the
// stroke can be re-smoothed without loss.
struct FreehandGeometry {
    QVector<QPointF> controlPoints;
    QVector<QPointF> smoothedPoints;
};

struct LineGeometry {
    QPointF start;
    QPointF end;
};

// Two opposite corners as dragged; rect() normalizes them.
struct RectangleGeometry {
    QPointF corner1;
    QPointF corner2;

    QRectF rect() const { return QRectF(corner1, corner2).normalized(); }
};

struct ArrowGeometry {
    QPointF start;
    QPointF end;
    QPointF headLeft;
    QPointF headRight;

    // End of the visible shaft, where the arrowhead base sits
    QPointF shaftEnd() const { return (headLeft + headRight) / 2.0; }
};

struct CircleGeometry {
    QPointF center;
    qreal radius = 0.0;
};

using StrokeGeometry = std::variant<FreehandGeometry, LineGeometry, RectangleGeometry,
                                    ArrowGeometry, CircleGeometry>;

/**
 * @brief A committed, immutable vector annotation.
 *
 * Coordinates are global virtual-desktop coordinates.
 */
struct Stroke {
    quint64 sequenceId = 0;
    QColor color;
    int thickness = 1;
    StrokeGeometry geometry;

    ToolId tool() const;

    /**
     * @brief The anchor where the gesture ended.
     *
     * Used as the start of a chained straight segment.
     */
    QPointF endAnchor() const;

    QRectF boundingRect() const;

    /**
     * @brief Outline path used for the glow and core passes.
     *
     * Arrowheads are not part of this path; see arrowHeadPath().
     */
    QPainterPath path() const;
    QPainterPath arrowHeadPath() const;
};

namespace StrokeGeometryBuilder {

// Arrowhead geometry shared by the live preview and the committed stroke
inline constexpr qreal kArrowHeadMinLength = 15.0;
inline constexpr qreal kArrowHeadLengthPerThickness = 5.0;
inline constexpr qreal kArrowHeadHalfAngle = 0.5235987755982988;  // 30 degrees

qreal arrowHeadLength(int thickness);
ArrowGeometry makeArrow(const QPointF& start, const QPointF& end, int thickness);
CircleGeometry makeCircle(const QPointF& center, const QPointF& rimPoint);

} // namespace StrokeGeometryBuilder

#endif // STROKE_H
