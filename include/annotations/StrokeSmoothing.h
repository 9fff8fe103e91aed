#ifndef STROKESMOOTHING_H
#define STROKESMOOTHING_H

#include <QPointF>
#include <QVector>

namespace StrokeSmoothing {

inline constexpr int kDefaultSamplesPerSegment = 8;

/**
 * @brief Interpolate a uniform Catmull-Rom spline through the points.
 *
 * The curve passes through every input point. End points are duplicated
 * as phantom neighbours, so the first and last samples equal the first
 * and last input points. Inputs with fewer than three points are
 * returned unchanged.
 *
 * For n >= 3 points the result holds (n - 1) * samplesPerSegment + 1
 * samples.
 */
QVector<QPointF> catmullRom(const QVector<QPointF>& points,
                            int samplesPerSegment = kDefaultSamplesPerSegment);

/**
 * @brief Evaluate one Catmull-Rom segment between p1 and p2 at t in [0, 1].
 */
QPointF catmullRomPoint(const QPointF& p0, const QPointF& p1,
                        const QPointF& p2, const QPointF& p3, qreal t);

} // namespace StrokeSmoothing

#endif // STROKESMOOTHING_H
