#include "annotations/StrokeSmoothing.h"

#include <QtGlobal>

namespace StrokeSmoothing {

QPointF catmullRomPoint(const QPointF& p0, const QPointF& p1,
                        const QPointF& p2, const QPointF& p3, qreal t)
{
    const qreal t2 = t * t;
    const qreal t3 = t2 * t;

    return 0.5 * ((2.0 * p1)
                  + (-p0 + p2) * t
                  + (2.0 * p0 - 5.0 * p1 + 4.0 * p2 - p3) * t2
                  + (-p0 + 3.0 * p1 - 3.0 * p2 + p3) * t3);
}

QVector<QPointF> catmullRom(const QVector<QPointF>& points, int samplesPerSegment)
{
    if (points.size() < 3) {
        return points;
    }

    const int samples = qMax(1, samplesPerSegment);
    const int last = points.size() - 1;

    QVector<QPointF> result;
    result.reserve(last * samples + 1);

    for (int i = 0; i < last; ++i) {
        const QPointF& p0 = points[qMax(0, i - 1)];
        const QPointF& p1 = points[i];
        const QPointF& p2 = points[i + 1];
        const QPointF& p3 = points[qMin(last, i + 2)];

        result.append(p1);
        for (int s = 1; s < samples; ++s) {
            result.append(catmullRomPoint(p0, p1, p2, p3, qreal(s) / samples));
        }
    }
    result.append(points.last());

    return result;
}

} // namespace StrokeSmoothing
