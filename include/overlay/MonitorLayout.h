#ifndef MONITORLAYOUT_H
#define MONITORLAYOUT_H

#include <QList>
#include <QPoint>
#include <QRect>
#include <QRegion>
#include <QVector>

class QScreen;

/**
 * @brief Geometry of the overlay surface across all monitors.
 *
 * Built from each display's available geometry, i.e. with taskbars and
 * docks excluded. The surface covers the bounding rectangle of those
 * areas; coveredRegion() is the exact union.
 */
class MonitorLayout
{
public:
    MonitorLayout() = default;

    static MonitorLayout fromAvailableGeometries(const QVector<QRect>& displays);
    static MonitorLayout fromScreens(const QList<QScreen*>& screens);

    /**
     * @brief Layout for the screens currently attached to the application.
     */
    static MonitorLayout current();

    const QVector<QRect>& displays() const { return m_displays; }
    QRect bounds() const { return m_bounds; }
    QRegion coveredRegion() const { return m_region; }
    bool isEmpty() const { return m_displays.isEmpty(); }

    bool contains(const QPoint& globalPos) const { return m_region.contains(globalPos); }

    /**
     * @brief Index of the display containing the point, or -1.
     */
    int displayAt(const QPoint& globalPos) const;

    QPoint toSurface(const QPoint& globalPos) const { return globalPos - m_bounds.topLeft(); }
    QPointF toSurface(const QPointF& globalPos) const { return globalPos - QPointF(m_bounds.topLeft()); }
    QPointF toGlobal(const QPointF& surfacePos) const { return surfacePos + QPointF(m_bounds.topLeft()); }

    bool operator==(const MonitorLayout& other) const { return m_displays == other.m_displays; }
    bool operator!=(const MonitorLayout& other) const { return !(*this == other); }

private:
    QVector<QRect> m_displays;
    QRect m_bounds;
    QRegion m_region;
};

#endif // MONITORLAYOUT_H
