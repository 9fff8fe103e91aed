#include "overlay/MonitorLayout.h"

#include <QGuiApplication>
#include <QScreen>

MonitorLayout MonitorLayout::fromAvailableGeometries(const QVector<QRect>& displays)
{
    MonitorLayout layout;
    for (const QRect& rect : displays) {
        if (rect.isEmpty()) {
            continue;
        }
        layout.m_displays.append(rect);
        layout.m_bounds = layout.m_bounds.united(rect);
        layout.m_region += rect;
    }
    return layout;
}

MonitorLayout MonitorLayout::fromScreens(const QList<QScreen*>& screens)
{
    QVector<QRect> displays;
    displays.reserve(screens.size());
    for (QScreen* screen : screens) {
        if (screen) {
            displays.append(screen->availableGeometry());
        }
    }
    return fromAvailableGeometries(displays);
}

MonitorLayout MonitorLayout::current()
{
    return fromScreens(QGuiApplication::screens());
}

int MonitorLayout::displayAt(const QPoint& globalPos) const
{
    for (int i = 0; i < m_displays.size(); ++i) {
        if (m_displays[i].contains(globalPos)) {
            return i;
        }
    }
    return -1;
}
