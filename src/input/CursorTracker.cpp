#include "input/CursorTracker.h"

#include <QCursor>
#include <QTimer>

CursorTracker::CursorTracker(QObject *parent)
    : QObject(parent)
    , m_timer(new QTimer(this))
    , m_source([] { return QCursor::pos(); })
{
    m_timer->setInterval(kPollIntervalMs);
    m_timer->setTimerType(Qt::PreciseTimer);
    connect(m_timer, &QTimer::timeout, this, &CursorTracker::poll);
}

CursorTracker::~CursorTracker() = default;

void CursorTracker::start()
{
    if (!m_timer->isActive()) {
        m_hasPosition = false;
        m_timer->start();
        poll();
    }
}

void CursorTracker::stop()
{
    m_timer->stop();
}

bool CursorTracker::isRunning() const
{
    return m_timer->isActive();
}

void CursorTracker::setPositionSource(PositionSource source)
{
    m_source = source ? std::move(source) : PositionSource([] { return QCursor::pos(); });
}

void CursorTracker::poll()
{
    const QPoint pos = m_source();
    if (m_hasPosition && pos == m_lastPos) {
        return;
    }
    m_lastPos = pos;
    m_hasPosition = true;
    emit cursorMoved(pos);
}
