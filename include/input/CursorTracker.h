#ifndef CURSORTRACKER_H
#define CURSORTRACKER_H

#include <QObject>
#include <QPoint>
#include <functional>

class QTimer;

/**
 * @brief Polls the global cursor position at about 60 Hz.
 *
 * Works while the overlay is click-through and receives no mouse events.
 * cursorMoved is emitted only when the position changes.
 */
class CursorTracker : public QObject
{
    Q_OBJECT

public:
    using PositionSource = std::function<QPoint()>;

    explicit CursorTracker(QObject *parent = nullptr);
    ~CursorTracker() override;

    void start();
    void stop();
    bool isRunning() const;

    /**
     * @brief Replace QCursor::pos() as the position source.
     */
    void setPositionSource(PositionSource source);

    QPoint lastPosition() const { return m_lastPos; }

public slots:
    void poll();

signals:
    void cursorMoved(const QPoint &globalPos);

private:
    QTimer *m_timer;
    PositionSource m_source;
    QPoint m_lastPos;
    bool m_hasPosition = false;

    static constexpr int kPollIntervalMs = 16;  // ~60fps
};

#endif // CURSORTRACKER_H
