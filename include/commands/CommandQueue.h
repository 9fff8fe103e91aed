#ifndef COMMANDQUEUE_H
#define COMMANDQUEUE_H

#include <QMutex>
#include <QQueue>
#include <QVector>

#include "commands/OverlayCommand.h"

/**
 * @brief Bounded, thread-safe FIFO between hotkey callbacks and the
 * control loop.
 *
 * Producers call tryPush() from any thread. The control loop drains the
 * whole queue once per tick. When the queue is full new commands are
 * dropped.
 */
class CommandQueue
{
public:
    static constexpr int kDefaultCapacity = 64;

    explicit CommandQueue(int capacity = kDefaultCapacity);

    /**
     * @return false when the queue is full and the command was dropped.
     */
    bool tryPush(const OverlayCommand& command);

    /**
     * @brief Remove and return every queued command in arrival order.
     */
    QVector<OverlayCommand> drain();

    int size() const;
    int capacity() const { return m_capacity; }
    int droppedCount() const;

private:
    CommandQueue(const CommandQueue&) = delete;
    CommandQueue& operator=(const CommandQueue&) = delete;

    mutable QMutex m_mutex;
    QQueue<OverlayCommand> m_queue;
    const int m_capacity;
    int m_dropped = 0;
};

#endif // COMMANDQUEUE_H
