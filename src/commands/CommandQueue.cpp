#include "commands/CommandQueue.h"

#include <QDebug>
#include <QMutexLocker>

CommandQueue::CommandQueue(int capacity)
    : m_capacity(qMax(1, capacity))
{
}

bool CommandQueue::tryPush(const OverlayCommand& command)
{
    QMutexLocker locker(&m_mutex);
    if (m_queue.size() >= m_capacity) {
        ++m_dropped;
        qWarning() << "CommandQueue: Queue full, dropping" << command.describe();
        return false;
    }
    m_queue.enqueue(command);
    return true;
}

QVector<OverlayCommand> CommandQueue::drain()
{
    QMutexLocker locker(&m_mutex);
    QVector<OverlayCommand> commands;
    commands.reserve(m_queue.size());
    while (!m_queue.isEmpty()) {
        commands.append(m_queue.dequeue());
    }
    return commands;
}

int CommandQueue::size() const
{
    QMutexLocker locker(&m_mutex);
    return m_queue.size();
}

int CommandQueue::droppedCount() const
{
    QMutexLocker locker(&m_mutex);
    return m_dropped;
}
