/**
 * @file GlobalHotkeyListener.h
 * @brief System-wide chord listener with background-thread delivery
 *
 * Chords are registered with the OS through QHotkey. Activations are
 * forwarded to a dispatch worker living on a dedicated thread, which
 * filters key repeat and runs the binding's callback there. Callbacks
 * therefore never run on the control thread and must only enqueue work.
 */

#pragma once

#include "HotkeyTypes.h"
#include "KeyRepeatFilter.h"

#include <QElapsedTimer>
#include <QMap>
#include <QMutex>
#include <QObject>
#include <QPointer>
#include <functional>

class QHotkey;
class QThread;

namespace Glowpoint {

using HotkeyCallback = std::function<void()>;

/**
 * @brief Runs binding callbacks on the listener thread.
 */
class HotkeyDispatchWorker : public QObject
{
    Q_OBJECT

public:
    explicit HotkeyDispatchWorker(QObject* parent = nullptr);

    void setCallbacks(const QMap<int, HotkeyCallback>& callbacks);
    int dispatchedCount() const;

public slots:
    void handlePress(int bindingId);
    void handleRelease(int bindingId);

private:
    mutable QMutex m_mutex;
    QMap<int, HotkeyCallback> m_callbacks;
    KeyRepeatFilter m_filter;
    QElapsedTimer m_clock;
    int m_dispatched = 0;
};

/**
 * @brief Owns the OS registrations and the listener thread.
 *
 * Usage:
 * @code
 * GlobalHotkeyListener listener;
 * listener.registerChord("<ctrl>+<shift>+s", [&queue] {
 *     queue.tryPush(OverlayCommand::toggleSpotlight());
 * });
 * listener.start();
 * @endcode
 */
class GlobalHotkeyListener : public QObject
{
    Q_OBJECT

public:
    explicit GlobalHotkeyListener(QObject* parent = nullptr);
    ~GlobalHotkeyListener() override;

    /**
     * @brief Add a binding. Takes effect on the next start().
     * @return binding id, or -1 when the chord cannot be parsed.
     */
    int registerChord(const QString& chord, HotkeyCallback callback);

    /**
     * @brief Remove every binding. Stops the listener if it is running.
     */
    void clearBindings();

    /**
     * @brief Register all bindings with the OS and start the listener thread.
     *
     * Individual registration failures are reported through
     * registrationFailed() and a toast; they do not stop the listener.
     * @return false when already running or the thread could not start.
     */
    bool start();

    /**
     * @brief Unregister every chord and join the listener thread.
     */
    void stop();

    bool isRunning() const;

    QList<HotkeyBinding> bindings() const { return m_bindings.values(); }
    HotkeyStatus status(int bindingId) const;
    int registeredCount() const;

    /**
     * @brief The worker that runs callbacks; lives on the listener thread
     * while running, nullptr otherwise.
     */
    HotkeyDispatchWorker* dispatcher() const { return m_worker; }

signals:
    void registrationFailed(const QString& chord, const QString& reason);
    void started();
    void stopped();

private:
    void registerWithOs();
    void unregisterFromOs();

    QMap<int, HotkeyBinding> m_bindings;
    QMap<int, HotkeyCallback> m_callbacks;
    QMap<int, QHotkey*> m_hotkeys;
    QThread* m_thread = nullptr;
    QPointer<HotkeyDispatchWorker> m_worker;
    int m_nextId = 1;
};

}  // namespace Glowpoint
