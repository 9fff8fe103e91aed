#include "hotkey/GlobalHotkeyListener.h"
#include "hotkey/ChordParser.h"
#include "ui/GlobalToast.h"

#include <QDebug>
#include <QGuiApplication>
#include <QHotkey>
#include <QMutexLocker>
#include <QStringList>
#include <QThread>

namespace Glowpoint {

// ============================================================================
// HotkeyDispatchWorker
// ============================================================================

HotkeyDispatchWorker::HotkeyDispatchWorker(QObject* parent)
    : QObject(parent)
{
    m_clock.start();
}

void HotkeyDispatchWorker::setCallbacks(const QMap<int, HotkeyCallback>& callbacks)
{
    QMutexLocker locker(&m_mutex);
    m_callbacks = callbacks;
}

int HotkeyDispatchWorker::dispatchedCount() const
{
    QMutexLocker locker(&m_mutex);
    return m_dispatched;
}

void HotkeyDispatchWorker::handlePress(int bindingId)
{
    HotkeyCallback callback;
    {
        QMutexLocker locker(&m_mutex);
        if (!m_filter.acceptPress(bindingId, m_clock.elapsed())) {
            return;
        }
        callback = m_callbacks.value(bindingId);
        if (!callback) {
            qWarning() << "HotkeyDispatchWorker: No callback for binding" << bindingId;
            return;
        }
        ++m_dispatched;
    }
    callback();
}

void HotkeyDispatchWorker::handleRelease(int bindingId)
{
    QMutexLocker locker(&m_mutex);
    m_filter.release(bindingId, m_clock.elapsed());
}

// ============================================================================
// GlobalHotkeyListener
// ============================================================================

GlobalHotkeyListener::GlobalHotkeyListener(QObject* parent)
    : QObject(parent)
{
}

GlobalHotkeyListener::~GlobalHotkeyListener()
{
    stop();
}

int GlobalHotkeyListener::registerChord(const QString& chord, HotkeyCallback callback)
{
    const std::optional<QKeySequence> sequence = ChordParser::parse(chord);
    if (!sequence) {
        qWarning() << "GlobalHotkeyListener: Ignoring invalid chord" << chord;
        return -1;
    }
    if (!callback) {
        qWarning() << "GlobalHotkeyListener: Ignoring chord without callback" << chord;
        return -1;
    }

    for (const HotkeyBinding& existing : m_bindings) {
        if (existing.sequence == *sequence) {
            qWarning() << "GlobalHotkeyListener: Chord" << chord
                       << "already bound as" << existing.chord;
            return -1;
        }
    }

    HotkeyBinding binding;
    binding.id = m_nextId++;
    binding.chord = chord;
    binding.sequence = *sequence;
    m_bindings.insert(binding.id, binding);
    m_callbacks.insert(binding.id, std::move(callback));
    return binding.id;
}

void GlobalHotkeyListener::clearBindings()
{
    stop();
    m_bindings.clear();
    m_callbacks.clear();
}

bool GlobalHotkeyListener::start()
{
    if (isRunning()) {
        return false;
    }

    m_thread = new QThread(this);
    m_thread->setObjectName(QStringLiteral("GlowpointHotkeyListener"));

    auto* worker = new HotkeyDispatchWorker;
    worker->setCallbacks(m_callbacks);
    worker->moveToThread(m_thread);
    connect(m_thread, &QThread::finished, worker, &QObject::deleteLater);
    m_worker = worker;

    m_thread->start();
    if (!m_thread->isRunning()) {
        qWarning() << "GlobalHotkeyListener: Listener thread failed to start";
        delete worker;
        delete m_thread;
        m_thread = nullptr;
        return false;
    }

    registerWithOs();

    qDebug() << "GlobalHotkeyListener: Started with" << registeredCount()
             << "of" << m_bindings.size() << "chords registered";
    emit started();
    return true;
}

void GlobalHotkeyListener::stop()
{
    if (!m_thread) {
        return;
    }

    unregisterFromOs();

    m_thread->quit();
    m_thread->wait();
    delete m_thread;
    m_thread = nullptr;

    qDebug() << "GlobalHotkeyListener: Stopped";
    emit stopped();
}

bool GlobalHotkeyListener::isRunning() const
{
    return m_thread && m_thread->isRunning();
}

HotkeyStatus GlobalHotkeyListener::status(int bindingId) const
{
    return m_bindings.value(bindingId).status;
}

int GlobalHotkeyListener::registeredCount() const
{
    int count = 0;
    for (const HotkeyBinding& binding : m_bindings) {
        if (binding.status == HotkeyStatus::Registered) {
            ++count;
        }
    }
    return count;
}

void GlobalHotkeyListener::registerWithOs()
{
    QStringList failed;

    for (auto it = m_bindings.begin(); it != m_bindings.end(); ++it) {
        HotkeyBinding& binding = it.value();
        const int id = binding.id;

        // QHotkey needs the GUI thread; only delivery moves to the listener thread
        auto* hotkey = new QHotkey(binding.sequence, true, this);
        HotkeyDispatchWorker* worker = m_worker.data();
        connect(hotkey, &QHotkey::activated, worker, [worker, id]() {
            worker->handlePress(id);
        }, Qt::QueuedConnection);
        connect(hotkey, &QHotkey::released, worker, [worker, id]() {
            worker->handleRelease(id);
        }, Qt::QueuedConnection);
        m_hotkeys.insert(id, hotkey);

        if (hotkey->isRegistered()) {
            binding.status = HotkeyStatus::Registered;
        } else {
            binding.status = HotkeyStatus::Failed;
            const QString reason = QGuiApplication::platformName() == QLatin1String("wayland")
                ? tr("Global shortcuts are not available on this display server")
                : tr("The shortcut is unavailable or already taken");
            qWarning() << "GlobalHotkeyListener: Failed to register" << binding.chord;
            failed << ChordParser::formatForDisplay(binding.chord);
            emit registrationFailed(binding.chord, reason);
        }
    }

    if (!failed.isEmpty()) {
        GlobalToast::instance().showToast(
            GlobalToast::Error,
            tr("Hotkey Registration Failed"),
            failed.join(QStringLiteral(", ")) + tr(" failed to register."),
            5000);
    }
}

void GlobalHotkeyListener::unregisterFromOs()
{
    for (QHotkey* hotkey : std::as_const(m_hotkeys)) {
        if (hotkey->isRegistered()) {
            hotkey->setRegistered(false);
        }
        delete hotkey;
    }
    m_hotkeys.clear();

    for (HotkeyBinding& binding : m_bindings) {
        binding.status = HotkeyStatus::Unset;
    }
}

}  // namespace Glowpoint
