#ifndef OVERLAYCONTROLLER_H
#define OVERLAYCONTROLLER_H

#include <QObject>
#include <QPointF>

#include "commands/CommandQueue.h"
#include "commands/OverlayCommand.h"
#include "overlay/MonitorLayout.h"
#include "settings/OverlayConfig.h"
#include "state/ModeStateMachine.h"

class CursorTracker;
class DrawingEngine;
class DrawingToolbar;
class OverlaySurface;
class QPainter;
class QScreen;
class QTimer;
class SpotlightRenderer;

namespace Glowpoint {
class GlobalHotkeyListener;
}

/**
 * @brief Context object that owns the overlay and serializes every command.
 *
 * Hotkey callbacks push into the command queue from the listener thread;
 * the control tick drains it. Toolbar, tray and local keys call execute()
 * directly on the control thread. Pointer input from the surface is
 * routed to the drawing engine while drawing.
 */
class OverlayController : public QObject
{
    Q_OBJECT

public:
    static constexpr int kTickIntervalMs = 16;

    explicit OverlayController(const Glowpoint::OverlayConfig &config, QObject *parent = nullptr);
    ~OverlayController() override;

    /**
     * @brief Show the surface, start the control tick and the hotkey listener.
     */
    void start();

    /**
     * @brief Stop the listener and the tick and hide every window.
     */
    void shutdown();

    bool isStarted() const { return m_started; }

    /**
     * @brief Run a command now. Must be called on the control thread.
     * @return whether the command was accepted.
     */
    bool execute(const OverlayCommand &command);

    /**
     * @brief Queue a command from any thread; runs on the next tick.
     */
    bool submit(const OverlayCommand &command);

    // Collaborator entry points
    bool toggleSpotlight() { return execute(OverlayCommand::toggleSpotlight()); }
    bool setDrawColor(const QString &colorName) { return execute(OverlayCommand::drawColor(colorName)); }
    bool clearAll() { return execute(OverlayCommand::clearAll()); }
    bool undo() { return execute(OverlayCommand::undo()); }
    bool redo() { return execute(OverlayCommand::redo()); }
    bool quit() { return execute(OverlayCommand::quit()); }
    bool setTool(ToolId tool) { return execute(OverlayCommand::setTool(tool)); }
    bool adjustThickness(int delta) { return execute(OverlayCommand::adjustThickness(delta)); }

    /**
     * @brief Apply a new configuration snapshot.
     *
     * Spotlight and drawing settings apply immediately; hotkeys are
     * re-registered when the shortcut table changed.
     */
    void applyConfig(const Glowpoint::OverlayConfig &config);
    const Glowpoint::OverlayConfig &config() const { return m_config; }

    /**
     * @brief Recompute the surface geometry; cancels any gesture in progress.
     */
    void setMonitorLayout(const MonitorLayout &layout);

    void setHotkeysEnabled(bool enabled);
    bool hotkeysEnabled() const { return m_hotkeysEnabled; }

    ModeStateMachine *stateMachine() const { return m_state; }
    DrawingEngine *engine() const { return m_engine; }
    SpotlightRenderer *spotlight() const { return m_spotlight; }
    OverlaySurface *surface() const { return m_surface; }
    DrawingToolbar *toolbar() const { return m_toolbar; }
    CursorTracker *cursorTracker() const { return m_cursorTracker; }
    Glowpoint::GlobalHotkeyListener *hotkeyListener() const { return m_hotkeys; }
    CommandQueue &commandQueue() { return m_queue; }

    /**
     * @brief Draw one frame: spotlight, committed strokes, gesture preview.
     */
    void render(QPainter &painter) const;

public slots:
    void processPendingCommands();
    void handleDisplayChange();

    // Pointer and key input in global coordinates
    void handlePointerPressed(const QPointF &globalPos, Qt::MouseButton button, Qt::KeyboardModifiers modifiers);
    void handlePointerMoved(const QPointF &globalPos);
    void handlePointerReleased(const QPointF &globalPos, Qt::MouseButton button);
    void handleWheel(int steps);
    void handleKeyPressed(int key, Qt::KeyboardModifiers modifiers, const QString &text);

signals:
    void quitRequested();
    void modeChanged(ModeStateMachine::Mode mode);

private slots:
    void onModeChanged(ModeStateMachine::Mode mode, ModeStateMachine::Mode previous);
    void onSpotlightChanged(bool active);
    void onDrawingColorChanged(const QString &colorName);
    void onCursorMoved(const QPoint &globalPos);

private:
    void rebindHotkeys();
    void connectScreen(QScreen *screen);
    void updateToolbar();
    void showToolbar();
    void notify(const QString &title, const QString &message);

    Glowpoint::OverlayConfig m_config;
    CommandQueue m_queue;

    ModeStateMachine *m_state;
    DrawingEngine *m_engine;
    SpotlightRenderer *m_spotlight;
    CursorTracker *m_cursorTracker;
    OverlaySurface *m_surface;
    DrawingToolbar *m_toolbar;
    Glowpoint::GlobalHotkeyListener *m_hotkeys;
    QTimer *m_tickTimer;

    bool m_started = false;
    bool m_hotkeysEnabled = true;
};

#endif // OVERLAYCONTROLLER_H
