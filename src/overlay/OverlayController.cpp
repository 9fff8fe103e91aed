#include "overlay/OverlayController.h"
#include "annotations/DrawingEngine.h"
#include "hotkey/GlobalHotkeyListener.h"
#include "input/CursorTracker.h"
#include "overlay/DrawingToolbar.h"
#include "overlay/OverlaySurface.h"
#include "platform/WindowLevel.h"
#include "settings/DrawingSettingsManager.h"
#include "spotlight/SpotlightRenderer.h"
#include "tools/ToolRegistry.h"
#include "ui/GlobalToast.h"

#include <QCursor>
#include <QDebug>
#include <QGuiApplication>
#include <QPainter>
#include <QScreen>
#include <QSignalBlocker>
#include <QTimer>

OverlayController::OverlayController(const Glowpoint::OverlayConfig &config, QObject *parent)
    : QObject(parent)
    , m_config(config)
    , m_state(new ModeStateMachine(this))
    , m_engine(new DrawingEngine(this))
    , m_spotlight(new SpotlightRenderer(this))
    , m_cursorTracker(new CursorTracker(this))
    , m_surface(new OverlaySurface)
    , m_toolbar(new DrawingToolbar)
    , m_hotkeys(new Glowpoint::GlobalHotkeyListener(this))
    , m_tickTimer(new QTimer(this))
{
    // Drawing state
    m_state->setColorCatalog(m_config.drawing.colors);
    m_state->setDefaultThickness(m_config.drawing.lineWidth);
    m_state->restoreThicknesses(DrawingSettingsManager::instance().loadAllThicknesses());
    m_state->restoreTool(DrawingSettingsManager::instance().loadTool());
    m_spotlight->applyConfig(m_config.spotlight);
    m_toolbar->setColors(m_config.drawing.colors);

    connect(m_state, &ModeStateMachine::modeChanged, this, &OverlayController::onModeChanged);
    connect(m_state, &ModeStateMachine::spotlightChanged, this, &OverlayController::onSpotlightChanged);
    connect(m_state, &ModeStateMachine::drawingColorChanged, this,
            [this](const QString &colorName, const QColor &) { onDrawingColorChanged(colorName); });
    connect(m_state, &ModeStateMachine::toolChanged, this, [this](ToolId tool) {
        DrawingSettingsManager::instance().saveTool(tool);
        updateToolbar();
    });
    connect(m_state, &ModeStateMachine::thicknessChanged, this, [this](const QString &colorName, int thickness) {
        DrawingSettingsManager::instance().saveThickness(colorName, thickness);
        updateToolbar();
    });

    // Rendering
    m_surface->setMonitorLayout(MonitorLayout::current());
    m_surface->setPaintDelegate([this](QPainter &painter) { render(painter); });
    connect(m_engine, &DrawingEngine::changed, m_surface, QOverload<>::of(&QWidget::update));
    connect(m_spotlight, &SpotlightRenderer::needsRepaint, m_surface, QOverload<>::of(&QWidget::update));
    connect(m_cursorTracker, &CursorTracker::cursorMoved, this, &OverlayController::onCursorMoved);

    // Input
    connect(m_surface, &OverlaySurface::pointerPressed, this, &OverlayController::handlePointerPressed);
    connect(m_surface, &OverlaySurface::pointerMoved, this, &OverlayController::handlePointerMoved);
    connect(m_surface, &OverlaySurface::pointerReleased, this, &OverlayController::handlePointerReleased);
    connect(m_surface, &OverlaySurface::wheelScrolled, this, &OverlayController::handleWheel);
    connect(m_surface, &OverlaySurface::keyPressed, this, &OverlayController::handleKeyPressed);
    connect(m_toolbar, &DrawingToolbar::commandRequested, this, &OverlayController::execute);

    // Display changes
    for (QScreen *screen : QGuiApplication::screens()) {
        connectScreen(screen);
    }
    connect(qApp, &QGuiApplication::screenAdded, this, [this](QScreen *screen) {
        connectScreen(screen);
        handleDisplayChange();
    });
    connect(qApp, &QGuiApplication::screenRemoved, this, &OverlayController::handleDisplayChange);

    m_tickTimer->setInterval(kTickIntervalMs);
    m_tickTimer->setTimerType(Qt::PreciseTimer);
    connect(m_tickTimer, &QTimer::timeout, this, &OverlayController::processPendingCommands);

    rebindHotkeys();
}

OverlayController::~OverlayController()
{
    shutdown();
    delete m_toolbar;
    delete m_surface;
}

void OverlayController::start()
{
    if (m_started) {
        return;
    }
    m_started = true;

    m_surface->show();
    setWindowClickThrough(m_surface, true);
    m_tickTimer->start();

    if (m_hotkeysEnabled) {
        m_hotkeys->start();
    }

    if (m_config.spotlight.enabled && !m_state->isSpotlightActive()) {
        m_state->toggleSpotlight();
    }
    qDebug() << "OverlayController: Started on" << m_surface->monitorLayout().displays().size()
             << "display(s)" << m_surface->monitorLayout().bounds();
}

void OverlayController::shutdown()
{
    if (!m_started) {
        return;
    }
    m_started = false;

    m_hotkeys->stop();
    m_tickTimer->stop();
    m_cursorTracker->stop();
    m_engine->cancelGesture();
    m_toolbar->hide();
    m_surface->hide();
    qDebug() << "OverlayController: Shut down";
}

bool OverlayController::submit(const OverlayCommand &command)
{
    return m_queue.tryPush(command);
}

void OverlayController::processPendingCommands()
{
    const QVector<OverlayCommand> commands = m_queue.drain();
    for (const OverlayCommand &command : commands) {
        execute(command);
    }
}

bool OverlayController::execute(const OverlayCommand &command)
{
    using Type = OverlayCommand::Type;

    switch (command.type) {
    case Type::ToggleSpotlight:
        return m_state->toggleSpotlight();

    case Type::DrawColor:
        return m_state->drawColor(command.colorName);

    case Type::ExitDrawing:
        return m_state->exitDrawing();

    case Type::ClearAll:
        if (m_engine->isEmpty() && !m_engine->canRedo()) {
            return true;
        }
        m_engine->clearAll();
        notify(tr("Drawings Cleared"), QString());
        return true;

    case Type::Undo:
        if (!m_state->acceptsHistoryCommand(m_engine->canUndo())) {
            qDebug() << "OverlayController: Undo not available in current mode";
            return false;
        }
        m_engine->cancelGesture();
        return m_engine->undo();

    case Type::Redo:
        if (!m_state->acceptsHistoryCommand(m_engine->canRedo())) {
            qDebug() << "OverlayController: Redo not available in current mode";
            return false;
        }
        m_engine->cancelGesture();
        return m_engine->redo();

    case Type::Quit:
        qDebug() << "OverlayController: Quit requested";
        emit quitRequested();
        return true;

    case Type::SetTool:
        if (m_engine->hasActiveGesture()) {
            m_engine->cancelGesture();
        }
        return m_state->setTool(command.tool);

    case Type::AdjustThickness:
        return m_state->adjustThickness(command.delta);
    }

    qWarning() << "OverlayController: Unhandled command" << command.describe();
    return false;
}

void OverlayController::applyConfig(const Glowpoint::OverlayConfig &config)
{
    const bool shortcutsChanged = (config.shortcuts != m_config.shortcuts)
        || (config.drawing.colors.keys() != m_config.drawing.colors.keys());
    const bool spotlightSettingChanged = (config.spotlight.enabled != m_config.spotlight.enabled);
    m_config = config;

    if (spotlightSettingChanged && config.spotlight.enabled != m_state->isSpotlightActive()) {
        qDebug() << "OverlayController: Spotlight" << (config.spotlight.enabled ? "enabled" : "disabled")
                 << "by configuration";
        m_state->toggleSpotlight();
    }

    m_spotlight->applyConfig(config.spotlight);
    m_state->setDefaultThickness(config.drawing.lineWidth);
    m_state->setColorCatalog(config.drawing.colors);
    m_toolbar->setColors(config.drawing.colors);
    updateToolbar();

    if (shortcutsChanged) {
        qDebug() << "OverlayController: Shortcuts changed, re-registering hotkeys";
        rebindHotkeys();
    }
    m_surface->update();
}

void OverlayController::setHotkeysEnabled(bool enabled)
{
    if (m_hotkeysEnabled == enabled) {
        return;
    }
    m_hotkeysEnabled = enabled;

    if (!m_started) {
        return;
    }
    if (enabled) {
        m_hotkeys->start();
    } else {
        m_hotkeys->stop();
    }
}

void OverlayController::rebindHotkeys()
{
    const bool wasRunning = m_hotkeys->isRunning();
    m_hotkeys->clearBindings();

    for (auto it = m_config.shortcuts.cbegin(); it != m_config.shortcuts.cend(); ++it) {
        if (it.value().trimmed().isEmpty()) {
            continue;
        }

        const std::optional<OverlayCommand> command = OverlayCommand::fromActionName(it.key());
        if (!command) {
            qWarning() << "OverlayController: Unknown shortcut action" << it.key();
            continue;
        }
        if (command->type == OverlayCommand::Type::DrawColor
            && !m_config.drawing.colors.contains(command->colorName)) {
            qWarning() << "OverlayController: Shortcut" << it.key() << "names an unknown color";
            continue;
        }

        CommandQueue *queue = &m_queue;
        const OverlayCommand queued = *command;
        m_hotkeys->registerChord(it.value(), [queue, queued]() {
            queue->tryPush(queued);
        });
    }

    if (wasRunning) {
        m_hotkeys->start();
    }
}

void OverlayController::setMonitorLayout(const MonitorLayout &layout)
{
    m_engine->cancelGesture();

    if (layout == m_surface->monitorLayout()) {
        return;
    }
    m_surface->setMonitorLayout(layout);
    if (m_toolbar->isVisible()) {
        showToolbar();
    }
    qDebug() << "OverlayController: Surface resized to" << layout.bounds();
}

void OverlayController::handleDisplayChange()
{
    qDebug() << "OverlayController: Display configuration changed";
    setMonitorLayout(MonitorLayout::current());
}

void OverlayController::connectScreen(QScreen *screen)
{
    if (!screen) {
        return;
    }
    connect(screen, &QScreen::availableGeometryChanged, this, &OverlayController::handleDisplayChange);
    connect(screen, &QScreen::geometryChanged, this, &OverlayController::handleDisplayChange);
}

void OverlayController::render(QPainter &painter) const
{
    if (m_state->isSpotlightActive()) {
        m_spotlight->render(painter);
    }
    m_engine->render(painter);
}

void OverlayController::handlePointerPressed(const QPointF &globalPos, Qt::MouseButton button,
                                             Qt::KeyboardModifiers modifiers)
{
    if (!m_state->isDrawing()) {
        return;
    }

    const MonitorLayout &layout = m_surface->monitorLayout();
    if (!layout.isEmpty() && !layout.contains(globalPos.toPoint())) {
        qDebug() << "OverlayController: Ignoring press outside covered displays" << globalPos;
        return;
    }

    if (button == Qt::RightButton) {
        m_engine->cancelGesture();
        return;
    }
    if (button != Qt::LeftButton) {
        return;
    }

    const ToolId tool = m_state->tool();
    const QColor color = m_state->drawingColor();
    const int thickness = m_state->thickness();

    if (modifiers.testFlag(Qt::ShiftModifier) && tool == ToolId::Freehand
        && m_engine->chainFromLastPoint(globalPos, color, thickness)) {
        return;
    }
    m_engine->beginGesture(globalPos, tool, color, thickness);
}

void OverlayController::handlePointerMoved(const QPointF &globalPos)
{
    if (m_state->isSpotlightActive()) {
        onCursorMoved(globalPos.toPoint());
    }
    if (m_state->isDrawing() && m_engine->hasActiveGesture()) {
        m_engine->extendGesture(globalPos);
    }
}

void OverlayController::handlePointerReleased(const QPointF &globalPos, Qt::MouseButton button)
{
    if (button != Qt::LeftButton || !m_engine->hasActiveGesture()) {
        return;
    }

    const QVector<QPointF> points = m_engine->gesturePoints();
    if (m_engine->activeGestureTool() != ToolId::Freehand
        || (!points.isEmpty() && points.last() != globalPos)) {
        m_engine->extendGesture(globalPos);
    }
    m_engine->commitGesture();
}

void OverlayController::handleWheel(int steps)
{
    if (steps != 0) {
        execute(OverlayCommand::adjustThickness(steps));
    }
}

void OverlayController::handleKeyPressed(int key, Qt::KeyboardModifiers modifiers, const QString &text)
{
    if (!m_state->isDrawing()) {
        return;
    }

    const bool ctrl = modifiers.testFlag(Qt::ControlModifier);
    const bool shift = modifiers.testFlag(Qt::ShiftModifier);

    if (key == Qt::Key_Escape) {
        execute(OverlayCommand::exitDrawing());
        return;
    }
    if (ctrl && key == Qt::Key_Z) {
        execute(shift ? OverlayCommand::redo() : OverlayCommand::undo());
        return;
    }
    if (ctrl && key == Qt::Key_Y) {
        execute(OverlayCommand::redo());
        return;
    }

    if (ctrl || modifiers.testFlag(Qt::AltModifier) || modifiers.testFlag(Qt::MetaModifier)
        || text.isEmpty()) {
        return;
    }

    const QString pressed = text.toLower();
    for (auto it = m_config.drawing.toolShortcuts.cbegin(); it != m_config.drawing.toolShortcuts.cend(); ++it) {
        if (it.value().toLower() != pressed) {
            continue;
        }
        const std::optional<ToolId> tool = ToolRegistry::instance().fromConfigKey(it.key());
        if (tool) {
            execute(OverlayCommand::setTool(*tool));
        } else {
            qWarning() << "OverlayController: Tool shortcut names unknown tool" << it.key();
        }
        return;
    }
}

void OverlayController::onModeChanged(ModeStateMachine::Mode mode, ModeStateMachine::Mode previous)
{
    m_engine->cancelGesture();

    if (mode == ModeStateMachine::Mode::Drawing) {
        m_surface->setInputMode(OverlaySurface::InputMode::Capture);
        showToolbar();

        const QMap<QString, QString> &shortcuts = m_config.drawing.toolShortcuts;
        notify(tr("Drawing Mode ON"),
               tr("Drawing in %1\nTools: %2\nPress the color hotkey again or ESC to stop")
                   .arg(m_state->drawingColorName().toUpper(),
                        ToolRegistry::instance().shortcutHint(shortcuts)));
    } else {
        m_surface->setInputMode(OverlaySurface::InputMode::ClickThrough);
        m_toolbar->hide();
        if (previous == ModeStateMachine::Mode::Drawing) {
            notify(tr("Drawing Mode OFF"), QString());
        }
    }

    emit modeChanged(mode);
    m_surface->update();
}

void OverlayController::onSpotlightChanged(bool active)
{
    // Track runtime toggles so a later config reload only acts on real edits
    m_config.spotlight.enabled = active;
    if (active) {
        m_cursorTracker->start();
    } else {
        m_cursorTracker->stop();
    }
    m_surface->update();
}

void OverlayController::onDrawingColorChanged(const QString &colorName)
{
    Q_UNUSED(colorName)
    // A gesture keeps the color it started with; switching abandons it
    m_engine->cancelGesture();
    updateToolbar();
}

void OverlayController::onCursorMoved(const QPoint &globalPos)
{
    const bool hadPosition = m_spotlight->hasPosition();
    const QPointF previous = m_spotlight->geometry().center;

    // needsRepaint would schedule a full repaint; repaint only the spot instead
    const QSignalBlocker blocker(m_spotlight);
    m_spotlight->update(globalPos);

    if (hadPosition) {
        m_surface->updateGlobalRect(m_spotlight->dirtyRect(previous));
    } else {
        m_surface->update();
    }
}

void OverlayController::updateToolbar()
{
    m_toolbar->setActiveState(m_state->tool(), m_state->drawingColorName(), m_state->thickness());
}

void OverlayController::showToolbar()
{
    updateToolbar();

    QScreen *screen = QGuiApplication::screenAt(QCursor::pos());
    if (!screen) {
        screen = QGuiApplication::primaryScreen();
    }
    if (screen) {
        m_toolbar->placeOnScreen(screen->availableGeometry());
    }
    m_toolbar->show();
    m_toolbar->raise();
    setWindowFloatingWithoutFocus(m_toolbar);
}

void OverlayController::notify(const QString &title, const QString &message)
{
    if (!m_started) {
        return;
    }
    GlobalToast::instance().showToast(GlobalToast::Info, title, message);
}
