#include <QtTest/QtTest>
#include <QImage>
#include <QPainter>
#include <QSignalSpy>
#include <QStandardPaths>

#include "annotations/DrawingEngine.h"
#include "hotkey/GlobalHotkeyListener.h"
#include "input/CursorTracker.h"
#include "overlay/DrawingToolbar.h"
#include "overlay/OverlayController.h"
#include "overlay/OverlaySurface.h"
#include "settings/Settings.h"
#include "spotlight/SpotlightRenderer.h"

using Glowpoint::OverlayConfig;
using Mode = ModeStateMachine::Mode;

/**
 * @brief Tests for OverlayController command routing and pointer handling
 *
 * The controller is not started in most tests so no hotkeys are
 * registered with the OS and no toasts are shown.
 */
class TestOverlayController : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();
    void init();
    void cleanup();

    // Commands
    void testSubmit_RunsOnNextDrain();
    void testSubmit_FromOtherThread();
    void testDrawColorTwice_ReturnsToIdle();
    void testUndo_RejectedInSpotlightMode();
    void testUndoRedo_WhileIdleWithHistory();
    void testClearAll_RemovesEverything();
    void testQuit_EmitsQuitRequested();
    void testToolbarCommand_Executes();

    // Pointer input
    void testPointer_IgnoredOutsideDrawing();
    void testPointer_FreehandStroke();
    void testPointer_LineStroke();
    void testPointer_ShiftClickChainsFromLastPoint();
    void testPointer_RightClickCancelsGesture();
    void testPointer_ClickWithoutMoveCommitsNothing();
    void testPointer_PressOnTaskbarStripIgnored();
    void testWheel_AdjustsThickness();

    // Keys
    void testKey_EscapeExitsDrawing();
    void testKey_UndoRedoShortcuts();
    void testKey_ToolShortcut();

    // Mode side effects
    void testModeChange_CancelsGesture();
    void testColorSwitch_CancelsGesture();
    void testDrawing_CapturesInputAndShowsToolbar();
    void testDisplayChange_CancelsGestureKeepsStrokes();
    void testRender_SpotlightOnlyWhenActive();

    // Configuration and lifecycle
    void testApplyConfig_UpdatesSpotlight();
    void testApplyConfig_RebindsShortcuts();
    void testStart_EnablesSpotlightFromConfig();
    void testApplyConfig_DisablesSpotlightLive();
    void testApplyConfig_EnablesSpotlightLive();
    void testApplyConfig_UnchangedEnabledKeepsRuntimeToggle();

private:
    void drawFreehand(const QVector<QPointF>& points);
    static bool hasVisiblePixel(const QImage& image);

    OverlayController* m_controller = nullptr;
};

void TestOverlayController::initTestCase()
{
    QStandardPaths::setTestModeEnabled(true);
    qRegisterMetaType<ModeStateMachine::Mode>();
}

void TestOverlayController::init()
{
    Glowpoint::getSettings().clear();
    m_controller = new OverlayController(OverlayConfig::defaults());
}

void TestOverlayController::cleanup()
{
    delete m_controller;
    m_controller = nullptr;
    Glowpoint::getSettings().clear();
}

void TestOverlayController::drawFreehand(const QVector<QPointF>& points)
{
    m_controller->handlePointerPressed(points.first(), Qt::LeftButton, Qt::NoModifier);
    for (int i = 1; i < points.size(); ++i) {
        m_controller->handlePointerMoved(points[i]);
    }
    m_controller->handlePointerReleased(points.last(), Qt::LeftButton);
}

bool TestOverlayController::hasVisiblePixel(const QImage& image)
{
    for (int y = 0; y < image.height(); ++y) {
        for (int x = 0; x < image.width(); ++x) {
            if (qAlpha(image.pixel(x, y)) > 0) {
                return true;
            }
        }
    }
    return false;
}

// ============================================================================
// Commands
// ============================================================================

void TestOverlayController::testSubmit_RunsOnNextDrain()
{
    QVERIFY(m_controller->submit(OverlayCommand::drawColor("red")));
    QCOMPARE(m_controller->stateMachine()->mode(), Mode::Idle);

    m_controller->processPendingCommands();
    QCOMPARE(m_controller->stateMachine()->mode(), Mode::Drawing);
    QCOMPARE(m_controller->stateMachine()->drawingColorName(), QString("red"));
    QCOMPARE(m_controller->commandQueue().size(), 0);
}

void TestOverlayController::testSubmit_FromOtherThread()
{
    QThread* producer = QThread::create([this]() {
        m_controller->submit(OverlayCommand::toggleSpotlight());
        m_controller->submit(OverlayCommand::drawColor("blue"));
    });
    producer->start();
    QVERIFY(producer->wait(5000));
    delete producer;

    m_controller->processPendingCommands();
    QCOMPARE(m_controller->stateMachine()->mode(), Mode::Drawing);
    QCOMPARE(m_controller->stateMachine()->restingMode(), Mode::SpotlightOnly);
}

void TestOverlayController::testDrawColorTwice_ReturnsToIdle()
{
    QVERIFY(m_controller->setDrawColor("green"));
    QVERIFY(m_controller->setDrawColor("green"));
    QCOMPARE(m_controller->stateMachine()->mode(), Mode::Idle);
}

void TestOverlayController::testUndo_RejectedInSpotlightMode()
{
    m_controller->setDrawColor("red");
    drawFreehand({ QPointF(0, 0), QPointF(10, 10) });
    m_controller->execute(OverlayCommand::exitDrawing());
    m_controller->toggleSpotlight();

    QVERIFY(!m_controller->undo());
    QCOMPARE(m_controller->engine()->strokeCount(), size_t(1));
}

void TestOverlayController::testUndoRedo_WhileIdleWithHistory()
{
    m_controller->setDrawColor("red");
    drawFreehand({ QPointF(0, 0), QPointF(10, 10) });
    m_controller->execute(OverlayCommand::exitDrawing());

    QVERIFY(m_controller->undo());
    QCOMPARE(m_controller->engine()->strokeCount(), size_t(0));
    QVERIFY(m_controller->redo());
    QCOMPARE(m_controller->engine()->strokeCount(), size_t(1));
    QVERIFY(!m_controller->redo());
}

void TestOverlayController::testClearAll_RemovesEverything()
{
    m_controller->setDrawColor("red");
    drawFreehand({ QPointF(0, 0), QPointF(10, 10) });
    drawFreehand({ QPointF(0, 20), QPointF(10, 30) });
    m_controller->undo();

    QVERIFY(m_controller->clearAll());
    QVERIFY(m_controller->engine()->isEmpty());
    QVERIFY(!m_controller->engine()->canRedo());
    QVERIFY(!m_controller->undo());

    // Still drawing after a clear
    QVERIFY(m_controller->stateMachine()->isDrawing());
    QVERIFY(m_controller->clearAll());
}

void TestOverlayController::testQuit_EmitsQuitRequested()
{
    QSignalSpy spy(m_controller, &OverlayController::quitRequested);
    m_controller->submit(OverlayCommand::quit());
    m_controller->processPendingCommands();
    QCOMPARE(spy.count(), 1);
}

void TestOverlayController::testToolbarCommand_Executes()
{
    m_controller->setDrawColor("blue");
    emit m_controller->toolbar()->commandRequested(OverlayCommand::setTool(ToolId::Circle));
    QCOMPARE(m_controller->stateMachine()->tool(), ToolId::Circle);
}

// ============================================================================
// Pointer input
// ============================================================================

void TestOverlayController::testPointer_IgnoredOutsideDrawing()
{
    drawFreehand({ QPointF(0, 0), QPointF(10, 10), QPointF(20, 20) });
    QVERIFY(m_controller->engine()->isEmpty());

    m_controller->toggleSpotlight();
    drawFreehand({ QPointF(0, 0), QPointF(10, 10), QPointF(20, 20) });
    QVERIFY(m_controller->engine()->isEmpty());
}

void TestOverlayController::testPointer_FreehandStroke()
{
    m_controller->setDrawColor("yellow");
    drawFreehand({ QPointF(0, 0), QPointF(10, 5), QPointF(20, 0) });

    QCOMPARE(m_controller->engine()->strokeCount(), size_t(1));
    const Stroke& stroke = m_controller->engine()->committedStrokes().front();
    QCOMPARE(stroke.color, QColor("#FFEB3B"));
    QCOMPARE(stroke.thickness, 4);
    QCOMPARE(std::get<FreehandGeometry>(stroke.geometry).controlPoints.size(), 3);
}

void TestOverlayController::testPointer_LineStroke()
{
    m_controller->setDrawColor("red");
    m_controller->setTool(ToolId::Line);

    m_controller->handlePointerPressed(QPointF(10, 10), Qt::LeftButton, Qt::NoModifier);
    m_controller->handlePointerMoved(QPointF(50, 70));
    m_controller->handlePointerReleased(QPointF(100, 100), Qt::LeftButton);

    const Stroke& stroke = m_controller->engine()->committedStrokes().front();
    const auto& line = std::get<LineGeometry>(stroke.geometry);
    QCOMPARE(line.start, QPointF(10, 10));
    QCOMPARE(line.end, QPointF(100, 100));
    QCOMPARE(stroke.thickness, 4);
}

void TestOverlayController::testPointer_ShiftClickChainsFromLastPoint()
{
    m_controller->setDrawColor("green");
    drawFreehand({ QPointF(0, 0), QPointF(10, 5), QPointF(20, 0) });

    m_controller->handlePointerPressed(QPointF(60, 0), Qt::LeftButton, Qt::ShiftModifier);
    m_controller->handlePointerReleased(QPointF(60, 0), Qt::LeftButton);

    QCOMPARE(m_controller->engine()->strokeCount(), size_t(2));
    const Stroke& chained = m_controller->engine()->committedStrokes().back();
    const auto& line = std::get<LineGeometry>(chained.geometry);
    QCOMPARE(line.start, QPointF(20, 0));
    QCOMPARE(line.end, QPointF(60, 0));

    // The freehand tool stays selected
    QCOMPARE(m_controller->stateMachine()->tool(), ToolId::Freehand);
}

void TestOverlayController::testPointer_RightClickCancelsGesture()
{
    m_controller->setDrawColor("red");
    m_controller->handlePointerPressed(QPointF(0, 0), Qt::LeftButton, Qt::NoModifier);
    m_controller->handlePointerMoved(QPointF(30, 30));
    m_controller->handlePointerPressed(QPointF(30, 30), Qt::RightButton, Qt::NoModifier);

    QVERIFY(!m_controller->engine()->hasActiveGesture());
    m_controller->handlePointerReleased(QPointF(30, 30), Qt::LeftButton);
    QCOMPARE(m_controller->engine()->strokeCount(), size_t(0));
}

void TestOverlayController::testPointer_ClickWithoutMoveCommitsNothing()
{
    m_controller->setDrawColor("red");
    m_controller->handlePointerPressed(QPointF(40, 40), Qt::LeftButton, Qt::NoModifier);
    m_controller->handlePointerReleased(QPointF(40, 40), Qt::LeftButton);

    QCOMPARE(m_controller->engine()->strokeCount(), size_t(0));
}

void TestOverlayController::testPointer_PressOnTaskbarStripIgnored()
{
    // Display A reserves y 1040-1080 for its taskbar; B is full height
    m_controller->setMonitorLayout(MonitorLayout::fromAvailableGeometries({
        QRect(0, 0, 1920, 1040), QRect(1920, 0, 1920, 1080)
    }));
    m_controller->setDrawColor("blue");

    m_controller->handlePointerPressed(QPointF(500, 1060), Qt::LeftButton, Qt::NoModifier);
    QVERIFY(!m_controller->engine()->hasActiveGesture());
    m_controller->handlePointerMoved(QPointF(600, 1070));
    m_controller->handlePointerReleased(QPointF(600, 1070), Qt::LeftButton);
    QCOMPARE(m_controller->engine()->strokeCount(), size_t(0));

    // The same row on display B is drawable
    drawFreehand({ QPointF(2500, 1060), QPointF(2600, 1070) });
    QCOMPARE(m_controller->engine()->strokeCount(), size_t(1));
}

void TestOverlayController::testWheel_AdjustsThickness()
{
    m_controller->setDrawColor("red");
    m_controller->handleWheel(3);
    QCOMPARE(m_controller->stateMachine()->thickness(), 7);

    m_controller->handleWheel(-50);
    QCOMPARE(m_controller->stateMachine()->thickness(), 1);
}

// ============================================================================
// Keys
// ============================================================================

void TestOverlayController::testKey_EscapeExitsDrawing()
{
    m_controller->setDrawColor("red");
    m_controller->handleKeyPressed(Qt::Key_Escape, Qt::NoModifier, QString());
    QCOMPARE(m_controller->stateMachine()->mode(), Mode::Idle);
}

void TestOverlayController::testKey_UndoRedoShortcuts()
{
    m_controller->setDrawColor("red");
    drawFreehand({ QPointF(0, 0), QPointF(10, 10) });

    m_controller->handleKeyPressed(Qt::Key_Z, Qt::ControlModifier, QString());
    QCOMPARE(m_controller->engine()->strokeCount(), size_t(0));

    m_controller->handleKeyPressed(Qt::Key_Z, Qt::ControlModifier | Qt::ShiftModifier, QString());
    QCOMPARE(m_controller->engine()->strokeCount(), size_t(1));

    m_controller->handleKeyPressed(Qt::Key_Z, Qt::ControlModifier, QString());
    m_controller->handleKeyPressed(Qt::Key_Y, Qt::ControlModifier, QString());
    QCOMPARE(m_controller->engine()->strokeCount(), size_t(1));
}

void TestOverlayController::testKey_ToolShortcut()
{
    m_controller->setDrawColor("red");
    m_controller->handleKeyPressed(Qt::Key_3, Qt::NoModifier, QStringLiteral("3"));
    QCOMPARE(m_controller->stateMachine()->tool(), ToolId::Rectangle);

    m_controller->handleKeyPressed(Qt::Key_5, Qt::NoModifier, QStringLiteral("5"));
    QCOMPARE(m_controller->stateMachine()->tool(), ToolId::Circle);

    // Modified keys are not tool shortcuts
    m_controller->handleKeyPressed(Qt::Key_1, Qt::ControlModifier, QStringLiteral("1"));
    QCOMPARE(m_controller->stateMachine()->tool(), ToolId::Circle);
}

// ============================================================================
// Mode side effects
// ============================================================================

void TestOverlayController::testModeChange_CancelsGesture()
{
    m_controller->setDrawColor("red");
    m_controller->handlePointerPressed(QPointF(0, 0), Qt::LeftButton, Qt::NoModifier);
    m_controller->handlePointerMoved(QPointF(30, 30));

    m_controller->execute(OverlayCommand::exitDrawing());
    QVERIFY(!m_controller->engine()->hasActiveGesture());
    m_controller->handlePointerReleased(QPointF(30, 30), Qt::LeftButton);
    QCOMPARE(m_controller->engine()->strokeCount(), size_t(0));
}

void TestOverlayController::testColorSwitch_CancelsGesture()
{
    m_controller->setDrawColor("red");
    m_controller->handlePointerPressed(QPointF(0, 0), Qt::LeftButton, Qt::NoModifier);
    m_controller->handlePointerMoved(QPointF(30, 30));

    m_controller->setDrawColor("blue");
    QVERIFY(m_controller->stateMachine()->isDrawing());
    QVERIFY(!m_controller->engine()->hasActiveGesture());
}

void TestOverlayController::testDrawing_CapturesInputAndShowsToolbar()
{
    QSignalSpy spy(m_controller, &OverlayController::modeChanged);

    m_controller->setDrawColor("red");
    QCOMPARE(m_controller->surface()->inputMode(), OverlaySurface::InputMode::Capture);
    QVERIFY(m_controller->toolbar()->isVisible());

    m_controller->setDrawColor("red");
    QCOMPARE(m_controller->surface()->inputMode(), OverlaySurface::InputMode::ClickThrough);
    QVERIFY(!m_controller->toolbar()->isVisible());
    QCOMPARE(spy.count(), 2);
}

void TestOverlayController::testDisplayChange_CancelsGestureKeepsStrokes()
{
    m_controller->setDrawColor("red");
    drawFreehand({ QPointF(0, 0), QPointF(10, 10) });
    m_controller->handlePointerPressed(QPointF(50, 50), Qt::LeftButton, Qt::NoModifier);
    m_controller->handlePointerMoved(QPointF(60, 60));

    const MonitorLayout layout = MonitorLayout::fromAvailableGeometries({
        QRect(0, 0, 800, 600), QRect(800, 0, 800, 600)
    });
    m_controller->setMonitorLayout(layout);

    QVERIFY(!m_controller->engine()->hasActiveGesture());
    QCOMPARE(m_controller->engine()->strokeCount(), size_t(1));
    QVERIFY(m_controller->surface()->monitorLayout() == layout);
    QCOMPARE(m_controller->surface()->geometry(), QRect(0, 0, 1600, 600));
}

void TestOverlayController::testRender_SpotlightOnlyWhenActive()
{
    m_controller->spotlight()->update(QPointF(100, 100));

    QImage image(200, 200, QImage::Format_ARGB32_Premultiplied);
    image.fill(Qt::transparent);
    {
        QPainter painter(&image);
        m_controller->render(painter);
    }
    QVERIFY(!hasVisiblePixel(image));

    m_controller->toggleSpotlight();
    {
        QPainter painter(&image);
        m_controller->render(painter);
    }
    QVERIFY(qAlpha(image.pixel(100, 100)) > 0);
    QVERIFY(m_controller->cursorTracker()->isRunning());

    m_controller->toggleSpotlight();
    QVERIFY(!m_controller->cursorTracker()->isRunning());
}

// ============================================================================
// Configuration and lifecycle
// ============================================================================

void TestOverlayController::testApplyConfig_UpdatesSpotlight()
{
    OverlayConfig config = OverlayConfig::defaults();
    config.spotlight.radius = 150;
    config.spotlight.ringRadius = 0;

    m_controller->applyConfig(config);
    QCOMPARE(m_controller->spotlight()->config().radius, 150);
    QCOMPARE(m_controller->spotlight()->config().ringRadius, 0);
}

void TestOverlayController::testApplyConfig_RebindsShortcuts()
{
    const int before = m_controller->hotkeyListener()->bindings().size();
    QVERIFY(before > 0);

    OverlayConfig config = OverlayConfig::defaults();
    config.shortcuts.insert(QStringLiteral("undo"), QStringLiteral("<ctrl>+<alt>+z"));
    m_controller->applyConfig(config);

    QCOMPARE(m_controller->hotkeyListener()->bindings().size(), before + 1);
}

void TestOverlayController::testStart_EnablesSpotlightFromConfig()
{
    m_controller->setHotkeysEnabled(false);
    m_controller->start();

    QVERIFY(m_controller->isStarted());
    QVERIFY(m_controller->stateMachine()->isSpotlightActive());
    QVERIFY(!m_controller->hotkeyListener()->isRunning());

    m_controller->shutdown();
    QVERIFY(!m_controller->isStarted());
    QVERIFY(!m_controller->cursorTracker()->isRunning());
}

void TestOverlayController::testApplyConfig_DisablesSpotlightLive()
{
    m_controller->setHotkeysEnabled(false);
    m_controller->start();
    QVERIFY(m_controller->stateMachine()->isSpotlightActive());
    QVERIFY(m_controller->cursorTracker()->isRunning());

    OverlayConfig config = OverlayConfig::defaults();
    config.spotlight.enabled = false;
    m_controller->applyConfig(config);

    QVERIFY(!m_controller->stateMachine()->isSpotlightActive());
    QVERIFY(!m_controller->cursorTracker()->isRunning());
    QCOMPARE(m_controller->stateMachine()->mode(), Mode::Idle);
}

void TestOverlayController::testApplyConfig_EnablesSpotlightLive()
{
    OverlayConfig disabled = OverlayConfig::defaults();
    disabled.spotlight.enabled = false;
    m_controller->applyConfig(disabled);
    m_controller->setDrawColor("red");
    QVERIFY(!m_controller->stateMachine()->isSpotlightActive());

    m_controller->applyConfig(OverlayConfig::defaults());

    // Drawing continues; the spotlight shows now and after exit
    QCOMPARE(m_controller->stateMachine()->mode(), Mode::Drawing);
    QVERIFY(m_controller->stateMachine()->isSpotlightActive());
    m_controller->execute(OverlayCommand::exitDrawing());
    QCOMPARE(m_controller->stateMachine()->mode(), Mode::SpotlightOnly);
}

void TestOverlayController::testApplyConfig_UnchangedEnabledKeepsRuntimeToggle()
{
    m_controller->setHotkeysEnabled(false);
    m_controller->start();
    m_controller->toggleSpotlight();
    QVERIFY(!m_controller->stateMachine()->isSpotlightActive());

    // A reload that carries the toggled value does not flip it back
    OverlayConfig config = OverlayConfig::defaults();
    config.spotlight.enabled = false;
    config.spotlight.radius = 120;
    m_controller->applyConfig(config);

    QVERIFY(!m_controller->stateMachine()->isSpotlightActive());
    QCOMPARE(m_controller->spotlight()->config().radius, 120);
}

QTEST_MAIN(TestOverlayController)
#include "tst_OverlayController.moc"
