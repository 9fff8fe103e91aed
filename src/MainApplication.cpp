#include "MainApplication.h"
#include "hotkey/ChordParser.h"
#include "hotkey/HotkeyTypes.h"
#include "overlay/OverlayController.h"
#include "settings/OverlayConfigStore.h"
#include "ui/GlobalToast.h"
#include "version.h"

#include <QAction>
#include <QApplication>
#include <QDebug>
#include <QIcon>
#include <QMenu>
#include <QPainter>
#include <QPixmap>
#include <QRadialGradient>
#include <QStringList>
#include <QSystemTrayIcon>

MainApplication::MainApplication(const QString &configPath, QObject *parent)
    : QObject(parent)
    , m_configPath(configPath)
    , m_trayIcon(nullptr)
    , m_trayMenu(nullptr)
    , m_spotlightAction(nullptr)
    , m_pauseHotkeysAction(nullptr)
    , m_configStore(nullptr)
    , m_controller(nullptr)
{
}

MainApplication::~MainApplication()
{
    delete m_trayMenu;
}

void MainApplication::initialize()
{
    // Configuration
    m_configStore = new Glowpoint::OverlayConfigStore(m_configPath, this);
    if (!m_configStore->load() && m_configPath.isEmpty()) {
        // First run: write the defaults so the user has a file to edit
        m_configStore->save(m_configStore->config());
    }
    m_configStore->setWatching(true);
    connect(m_configStore, &Glowpoint::OverlayConfigStore::configChanged,
            this, &MainApplication::onConfigChanged);

    // Overlay
    m_controller = new OverlayController(m_configStore->config(), this);
    connect(m_controller, &OverlayController::quitRequested, this, &MainApplication::onQuit);
    connect(m_controller, &OverlayController::modeChanged, this, &MainApplication::onModeChanged);
    connect(m_controller->stateMachine(), &ModeStateMachine::spotlightChanged,
            this, [this](bool active) {
                m_configStore->setSpotlightEnabled(active);
                updateTrayState();
            });

    // Create system tray icon
    m_trayIcon = new QSystemTrayIcon(createTrayIcon(false), this);

    // Create context menu
    m_trayMenu = new QMenu();

    m_spotlightAction = m_trayMenu->addAction("Spotlight: OFF");
    connect(m_spotlightAction, &QAction::triggered, this, &MainApplication::onToggleSpotlight);

    QAction *clearAction = m_trayMenu->addAction("Clear Drawings");
    connect(clearAction, &QAction::triggered, this, &MainApplication::onClearDrawings);

    m_trayMenu->addSeparator();

    QAction *reloadAction = m_trayMenu->addAction("Reload Configuration");
    connect(reloadAction, &QAction::triggered, this, &MainApplication::onReloadConfig);

    m_pauseHotkeysAction = m_trayMenu->addAction("Pause Hotkeys");
    m_pauseHotkeysAction->setCheckable(true);
    connect(m_pauseHotkeysAction, &QAction::toggled, this, &MainApplication::onPauseHotkeys);

    m_trayMenu->addSeparator();

    QAction *quitAction = m_trayMenu->addAction("Quit");
    connect(quitAction, &QAction::triggered, this, &MainApplication::onQuit);

    m_trayIcon->setContextMenu(m_trayMenu);
    m_trayIcon->show();

    m_controller->start();
    updateTrayState();

    GlobalToast::instance().showToast(GlobalToast::Info,
        QStringLiteral("%1 %2").arg(QString::fromLatin1(GLOWPOINT_APP_NAME), QString::fromLatin1(GLOWPOINT_VERSION)),
        shortcutSummary(), 5000);

    qDebug() << "Glowpoint initialized and running in system tray";
}

void MainApplication::onToggleSpotlight()
{
    m_controller->toggleSpotlight();
}

void MainApplication::onClearDrawings()
{
    m_controller->clearAll();
}

void MainApplication::onReloadConfig()
{
    if (m_configStore->load()) {
        onConfigChanged(m_configStore->config());
        GlobalToast::instance().showToast(GlobalToast::Success, tr("Configuration Reloaded"),
                                          m_configStore->path());
    } else {
        m_controller->applyConfig(m_configStore->config());
        GlobalToast::instance().showToast(GlobalToast::Error, tr("Configuration Not Loaded"),
                                          tr("Using defaults. See the log for details."));
    }
}

void MainApplication::onPauseHotkeys(bool paused)
{
    m_controller->setHotkeysEnabled(!paused);
    qDebug() << "MainApplication: Hotkeys" << (paused ? "paused" : "resumed");
}

void MainApplication::onQuit()
{
    qDebug() << "MainApplication: Quitting";
    m_controller->shutdown();
    if (m_trayIcon) {
        m_trayIcon->hide();
    }
    QCoreApplication::quit();
}

void MainApplication::onConfigChanged(const Glowpoint::OverlayConfig &config)
{
    m_controller->applyConfig(config);
    updateTrayState();
}

void MainApplication::onModeChanged(ModeStateMachine::Mode mode)
{
    Q_UNUSED(mode)
    updateTrayState();
}

void MainApplication::updateTrayState()
{
    if (!m_trayIcon) {
        return;
    }

    const bool spotlightOn = m_controller->stateMachine()->isSpotlightActive();
    m_spotlightAction->setText(spotlightOn ? "Spotlight: ON" : "Spotlight: OFF");
    m_trayIcon->setIcon(createTrayIcon(spotlightOn));

    QString tooltip = QString::fromLatin1(GLOWPOINT_APP_NAME);
    if (m_controller->stateMachine()->isDrawing()) {
        tooltip += QStringLiteral(" - drawing in %1").arg(m_controller->stateMachine()->drawingColorName());
    }
    m_trayIcon->setToolTip(tooltip + QLatin1Char('\n') + shortcutSummary());
}

QString MainApplication::shortcutSummary() const
{
    QStringList lines;
    const QMap<QString, QString> &shortcuts = m_controller->config().shortcuts;
    for (auto it = shortcuts.cbegin(); it != shortcuts.cend(); ++it) {
        if (it.value().trimmed().isEmpty()) {
            continue;
        }
        lines << QStringLiteral("%1: %2").arg(Glowpoint::actionDisplayName(it.key()),
                                              Glowpoint::ChordParser::formatForDisplay(it.value()));
    }
    return lines.join(QLatin1Char('\n'));
}

QIcon MainApplication::createTrayIcon(bool spotlightOn)
{
    QPixmap pixmap(64, 64);
    pixmap.fill(Qt::transparent);

    QPainter painter(&pixmap);
    painter.setRenderHint(QPainter::Antialiasing);

    const QColor glow = spotlightOn ? QColor(255, 255, 100) : QColor(180, 180, 180);
    QRadialGradient gradient(QPointF(32, 32), 30);
    gradient.setColorAt(0.0, glow);
    gradient.setColorAt(0.6, QColor(glow.red(), glow.green(), glow.blue(), 140));
    gradient.setColorAt(1.0, QColor(glow.red(), glow.green(), glow.blue(), 0));
    painter.setPen(Qt::NoPen);
    painter.setBrush(gradient);
    painter.drawEllipse(QPointF(32, 32), 30, 30);

    painter.setPen(QPen(QColor(40, 40, 40), 4));
    painter.setBrush(Qt::NoBrush);
    painter.drawEllipse(QPointF(32, 32), 14, 14);

    return QIcon(pixmap);
}
