#ifndef MAINAPPLICATION_H
#define MAINAPPLICATION_H

#include <QObject>
#include <QString>

#include "state/ModeStateMachine.h"

class QSystemTrayIcon;
class QMenu;
class QAction;
class QIcon;
class OverlayController;

namespace Glowpoint {
class OverlayConfigStore;
struct OverlayConfig;
}

class MainApplication : public QObject
{
    Q_OBJECT

public:
    explicit MainApplication(const QString &configPath = QString(), QObject *parent = nullptr);
    ~MainApplication();

    void initialize();

private slots:
    void onToggleSpotlight();
    void onClearDrawings();
    void onReloadConfig();
    void onPauseHotkeys(bool paused);
    void onQuit();
    void onConfigChanged(const Glowpoint::OverlayConfig &config);
    void onModeChanged(ModeStateMachine::Mode mode);

private:
    static QIcon createTrayIcon(bool spotlightOn);
    void updateTrayState();
    QString shortcutSummary() const;

    QString m_configPath;
    QSystemTrayIcon *m_trayIcon;
    QMenu *m_trayMenu;
    QAction *m_spotlightAction;
    QAction *m_pauseHotkeysAction;
    Glowpoint::OverlayConfigStore *m_configStore;
    OverlayController *m_controller;
};

#endif // MAINAPPLICATION_H
