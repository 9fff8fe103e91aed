#include <QApplication>
#include <QCommandLineParser>
#include "MainApplication.h"
#include "settings/Settings.h"
#include "version.h"

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);

    // Critical: Don't quit when last window closes (we're a tray app)
    app.setQuitOnLastWindowClosed(false);

    // Set application metadata
    app.setApplicationName(Glowpoint::kApplicationName);
    app.setOrganizationName(Glowpoint::kOrganizationName);
    app.setApplicationVersion(GLOWPOINT_VERSION);

    QCommandLineParser parser;
    parser.setApplicationDescription("Cursor spotlight and on-screen annotation overlay");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption configOption(QStringList{ "c", "config" },
                                    "Read the configuration from <file>.", "file");
    parser.addOption(configOption);
    parser.process(app);

    MainApplication mainApp(parser.value(configOption));
    mainApp.initialize();

    return app.exec();
}
