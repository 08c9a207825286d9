#include <signal.h>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDBusConnection>
#include <QFile>
#include <QTimer>
#include <memory>
#include "core/Daemon.hpp"
#include "core/Logging.hpp"
#include "core/YamlConfig.hpp"
#include "core/events/PwDumpEventSource.hpp"
#include "core/mitigation/MprisPlayerControl.hpp"
#include "core/mitigation/PipeWireMuteActuator.hpp"
#include "core/mitigation/PwCliMuteActuator.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("pw-autopaused");
    app.setApplicationVersion("0.2.0");

    QCommandLineParser parser;
    parser.setApplicationDescription(
        "Pauses media players when audio output moves from headphones to speakers.");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption configOption({"c", "config"}, "Configuration file.", "path",
                                    pwa::YamlConfig::defaultPath());
    QCommandLineOption levelOption({"l", "log-level"},
                                   "trace, debug, info, warning or error.", "level");
    parser.addOption(configOption);
    parser.addOption(levelOption);
    parser.process(app);

    pwa::YamlConfig config;
    const QString configPath = parser.value(configOption);
    if (QFile::exists(configPath)) {
        try {
            config.load(configPath);
            qInfo() << "Loaded configuration from" << configPath;
        } catch (const YAML::Exception& e) {
            qWarning() << "Ignoring configuration" << configPath << ":" << e.what();
        }
    }

    const QString level = parser.isSet(levelOption) ? parser.value(levelOption)
                                                    : config.logLevel();
    if (!pwa::applyLogLevel(level))
        qWarning() << "Unknown log level" << level << ", keeping default";

    pwa::MitigationSettings settings;
    settings.deadlineMs = config.deadlineMs();
    settings.graceMs = config.graceMs();
    settings.callTimeoutMs = config.callTimeoutMs();
    settings.unmuteOnTimeout = config.unmuteOnTimeout();
    settings.muteTarget = config.muteTarget() == "outgoing" ? pwa::MuteTarget::Outgoing
                                                             : pwa::MuteTarget::Incoming;

    pwa::PlayerControlSettings playerSettings;
    playerSettings.servicePrefix = config.playerServicePrefix();
    playerSettings.objectPath = config.playerObjectPath();
    playerSettings.interface = config.playerInterface();

    // --- External collaborators ---
    std::unique_ptr<pwa::IMuteActuator> actuator;
    if (config.muteBackend() == "native")
        actuator = std::make_unique<pwa::PipeWireMuteActuator>();
    else
        actuator = std::make_unique<pwa::PwCliMuteActuator>(config.muteProgram());

    pwa::PwDumpEventSource eventSource(config.eventSourceProgram(),
                                       config.eventSourceArguments());
    pwa::MprisPlayerControl players(QDBusConnection::sessionBus(), playerSettings);

    pwa::Daemon daemon(&eventSource, actuator.get(), &players, settings);

    const int exitGraceMs = config.exitGraceMs();
    QObject::connect(&daemon, &pwa::Daemon::fatal, &app, [exitGraceMs](const QString& reason) {
        qCritical() << "Collaborator lost (" << reason << "), exiting in"
                    << exitGraceMs << "ms";
        QTimer::singleShot(exitGraceMs, []() { QCoreApplication::exit(1); });
    });

    // SIGINT / SIGTERM: orderly shutdown with status 0
    auto requestQuit = [](int) {
        QMetaObject::invokeMethod(QCoreApplication::instance(), []() {
            QCoreApplication::quit();
        }, Qt::QueuedConnection);
    };
    signal(SIGINT, requestQuit);
    signal(SIGTERM, requestQuit);

    if (!daemon.start())
        return 1;

    int ret = app.exec();

    daemon.stop();
    return ret;
}
