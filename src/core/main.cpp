#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDebug>
#include <QProcessEnvironment>
#include <QSettings>
#include <QTextStream>
#include <QTimer>

#include <atomic>
#include <csignal>
#include <cstdio>

import nava.core.app_config;
import nava.core.cli_app;

#ifndef APP_VERSION
#define APP_VERSION "0.1.0"
#endif

namespace {

std::atomic<bool> g_interrupted{false};

void signalHandler(int signal)
{
    if (signal == SIGINT || signal == SIGTERM) {
        g_interrupted = true;
    }
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("Genyleap"));
    QCoreApplication::setApplicationName(QStringLiteral("Nava"));
    QCoreApplication::setApplicationVersion(QStringLiteral(APP_VERSION));

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Download songs, albums, playlists and podcast episodes to local audio files."));
    parser.addHelpOption();
    parser.addVersionOption();
    AppConfig::addOptions(parser);
    parser.process(app);

    AppConfig config;
    QSettings settings;
    config.loadSettings(settings);
    config.loadEnvironment(QProcessEnvironment::systemEnvironment());

    QString error;
    if (!config.applyCommandLine(parser, &error) || !config.validate(&error)) {
        qCritical().noquote() << error;
        return CliApplication::ExitSetupError;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    QTextStream in(stdin);
    QTextStream out(stdout);
    CliApplication cli(config, &in, &out);
    QObject::connect(&cli, &CliApplication::done, &app, [](int exitCode) {
        QCoreApplication::exit(exitCode);
    }, Qt::QueuedConnection);

    // Signal handlers only set a flag; the event loop picks it up.
    QTimer interruptPoll;
    QObject::connect(&interruptPoll, &QTimer::timeout, &cli, [&cli]() {
        if (g_interrupted.exchange(false)) cli.requestCancel();
    });
    interruptPoll.start(100);

    QTimer::singleShot(0, &cli, &CliApplication::start);
    return app.exec();
}
