#include <QCoreApplication>
#include <QTextStream>

#include "config/command_line.h"
#include "core/bootstrap.h"
#include "core/log_manager.h"
#include "core/signal_watcher.h"

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("sampling-proxy"));
    app.setApplicationVersion(QStringLiteral("1.0.0"));

    QTextStream out(stdout);
    QTextStream err(stderr);

    // --- 1. Command line ---
    CommandLine commandLine;
    auto parsed = commandLine.parse(app.arguments());
    if (!parsed) {
        err << "Error: " << parsed.error().message << "\n\n" << commandLine.helpText();
        return 1;
    }
    const CommandLineOptions& options = *parsed;

    if (options.showHelp) {
        out << commandLine.helpText();
        return 0;
    }
    if (options.showVersion) {
        out << app.applicationName() << ' ' << app.applicationVersion() << '\n';
        return 0;
    }

    // --- 2. Log ---
    LogManager::instance().initialize(options.logFile);
    LogManager::instance().setMinimumLevel(options.runtime.debugMode ? LogManager::Debug
                                                                     : LogManager::Info);

    // --- 3. Config + proxy ---
    Bootstrap bootstrap;
    auto started = bootstrap.startAll(options);
    if (!started) {
        LOG_ERROR(QStringLiteral("Startup failed [%1]: %2")
                      .arg(started.error().code, started.error().message));
        return 1;
    }

    // --- 4. Run until SIGINT / SIGTERM ---
    SignalWatcher signalWatcher;
    QObject::connect(&signalWatcher, &SignalWatcher::terminationRequested,
                     &app, [](int) { QCoreApplication::quit(); });

    const int rc = app.exec();
    bootstrap.stopAll();
    LOG_INFO(QStringLiteral("Proxy stopped"));
    return rc;
}
