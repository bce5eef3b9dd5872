#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QProcessEnvironment>
#include <QTextStream>

#include <csignal>
#include <cstdio>

#include "sidecar/config/shell_args.h"
#include "sidecar/config/supervisor_config.h"
#include "sidecar/platform/platform_utils.h"
#include "sidecar/supervisor/backend_supervisor.h"
#include "sidecar/utils/shell_logger.h"

using namespace sidecar;

namespace {

constexpr char kShellVersion[] = "0.1.0";

void printHelp() {
    QTextStream err(stderr);
    err << "Usage: sidecar_shell [options]\n"
        << "Options:\n"
        << "  --config=<path>            JSON config file\n"
        << "  --port=<port>              Backend port (default: $APP_PORT or 8000)\n"
        << "  --sidecar=<path>           Backend executable (default: bundled "
        << kSidecarName << ")\n"
        << "  --update-feed-url=<url>    Update feed passed to the backend\n"
        << "  --ready-timeout-ms=<ms>    Backend startup deadline (default: 15000)\n"
        << "  --log-level=<level>        debug|info|warn|error (default: info)\n"
        << "  --log-dir=<path>           Also write rotating logs to <path>/shell.log\n"
        << "  -h, --help                 Show this help\n"
        << "  -v, --version              Show version\n";
    err.flush();
}

void requestQuitSignalHandler(int) {
    QMetaObject::invokeMethod(
        qApp,
        []() { QCoreApplication::quit(); },
        Qt::QueuedConnection);
}

} // namespace

int main(int argc, char* argv[]) {
    PlatformUtils::initConsoleEncoding();
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("sidecar_shell");
    QCoreApplication::setApplicationVersion(kShellVersion);

    const ShellArgs args = ShellArgs::parse(app.arguments());
    if (args.help) {
        printHelp();
        return 0;
    }
    if (args.version) {
        std::fprintf(stderr, "sidecar_shell %s\n", kShellVersion);
        return 0;
    }
    if (!args.error.isEmpty()) {
        std::fprintf(stderr, "Error: %s\n", qUtf8Printable(args.error));
        return 2;
    }

    SupervisorConfig config;
    if (!args.configFile.isEmpty()) {
        QString cfgErr;
        config = SupervisorConfig::loadFromFile(QFileInfo(args.configFile).absoluteFilePath(), cfgErr);
        if (!cfgErr.isEmpty()) {
            std::fprintf(stderr, "Error: %s\n", qUtf8Printable(cfgErr));
            return 2;
        }
    }
    config.applyEnvironment(QProcessEnvironment::systemEnvironment());
    config.applyArgs(args);
    config.appVersion = QCoreApplication::applicationVersion();

    if (!config.logDir.isEmpty() && !QDir().mkpath(config.logDir)) {
        std::fprintf(stderr, "Error: cannot create log directory: %s\n",
                     qUtf8Printable(config.logDir));
        return 1;
    }

    ShellLogger::Config logCfg;
    logCfg.logLevel = config.logLevel;
    logCfg.logDir = config.logDir;
    QString logErr;
    if (!ShellLogger::init(logCfg, logErr)) {
        std::fprintf(stderr, "Error: %s\n", qUtf8Printable(logErr));
        return 1;
    }

    // Installed before supervision so a quit request during startup is
    // queued for the event loop instead of killing the shell.
    std::signal(SIGINT, requestQuitSignalHandler);
#ifdef SIGTERM
    std::signal(SIGTERM, requestQuitSignalHandler);
#endif

    BackendSupervisor supervisor(config);
    if (!supervisor.ensureBackendRunning()) {
        qWarning("Desktop backend failed to initialize correctly.");
    }

    QObject::connect(&app, &QCoreApplication::aboutToQuit, [&]() {
        supervisor.shutdown();
    });

    const int rc = app.exec();
    ShellLogger::shutdown();
    return rc;
}
