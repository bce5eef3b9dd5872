#include "shell_args.h"

namespace sidecar {

namespace {

bool isValidPort(const QString& raw) {
    bool ok = false;
    const int port = raw.toInt(&ok);
    return ok && port >= 1 && port <= 65535;
}

} // namespace

ShellArgs ShellArgs::parse(const QStringList& args) {
    ShellArgs result;

    for (int i = 1; i < args.size(); ++i) {
        const QString& arg = args[i];
        if (arg == "-h" || arg == "--help") {
            result.help = true;
            continue;
        }
        if (arg == "-v" || arg == "--version") {
            result.version = true;
            continue;
        }
        if (arg.startsWith("--config=")) {
            result.configFile = arg.mid(9);
            if (result.configFile.isEmpty()) {
                result.error = "config cannot be empty";
                return result;
            }
            continue;
        }
        if (arg.startsWith("--port=")) {
            result.port = arg.mid(7);
            if (!isValidPort(result.port)) {
                result.error = "invalid port: " + result.port;
                return result;
            }
            result.hasPort = true;
            continue;
        }
        if (arg.startsWith("--sidecar=")) {
            result.sidecarProgram = arg.mid(10);
            if (result.sidecarProgram.isEmpty()) {
                result.error = "sidecar cannot be empty";
                return result;
            }
            result.hasSidecarProgram = true;
            continue;
        }
        if (arg.startsWith("--update-feed-url=")) {
            result.updateFeedUrl = arg.mid(18);
            if (result.updateFeedUrl.isEmpty()) {
                result.error = "update-feed-url cannot be empty";
                return result;
            }
            result.hasUpdateFeedUrl = true;
            continue;
        }
        if (arg.startsWith("--ready-timeout-ms=")) {
            bool ok = false;
            const QString raw = arg.mid(19);
            result.readyTimeoutMs = raw.toInt(&ok);
            if (!ok || result.readyTimeoutMs <= 0) {
                result.error = "invalid ready timeout: " + raw;
                return result;
            }
            result.hasReadyTimeout = true;
            continue;
        }
        if (arg.startsWith("--log-level=")) {
            result.logLevel = arg.mid(12);
            if (result.logLevel != "debug" && result.logLevel != "info"
                && result.logLevel != "warn" && result.logLevel != "error") {
                result.error = "invalid log level: " + result.logLevel;
                return result;
            }
            result.hasLogLevel = true;
            continue;
        }
        if (arg.startsWith("--log-dir=")) {
            result.logDir = arg.mid(10);
            if (result.logDir.isEmpty()) {
                result.error = "log-dir cannot be empty";
                return result;
            }
            result.hasLogDir = true;
            continue;
        }

        result.error = "unknown option: " + arg;
        return result;
    }

    return result;
}

} // namespace sidecar
