#pragma once

#include <QProcessEnvironment>
#include <QString>

#include "shell_args.h"
#include "sidecar/sidecar_export.h"

namespace sidecar {

/// Loopback address the sidecar is launched on and probed at.
inline const char kBackendHost[] = "127.0.0.1";
inline const char kDefaultBackendPort[] = "8000";
inline const char kDefaultUpdateFeedUrl[] =
    "https://github.com/alexllenaf/INTERLENA-updates/releases/latest/download/latest.json";
inline const char kSidecarName[] = "interview-atlas-backend";

struct SIDECAR_API SupervisorConfig {
    QString host = kBackendHost;
    QString port = kDefaultBackendPort;
    QString updateFeedUrl = kDefaultUpdateFeedUrl;
    QString appVersion;
    QString sidecarName = kSidecarName;
    QString sidecarProgram;

    /// Deadline of the short poll that detects an already running backend.
    int reuseProbeTimeoutMs = 250;
    int readyTimeoutMs = 15000;
    int pollIntervalMs = 120;
    int connectTimeoutMs = 1000;

    QString logLevel = "info";
    QString logDir;

    /// Missing file yields defaults with an empty @p error.
    static SupervisorConfig loadFromFile(const QString& filePath, QString& error);

    /// Reads APP_PORT and UPDATE_FEED_URL; unset or empty values keep the current ones.
    void applyEnvironment(const QProcessEnvironment& env);
    void applyArgs(const ShellArgs& args);

    /// Numeric port, or 0 when @c port is not in 1..65535.
    quint16 portNumber() const;
};

} // namespace sidecar
