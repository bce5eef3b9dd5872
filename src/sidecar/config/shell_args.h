#pragma once

#include <QString>
#include <QStringList>

#include "sidecar/sidecar_export.h"

namespace sidecar {

struct SIDECAR_API ShellArgs {
    QString configFile;
    QString port;
    QString sidecarProgram;
    QString updateFeedUrl;
    int readyTimeoutMs = 0;
    QString logLevel = "info";
    QString logDir;

    bool hasPort = false;
    bool hasSidecarProgram = false;
    bool hasUpdateFeedUrl = false;
    bool hasReadyTimeout = false;
    bool hasLogLevel = false;
    bool hasLogDir = false;

    bool help = false;
    bool version = false;
    QString error;

    static ShellArgs parse(const QStringList& args);
};

} // namespace sidecar
