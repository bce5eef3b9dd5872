#pragma once

#include <QString>

#include "sidecar/sidecar_export.h"

namespace sidecar {

class SIDECAR_API ShellLogger {
public:
    struct Config {
        QString logLevel = "info";
        QString logDir;  // empty: console only
        qint64 maxFileBytes = 10 * 1024 * 1024;
        int maxFiles = 3;
    };

    static bool init(const Config& config, QString& error);
    static void shutdown();

private:
    ShellLogger() = delete;
};

} // namespace sidecar
