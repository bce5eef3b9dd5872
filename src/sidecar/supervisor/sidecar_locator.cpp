#include "sidecar_locator.h"

#include <QCoreApplication>
#include <QFileInfo>
#include <QStandardPaths>

#include "sidecar/platform/platform_utils.h"

namespace sidecar {

QString locateSidecar(const SupervisorConfig& config, QString& error) {
    error.clear();

    if (!config.sidecarProgram.isEmpty()) {
        const QFileInfo explicitPath(config.sidecarProgram);
        if (explicitPath.isFile() && explicitPath.isExecutable()) {
            return explicitPath.absoluteFilePath();
        }

        if (explicitPath.isRelative()) {
            const QFileInfo besideShell(PlatformUtils::appendExecutableSuffix(
                QCoreApplication::applicationDirPath() + "/" + config.sidecarProgram));
            if (besideShell.isFile() && besideShell.isExecutable()) {
                return besideShell.absoluteFilePath();
            }
        }

        error = "sidecar not executable: " + config.sidecarProgram;
        return {};
    }

    if (config.sidecarName.isEmpty()) {
        error = "sidecar name is empty";
        return {};
    }

    const QFileInfo bundled(PlatformUtils::executablePath(
        QCoreApplication::applicationDirPath(), config.sidecarName));
    if (bundled.isFile() && bundled.isExecutable()) {
        return bundled.absoluteFilePath();
    }

    const QString onPath = QStandardPaths::findExecutable(config.sidecarName);
    if (!onPath.isEmpty()) {
        return onPath;
    }

    error = "sidecar not found: " + config.sidecarName;
    return {};
}

} // namespace sidecar
