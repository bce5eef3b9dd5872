#include "platform_utils.h"

#include <QDir>

#ifdef Q_OS_WIN
#include <windows.h>
#endif

namespace sidecar::PlatformUtils {

void initConsoleEncoding() {
#ifdef Q_OS_WIN
    SetConsoleOutputCP(CP_UTF8);
    SetConsoleCP(CP_UTF8);
#endif
}

QString executableSuffix() {
#ifdef Q_OS_WIN
    return QStringLiteral(".exe");
#else
    return QString();
#endif
}

QString executablePath(const QString& dir, const QString& baseName) {
    return QDir::fromNativeSeparators(dir + "/" + baseName + executableSuffix());
}

QString appendExecutableSuffix(const QString& path) {
    const QString suffix = executableSuffix();
    if (suffix.isEmpty() || path.endsWith(suffix, Qt::CaseInsensitive)) {
        return path;
    }
    return path + suffix;
}

} // namespace sidecar::PlatformUtils
