#pragma once

#include "sidecar/sidecar_export.h"

#include <QString>

namespace sidecar::PlatformUtils {

/**
 * Windows UTF-8 console setup (SetConsoleOutputCP / SetConsoleCP).
 * No-op on other platforms.
 */
SIDECAR_API void initConsoleEncoding();

/**
 * Executable suffix of the current platform.
 * Windows: ".exe", others: ""
 */
SIDECAR_API QString executableSuffix();

/**
 * Full platform path of an executable.
 * @param dir directory
 * @param baseName executable name without suffix
 * @return dir/baseName[.exe]
 */
SIDECAR_API QString executablePath(const QString& dir, const QString& baseName);

/// Append the platform suffix to @p path unless it already carries it.
SIDECAR_API QString appendExecutableSuffix(const QString& path);

} // namespace sidecar::PlatformUtils
