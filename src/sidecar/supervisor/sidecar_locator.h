#pragma once

#include <QString>

#include "sidecar/config/supervisor_config.h"
#include "sidecar/sidecar_export.h"

namespace sidecar {

/**
 * Resolves the sidecar executable.
 *
 * An explicit @c sidecarProgram must be executable as given or relative to
 * the shell's directory. Otherwise the bundled @c sidecarName is looked up
 * next to the shell executable, then on PATH.
 *
 * @return absolute path, or an empty string with @p error set.
 */
SIDECAR_API QString locateSidecar(const SupervisorConfig& config, QString& error);

} // namespace sidecar
