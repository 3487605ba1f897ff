#pragma once

#include "core/sidecar/sidecar_config.h"

#include <QString>

#include <optional>

namespace fo {

// Path of the running binary as reported by the OS, or nullopt when the
// platform cannot tell.
std::optional<QString> currentExecutablePath();

// <directory of executablePath>/<binaryName>. Returns nullopt for an empty
// path, a relative path without a directory component, or a bare root.
std::optional<QString> sidecarPathForExecutable(const QString& executablePath,
                                                const QString& binaryName);

std::optional<QString> locateSidecarExecutable(const SidecarConfig& config);

} // namespace fo
