#pragma once

#include <QString>

namespace fo {

enum class DeploymentMode {
    Development,
    Distribution,
};

// Mode this binary was built for. Debug builds define
// FILEORGANIZER_DEVELOPMENT_BUILD; everything else is a distribution build.
DeploymentMode compiledDeploymentMode();

QString deploymentModeToString(DeploymentMode mode);

} // namespace fo
