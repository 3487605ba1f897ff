#include "deployment_mode.h"

namespace fo {

DeploymentMode compiledDeploymentMode()
{
#if defined(FILEORGANIZER_DEVELOPMENT_BUILD)
    return DeploymentMode::Development;
#else
    return DeploymentMode::Distribution;
#endif
}

QString deploymentModeToString(DeploymentMode mode)
{
    switch (mode) {
    case DeploymentMode::Development:
        return QStringLiteral("development");
    case DeploymentMode::Distribution:
        return QStringLiteral("distribution");
    }
    return QStringLiteral("unknown");
}

} // namespace fo
