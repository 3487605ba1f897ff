#include "startup_bootstrap.h"
#include "core/shared/logging.h"
#include "core/sidecar/executable_locator.h"
#include "core/sidecar/sidecar_launcher.h"

#include <utility>

namespace fo {

StartupBootstrap::StartupBootstrap()
    : StartupBootstrap([](const SidecarConfig& config) {
        return std::make_unique<SidecarLauncher>(config);
    })
{
}

StartupBootstrap::StartupBootstrap(LauncherFactory factory)
    : m_factory(std::move(factory))
{
}

StartupBootstrap::~StartupBootstrap() = default;

StartupReport StartupBootstrap::run(DeploymentMode mode)
{
    if (m_report) {
        return *m_report;
    }

    LOG_INFO(foCore, "Startup bootstrap (%s build)",
             qUtf8Printable(deploymentModeToString(mode)));

    m_report = mode == DeploymentMode::Development ? runDevelopment() : runDistribution();
    return *m_report;
}

StartupReport StartupBootstrap::runDevelopment()
{
    enableVerboseLogging();
    LOG_INFO(foCore, "Development build: sidecar not launched, start the backend separately");

    StartupReport report;
    report.mode = DeploymentMode::Development;
    report.verboseLogging = true;
    return report;
}

StartupReport StartupBootstrap::runDistribution()
{
    const SidecarConfig config = m_config ? *m_config : SidecarConfig::forApplication();

    StartupReport report;
    report.mode = DeploymentMode::Distribution;
    report.sidecarPath = locateSidecarExecutable(config);

    if (m_factory) {
        m_launcher = m_factory(config);
    }
    if (!m_launcher) {
        // Still produce and log an outcome; this launcher reports a spawn failure.
        LOG_ERROR(foCore, "No sidecar launcher available, continuing without backend");
        m_launcher = std::make_unique<SidecarLauncher>(config, nullptr);
    }

    report.sidecarAttempted = true;
    report.outcome = m_launcher->launch(report.sidecarPath);
    return report;
}

} // namespace fo
