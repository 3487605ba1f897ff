#pragma once

#include "deployment_mode.h"
#include "core/sidecar/launch_outcome.h"
#include "core/sidecar/sidecar_config.h"

#include <QString>

#include <functional>
#include <memory>
#include <optional>

namespace fo {

class SidecarLauncher;

struct StartupReport {
    DeploymentMode mode = DeploymentMode::Distribution;
    bool sidecarAttempted = false;
    bool verboseLogging = false;
    std::optional<QString> sidecarPath;
    std::optional<LaunchOutcome> outcome;
};

// StartupBootstrap -- picks the startup strategy for the deployment mode.
//
// Development: verbose in-process logging, the backend is expected to be
// started by hand. Distribution: locate and launch the bundled sidecar.
// Nothing in run() can fail startup.
class StartupBootstrap {
public:
    using LauncherFactory =
        std::function<std::unique_ptr<SidecarLauncher>(const SidecarConfig&)>;

    StartupBootstrap();
    explicit StartupBootstrap(LauncherFactory factory);
    ~StartupBootstrap();

    StartupBootstrap(const StartupBootstrap&) = delete;
    StartupBootstrap& operator=(const StartupBootstrap&) = delete;

    // Later calls return the first report unchanged.
    StartupReport run(DeploymentMode mode);

    // Overrides SidecarConfig::forApplication() for the next run().
    void setConfig(const SidecarConfig& config) { m_config = config; }

    bool hasRun() const { return m_report.has_value(); }
    SidecarLauncher* launcher() const { return m_launcher.get(); }

private:
    StartupReport runDevelopment();
    StartupReport runDistribution();

    LauncherFactory m_factory;
    std::optional<SidecarConfig> m_config;
    std::unique_ptr<SidecarLauncher> m_launcher;
    std::optional<StartupReport> m_report;
};

} // namespace fo
