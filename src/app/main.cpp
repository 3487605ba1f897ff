#include "deployment_mode.h"
#include "startup_bootstrap.h"
#include "core/shared/logging.h"
#include "core/sidecar/sidecar_config.h"

#include <QCoreApplication>

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("FileOrganizer"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));
    app.setOrganizationName(QStringLiteral("FileOrganizer"));
    app.setOrganizationDomain(QStringLiteral("com.fileorganizer"));

    qInfo() << "FileOrganizer shell starting...";

    // The backend is optional at this point: whatever happens here, the
    // shell keeps starting and the UI reports an unreachable endpoint later.
    fo::StartupBootstrap bootstrap;
    const fo::StartupReport report = bootstrap.run(fo::compiledDeploymentMode());

    if (report.outcome && !report.outcome->isSuccess()) {
        LOG_WARN(foCore, "Continuing without a bundled backend (%s)",
                 qUtf8Printable(fo::launchFailureToString(report.outcome->failure())));
    }
    LOG_INFO(foCore, "Backend endpoint: %s",
             qUtf8Printable(fo::SidecarConfig().backendUrl().toString()));

    return app.exec();
}
