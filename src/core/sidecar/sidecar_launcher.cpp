#include "core/sidecar/sidecar_launcher.h"
#include "core/shared/logging.h"

#include <QDateTime>

#include <utility>

namespace fo {

SidecarLauncher::SidecarLauncher(SidecarConfig config, std::unique_ptr<ProcessSpawner> spawner)
    : m_config(std::move(config))
    , m_spawner(std::move(spawner))
    , m_log(m_config.logFilePath())
{
}

LaunchOutcome SidecarLauncher::launch(const std::optional<QString>& sidecarPath)
{
    if (m_outcome) {
        LOG_WARN(foSidecar, "Sidecar launch already attempted this run, not retrying");
        return *m_outcome;
    }

    m_attemptedPath = sidecarPath;

    if (!sidecarPath) {
        m_outcome = LaunchOutcome::failed(LaunchFailure::DirectoryUnresolved,
                                          QStringLiteral("could not resolve directory"));
    } else if (!m_spawner) {
        m_outcome = LaunchOutcome::failed(LaunchFailure::SpawnFailed,
                                          QStringLiteral("no process spawner available"));
    } else {
        LOG_INFO(foSidecar, "Starting sidecar: %s", qUtf8Printable(*sidecarPath));
        m_outcome = m_spawner->spawnDetached(*sidecarPath);
    }

    if (m_outcome->isSuccess()) {
        LOG_INFO(foSidecar, "Sidecar started (pid=%lld), expecting it on %s",
                 m_outcome->pid(), qUtf8Printable(m_config.backendUrl().toString()));
    } else {
        LOG_WARN(foSidecar, "Sidecar launch failed (%s): %s",
                 qUtf8Printable(launchFailureToString(m_outcome->failure())),
                 qUtf8Printable(m_outcome->message()));
    }

    const QString entry = DiagnosticLog::formatEntry(
        QDateTime::currentDateTimeUtc(), m_attemptedPath, *m_outcome);
    m_diagnosticsWritten = m_log.appendLine(entry);
    if (!m_diagnosticsWritten) {
        LOG_DEBUG(foSidecar, "Sidecar diagnostics not written to %s",
                  qUtf8Printable(m_log.filePath()));
    }

    return *m_outcome;
}

QJsonObject SidecarLauncher::diagnostics() const
{
    QJsonObject json;
    json[QStringLiteral("launched")] = hasLaunched();
    json[QStringLiteral("path")] = m_attemptedPath ? *m_attemptedPath : QString();
    json[QStringLiteral("logFile")] = m_log.filePath();
    json[QStringLiteral("logWritten")] = m_diagnosticsWritten;
    json[QStringLiteral("backendUrl")] = m_config.backendUrl().toString();
    if (m_outcome) {
        json[QStringLiteral("outcome")] = m_outcome->toJson();
    }
    return json;
}

} // namespace fo
