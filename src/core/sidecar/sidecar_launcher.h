#pragma once

#include "core/sidecar/diagnostic_log.h"
#include "core/sidecar/launch_outcome.h"
#include "core/sidecar/process_spawner.h"
#include "core/sidecar/sidecar_config.h"

#include <QJsonObject>
#include <QString>

#include <memory>
#include <optional>

namespace fo {

// SidecarLauncher -- one-shot, fire-and-forget start of the backend.
//
// launch() makes at most one spawn attempt and writes exactly one line to
// <logDirectory>/sidecar.log describing it. Neither a failed spawn nor a
// failed log write escapes as an error; both are only recorded. The child
// is not tracked after the OS accepts it, so a backend that exits because
// its port is already taken still counts as a successful launch.
class SidecarLauncher {
public:
    explicit SidecarLauncher(SidecarConfig config,
                             std::unique_ptr<ProcessSpawner> spawner = ProcessSpawner::create());

    SidecarLauncher(const SidecarLauncher&) = delete;
    SidecarLauncher& operator=(const SidecarLauncher&) = delete;

    LaunchOutcome launch(const std::optional<QString>& sidecarPath);

    bool hasLaunched() const { return m_outcome.has_value(); }
    const std::optional<LaunchOutcome>& lastOutcome() const { return m_outcome; }
    const std::optional<QString>& attemptedPath() const { return m_attemptedPath; }
    bool diagnosticsWritten() const { return m_diagnosticsWritten; }
    QString logFilePath() const { return m_log.filePath(); }

    QJsonObject diagnostics() const;

private:
    SidecarConfig m_config;
    std::unique_ptr<ProcessSpawner> m_spawner;
    DiagnosticLog m_log;

    std::optional<QString> m_attemptedPath;
    std::optional<LaunchOutcome> m_outcome;
    bool m_diagnosticsWritten = false;
};

} // namespace fo
