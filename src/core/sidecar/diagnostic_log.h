#pragma once

#include "core/sidecar/launch_outcome.h"

#include <QDateTime>
#include <QString>

#include <optional>

namespace fo {

// DiagnosticLog -- append-only sidecar.log writer.
//
// Each appendLine() opens the file in append mode, writes one line and
// closes it again. The file is never truncated or rotated here.
class DiagnosticLog {
public:
    explicit DiagnosticLog(QString filePath);

    const QString& filePath() const { return m_filePath; }

    // Creates the parent directory if needed. Returns false when the
    // directory, the file or the write fails; nothing is thrown.
    bool appendLine(const QString& line) const;

    // <timestamp> sidecar spawn: path="..." result=...
    static QString formatEntry(const QDateTime& timestamp,
                               const std::optional<QString>& sidecarPath,
                               const LaunchOutcome& outcome);

private:
    QString m_filePath;
};

} // namespace fo
