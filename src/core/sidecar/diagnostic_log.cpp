#include "core/sidecar/diagnostic_log.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>

#include <utility>

namespace fo {

DiagnosticLog::DiagnosticLog(QString filePath)
    : m_filePath(std::move(filePath))
{
}

bool DiagnosticLog::appendLine(const QString& line) const
{
    if (m_filePath.isEmpty()) {
        return false;
    }

    const QString parentDir = QFileInfo(m_filePath).absolutePath();
    if (!QDir().mkpath(parentDir)) {
        LOG_DEBUG(foSidecar, "Cannot create log directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    QFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        LOG_DEBUG(foSidecar, "Cannot open %s: %s",
                  qUtf8Printable(m_filePath), qUtf8Printable(file.errorString()));
        return false;
    }

    const QByteArray payload = line.toUtf8() + '\n';
    const qint64 bytesWritten = file.write(payload);
    // flush() surfaces errors a buffered write would otherwise defer to close().
    const bool flushed = file.flush();
    file.close();

    return bytesWritten == payload.size() && flushed;
}

QString DiagnosticLog::formatEntry(const QDateTime& timestamp,
                                   const std::optional<QString>& sidecarPath,
                                   const LaunchOutcome& outcome)
{
    const QString pathField = sidecarPath
        ? QStringLiteral("path=%1").arg(quoteLogValue(*sidecarPath))
        : QStringLiteral("path=<none>");
    return QStringLiteral("%1 sidecar spawn: %2 %3")
        .arg(timestamp.toUTC().toString(Qt::ISODateWithMs), pathField, outcome.describe());
}

} // namespace fo
