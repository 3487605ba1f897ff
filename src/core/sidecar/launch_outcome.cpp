#include "core/sidecar/launch_outcome.h"

#include <utility>

namespace fo {

QString quoteLogValue(const QString& value)
{
    QString escaped = value;
    escaped.replace(QLatin1Char('\\'), QStringLiteral("\\\\"));
    escaped.replace(QLatin1Char('"'), QStringLiteral("\\\""));
    escaped.replace(QLatin1Char('\n'), QStringLiteral("\\n"));
    escaped.replace(QLatin1Char('\r'), QStringLiteral("\\r"));
    return QLatin1Char('"') + escaped + QLatin1Char('"');
}

QString launchFailureToString(LaunchFailure failure)
{
    switch (failure) {
    case LaunchFailure::None:
        return QStringLiteral("none");
    case LaunchFailure::DirectoryUnresolved:
        return QStringLiteral("directory_unresolved");
    case LaunchFailure::ExecutableNotFound:
        return QStringLiteral("not_found");
    case LaunchFailure::PermissionDenied:
        return QStringLiteral("permission_denied");
    case LaunchFailure::SpawnFailed:
        return QStringLiteral("spawn_failed");
    }
    return QStringLiteral("unknown");
}

LaunchOutcome::LaunchOutcome(LaunchFailure failure, QString message, qint64 pid)
    : m_failure(failure)
    , m_message(std::move(message))
    , m_pid(pid)
{
}

LaunchOutcome LaunchOutcome::succeeded(qint64 pid)
{
    return LaunchOutcome(LaunchFailure::None, QString(), pid);
}

LaunchOutcome LaunchOutcome::failed(LaunchFailure failure, const QString& message)
{
    // A failure without a cause would read as success.
    if (failure == LaunchFailure::None) {
        failure = LaunchFailure::SpawnFailed;
    }
    return LaunchOutcome(failure, message, 0);
}

QString LaunchOutcome::describe() const
{
    if (isSuccess()) {
        return QStringLiteral("result=ok pid=%1").arg(m_pid);
    }
    return QStringLiteral("result=error cause=%1 message=%2")
        .arg(launchFailureToString(m_failure), quoteLogValue(m_message));
}

QJsonObject LaunchOutcome::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("success")] = isSuccess();
    json[QStringLiteral("cause")] = launchFailureToString(m_failure);
    json[QStringLiteral("message")] = m_message;
    json[QStringLiteral("pid")] = m_pid;
    return json;
}

} // namespace fo
