#pragma once

#include <QJsonObject>
#include <QString>
#include <QtGlobal>

namespace fo {

enum class LaunchFailure {
    None,
    DirectoryUnresolved,
    ExecutableNotFound,
    PermissionDenied,
    SpawnFailed,
};

QString launchFailureToString(LaunchFailure failure);

// Double-quotes a value for a log line, escaping backslashes, quotes and
// line breaks so one entry always stays on one line.
QString quoteLogValue(const QString& value);

// Result of the single spawn attempt made during startup.
class LaunchOutcome {
public:
    static LaunchOutcome succeeded(qint64 pid);
    static LaunchOutcome failed(LaunchFailure failure, const QString& message);

    bool isSuccess() const { return m_failure == LaunchFailure::None; }
    LaunchFailure failure() const { return m_failure; }
    const QString& message() const { return m_message; }
    qint64 pid() const { return m_pid; }

    // "result=ok pid=..." or "result=error cause=... message=\"...\""
    QString describe() const;
    QJsonObject toJson() const;

private:
    LaunchOutcome(LaunchFailure failure, QString message, qint64 pid);

    LaunchFailure m_failure = LaunchFailure::None;
    QString m_message;
    qint64 m_pid = 0;
};

} // namespace fo
