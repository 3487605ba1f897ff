#include "core/sidecar/process_spawner.h"

#include <QFileInfo>
#include <QProcess>

namespace fo {

namespace {

class QtProcessSpawner final : public ProcessSpawner {
public:
    LaunchOutcome spawnDetached(const QString& program) override
    {
        QProcess process;
        process.setProgram(program);
        process.setArguments({});

        qint64 pid = 0;
        if (!process.startDetached(&pid)) {
            QString message = process.errorString();
            if (message.isEmpty() || message == QLatin1String("Unknown error")) {
                message = QStringLiteral("Failed to start %1").arg(program);
            }
            return LaunchOutcome::failed(classifySpawnFailure(program), message);
        }
        return LaunchOutcome::succeeded(pid);
    }
};

} // namespace

LaunchFailure classifySpawnFailure(const QString& program)
{
    const QFileInfo info(program);
    if (!info.exists()) {
        return LaunchFailure::ExecutableNotFound;
    }
    if (info.isDir() || !info.isExecutable()) {
        return LaunchFailure::PermissionDenied;
    }
    return LaunchFailure::SpawnFailed;
}

std::unique_ptr<ProcessSpawner> ProcessSpawner::create()
{
    return std::make_unique<QtProcessSpawner>();
}

} // namespace fo
