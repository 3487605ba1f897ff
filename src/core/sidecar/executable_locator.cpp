#include "core/sidecar/executable_locator.h"
#include "core/shared/logging.h"

#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>

namespace fo {

std::optional<QString> currentExecutablePath()
{
    QString path;
    if (QCoreApplication::instance()) {
        path = QCoreApplication::applicationFilePath();
    }
#if defined(Q_OS_LINUX)
    if (path.isEmpty()) {
        path = QFileInfo(QStringLiteral("/proc/self/exe")).symLinkTarget();
    }
#endif
    if (path.isEmpty()) {
        return std::nullopt;
    }
    return path;
}

std::optional<QString> sidecarPathForExecutable(const QString& executablePath,
                                                const QString& binaryName)
{
    if (executablePath.trimmed().isEmpty()) {
        return std::nullopt;
    }

    const QString cleaned = QDir::cleanPath(executablePath);
    const qsizetype separator = cleaned.lastIndexOf(QLatin1Char('/'));
    if (separator < 0 || separator == cleaned.size() - 1) {
        return std::nullopt;
    }

    const QString directory = separator == 0 ? QStringLiteral("/") : cleaned.left(separator);
    return QDir(directory).filePath(binaryName);
}

std::optional<QString> locateSidecarExecutable(const SidecarConfig& config)
{
    if (!config.executableOverride.isEmpty()) {
        LOG_DEBUG(foSidecar, "Using sidecar override: %s",
                  qUtf8Printable(config.executableOverride));
        return config.executableOverride;
    }

    const std::optional<QString> executable = currentExecutablePath();
    if (!executable) {
        LOG_WARN(foSidecar, "Could not determine the running executable path");
        return std::nullopt;
    }

    std::optional<QString> sidecarPath = sidecarPathForExecutable(*executable, config.binaryName);
    if (!sidecarPath) {
        LOG_WARN(foSidecar, "Executable path has no parent directory: %s",
                 qUtf8Printable(*executable));
    }
    return sidecarPath;
}

} // namespace fo
