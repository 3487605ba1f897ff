#include "core/sidecar/sidecar_config.h"

#include <QDir>
#include <QStandardPaths>

namespace fo {

QString defaultSidecarBinaryName()
{
#if defined(Q_OS_WIN)
    return QStringLiteral("file-organizer-backend.exe");
#else
    return QStringLiteral("file-organizer-backend");
#endif
}

QString SidecarConfig::logFilePath() const
{
    const QString directory = logDirectory.isEmpty() ? QDir::currentPath() : logDirectory;
    return QDir::cleanPath(directory + QLatin1Char('/') + logFileName);
}

QUrl SidecarConfig::backendUrl() const
{
    QUrl url;
    url.setScheme(QStringLiteral("http"));
    url.setHost(host);
    url.setPort(port);
    return url;
}

QString SidecarConfig::defaultLogDirectory()
{
    const QString dataDir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (!dataDir.isEmpty()) {
        return QDir::cleanPath(dataDir);
    }
    return QDir::currentPath();
}

SidecarConfig SidecarConfig::forApplication()
{
    SidecarConfig config;
    config.logDirectory = defaultLogDirectory();
    return config;
}

} // namespace fo
