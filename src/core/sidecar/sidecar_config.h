#pragma once

#include <QString>
#include <QUrl>
#include <QtGlobal>

namespace fo {

// File name of the backend binary shipped beside the shell executable.
QString defaultSidecarBinaryName();

struct SidecarConfig {
    QString binaryName = defaultSidecarBinaryName();

    // When non-empty the locator returns this path instead of deriving a
    // sibling of the running executable. Only set programmatically.
    QString executableOverride;

    QString logDirectory;
    QString logFileName = QStringLiteral("sidecar.log");

    // Endpoint the backend binds on its own. Only reported, never probed.
    QString host = QStringLiteral("127.0.0.1");
    quint16 port = 8000;

    QString logFilePath() const;
    QUrl backendUrl() const;

    // Defaults for this application: sibling binary, log in the application
    // data directory (current working directory when that is unknown).
    static SidecarConfig forApplication();
    static QString defaultLogDirectory();
};

} // namespace fo
