#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(foCore, "fileorganizer.core", QtInfoMsg)
Q_LOGGING_CATEGORY(foSidecar, "fileorganizer.sidecar", QtInfoMsg)

namespace fo {

void enableVerboseLogging()
{
    QLoggingCategory::setFilterRules(QStringLiteral("fileorganizer.*.debug=true"));
    qSetMessagePattern(QStringLiteral(
        "%{time yyyy-MM-ddTHH:mm:ss.zzz} [%{type}] %{category}: %{message}"));
    qCDebug(foCore, "Verbose logging enabled");
}

} // namespace fo
