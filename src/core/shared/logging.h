#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(foCore)
Q_DECLARE_LOGGING_CATEGORY(foSidecar)

#define LOG_DEBUG(cat, ...) qCDebug(cat, __VA_ARGS__)
#define LOG_INFO(cat, ...)  qCInfo(cat, __VA_ARGS__)
#define LOG_WARN(cat, ...)  qCWarning(cat, __VA_ARGS__)
#define LOG_ERROR(cat, ...) qCCritical(cat, __VA_ARGS__)

namespace fo {

// Turns on debug output for every fileorganizer.* category and switches the
// message pattern to one carrying time, severity and category.
void enableVerboseLogging();

} // namespace fo
