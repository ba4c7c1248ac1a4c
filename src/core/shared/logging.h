#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(gfCore)
Q_DECLARE_LOGGING_CATEGORY(gfPipeline)
Q_DECLARE_LOGGING_CATEGORY(gfGeneration)
Q_DECLARE_LOGGING_CATEGORY(gfExtraction)
Q_DECLARE_LOGGING_CATEGORY(gfMatching)
Q_DECLARE_LOGGING_CATEGORY(gfIndex)
Q_DECLARE_LOGGING_CATEGORY(gfIpc)

#define LOG_DEBUG(cat, ...) qCDebug(cat, __VA_ARGS__)
#define LOG_INFO(cat, ...)  qCInfo(cat, __VA_ARGS__)
#define LOG_WARN(cat, ...)  qCWarning(cat, __VA_ARGS__)
#define LOG_ERROR(cat, ...) qCCritical(cat, __VA_ARGS__)
