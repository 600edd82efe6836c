/*
 * Copyright 2024 Dmitry Ivanov
 *
 * This file is part of libhealthsync
 *
 * libhealthsync is free software; you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as published by
 * the Free Software Foundation, version 3 of the License.
 *
 * libhealthsync is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with libhealthsync. If not, see <http://www.gnu.org/licenses/>.
 */

#pragma once

#include <healthsync/utility/Linkage.h>

#include <QDebug>
#include <QRegularExpression>
#include <QString>
#include <QTextStream>

#include <optional>

namespace healthsync {

/**
 * Levels of log entries, from the most verbose to the least verbose one
 */
enum class LogLevel
{
    Trace,
    Debug,
    Info,
    Warning,
    Error
};

HEALTHSYNC_EXPORT QDebug & operator<<(QDebug & dbg, LogLevel logLevel);

HEALTHSYNC_EXPORT QTextStream & operator<<(
    QTextStream & strm, LogLevel logLevel);

/**
 * Must be called once during the process lifetime before the library is used.
 * Sets up the writing of logs to rotated files located in the directory
 * returned by HealthSyncLogFilesDirPath.
 */
void HEALTHSYNC_EXPORT HealthSyncInitializeLogging();

void HEALTHSYNC_EXPORT HealthSyncAddLogEntry(
    const QString & sourceFileName, int sourceFileLineNumber,
    const QString & component, const QString & message, LogLevel logLevel);

/**
 * Current minimal log level, LogLevel::Info by default
 */
[[nodiscard]] LogLevel HEALTHSYNC_EXPORT HealthSyncMinLogLevel();

void HEALTHSYNC_EXPORT HealthSyncSetMinLogLevel(LogLevel logLevel);

/**
 * Parses level name as printed into log entries, case insensitive;
 * "warning" is accepted along with "warn"
 */
[[nodiscard]] std::optional<LogLevel> HEALTHSYNC_EXPORT
    HealthSyncLogLevelFromString(const QString & name);

[[nodiscard]] bool HEALTHSYNC_EXPORT HealthSyncIsLogLevelActive(
    LogLevel logLevel);

/**
 * Makes logs go to stderr in addition to rotated log files
 */
void HEALTHSYNC_EXPORT HealthSyncAddStdOutLogDestination();

[[nodiscard]] QString HEALTHSYNC_EXPORT HealthSyncLogFilesDirPath();

[[nodiscard]] QRegularExpression HEALTHSYNC_EXPORT
    HealthSyncLogComponentFilter();

/**
 * Only log entries which components match the filter are written. Invalid
 * regular expression means no filtering.
 */
void HEALTHSYNC_EXPORT
    HealthSyncSetLogComponentFilter(const QRegularExpression & filter);

} // namespace healthsync

#define HSLOG_PRIVATE_BASE(component, message, level)                          \
    if (healthsync::HealthSyncIsLogLevelActive(                                \
            healthsync::LogLevel::level)) {                                    \
        QString msg;                                                           \
        QDebug dbg(&msg);                                                      \
        dbg.nospace();                                                         \
        dbg.noquote();                                                         \
        dbg << message;                                                        \
        healthsync::HealthSyncAddLogEntry(                                     \
            QStringLiteral(__FILE__), __LINE__, QString::fromUtf8(component),  \
            msg, healthsync::LogLevel::level);                                 \
    }                                                                          \
    // HSLOG_PRIVATE_BASE

#define HSTRACE(component, message)                                            \
    HSLOG_PRIVATE_BASE(component, message, Trace)                              \
    // HSTRACE

#define HSDEBUG(component, message)                                            \
    HSLOG_PRIVATE_BASE(component, message, Debug)                              \
    // HSDEBUG

#define HSINFO(component, message)                                             \
    HSLOG_PRIVATE_BASE(component, message, Info)                               \
    // HSINFO

#define HSWARNING(component, message)                                          \
    HSLOG_PRIVATE_BASE(component, message, Warning)                            \
    // HSWARNING

#define HSERROR(component, message)                                            \
    HSLOG_PRIVATE_BASE(component, message, Error)                              \
    // HSERROR

#define HEALTHSYNC_SET_MIN_LOG_LEVEL(level)                                    \
    healthsync::HealthSyncSetMinLogLevel(healthsync::LogLevel::level)
  // HEALTHSYNC_SET_MIN_LOG_LEVEL

#define HEALTHSYNC_INITIALIZE_LOGGING() healthsync::HealthSyncInitializeLogging()
  // HEALTHSYNC_INITIALIZE_LOGGING

// clang-format off
#define HEALTHSYNC_ADD_STDOUT_LOG_DESTINATION()                                \
    healthsync::HealthSyncAddStdOutLogDestination()                            \
    // HEALTHSYNC_ADD_STDOUT_LOG_DESTINATION
// clang-format on
