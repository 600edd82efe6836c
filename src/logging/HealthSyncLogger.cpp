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


#include <healthsync/logging/HealthSyncLogger.h>

#include "HealthSyncLogger_p.h"

#include <healthsync/utility/Printable.h>

#include <array>

namespace healthsync {

namespace {

constexpr std::array<const char *, 5> gLogLevelNames{
    "Trace", "Debug", "Info", "Warn", "Error"};

} // namespace

void HealthSyncInitializeLogging()
{
    Q_UNUSED(logging::HealthSyncLogger::instance())
}

void HealthSyncAddLogEntry(
    const QString & sourceFileName, const int sourceFileLineNumber,
    const QString & component, const QString & message, const LogLevel logLevel)
{
    logging::HealthSyncLogger::instance().write(
        sourceFileName, sourceFileLineNumber, component, message, logLevel);
}

LogLevel HealthSyncMinLogLevel()
{
    return logging::HealthSyncLogger::instance().minLogLevel();
}

void HealthSyncSetMinLogLevel(const LogLevel logLevel)
{
    logging::HealthSyncLogger::instance().setMinLogLevel(logLevel);
}

bool HealthSyncIsLogLevelActive(const LogLevel logLevel)
{
    return HealthSyncMinLogLevel() <= logLevel;
}

std::optional<LogLevel> HealthSyncLogLevelFromString(const QString & name)
{
    for (std::size_t i = 0; i < gLogLevelNames.size(); ++i) {
        if (name.compare(
                QLatin1String{gLogLevelNames[i]}, Qt::CaseInsensitive) == 0)
        {
            return static_cast<LogLevel>(i);
        }
    }

    if (name.compare(QStringLiteral("warning"), Qt::CaseInsensitive) == 0) {
        return LogLevel::Warning;
    }

    return std::nullopt;
}

void HealthSyncAddStdOutLogDestination()
{
    logging::HealthSyncLogger::instance().addWriter(
        new logging::StderrLogWriter);
}

QString HealthSyncLogFilesDirPath()
{
    return logging::HealthSyncLogger::logFilesDirPath();
}

QRegularExpression HealthSyncLogComponentFilter()
{
    return logging::HealthSyncLogger::instance().componentFilter();
}

void HealthSyncSetLogComponentFilter(const QRegularExpression & filter)
{
    logging::HealthSyncLogger::instance().setComponentFilter(filter);
}

QTextStream & operator<<(QTextStream & strm, const LogLevel logLevel)
{
    const auto index = static_cast<std::size_t>(logLevel);
    if (index < gLogLevelNames.size()) {
        strm << gLogLevelNames[index];
    }
    else {
        strm << "Unknown (" << static_cast<qint64>(logLevel) << ")";
    }

    return strm;
}

QDebug & operator<<(QDebug & dbg, const LogLevel logLevel)
{
    dbg << ToString(logLevel);
    return dbg;
}

} // namespace healthsync
