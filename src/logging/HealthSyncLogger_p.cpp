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


#include "HealthSyncLogger_p.h"

#include <healthsync/exception/RuntimeError.h>

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QStandardPaths>
#include <QStringConverter>

#include <cstdio>
#include <typeinfo>

namespace healthsync::logging {

namespace {

constexpr qint64 gMaxLogFileSize = 100 * 1024 * 1024;
constexpr int gMaxOldLogFilesCount = 5;

// Writers report their own failures here since they can't log them
void reportWriterFailure(const QString & what)
{
    std::fprintf(stderr, "healthsync logger: %s\n", qPrintable(what));
}

// Source paths are shortened to the part starting at src/ or headers/
[[nodiscard]] QString shortSourcePath(const QString & path)
{
    for (const auto & marker:
         {QStringLiteral("/src/"), QStringLiteral("/headers/")})
    {
        const auto index = path.lastIndexOf(marker);
        if (index >= 0) {
            return path.mid(index + 1);
        }
    }

    return path;
}

} // namespace

RotatingFileLogWriter::RotatingFileLogWriter(
    QString dirPath, const Limits limits) :
    m_dirPath{std::move(dirPath)}, m_limits{limits}
{
    if (Q_UNLIKELY(!QDir{}.mkpath(m_dirPath))) {
        ErrorString error{QT_TRANSLATE_NOOP(
            "logging::RotatingFileLogWriter", "Cannot create log files dir")};
        error.setDetails(m_dirPath);
        throw RuntimeError{std::move(error)};
    }

    openCurrentFile();
    if (Q_UNLIKELY(!m_file.isOpen())) {
        ErrorString error{QT_TRANSLATE_NOOP(
            "logging::RotatingFileLogWriter", "Cannot open log file")};
        error.setDetails(m_file.errorString());
        throw RuntimeError{std::move(error)};
    }
}

RotatingFileLogWriter::~RotatingFileLogWriter()
{
    m_file.close();
}

void RotatingFileLogWriter::write(QString entry)
{
    const QByteArray line =
        QDateTime::currentDateTime().toString(Qt::ISODateWithMs).toUtf8() +
        ' ' + entry.toUtf8() + '\n';

    if (m_file.isOpen() && m_file.size() + line.size() > m_limits.maxFileSize)
    {
        rotate();
    }

    if (Q_UNLIKELY(!m_file.isOpen())) {
        return;
    }

    if (Q_UNLIKELY(m_file.write(line) != line.size())) {
        reportWriterFailure(
            QStringLiteral("failed to write log entry: ") +
            m_file.errorString());
    }
}

QString RotatingFileLogWriter::filePath(const int generation) const
{
    QString appName = QCoreApplication::applicationName();
    if (appName.isEmpty()) {
        appName = QStringLiteral("healthsync");
    }

    const QString suffix = generation == 0
        ? QStringLiteral("-log.txt")
        : QStringLiteral("-log.%1.txt").arg(generation);

    return QDir{m_dirPath}.filePath(appName + suffix);
}

void RotatingFileLogWriter::openCurrentFile()
{
    m_file.setFileName(filePath(0));
    if (!m_file.open(
            QIODevice::WriteOnly | QIODevice::Append | QIODevice::Unbuffered))
    {
        reportWriterFailure(
            QStringLiteral("cannot open log file: ") + m_file.errorString());
    }
}

void RotatingFileLogWriter::rotate()
{
    m_file.close();

    // The oldest generation is dropped, the rest move one step older
    QFile::remove(filePath(m_limits.maxOldFilesCount));
    for (int generation = m_limits.maxOldFilesCount - 1; generation >= 0;
         --generation)
    {
        const QString from = filePath(generation);
        if (QFile::exists(from) &&
            Q_UNLIKELY(!QFile::rename(from, filePath(generation + 1))))
        {
            reportWriterFailure(QStringLiteral("cannot rotate ") + from);
        }
    }

    openCurrentFile();
}

void StderrLogWriter::write(QString entry)
{
    const QByteArray line = entry.toLocal8Bit();
    std::fprintf(stderr, "%s\n", line.constData());
    std::fflush(stderr);
}

HealthSyncLogger & HealthSyncLogger::instance()
{
    static HealthSyncLogger logger;
    return logger;
}

HealthSyncLogger::HealthSyncLogger() :
    m_minLogLevel{static_cast<int>(LogLevel::Info)}
{
    m_writersThread.setObjectName(QStringLiteral("healthsync-log-writers"));
    m_writersThread.start(QThread::LowPriority);

    addWriter(new RotatingFileLogWriter(
        logFilesDirPath(),
        RotatingFileLogWriter::Limits{gMaxLogFileSize, gMaxOldLogFilesCount}));
}

HealthSyncLogger::~HealthSyncLogger()
{
    m_writersThread.quit();
    m_writersThread.wait();

    for (auto * writer: m_writers) {
        delete writer;
    }
}

QString HealthSyncLogger::logFilesDirPath()
{
    return QDir{QStandardPaths::writableLocation(
                    QStandardPaths::AppDataLocation)}
        .filePath(QStringLiteral("logs-healthsync"));
}

void HealthSyncLogger::addWriter(ILogWriter * writer)
{
    if (Q_UNLIKELY(!writer)) {
        return;
    }

    for (const auto * existingWriter: m_writers) {
        if (typeid(*existingWriter) == typeid(*writer)) {
            delete writer;
            return;
        }
    }

    writer->setParent(nullptr);
    writer->moveToThread(&m_writersThread);
    m_writers.push_back(writer);

    QObject::connect(
        this, &HealthSyncLogger::entryReady, writer, &ILogWriter::write,
        Qt::QueuedConnection);
}

void HealthSyncLogger::write(
    const QString & sourceFilePath, const int line, const QString & component,
    const QString & message, const LogLevel level)
{
    if (!passesComponentFilter(component)) {
        return;
    }

    QString entry = shortSourcePath(sourceFilePath);
    QTextStream strm{&entry, QIODevice::Append};
    strm << ":" << line << " [" << level << "] [" << component
         << "]: " << message;
    strm.flush();

    Q_EMIT entryReady(std::move(entry));
}

LogLevel HealthSyncLogger::minLogLevel() const noexcept
{
    return static_cast<LogLevel>(m_minLogLevel.loadAcquire());
}

void HealthSyncLogger::setMinLogLevel(const LogLevel level) noexcept
{
    m_minLogLevel.storeRelease(static_cast<int>(level));
}

QRegularExpression HealthSyncLogger::componentFilter() const
{
    const QReadLocker locker{&m_componentFilterLock};
    return m_componentFilter;
}

void HealthSyncLogger::setComponentFilter(QRegularExpression filter)
{
    const QWriteLocker locker{&m_componentFilterLock};
    m_componentFilter = std::move(filter);
}

bool HealthSyncLogger::passesComponentFilter(const QString & component) const
{
    const QReadLocker locker{&m_componentFilterLock};
    if (component.isEmpty() || m_componentFilter.pattern().isEmpty() ||
        !m_componentFilter.isValid())
    {
        return true;
    }

    return m_componentFilter.match(component).hasMatch();
}

} // namespace healthsync::logging
