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

#include <healthsync/logging/HealthSyncLogger.h>

#include <QAtomicInt>
#include <QFile>
#include <QObject>
#include <QReadWriteLock>
#include <QRegularExpression>
#include <QString>
#include <QThread>

#include <vector>

namespace healthsync::logging {

/**
 * Destination of log entries. Writers are owned by the logger and live in
 * its low priority thread, entries are delivered by queued signal.
 */
class ILogWriter : public QObject
{
    Q_OBJECT
public:
    using QObject::QObject;

public Q_SLOTS:
    virtual void write(QString entry) = 0;
};

/**
 * Writes entries into <logs dir>/<app name>-log.txt; once the file grows
 * beyond maxFileSize it becomes <app name>-log.1.txt, the previous .1
 * becomes .2 and so on up to maxOldFilesCount
 */
class RotatingFileLogWriter final : public ILogWriter
{
    Q_OBJECT
public:
    struct Limits
    {
        qint64 maxFileSize = 0;
        int maxOldFilesCount = 0;
    };

    RotatingFileLogWriter(QString dirPath, Limits limits);
    ~RotatingFileLogWriter() override;

public Q_SLOTS:
    void write(QString entry) override;

private:
    [[nodiscard]] QString filePath(int generation) const;
    void openCurrentFile();
    void rotate();

private:
    const QString m_dirPath;
    const Limits m_limits;
    QFile m_file;
};

class StderrLogWriter final : public ILogWriter
{
    Q_OBJECT
public:
    using ILogWriter::ILogWriter;

public Q_SLOTS:
    void write(QString entry) override;
};

class HealthSyncLogger final : public QObject
{
    Q_OBJECT
public:
    static HealthSyncLogger & instance();

    ~HealthSyncLogger() override;

    [[nodiscard]] static QString logFilesDirPath();

    /**
     * Takes ownership of the writer; adding a writer of the same type twice
     * is a no-op
     */
    void addWriter(ILogWriter * writer);

    void write(
        const QString & sourceFilePath, int line, const QString & component,
        const QString & message, LogLevel level);

    [[nodiscard]] LogLevel minLogLevel() const noexcept;
    void setMinLogLevel(LogLevel level) noexcept;

    [[nodiscard]] QRegularExpression componentFilter() const;
    void setComponentFilter(QRegularExpression filter);

Q_SIGNALS:
    void entryReady(QString entry);

private:
    HealthSyncLogger();
    Q_DISABLE_COPY(HealthSyncLogger)

    [[nodiscard]] bool passesComponentFilter(const QString & component) const;

private:
    QThread m_writersThread;
    std::vector<ILogWriter *> m_writers;
    QAtomicInt m_minLogLevel;

    mutable QReadWriteLock m_componentFilterLock;
    QRegularExpression m_componentFilter;
};

} // namespace healthsync::logging
