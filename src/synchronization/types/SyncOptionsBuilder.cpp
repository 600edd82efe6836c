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

#include <healthsync/synchronization/types/SyncOptionsBuilder.h>

#include <healthsync/exception/InvalidArgument.h>

#include <QSet>

#include <utility>

namespace healthsync::synchronization {

SyncOptionsBuilder & SyncOptionsBuilder::setTrackedTypes(
    QList<TrackedType> types)
{
    m_options.trackedTypes = std::move(types);
    return *this;
}

SyncOptionsBuilder & SyncOptionsBuilder::setForegroundChunkSize(
    const int size)
{
    m_options.foregroundChunkSize = size;
    return *this;
}

SyncOptionsBuilder & SyncOptionsBuilder::setBackgroundChunkSize(
    const int size)
{
    m_options.backgroundChunkSize = size;
    return *this;
}

SyncOptionsBuilder & SyncOptionsBuilder::setDebounceInterval(
    const std::chrono::milliseconds interval)
{
    m_options.debounceInterval = interval;
    return *this;
}

SyncOptionsBuilder & SyncOptionsBuilder::setNetworkSettleDelay(
    const std::chrono::milliseconds delay)
{
    m_options.networkSettleDelay = delay;
    return *this;
}

SyncOptionsBuilder & SyncOptionsBuilder::setAvailabilityResumeDelay(
    const std::chrono::milliseconds delay)
{
    m_options.availabilityResumeDelay = delay;
    return *this;
}

SyncOptionsBuilder & SyncOptionsBuilder::setOutboxRetryMinAge(
    const std::chrono::milliseconds age)
{
    m_options.outboxRetryMinAge = age;
    return *this;
}

SyncOptionsBuilder & SyncOptionsBuilder::setOutboxSweepInterval(
    const std::chrono::milliseconds interval)
{
    m_options.outboxSweepInterval = interval;
    return *this;
}

SyncOptionsBuilder & SyncOptionsBuilder::setRequestTimeout(
    const std::chrono::milliseconds timeout)
{
    m_options.requestTimeout = timeout;
    return *this;
}

SyncOptionsBuilder & SyncOptionsBuilder::setStorageRootDirPath(QString path)
{
    m_options.storageRootDirPath = std::move(path);
    return *this;
}

SyncOptionsBuilder & SyncOptionsBuilder::setSyncPathTemplate(
    QString pathTemplate)
{
    m_options.syncPathTemplate = std::move(pathTemplate);
    return *this;
}

SyncOptionsBuilder & SyncOptionsBuilder::setRefreshPath(QString path)
{
    m_options.refreshPath = std::move(path);
    return *this;
}

SyncOptionsBuilder & SyncOptionsBuilder::setApiKeyHeaderName(QString name)
{
    m_options.apiKeyHeaderName = std::move(name);
    return *this;
}

SyncOptions SyncOptionsBuilder::build()
{
    SyncOptions options = std::exchange(m_options, SyncOptions{});

    QList<TrackedType> trackedTypes;
    trackedTypes.reserve(options.trackedTypes.size());
    QSet<TrackedType> seenTypes;
    for (const auto & type: std::as_const(options.trackedTypes)) {
        if (Q_UNLIKELY(type.isEmpty())) {
            throw InvalidArgument{ErrorString{
                QT_TRANSLATE_NOOP("synchronization::SyncOptionsBuilder",
                                  "Tracked type identifier is empty")}};
        }

        if (seenTypes.contains(type)) {
            continue;
        }

        seenTypes.insert(type);
        trackedTypes << type;
    }
    options.trackedTypes = std::move(trackedTypes);

    if (Q_UNLIKELY(
            options.foregroundChunkSize <= 0 ||
            options.backgroundChunkSize <= 0))
    {
        ErrorString error{QT_TRANSLATE_NOOP(
            "synchronization::SyncOptionsBuilder",
            "Chunk size must be positive")};
        error.details() = QStringLiteral("foreground %1, background %2")
                              .arg(options.foregroundChunkSize)
                              .arg(options.backgroundChunkSize);
        throw InvalidArgument{std::move(error)};
    }

    const auto isNegative = [](const std::chrono::milliseconds value) {
        return value.count() < 0;
    };

    if (Q_UNLIKELY(
            isNegative(options.debounceInterval) ||
            isNegative(options.networkSettleDelay) ||
            isNegative(options.availabilityResumeDelay) ||
            isNegative(options.outboxRetryMinAge)))
    {
        throw InvalidArgument{ErrorString{QT_TRANSLATE_NOOP(
            "synchronization::SyncOptionsBuilder",
            "Delays and intervals must not be negative")}};
    }

    if (Q_UNLIKELY(
            options.outboxSweepInterval.count() <= 0 ||
            options.requestTimeout.count() <= 0))
    {
        throw InvalidArgument{ErrorString{QT_TRANSLATE_NOOP(
            "synchronization::SyncOptionsBuilder",
            "Outbox sweep interval and request timeout must be positive")}};
    }

    if (Q_UNLIKELY(options.storageRootDirPath.isEmpty())) {
        throw InvalidArgument{ErrorString{QT_TRANSLATE_NOOP(
            "synchronization::SyncOptionsBuilder",
            "Storage root dir path is empty")}};
    }

    if (Q_UNLIKELY(!options.syncPathTemplate.contains(QStringLiteral("%1")))) {
        ErrorString error{QT_TRANSLATE_NOOP(
            "synchronization::SyncOptionsBuilder",
            "Sync path template has no placeholder for user id")};
        error.details() = options.syncPathTemplate;
        throw InvalidArgument{std::move(error)};
    }

    if (Q_UNLIKELY(options.refreshPath.isEmpty())) {
        throw InvalidArgument{ErrorString{QT_TRANSLATE_NOOP(
            "synchronization::SyncOptionsBuilder", "Refresh path is empty")}};
    }

    if (Q_UNLIKELY(options.apiKeyHeaderName.isEmpty())) {
        throw InvalidArgument{ErrorString{QT_TRANSLATE_NOOP(
            "synchronization::SyncOptionsBuilder",
            "API key header name is empty")}};
    }

    return options;
}

} // namespace healthsync::synchronization
