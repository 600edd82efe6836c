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

#include <healthsync/synchronization/types/TypeAliases.h>
#include <healthsync/utility/Linkage.h>
#include <healthsync/utility/Printable.h>

#include <QList>
#include <QString>

#include <chrono>

namespace healthsync::synchronization {

/**
 * @brief Options of the sync engine. Instances are created by
 * SyncOptionsBuilder which validates the values.
 */
struct HEALTHSYNC_EXPORT SyncOptions : public Printable
{
    QTextStream & print(QTextStream & strm) const override;

    /**
     * Types to sync, in the order of processing
     */
    QList<TrackedType> trackedTypes;

    /**
     * Max number of records per chunk when the execution is not constrained
     */
    int foregroundChunkSize = 2000;

    /**
     * Max number of records per chunk under constrained (background)
     * execution
     */
    int backgroundChunkSize = 100;

    std::chrono::milliseconds debounceInterval{2000};
    std::chrono::milliseconds networkSettleDelay{2000};
    std::chrono::milliseconds availabilityResumeDelay{1000};

    /**
     * Outbox items younger than this are not retried by the sweep as they
     * might still be in flight on the main path
     */
    std::chrono::milliseconds outboxRetryMinAge{30000};
    std::chrono::milliseconds outboxSweepInterval{300000};
    std::chrono::milliseconds requestTimeout{60000};

    /**
     * Root dir for per user persistent data: sync state, cursors, outbox
     */
    QString storageRootDirPath;

    /**
     * Path of the upload endpoint, %1 is replaced with user id
     */
    QString syncPathTemplate =
        QStringLiteral("/api/v1/sdk/users/%1/sync/apple");

    QString refreshPath = QStringLiteral("/api/v1/token/refresh");
    QString apiKeyHeaderName = QStringLiteral("X-Open-Wearables-API-Key");
};

[[nodiscard]] HEALTHSYNC_EXPORT bool operator==(
    const SyncOptions & lhs, const SyncOptions & rhs) noexcept;

[[nodiscard]] HEALTHSYNC_EXPORT bool operator!=(
    const SyncOptions & lhs, const SyncOptions & rhs) noexcept;

} // namespace healthsync::synchronization
