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

#include <healthsync/synchronization/types/TypeProgress.h>

#include <QDateTime>
#include <QHash>
#include <QSet>

namespace healthsync::synchronization {

/**
 * @brief The SyncState struct is the durable record of the sync session in
 * progress for one user. It is created when the sync starts, updated after
 * each acknowledged chunk and deleted once all tracked types are complete.
 */
struct HEALTHSYNC_EXPORT SyncState : public Printable
{
    /**
     * @return true if at least one record was sent or at least one type was
     *         completed within the session
     */
    [[nodiscard]] bool hasProgress() const noexcept;

    /**
     * @return progress of the given type, creating empty one on first touch
     */
    [[nodiscard]] TypeProgress & progressFor(const TrackedType & type);

    QTextStream & print(QTextStream & strm) const override;

    QString userKey;
    bool fullExport = false;
    QDateTime createdAt;
    QHash<TrackedType, TypeProgress> typeProgress;
    qint64 totalSentCount = 0;
    QSet<TrackedType> completedTypes;

    /**
     * Index within the configured tracked types of the type being processed
     */
    int currentTypeIndex = 0;
};

[[nodiscard]] HEALTHSYNC_EXPORT bool operator==(
    const SyncState & lhs, const SyncState & rhs) noexcept;

[[nodiscard]] HEALTHSYNC_EXPORT bool operator!=(
    const SyncState & lhs, const SyncState & rhs) noexcept;

} // namespace healthsync::synchronization
