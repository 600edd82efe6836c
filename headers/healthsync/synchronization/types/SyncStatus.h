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
#include <healthsync/utility/Printable.h>

#include <QDateTime>

#include <optional>

namespace healthsync::synchronization {

/**
 * @brief Snapshot of the synchronization status for displaying to the user
 */
struct HEALTHSYNC_EXPORT SyncStatus : public Printable
{
    QTextStream & print(QTextStream & strm) const override;

    bool hasResumableSession = false;
    qint64 sentCount = 0;
    int completedTypeCount = 0;
    bool isFullExport = false;

    /**
     * Creation time of the session, absent if there is no session
     */
    std::optional<QDateTime> createdAt;

    bool isSyncing = false;
    int pendingOutboxItemCount = 0;
};

} // namespace healthsync::synchronization
