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

#include <healthsync/synchronization/types/SyncStatus.h>

namespace healthsync::synchronization {

QTextStream & SyncStatus::print(QTextStream & strm) const
{
    strm << "SyncStatus: has resumable session = "
         << (hasResumableSession ? "true" : "false")
         << ", sent count = " << sentCount
         << ", completed type count = " << completedTypeCount
         << ", is full export = " << (isFullExport ? "true" : "false")
         << ", created at = "
         << (createdAt ? createdAt->toString(Qt::ISODateWithMs)
                       : QStringLiteral("<none>"))
         << ", is syncing = " << (isSyncing ? "true" : "false")
         << ", pending outbox items = " << pendingOutboxItemCount;
    return strm;
}

} // namespace healthsync::synchronization
