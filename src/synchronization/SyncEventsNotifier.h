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

#include <healthsync/synchronization/ISyncEventsNotifier.h>

namespace healthsync::synchronization {

class SyncEventsNotifier final : public ISyncEventsNotifier
{
    Q_OBJECT
public:
    explicit SyncEventsNotifier(QObject * parent = nullptr);
    ~SyncEventsNotifier() override = default;

    void notifySyncStarted(bool fullExport);
    void notifyTypeProgress(const TrackedType & type, qint64 sentCount);
    void notifyTypeCompleted(const TrackedType & type, qint64 sentCount);

    void notifyChunkRejected(
        const TrackedType & type, int httpStatus, int recordCount);

    void notifySyncFinished(SyncOutcome outcome);
    void notifyAuthenticationFailed(int httpStatus);
};

} // namespace healthsync::synchronization
