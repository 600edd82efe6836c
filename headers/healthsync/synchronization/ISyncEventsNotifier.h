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

#include <healthsync/synchronization/types/SyncOutcome.h>
#include <healthsync/synchronization/types/TypeAliases.h>
#include <healthsync/utility/Linkage.h>

#include <QObject>

namespace healthsync::synchronization {

class HEALTHSYNC_EXPORT ISyncEventsNotifier : public QObject
{
    Q_OBJECT
protected:
    explicit ISyncEventsNotifier(QObject * parent = nullptr);

public:
    ~ISyncEventsNotifier() override;

Q_SIGNALS:
    /**
     * Emitted when a sync attempt starts, both fresh and resumed.
     * @param fullExport            Whether the whole history is exported
     */
    void syncStarted(bool fullExport);

    /**
     * Emitted after each acknowledged chunk of the type.
     * @param sentCount             Number of records of the type sent within
     *                              the current session so far
     */
    void typeProgress(TrackedType type, qint64 sentCount);

    void typeCompleted(TrackedType type, qint64 sentCount);

    /**
     * Emitted when the server permanently rejects a chunk; the chunk is
     * dropped and the records in it are not sent.
     */
    void chunkRejected(TrackedType type, int httpStatus, int recordCount);

    void syncFinished(SyncOutcome outcome);

    /**
     * Emitted when the server rejects credentials and they cannot be
     * refreshed; the user needs to sign in again
     */
    void authenticationFailed(int httpStatus);
};

} // namespace healthsync::synchronization
