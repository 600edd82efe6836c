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


#include "SyncEventsNotifier.h"

namespace healthsync::synchronization {

SyncEventsNotifier::SyncEventsNotifier(QObject * parent) :
    ISyncEventsNotifier(parent)
{}

void SyncEventsNotifier::notifySyncStarted(const bool fullExport)
{
    Q_EMIT syncStarted(fullExport);
}

void SyncEventsNotifier::notifyTypeProgress(
    const TrackedType & type, const qint64 sentCount)
{
    Q_EMIT typeProgress(type, sentCount);
}

void SyncEventsNotifier::notifyTypeCompleted(
    const TrackedType & type, const qint64 sentCount)
{
    Q_EMIT typeCompleted(type, sentCount);
}

void SyncEventsNotifier::notifyChunkRejected(
    const TrackedType & type, const int httpStatus, const int recordCount)
{
    Q_EMIT chunkRejected(type, httpStatus, recordCount);
}

void SyncEventsNotifier::notifySyncFinished(const SyncOutcome outcome)
{
    Q_EMIT syncFinished(outcome);
}

void SyncEventsNotifier::notifyAuthenticationFailed(const int httpStatus)
{
    Q_EMIT authenticationFailed(httpStatus);
}

} // namespace healthsync::synchronization
