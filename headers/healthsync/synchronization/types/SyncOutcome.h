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

#include <QDebug>
#include <QTextStream>

namespace healthsync::synchronization {

/**
 * The result of a sync attempt
 */
enum class SyncOutcome
{
    /**
     * All tracked types were processed, the session is finalized
     */
    Completed,
    /**
     * Another sync is running, the request was ignored
     */
    AlreadyInProgress,
    /**
     * Resume was requested but there is no session to resume
     */
    NothingToResume,
    /**
     * Sync was canceled; the session can be resumed later
     */
    Canceled,
    /**
     * Sync was paused due to network failure; the session can be resumed
     * later
     */
    Interrupted,
    /**
     * Health data is temporarily inaccessible (i.e. the device is locked);
     * the session is resumed once data becomes available
     */
    DataUnavailable,
    /**
     * Execution budget ran out; the session can be resumed later
     */
    BudgetExhausted,
    /**
     * Local persistent storage failed
     */
    StorageFailure,
    /**
     * Server rejected the credentials and they could not be refreshed
     */
    AuthenticationFailed,
    /**
     * No valid credentials are stored
     */
    NotSignedIn
};

HEALTHSYNC_EXPORT QTextStream & operator<<(
    QTextStream & strm, SyncOutcome outcome);

HEALTHSYNC_EXPORT QDebug & operator<<(QDebug & dbg, SyncOutcome outcome);

} // namespace healthsync::synchronization
