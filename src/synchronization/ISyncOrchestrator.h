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

#include <healthsync/synchronization/Fwd.h>
#include <healthsync/synchronization/types/SyncOutcome.h>
#include <healthsync/synchronization/types/SyncStatus.h>

#include <QFuture>

namespace healthsync::synchronization {

/**
 * @brief The ISyncOrchestrator interface drives sync attempts across all
 * tracked types. At most one sync attempt runs at any time.
 */
class ISyncOrchestrator
{
public:
    virtual ~ISyncOrchestrator() = default;

    /**
     * Resumes the stored session if it has progress, otherwise starts a new
     * one. A new session is a full export if requested or if no full export
     * has completed for the user yet.
     *
     * @param budget        Execution budget, unlimited if null
     * @return future with the outcome; the future never contains exception
     */
    [[nodiscard]] virtual QFuture<SyncOutcome> startSync(
        bool fullExport, IExecutionBudgetPtr budget) = 0;

    /**
     * Continues the stored session, reports NothingToResume if there is no
     * session with progress
     */
    [[nodiscard]] virtual QFuture<SyncOutcome> resumeSync(
        IExecutionBudgetPtr budget) = 0;

    /**
     * Debounced incremental sync: requests coming within the debounce
     * interval from each other result in a single sync attempt
     */
    virtual void requestSync() = 0;

    /**
     * Cancels the pending debounced request and the running sync, aborting
     * its requests in flight
     */
    virtual void cancelSync() = 0;

    /**
     * Cancels the running sync and, once it is finished, removes session,
     * cursors, full export flag and outbox items of the current user
     */
    [[nodiscard]] virtual QFuture<void> resetProgress() = 0;

    [[nodiscard]] virtual bool isSyncing() const = 0;
    [[nodiscard]] virtual bool hasResumableSession() const = 0;
    [[nodiscard]] virtual SyncStatus status() const = 0;
};

} // namespace healthsync::synchronization
