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
#include <healthsync/synchronization/types/Credentials.h>
#include <healthsync/synchronization/types/SyncOutcome.h>
#include <healthsync/synchronization/types/SyncStatus.h>
#include <healthsync/utility/Linkage.h>

#include <QFuture>

#include <optional>

namespace healthsync::synchronization {

/**
 * @brief The ISyncEngine interface is the command surface of the engine which
 * delivers health records from the data provider to the server.
 *
 * Methods must be called from the thread the engine was created in; returned
 * futures are finished in that thread too.
 */
class HEALTHSYNC_EXPORT ISyncEngine
{
public:
    virtual ~ISyncEngine() noexcept;

    /**
     * Stores the credentials of the user and clears all sync data persisted
     * for that user previously.
     *
     * @return future containing InvalidArgument if credentials are invalid
     */
    [[nodiscard]] virtual QFuture<void> signIn(Credentials credentials) = 0;

    /**
     * Cancels sync, stops background sync, clears sync data of the user and
     * stored credentials.
     */
    [[nodiscard]] virtual QFuture<void> signOut() = 0;

    /**
     * Stores new tokens obtained by the host application and retries
     * delivery of chunks which failed previously.
     */
    virtual void updateTokens(
        QString accessToken, std::optional<QString> refreshToken) = 0;

    /**
     * Starts connectivity and availability monitoring, periodic retries of
     * failed deliveries and runs sync; the active flag is persisted so that
     * background sync can be restored after restart.
     */
    virtual void startBackgroundSync() = 0;
    virtual void stopBackgroundSync() = 0;
    [[nodiscard]] virtual bool isBackgroundSyncActive() const = 0;

    /**
     * Runs sync. If there is a resumable session, it is continued,
     * otherwise a new session is started. The first sync of the user is
     * always a full export.
     */
    [[nodiscard]] virtual QFuture<SyncOutcome> startSync(
        bool fullExport, IExecutionBudgetPtr budget = nullptr) = 0;

    /**
     * Incremental sync, equivalent to startSync(false)
     */
    [[nodiscard]] virtual QFuture<SyncOutcome> syncNow(
        IExecutionBudgetPtr budget = nullptr) = 0;

    /**
     * Continues the interrupted session; reports NothingToResume if there
     * is none
     */
    [[nodiscard]] virtual QFuture<SyncOutcome> resumeSync(
        IExecutionBudgetPtr budget = nullptr) = 0;

    /**
     * Cancels running sync leaving its session resumable
     */
    virtual void stopSync() = 0;

    /**
     * Forgets all sync progress of the user: session, cursors, outbox,
     * full export flag. If background sync is active, full export starts
     * right away.
     */
    virtual void resetProgress() = 0;

    /**
     * Debounced sync request used for change notifications; bursts of
     * requests result in a single sync
     */
    virtual void requestSync() = 0;

    /**
     * Informs the engine whether health data can currently be read, i.e. it
     * becomes unavailable while the device is locked. Sync which paused
     * because of unavailable data resumes shortly after the data becomes
     * available again, provided background sync is active.
     */
    virtual void setDataAvailable(bool available) = 0;

    [[nodiscard]] virtual SyncStatus status() const = 0;

    [[nodiscard]] virtual ISyncEventsNotifier * notifier() const noexcept = 0;
};

} // namespace healthsync::synchronization
