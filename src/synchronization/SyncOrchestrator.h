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

#include "Fwd.h"
#include "ISyncOrchestrator.h"
#include "ITypeStreamer.h"
#include "SyncEventsNotifier.h"

#include <healthsync/synchronization/types/SyncOptions.h>
#include <healthsync/utility/Fwd.h>

#include <QMutex>
#include <QPointer>

#include <memory>
#include <optional>

class QTimer;

template <class T>
class QPromise;

namespace healthsync::synchronization {

class SyncOrchestrator final :
    public ISyncOrchestrator,
    public std::enable_shared_from_this<SyncOrchestrator>
{
public:
    SyncOrchestrator(
        SyncOptions options, ICredentialsStorePtr credentialsStore,
        ISyncStateStoragePtr syncStateStorage, ICursorStoragePtr cursorStorage,
        IOutboxStoragePtr outboxStorage, ITypeStreamerPtr typeStreamer,
        INetworkClientPtr networkClient, SyncEventsNotifier * notifier);

    ~SyncOrchestrator() override;

    [[nodiscard]] QFuture<SyncOutcome> startSync(
        bool fullExport, IExecutionBudgetPtr budget) override;

    [[nodiscard]] QFuture<SyncOutcome> resumeSync(
        IExecutionBudgetPtr budget) override;

    void requestSync() override;
    void cancelSync() override;

    [[nodiscard]] QFuture<void> resetProgress() override;

    [[nodiscard]] bool isSyncing() const override;
    [[nodiscard]] bool hasResumableSession() const override;
    [[nodiscard]] SyncStatus status() const override;

private:
    struct RunContext
    {
        SyncSessionPtr session;
        IExecutionBudgetPtr budget;
        utility::cancelers::ManualCancelerPtr canceler;
        std::shared_ptr<QPromise<SyncOutcome>> promise;
    };

    using RunContextPtr = std::shared_ptr<RunContext>;

    enum class Mode
    {
        StartOrResume,
        ResumeOnly
    };

    [[nodiscard]] QFuture<SyncOutcome> startSyncImpl(
        Mode mode, bool fullExport, IExecutionBudgetPtr budget);

    [[nodiscard]] bool tryAcquireSyncGate();
    void releaseSyncGate();

    [[nodiscard]] std::optional<QString> currentUserKey() const;

    [[nodiscard]] std::optional<Cursor> startCursor(
        const SyncSession & session, const TrackedType & type) const;

    void processNextType(const RunContextPtr & context);

    void onTypeStreamed(
        const RunContextPtr & context, const TrackedType & type,
        TypeStreamStatus status);

    void finalize(const RunContextPtr & context);
    void finish(const RunContextPtr & context, SyncOutcome outcome);

    void clearProgress();

private:
    const SyncOptions m_options;
    const ICredentialsStorePtr m_credentialsStore;
    const ISyncStateStoragePtr m_syncStateStorage;
    const ICursorStoragePtr m_cursorStorage;
    const IOutboxStoragePtr m_outboxStorage;
    const ITypeStreamerPtr m_typeStreamer;
    const INetworkClientPtr m_networkClient;
    const QPointer<SyncEventsNotifier> m_notifier;

    std::unique_ptr<QTimer> m_debounceTimer;

    mutable QMutex m_syncGateMutex;
    bool m_syncInProgress = false;
    utility::cancelers::ManualCancelerPtr m_canceler;
    std::optional<QFuture<SyncOutcome>> m_currentRun;
};

} // namespace healthsync::synchronization
