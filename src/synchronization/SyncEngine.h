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

#include "ConnectivityMonitor.h"
#include "Fwd.h"
#include "SyncEventsNotifier.h"

#include <healthsync/synchronization/ISyncEngine.h>
#include <healthsync/synchronization/SyncSettings.h>
#include <healthsync/synchronization/types/SyncOptions.h>

#include <QPointer>
#include <QTimer>

#include <memory>

class QNetworkInformation;

namespace healthsync::synchronization {

class SyncEngine final :
    public ISyncEngine,
    public std::enable_shared_from_this<SyncEngine>
{
public:
    SyncEngine(
        SyncOptions options, ICredentialsStorePtr credentialsStore,
        ISyncOrchestratorPtr orchestrator,
        IChunkTransmitterPtr chunkTransmitter,
        std::unique_ptr<SyncEventsNotifier> notifier);

    ~SyncEngine() override;

    [[nodiscard]] QFuture<void> signIn(Credentials credentials) override;
    [[nodiscard]] QFuture<void> signOut() override;

    void updateTokens(
        QString accessToken, std::optional<QString> refreshToken) override;

    void startBackgroundSync() override;
    void stopBackgroundSync() override;
    [[nodiscard]] bool isBackgroundSyncActive() const override;

    [[nodiscard]] QFuture<SyncOutcome> startSync(
        bool fullExport, IExecutionBudgetPtr budget) override;

    [[nodiscard]] QFuture<SyncOutcome> syncNow(
        IExecutionBudgetPtr budget) override;

    [[nodiscard]] QFuture<SyncOutcome> resumeSync(
        IExecutionBudgetPtr budget) override;

    void stopSync() override;
    void resetProgress() override;
    void requestSync() override;
    void setDataAvailable(bool available) override;

    [[nodiscard]] SyncStatus status() const override;
    [[nodiscard]] ISyncEventsNotifier * notifier() const noexcept override;

    [[nodiscard]] ConnectivityMonitor * connectivityMonitor() const noexcept;

private:
    void connectToNetworkInformation();
    void retryPendingItems(const char * reason);

private:
    const SyncOptions m_options;
    const ICredentialsStorePtr m_credentialsStore;
    const ISyncOrchestratorPtr m_orchestrator;
    const IChunkTransmitterPtr m_chunkTransmitter;
    const std::unique_ptr<SyncEventsNotifier> m_notifier;
    const std::unique_ptr<ConnectivityMonitor> m_connectivityMonitor;

    SyncSettings m_settings;
    QTimer m_outboxSweepTimer;
    QPointer<QNetworkInformation> m_networkInformation;
};

} // namespace healthsync::synchronization
