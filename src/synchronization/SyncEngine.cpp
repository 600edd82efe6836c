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


#include "SyncEngine.h"
#include "IChunkTransmitter.h"
#include "ISyncOrchestrator.h"

#include <healthsync/exception/InvalidArgument.h>
#include <healthsync/logging/HealthSyncLogger.h>
#include <healthsync/synchronization/ICredentialsStore.h>
#include <healthsync/threading/Future.h>
#include <healthsync/threading/QtFutureContinuations.h>
#include <healthsync/threading/TrackedTask.h>

#include <QDir>
#include <QNetworkInformation>
#include <QPromise>
#include <QThread>

namespace healthsync::synchronization {

namespace {

[[nodiscard]] ConnectivityMonitor::Reachability toMonitorReachability(
    const QNetworkInformation::Reachability reachability) noexcept
{
    switch (reachability) {
    case QNetworkInformation::Reachability::Online:
        return ConnectivityMonitor::Reachability::Connected;
    case QNetworkInformation::Reachability::Disconnected:
    case QNetworkInformation::Reachability::Local:
    case QNetworkInformation::Reachability::Site:
        return ConnectivityMonitor::Reachability::Disconnected;
    case QNetworkInformation::Reachability::Unknown:
        break;
    }

    return ConnectivityMonitor::Reachability::Unknown;
}

} // namespace

SyncEngine::SyncEngine(
    SyncOptions options, ICredentialsStorePtr credentialsStore,
    ISyncOrchestratorPtr orchestrator, IChunkTransmitterPtr chunkTransmitter,
    std::unique_ptr<SyncEventsNotifier> notifier) :
    m_options{std::move(options)},
    m_credentialsStore{std::move(credentialsStore)},
    m_orchestrator{std::move(orchestrator)},
    m_chunkTransmitter{std::move(chunkTransmitter)},
    m_notifier{std::move(notifier)},
    m_connectivityMonitor{
        (m_orchestrator && m_chunkTransmitter)
            ? std::make_unique<ConnectivityMonitor>(
                  m_orchestrator, m_chunkTransmitter,
                  ConnectivityMonitor::Delays{
                      m_options.networkSettleDelay,
                      m_options.availabilityResumeDelay,
                      m_options.outboxRetryMinAge})
            : nullptr},
    m_settings{QDir{m_options.storageRootDirPath}.absoluteFilePath(
        QStringLiteral("settings.ini"))}
{
    if (Q_UNLIKELY(!m_credentialsStore)) {
        throw InvalidArgument{ErrorString{
            QStringLiteral("SyncEngine ctor: credentials store is null")}};
    }

    if (Q_UNLIKELY(!m_orchestrator)) {
        throw InvalidArgument{ErrorString{
            QStringLiteral("SyncEngine ctor: orchestrator is null")}};
    }

    if (Q_UNLIKELY(!m_chunkTransmitter)) {
        throw InvalidArgument{ErrorString{
            QStringLiteral("SyncEngine ctor: chunk transmitter is null")}};
    }

    if (Q_UNLIKELY(!m_notifier)) {
        throw InvalidArgument{
            ErrorString{QStringLiteral("SyncEngine ctor: notifier is null")}};
    }

    m_settings.setTrackedTypes(m_options.trackedTypes);

    QObject::connect(
        m_notifier.get(), &ISyncEventsNotifier::syncFinished,
        m_connectivityMonitor.get(), &ConnectivityMonitor::onSyncFinished);

    m_outboxSweepTimer.setInterval(m_options.outboxSweepInterval);
    QObject::connect(
        &m_outboxSweepTimer, &QTimer::timeout, &m_outboxSweepTimer,
        [this] { retryPendingItems("periodic outbox sweep"); });
}

SyncEngine::~SyncEngine()
{
    m_outboxSweepTimer.stop();
    m_connectivityMonitor->stop();
    m_orchestrator->cancelSync();
}

QFuture<void> SyncEngine::signIn(Credentials credentials)
{
    if (!credentials.isValid()) {
        HSWARNING(
            "synchronization::SyncEngine",
            "Cannot sign in with invalid credentials: " << credentials);

        return threading::makeExceptionalFuture<void>(
            InvalidArgument{ErrorString{QStringLiteral(
                "Cannot sign in: credentials must contain user id and either "
                "access token or API key")}});
    }

    HSINFO(
        "synchronization::SyncEngine",
        "Signing in user " << credentials.userId);

    m_orchestrator->cancelSync();
    m_credentialsStore->setCredentials(std::move(credentials));

    // Data left by the previous sign in of the same user is stale now
    return m_orchestrator->resetProgress();
}

QFuture<void> SyncEngine::signOut()
{
    HSINFO("synchronization::SyncEngine", "Signing out");

    stopBackgroundSync();

    auto promise = std::make_shared<QPromise<void>>();
    auto future = promise->future();
    promise->start();

    auto resetFuture = m_orchestrator->resetProgress();

    const auto selfWeak = weak_from_this();

    auto thenFuture = threading::then(
        std::move(resetFuture), QThread::currentThread(),
        threading::TrackedTask{selfWeak, [this, promise] {
            m_credentialsStore->clear();
            HSINFO("synchronization::SyncEngine", "Signed out");
            promise->finish();
        }});

    threading::onFailed(
        std::move(thenFuture), [promise](const QException & e) {
            promise->setException(e);
            promise->finish();
        });

    return future;
}

void SyncEngine::updateTokens(
    QString accessToken, std::optional<QString> refreshToken)
{
    m_credentialsStore->updateTokens(
        std::move(accessToken), std::move(refreshToken));

    HSINFO("synchronization::SyncEngine", "Tokens updated");
    retryPendingItems("tokens update");
}

void SyncEngine::startBackgroundSync()
{
    const auto credentials = m_credentialsStore->credentials();
    if (!credentials || !credentials->isValid()) {
        HSWARNING(
            "synchronization::SyncEngine",
            "Cannot start background sync: not signed in");
        return;
    }

    HSINFO("synchronization::SyncEngine", "Starting background sync");

    m_settings.setBackgroundSyncActive(true);
    m_connectivityMonitor->start();
    connectToNetworkInformation();
    m_outboxSweepTimer.start();

    auto future = startSync(false, nullptr);
    threading::then(std::move(future), [](const SyncOutcome outcome) {
        HSINFO(
            "synchronization::SyncEngine",
            "Initial background sync finished: " << outcome);
    });
}

void SyncEngine::stopBackgroundSync()
{
    HSINFO("synchronization::SyncEngine", "Stopping background sync");

    m_orchestrator->cancelSync();
    m_connectivityMonitor->stop();
    m_outboxSweepTimer.stop();

    if (m_networkInformation) {
        QObject::disconnect(
            m_networkInformation, nullptr, m_connectivityMonitor.get(),
            nullptr);
    }

    m_settings.setBackgroundSyncActive(false);
}

bool SyncEngine::isBackgroundSyncActive() const
{
    return m_settings.isBackgroundSyncActive();
}

QFuture<SyncOutcome> SyncEngine::startSync(
    const bool fullExport, IExecutionBudgetPtr budget)
{
    return m_orchestrator->startSync(fullExport, std::move(budget));
}

QFuture<SyncOutcome> SyncEngine::syncNow(IExecutionBudgetPtr budget)
{
    return startSync(false, std::move(budget));
}

QFuture<SyncOutcome> SyncEngine::resumeSync(IExecutionBudgetPtr budget)
{
    return m_orchestrator->resumeSync(std::move(budget));
}

void SyncEngine::stopSync()
{
    m_orchestrator->cancelSync();
}

void SyncEngine::resetProgress()
{
    HSINFO("synchronization::SyncEngine", "Resetting sync progress");

    auto resetFuture = m_orchestrator->resetProgress();

    const auto selfWeak = weak_from_this();

    auto thenFuture = threading::then(
        std::move(resetFuture), QThread::currentThread(),
        threading::TrackedTask{selfWeak, [this] {
            if (!isBackgroundSyncActive()) {
                return;
            }

            HSINFO(
                "synchronization::SyncEngine",
                "Background sync is active, starting full export");

            auto future = startSync(true, nullptr);
            threading::then(std::move(future), [](const SyncOutcome outcome) {
                HSINFO(
                    "synchronization::SyncEngine",
                    "Full export after reset finished: " << outcome);
            });
        }});

    threading::onFailed(std::move(thenFuture), [](const QException & e) {
        HSWARNING(
            "synchronization::SyncEngine",
            "Failed to reset sync progress: " << e.what());
    });
}

void SyncEngine::requestSync()
{
    m_orchestrator->requestSync();
}

void SyncEngine::setDataAvailable(const bool available)
{
    m_connectivityMonitor->setDataAvailability(
        available ? ConnectivityMonitor::DataAvailability::Available
                  : ConnectivityMonitor::DataAvailability::Unavailable);
}

SyncStatus SyncEngine::status() const
{
    return m_orchestrator->status();
}

ISyncEventsNotifier * SyncEngine::notifier() const noexcept
{
    return m_notifier.get();
}

ConnectivityMonitor * SyncEngine::connectivityMonitor() const noexcept
{
    return m_connectivityMonitor.get();
}

void SyncEngine::connectToNetworkInformation()
{
    if (!m_networkInformation) {
        if (!QNetworkInformation::load(
                QNetworkInformation::Feature::Reachability))
        {
            HSWARNING(
                "synchronization::SyncEngine",
                "No network information backend supporting reachability, "
                "network restore won't trigger sync resume");
            return;
        }

        m_networkInformation = QNetworkInformation::instance();
        if (Q_UNLIKELY(!m_networkInformation)) {
            return;
        }
    }

    QObject::disconnect(
        m_networkInformation, nullptr, m_connectivityMonitor.get(), nullptr);

    QObject::connect(
        m_networkInformation, &QNetworkInformation::reachabilityChanged,
        m_connectivityMonitor.get(),
        [monitor = m_connectivityMonitor.get()](
            const QNetworkInformation::Reachability reachability) {
            monitor->setReachability(toMonitorReachability(reachability));
        });

    m_connectivityMonitor->setReachability(
        toMonitorReachability(m_networkInformation->reachability()));
}

void SyncEngine::retryPendingItems(const char * reason)
{
    HSDEBUG(
        "synchronization::SyncEngine",
        "Retrying pending outbox items after " << reason);

    auto future =
        m_chunkTransmitter->retryPendingItems(m_options.outboxRetryMinAge);

    const auto selfWeak = weak_from_this();

    threading::then(
        std::move(future), QThread::currentThread(),
        threading::TrackedTask{selfWeak, [this](const SweepResult & result) {
            HSDEBUG(
                "synchronization::SyncEngine",
                "Pending outbox items retry: " << result);

            // Requests fail while the system still reports connectivity,
            // the next reconnect has to resume the delivery
            if (result.networkFailure) {
                m_connectivityMonitor->markNetworkError();
            }
        }});
}

} // namespace healthsync::synchronization
