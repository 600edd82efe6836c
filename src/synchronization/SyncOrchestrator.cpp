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


#include "SyncOrchestrator.h"
#include "ICursorStorage.h"
#include "INetworkClient.h"
#include "IOutboxStorage.h"
#include "SyncSession.h"
#include "Utils.h"

#include <healthsync/exception/IHealthSyncException.h>
#include <healthsync/exception/InvalidArgument.h>
#include <healthsync/logging/HealthSyncLogger.h>
#include <healthsync/synchronization/ICredentialsStore.h>
#include <healthsync/synchronization/IExecutionBudget.h>
#include <healthsync/synchronization/ISyncStateStorage.h>
#include <healthsync/threading/Future.h>
#include <healthsync/threading/QtFutureContinuations.h>
#include <healthsync/threading/TrackedTask.h>
#include <healthsync/utility/cancelers/ManualCanceler.h>

#include <QDateTime>
#include <QMutexLocker>
#include <QPromise>
#include <QThread>
#include <QTimer>

namespace healthsync::synchronization {

SyncOrchestrator::SyncOrchestrator(
    SyncOptions options, ICredentialsStorePtr credentialsStore,
    ISyncStateStoragePtr syncStateStorage, ICursorStoragePtr cursorStorage,
    IOutboxStoragePtr outboxStorage, ITypeStreamerPtr typeStreamer,
    INetworkClientPtr networkClient, SyncEventsNotifier * notifier) :
    m_options{std::move(options)},
    m_credentialsStore{std::move(credentialsStore)},
    m_syncStateStorage{std::move(syncStateStorage)},
    m_cursorStorage{std::move(cursorStorage)},
    m_outboxStorage{std::move(outboxStorage)},
    m_typeStreamer{std::move(typeStreamer)},
    m_networkClient{std::move(networkClient)}, m_notifier{notifier},
    m_debounceTimer{std::make_unique<QTimer>()}
{
    if (Q_UNLIKELY(!m_credentialsStore)) {
        throw InvalidArgument{ErrorString{QStringLiteral(
            "SyncOrchestrator ctor: credentials store is null")}};
    }

    if (Q_UNLIKELY(!m_syncStateStorage)) {
        throw InvalidArgument{ErrorString{QStringLiteral(
            "SyncOrchestrator ctor: sync state storage is null")}};
    }

    if (Q_UNLIKELY(!m_cursorStorage)) {
        throw InvalidArgument{ErrorString{
            QStringLiteral("SyncOrchestrator ctor: cursor storage is null")}};
    }

    if (Q_UNLIKELY(!m_outboxStorage)) {
        throw InvalidArgument{ErrorString{
            QStringLiteral("SyncOrchestrator ctor: outbox storage is null")}};
    }

    if (Q_UNLIKELY(!m_typeStreamer)) {
        throw InvalidArgument{ErrorString{
            QStringLiteral("SyncOrchestrator ctor: type streamer is null")}};
    }

    if (Q_UNLIKELY(!m_networkClient)) {
        throw InvalidArgument{ErrorString{
            QStringLiteral("SyncOrchestrator ctor: network client is null")}};
    }

    if (Q_UNLIKELY(!m_notifier)) {
        throw InvalidArgument{ErrorString{
            QStringLiteral("SyncOrchestrator ctor: notifier is null")}};
    }

    m_debounceTimer->setSingleShot(true);
    m_debounceTimer->setInterval(m_options.debounceInterval);

    QObject::connect(
        m_debounceTimer.get(), &QTimer::timeout, m_debounceTimer.get(),
        [this] {
            HSDEBUG(
                "synchronization::SyncOrchestrator",
                "Debounce interval elapsed, starting sync");

            auto future = startSync(false, nullptr);
            threading::then(std::move(future), [](const SyncOutcome outcome) {
                HSDEBUG(
                    "synchronization::SyncOrchestrator",
                    "Requested sync finished: " << outcome);
            });
        });
}

SyncOrchestrator::~SyncOrchestrator()
{
    m_debounceTimer->stop();

    const QMutexLocker locker{&m_syncGateMutex};
    if (m_canceler) {
        m_canceler->cancel();
    }
}

QFuture<SyncOutcome> SyncOrchestrator::startSync(
    const bool fullExport, IExecutionBudgetPtr budget)
{
    return startSyncImpl(Mode::StartOrResume, fullExport, std::move(budget));
}

QFuture<SyncOutcome> SyncOrchestrator::resumeSync(IExecutionBudgetPtr budget)
{
    return startSyncImpl(Mode::ResumeOnly, false, std::move(budget));
}

void SyncOrchestrator::requestSync()
{
    HSDEBUG(
        "synchronization::SyncOrchestrator",
        "Sync requested, waiting "
            << m_options.debounceInterval.count()
            << " ms for more requests");

    // Restarting replaces the pending request instead of queueing another one
    m_debounceTimer->start();
}

void SyncOrchestrator::cancelSync()
{
    m_debounceTimer->stop();

    utility::cancelers::ManualCancelerPtr canceler;
    {
        const QMutexLocker locker{&m_syncGateMutex};
        canceler = m_canceler;
    }

    if (!canceler) {
        return;
    }

    HSINFO("synchronization::SyncOrchestrator", "Canceling sync");
    canceler->cancel();
    m_networkClient->abortAll();
}

QFuture<void> SyncOrchestrator::resetProgress()
{
    cancelSync();

    std::optional<QFuture<SyncOutcome>> currentRun;
    {
        const QMutexLocker locker{&m_syncGateMutex};
        currentRun = m_currentRun;
    }

    if (!currentRun) {
        clearProgress();
        return threading::makeReadyFuture();
    }

    HSDEBUG(
        "synchronization::SyncOrchestrator",
        "Waiting for the canceled sync to finish before resetting progress");

    auto promise = std::make_shared<QPromise<void>>();
    auto future = promise->future();
    promise->start();

    const auto selfWeak = weak_from_this();

    auto thenFuture = threading::then(
        std::move(*currentRun), QThread::currentThread(),
        [selfWeak, promise](SyncOutcome) {
            if (const auto self = selfWeak.lock()) {
                self->clearProgress();
            }
            promise->finish();
        });

    threading::onFailed(
        std::move(thenFuture), [promise](const QException & e) {
            promise->setException(e);
            promise->finish();
        });

    return future;
}

bool SyncOrchestrator::isSyncing() const
{
    const QMutexLocker locker{&m_syncGateMutex};
    return m_syncInProgress;
}

bool SyncOrchestrator::hasResumableSession() const
{
    const auto userKey = currentUserKey();
    if (!userKey) {
        return false;
    }

    const auto state = m_syncStateStorage->syncState(*userKey);
    return state && state->hasProgress();
}

SyncStatus SyncOrchestrator::status() const
{
    SyncStatus status;
    status.isSyncing = isSyncing();

    const auto userKey = currentUserKey();
    if (!userKey) {
        return status;
    }

    if (const auto state = m_syncStateStorage->syncState(*userKey)) {
        status.hasResumableSession = state->hasProgress();
        status.sentCount = state->totalSentCount;
        status.completedTypeCount =
            static_cast<int>(state->completedTypes.size());
        status.isFullExport = state->fullExport;
        status.createdAt = state->createdAt;
    }

    status.pendingOutboxItemCount = m_outboxStorage->size(*userKey);
    return status;
}

QFuture<SyncOutcome> SyncOrchestrator::startSyncImpl(
    const Mode mode, const bool fullExport, IExecutionBudgetPtr budget)
{
    if (!tryAcquireSyncGate()) {
        HSINFO(
            "synchronization::SyncOrchestrator",
            "Sync already in progress, ignoring request");
        return threading::makeReadyFuture(SyncOutcome::AlreadyInProgress);
    }

    const auto userKey = currentUserKey();
    if (!userKey) {
        HSWARNING(
            "synchronization::SyncOrchestrator",
            "No valid credentials, cannot sync");
        releaseSyncGate();
        return threading::makeReadyFuture(SyncOutcome::NotSignedIn);
    }

    SyncSessionPtr session;
    try {
        auto storedState = m_syncStateStorage->syncState(*userKey);
        const bool hasProgress = storedState && storedState->hasProgress();

        if (mode == Mode::ResumeOnly && !hasProgress) {
            HSINFO(
                "synchronization::SyncOrchestrator",
                "No sync session to resume");
            releaseSyncGate();
            return threading::makeReadyFuture(SyncOutcome::NothingToResume);
        }

        if (hasProgress) {
            HSINFO(
                "synchronization::SyncOrchestrator",
                "Resuming " << (storedState->fullExport ? "full export"
                                                         : "incremental sync")
                            << ", " << storedState->totalSentCount
                            << " records sent so far");
            session = std::make_shared<SyncSession>(
                std::move(*storedState), m_syncStateStorage);
        }
        else {
            const bool fullExportDone =
                m_cursorStorage->isFullExportDone(*userKey);
            if (!fullExport && !fullExportDone) {
                HSINFO(
                    "synchronization::SyncOrchestrator",
                    "Full export has not completed yet, forcing it");
            }

            SyncState state;
            state.userKey = *userKey;
            state.fullExport = fullExport || !fullExportDone;
            state.createdAt = QDateTime::currentDateTimeUtc();

            session = std::make_shared<SyncSession>(
                std::move(state), m_syncStateStorage);
        }

        session->persist();
    }
    catch (const IHealthSyncException & e) {
        HSWARNING(
            "synchronization::SyncOrchestrator",
            "Failed to prepare sync session: " << e.what());
        releaseSyncGate();
        return threading::makeReadyFuture(SyncOutcome::StorageFailure);
    }

    auto context = std::make_shared<RunContext>();
    context->session = std::move(session);
    context->budget =
        budget ? std::move(budget) : createUnlimitedExecutionBudget();
    context->canceler =
        std::make_shared<utility::cancelers::ManualCanceler>();
    context->promise = std::make_shared<QPromise<SyncOutcome>>();
    context->promise->start();

    auto future = context->promise->future();
    {
        const QMutexLocker locker{&m_syncGateMutex};
        m_canceler = context->canceler;
        m_currentRun = future;
    }

    const auto & state = context->session->state();
    HSINFO(
        "synchronization::SyncOrchestrator",
        "Starting " << (state.fullExport ? "full export" : "incremental sync")
                    << " of " << m_options.trackedTypes.size() << " types");

    if (m_notifier) {
        m_notifier->notifySyncStarted(state.fullExport);
    }

    processNextType(context);
    return future;
}

bool SyncOrchestrator::tryAcquireSyncGate()
{
    const QMutexLocker locker{&m_syncGateMutex};
    if (m_syncInProgress) {
        return false;
    }

    m_syncInProgress = true;
    return true;
}

void SyncOrchestrator::releaseSyncGate()
{
    const QMutexLocker locker{&m_syncGateMutex};
    m_syncInProgress = false;
    m_canceler.reset();
    m_currentRun.reset();
}

std::optional<QString> SyncOrchestrator::currentUserKey() const
{
    const auto credentials = m_credentialsStore->credentials();
    if (!credentials || !credentials->isValid()) {
        return std::nullopt;
    }

    return userKey(credentials->userId);
}

std::optional<Cursor> SyncOrchestrator::startCursor(
    const SyncSession & session, const TrackedType & type) const
{
    auto progress = session.progress(type);
    if (progress.pendingCursor) {
        return std::move(progress.pendingCursor);
    }

    if (session.state().fullExport) {
        return std::nullopt;
    }

    return m_cursorStorage->cursor(session.state().userKey, type);
}

void SyncOrchestrator::processNextType(const RunContextPtr & context)
{
    const auto & types = m_options.trackedTypes;
    const auto & session = context->session;

    if (context->canceler->isCanceled()) {
        finish(context, SyncOutcome::Canceled);
        return;
    }

    // Types are processed in order starting from the one the session
    // stopped at; incomplete types before it are picked up afterwards
    int index = -1;
    const int startIndex = qMax(session->state().currentTypeIndex, 0);
    for (int i = 0, size = static_cast<int>(types.size()); i < size; ++i) {
        const int candidate = (startIndex + i) % size;
        if (!session->isTypeComplete(types[candidate])) {
            index = candidate;
            break;
        }
    }

    if (index < 0) {
        finalize(context);
        return;
    }

    const auto & type = types[index];

    if (context->budget->isExhausted()) {
        HSINFO(
            "synchronization::SyncOrchestrator",
            "Sync paused at " << shortTypeName(type)
                              << ": execution budget is exhausted");
        finish(context, SyncOutcome::BudgetExhausted);
        return;
    }

    TypeStreamRequest request;
    try {
        session->setCurrentTypeIndex(index);
        request.startCursor = startCursor(*session, type);
    }
    catch (const IHealthSyncException & e) {
        HSWARNING(
            "synchronization::SyncOrchestrator",
            "Failed to prepare sync of " << shortTypeName(type) << ": "
                                         << e.what());
        finish(context, SyncOutcome::StorageFailure);
        return;
    }

    request.type = type;
    request.chunkSize = context->budget->isConstrained()
        ? m_options.backgroundChunkSize
        : m_options.foregroundChunkSize;
    request.fullExport = session->state().fullExport;
    request.session = session;
    request.budget = context->budget;
    request.canceler = context->canceler;

    HSINFO(
        "synchronization::SyncOrchestrator",
        "Syncing " << shortTypeName(type) << " (" << (index + 1) << "/"
                   << types.size() << ")");

    auto streamFuture = m_typeStreamer->stream(std::move(request));

    const auto selfWeak = weak_from_this();
    auto * currentThread = QThread::currentThread();

    auto thenFuture = threading::then(
        std::move(streamFuture), currentThread,
        threading::TrackedTask{
            selfWeak, [this, context, type](const TypeStreamStatus status) {
                onTypeStreamed(context, type, status);
            }});

    threading::onFailed(
        std::move(thenFuture), currentThread,
        [this, selfWeak, context](const QException & e) {
            const auto self = selfWeak.lock();
            if (!self) {
                return;
            }

            HSWARNING(
                "synchronization::SyncOrchestrator",
                "Failed to sync type: " << e.what());
            finish(context, SyncOutcome::StorageFailure);
        });
}

void SyncOrchestrator::onTypeStreamed(
    const RunContextPtr & context, const TrackedType & type,
    const TypeStreamStatus status)
{
    std::optional<SyncOutcome> outcome;
    switch (status) {
    case TypeStreamStatus::Completed:
    case TypeStreamStatus::Skipped:
        processNextType(context);
        return;
    case TypeStreamStatus::Canceled:
        outcome = SyncOutcome::Canceled;
        break;
    case TypeStreamStatus::NetworkFailure:
        outcome = SyncOutcome::Interrupted;
        break;
    case TypeStreamStatus::DataUnavailable:
        outcome = SyncOutcome::DataUnavailable;
        break;
    case TypeStreamStatus::AuthenticationFailure:
        outcome = SyncOutcome::AuthenticationFailed;
        if (m_notifier) {
            m_notifier->notifyAuthenticationFailed(401);
        }
        break;
    case TypeStreamStatus::BudgetExhausted:
        outcome = SyncOutcome::BudgetExhausted;
        break;
    case TypeStreamStatus::StorageFailure:
        outcome = SyncOutcome::StorageFailure;
        break;
    }

    if (Q_UNLIKELY(!outcome)) {
        outcome = SyncOutcome::StorageFailure;
    }

    HSINFO(
        "synchronization::SyncOrchestrator",
        "Sync paused at " << shortTypeName(type) << ": " << *outcome);

    finish(context, *outcome);
}

void SyncOrchestrator::finalize(const RunContextPtr & context)
{
    const auto & state = context->session->state();

    try {
        if (state.fullExport) {
            m_cursorStorage->setFullExportDone(state.userKey, true);
            HSINFO(
                "synchronization::SyncOrchestrator",
                "Marked full export complete");
        }

        m_syncStateStorage->clearSyncState(state.userKey);
    }
    catch (const IHealthSyncException & e) {
        HSWARNING(
            "synchronization::SyncOrchestrator",
            "Failed to finalize sync session: " << e.what());
        finish(context, SyncOutcome::StorageFailure);
        return;
    }

    HSINFO(
        "synchronization::SyncOrchestrator",
        "Sync complete: " << state.totalSentCount << " records across "
                          << state.completedTypes.size() << " types");

    finish(context, SyncOutcome::Completed);
}

void SyncOrchestrator::finish(
    const RunContextPtr & context, const SyncOutcome outcome)
{
    releaseSyncGate();

    HSDEBUG(
        "synchronization::SyncOrchestrator", "Sync finished: " << outcome);

    if (m_notifier) {
        m_notifier->notifySyncFinished(outcome);
    }

    context->promise->addResult(outcome);
    context->promise->finish();
}

void SyncOrchestrator::clearProgress()
{
    const auto userKey = currentUserKey();
    if (!userKey) {
        return;
    }

    m_syncStateStorage->clearSyncState(*userKey);
    m_cursorStorage->clear(*userKey);
    m_outboxStorage->clear(*userKey);

    HSINFO(
        "synchronization::SyncOrchestrator",
        "Sync progress reset for " << *userKey);
}

} // namespace healthsync::synchronization
