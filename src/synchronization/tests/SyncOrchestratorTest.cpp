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


#include "Utils.h"

#include <synchronization/CursorStorage.h>
#include <synchronization/OutboxStorage.h>
#include <synchronization/SyncEventsNotifier.h>
#include <synchronization/SyncOrchestrator.h>
#include <synchronization/SyncSession.h>
#include <synchronization/SyncStateStorage.h>
#include <synchronization/Utils.h>
#include <synchronization/tests/mocks/MockINetworkClient.h>
#include <synchronization/tests/mocks/MockITypeStreamer.h>

#include <healthsync/exception/InvalidArgument.h>
#include <healthsync/synchronization/tests/mocks/MockICredentialsStore.h>
#include <healthsync/synchronization/tests/mocks/MockIExecutionBudget.h>
#include <healthsync/synchronization/types/SyncOptionsBuilder.h>
#include <healthsync/threading/Future.h>
#include <healthsync/utility/cancelers/ICanceler.h>

#include <QPromise>
#include <QTemporaryDir>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

// clazy:excludeall=non-pod-global-static
// clazy:excludeall=returning-void-expression

namespace healthsync::synchronization::tests {

using namespace std::chrono_literals;

using testing::_;
using testing::NiceMock;
using testing::Return;
using testing::StrictMock;

namespace {

const TrackedType gStepsType =
    QStringLiteral("HKQuantityTypeIdentifierStepCount");

const TrackedType gHeartRateType =
    QStringLiteral("HKQuantityTypeIdentifierHeartRate");

const TrackedType gSleepType =
    QStringLiteral("HKCategoryTypeIdentifierSleepAnalysis");

// Simulates streaming of all records of the type
[[nodiscard]] QFuture<TypeStreamStatus> completeType(
    const TypeStreamRequest & request, const int recordCount = 10)
{
    const Cursor cursor = Cursor{"cursor-of-"} + request.type.toUtf8();
    request.session->recordDelivered(request.type, recordCount, cursor);
    request.session->markTypeComplete(request.type);
    return threading::makeReadyFuture(TypeStreamStatus::Completed);
}

} // namespace

class SyncOrchestratorTest : public testing::Test
{
protected:
    void SetUp() override
    {
        const QDir rootDir{m_tempDir.path()};
        m_syncStateStorage = std::make_shared<SyncStateStorage>(rootDir);
        m_cursorStorage = std::make_shared<CursorStorage>(rootDir);
        m_outboxStorage = std::make_shared<OutboxStorage>(rootDir);

        m_options =
            SyncOptionsBuilder{}
                .setTrackedTypes({gStepsType, gHeartRateType, gSleepType})
                .setForegroundChunkSize(50)
                .setBackgroundChunkSize(10)
                .setDebounceInterval(20ms)
                .setStorageRootDirPath(m_tempDir.path())
                .build();

        EXPECT_CALL(*m_mockCredentialsStore, credentials)
            .WillRepeatedly(Return(tokenCredentials()));
    }

    [[nodiscard]] std::shared_ptr<SyncOrchestrator> createOrchestrator()
    {
        return std::make_shared<SyncOrchestrator>(
            m_options, m_mockCredentialsStore, m_syncStateStorage,
            m_cursorStorage, m_outboxStorage, m_mockTypeStreamer,
            m_mockNetworkClient, &m_notifier);
    }

    [[nodiscard]] SyncOutcome waitForOutcome(QFuture<SyncOutcome> future)
    {
        waitForFuture(future);
        EXPECT_TRUE(future.isFinished());
        EXPECT_EQ(future.resultCount(), 1);
        return future.resultCount() == 1 ? future.result()
                                         : SyncOutcome::StorageFailure;
    }

protected:
    QTemporaryDir m_tempDir;
    const QString m_userKey = userKey(QStringLiteral("user-1"));

    SyncOptions m_options;
    SyncEventsNotifier m_notifier;

    std::shared_ptr<SyncStateStorage> m_syncStateStorage;
    std::shared_ptr<CursorStorage> m_cursorStorage;
    std::shared_ptr<OutboxStorage> m_outboxStorage;

    const std::shared_ptr<mocks::MockICredentialsStore>
        m_mockCredentialsStore =
            std::make_shared<StrictMock<mocks::MockICredentialsStore>>();

    const std::shared_ptr<mocks::MockITypeStreamer> m_mockTypeStreamer =
        std::make_shared<StrictMock<mocks::MockITypeStreamer>>();

    const std::shared_ptr<mocks::MockINetworkClient> m_mockNetworkClient =
        std::make_shared<StrictMock<mocks::MockINetworkClient>>();
};

TEST_F(SyncOrchestratorTest, Ctor)
{
    EXPECT_NO_THROW(createOrchestrator());
}

TEST_F(SyncOrchestratorTest, CtorNullCredentialsStore)
{
    EXPECT_THROW(
        SyncOrchestrator(
            m_options, nullptr, m_syncStateStorage, m_cursorStorage,
            m_outboxStorage, m_mockTypeStreamer, m_mockNetworkClient,
            &m_notifier),
        InvalidArgument);
}

TEST_F(SyncOrchestratorTest, CtorNullSyncStateStorage)
{
    EXPECT_THROW(
        SyncOrchestrator(
            m_options, m_mockCredentialsStore, nullptr, m_cursorStorage,
            m_outboxStorage, m_mockTypeStreamer, m_mockNetworkClient,
            &m_notifier),
        InvalidArgument);
}

TEST_F(SyncOrchestratorTest, CtorNullCursorStorage)
{
    EXPECT_THROW(
        SyncOrchestrator(
            m_options, m_mockCredentialsStore, m_syncStateStorage, nullptr,
            m_outboxStorage, m_mockTypeStreamer, m_mockNetworkClient,
            &m_notifier),
        InvalidArgument);
}

TEST_F(SyncOrchestratorTest, CtorNullOutboxStorage)
{
    EXPECT_THROW(
        SyncOrchestrator(
            m_options, m_mockCredentialsStore, m_syncStateStorage,
            m_cursorStorage, nullptr, m_mockTypeStreamer, m_mockNetworkClient,
            &m_notifier),
        InvalidArgument);
}

TEST_F(SyncOrchestratorTest, CtorNullTypeStreamer)
{
    EXPECT_THROW(
        SyncOrchestrator(
            m_options, m_mockCredentialsStore, m_syncStateStorage,
            m_cursorStorage, m_outboxStorage, nullptr, m_mockNetworkClient,
            &m_notifier),
        InvalidArgument);
}

TEST_F(SyncOrchestratorTest, CtorNullNetworkClient)
{
    EXPECT_THROW(
        SyncOrchestrator(
            m_options, m_mockCredentialsStore, m_syncStateStorage,
            m_cursorStorage, m_outboxStorage, m_mockTypeStreamer, nullptr,
            &m_notifier),
        InvalidArgument);
}

TEST_F(SyncOrchestratorTest, CtorNullNotifier)
{
    EXPECT_THROW(
        SyncOrchestrator(
            m_options, m_mockCredentialsStore, m_syncStateStorage,
            m_cursorStorage, m_outboxStorage, m_mockTypeStreamer,
            m_mockNetworkClient, nullptr),
        InvalidArgument);
}

TEST_F(SyncOrchestratorTest, NotSignedIn)
{
    const auto orchestrator = createOrchestrator();

    testing::Mock::VerifyAndClearExpectations(m_mockCredentialsStore.get());
    EXPECT_CALL(*m_mockCredentialsStore, credentials)
        .WillRepeatedly(Return(std::nullopt));

    EXPECT_EQ(
        waitForOutcome(orchestrator->startSync(false, nullptr)),
        SyncOutcome::NotSignedIn);

    EXPECT_FALSE(orchestrator->isSyncing());
    EXPECT_FALSE(orchestrator->hasResumableSession());
}

TEST_F(SyncOrchestratorTest, FirstSyncIsFullExport)
{
    const auto orchestrator = createOrchestrator();

    QList<TrackedType> streamedTypes;
    EXPECT_CALL(*m_mockTypeStreamer, stream)
        .Times(3)
        .WillRepeatedly([&](const TypeStreamRequest & request) {
            streamedTypes << request.type;
            EXPECT_TRUE(request.fullExport);
            EXPECT_FALSE(request.startCursor);
            EXPECT_EQ(request.chunkSize, 50);
            EXPECT_TRUE(request.canceler);
            EXPECT_TRUE(request.budget);
            return completeType(request);
        });

    std::optional<bool> startedFullExport;
    QObject::connect(
        &m_notifier, &ISyncEventsNotifier::syncStarted, &m_notifier,
        [&](const bool fullExport) { startedFullExport = fullExport; });

    std::optional<SyncOutcome> finishedOutcome;
    bool wasSyncingWhenFinished = true;
    QObject::connect(
        &m_notifier, &ISyncEventsNotifier::syncFinished, &m_notifier,
        [&](const SyncOutcome outcome) {
            finishedOutcome = outcome;
            wasSyncingWhenFinished = orchestrator->isSyncing();
        });

    // Incremental sync is requested but the full export has never completed
    EXPECT_EQ(
        waitForOutcome(orchestrator->startSync(false, nullptr)),
        SyncOutcome::Completed);

    EXPECT_EQ(
        streamedTypes,
        (QList<TrackedType>{gStepsType, gHeartRateType, gSleepType}));

    EXPECT_EQ(startedFullExport, true);
    EXPECT_EQ(finishedOutcome, SyncOutcome::Completed);
    EXPECT_FALSE(wasSyncingWhenFinished);

    EXPECT_TRUE(m_cursorStorage->isFullExportDone(m_userKey));
    EXPECT_FALSE(m_syncStateStorage->syncState(m_userKey));
    EXPECT_FALSE(orchestrator->isSyncing());
    EXPECT_FALSE(orchestrator->hasResumableSession());
}

TEST_F(SyncOrchestratorTest, IncrementalSyncStartsFromCommittedCursors)
{
    m_cursorStorage->setFullExportDone(m_userKey, true);
    EXPECT_TRUE(
        m_cursorStorage->commitCursor(m_userKey, gStepsType, Cursor{"c1"}, 1));

    const auto orchestrator = createOrchestrator();

    EXPECT_CALL(*m_mockTypeStreamer, stream)
        .Times(3)
        .WillRepeatedly([&](const TypeStreamRequest & request) {
            EXPECT_FALSE(request.fullExport);
            if (request.type == gStepsType) {
                EXPECT_EQ(request.startCursor, Cursor{"c1"});
            }
            else {
                EXPECT_FALSE(request.startCursor);
            }
            return completeType(request);
        });

    EXPECT_EQ(
        waitForOutcome(orchestrator->startSync(false, nullptr)),
        SyncOutcome::Completed);
}

TEST_F(SyncOrchestratorTest, FullExportIgnoresCommittedCursors)
{
    m_cursorStorage->setFullExportDone(m_userKey, true);
    EXPECT_TRUE(
        m_cursorStorage->commitCursor(m_userKey, gStepsType, Cursor{"c1"}, 1));

    const auto orchestrator = createOrchestrator();

    EXPECT_CALL(*m_mockTypeStreamer, stream)
        .Times(3)
        .WillRepeatedly([&](const TypeStreamRequest & request) {
            EXPECT_TRUE(request.fullExport);
            EXPECT_FALSE(request.startCursor);
            return completeType(request);
        });

    EXPECT_EQ(
        waitForOutcome(orchestrator->startSync(true, nullptr)),
        SyncOutcome::Completed);
}

TEST_F(SyncOrchestratorTest, SingleSyncAtATime)
{
    const auto orchestrator = createOrchestrator();

    auto streamPromise = std::make_shared<QPromise<TypeStreamStatus>>();
    streamPromise->start();

    EXPECT_CALL(*m_mockTypeStreamer, stream)
        .WillOnce(Return(streamPromise->future()));

    auto firstFuture = orchestrator->startSync(false, nullptr);
    EXPECT_FALSE(firstFuture.isFinished());
    EXPECT_TRUE(orchestrator->isSyncing());

    auto secondFuture = orchestrator->startSync(true, nullptr);
    ASSERT_TRUE(secondFuture.isFinished());
    EXPECT_EQ(secondFuture.result(), SyncOutcome::AlreadyInProgress);

    auto resumeFuture = orchestrator->resumeSync(nullptr);
    ASSERT_TRUE(resumeFuture.isFinished());
    EXPECT_EQ(resumeFuture.result(), SyncOutcome::AlreadyInProgress);

    streamPromise->addResult(TypeStreamStatus::NetworkFailure);
    streamPromise->finish();

    EXPECT_EQ(waitForOutcome(firstFuture), SyncOutcome::Interrupted);
    EXPECT_FALSE(orchestrator->isSyncing());
}

TEST_F(SyncOrchestratorTest, SkippedTypeDoesNotStopSync)
{
    const auto orchestrator = createOrchestrator();

    EXPECT_CALL(*m_mockTypeStreamer, stream)
        .Times(3)
        .WillRepeatedly([&](const TypeStreamRequest & request) {
            if (request.type == gHeartRateType) {
                request.session->markTypeComplete(request.type);
                return threading::makeReadyFuture(TypeStreamStatus::Skipped);
            }
            return completeType(request);
        });

    EXPECT_EQ(
        waitForOutcome(orchestrator->startSync(false, nullptr)),
        SyncOutcome::Completed);

    EXPECT_TRUE(m_cursorStorage->isFullExportDone(m_userKey));
}

TEST_F(SyncOrchestratorTest, InterruptedSyncIsResumedWhereItStopped)
{
    const auto orchestrator = createOrchestrator();

    // Steps complete, heart rate delivers one chunk and the network fails
    EXPECT_CALL(*m_mockTypeStreamer, stream)
        .WillOnce([](const TypeStreamRequest & request) {
            return completeType(request, 5);
        })
        .WillOnce([](const TypeStreamRequest & request) {
            EXPECT_EQ(request.type, gHeartRateType);
            request.session->recordDelivered(
                request.type, 50, Cursor{"hr-1"});
            return threading::makeReadyFuture(
                TypeStreamStatus::NetworkFailure);
        });

    EXPECT_EQ(
        waitForOutcome(orchestrator->startSync(false, nullptr)),
        SyncOutcome::Interrupted);

    EXPECT_TRUE(orchestrator->hasResumableSession());

    const auto status = orchestrator->status();
    EXPECT_TRUE(status.hasResumableSession);
    EXPECT_FALSE(status.isSyncing);
    EXPECT_TRUE(status.isFullExport);
    EXPECT_EQ(status.sentCount, 55);
    EXPECT_EQ(status.completedTypeCount, 1);
    EXPECT_TRUE(status.createdAt);

    testing::Mock::VerifyAndClearExpectations(m_mockTypeStreamer.get());

    QList<TrackedType> streamedTypes;
    EXPECT_CALL(*m_mockTypeStreamer, stream)
        .Times(2)
        .WillRepeatedly([&](const TypeStreamRequest & request) {
            streamedTypes << request.type;
            EXPECT_TRUE(request.fullExport);
            if (request.type == gHeartRateType) {
                EXPECT_EQ(request.startCursor, Cursor{"hr-1"});
            }
            return completeType(request);
        });

    EXPECT_EQ(
        waitForOutcome(orchestrator->resumeSync(nullptr)),
        SyncOutcome::Completed);

    EXPECT_EQ(streamedTypes, (QList<TrackedType>{gHeartRateType, gSleepType}));
    EXPECT_TRUE(m_cursorStorage->isFullExportDone(m_userKey));
    EXPECT_FALSE(orchestrator->hasResumableSession());
}

TEST_F(SyncOrchestratorTest, StartSyncResumesStoredSession)
{
    const auto orchestrator = createOrchestrator();

    EXPECT_CALL(*m_mockTypeStreamer, stream)
        .WillOnce([](const TypeStreamRequest & request) {
            return completeType(request);
        })
        .WillOnce([](const TypeStreamRequest &) {
            return threading::makeReadyFuture(
                TypeStreamStatus::DataUnavailable);
        });

    EXPECT_EQ(
        waitForOutcome(orchestrator->startSync(false, nullptr)),
        SyncOutcome::DataUnavailable);

    testing::Mock::VerifyAndClearExpectations(m_mockTypeStreamer.get());

    // The full export session continues even though incremental sync is
    // requested
    EXPECT_CALL(*m_mockTypeStreamer, stream)
        .Times(2)
        .WillRepeatedly([](const TypeStreamRequest & request) {
            EXPECT_NE(request.type, gStepsType);
            EXPECT_TRUE(request.fullExport);
            return completeType(request);
        });

    EXPECT_EQ(
        waitForOutcome(orchestrator->startSync(false, nullptr)),
        SyncOutcome::Completed);
}

TEST_F(SyncOrchestratorTest, IncompleteTypesBeforeCurrentOneAreProcessedLast)
{
    SyncState state;
    state.userKey = m_userKey;
    state.fullExport = true;
    state.createdAt = QDateTime::currentDateTimeUtc();
    state.currentTypeIndex = 2;
    state.progressFor(gHeartRateType).isComplete = true;
    state.completedTypes.insert(gHeartRateType);
    state.totalSentCount = 10;
    m_syncStateStorage->setSyncState(state);

    const auto orchestrator = createOrchestrator();

    QList<TrackedType> streamedTypes;
    EXPECT_CALL(*m_mockTypeStreamer, stream)
        .Times(2)
        .WillRepeatedly([&](const TypeStreamRequest & request) {
            streamedTypes << request.type;
            return completeType(request);
        });

    EXPECT_EQ(
        waitForOutcome(orchestrator->resumeSync(nullptr)),
        SyncOutcome::Completed);

    EXPECT_EQ(streamedTypes, (QList<TrackedType>{gSleepType, gStepsType}));
}

TEST_F(SyncOrchestratorTest, NothingToResume)
{
    const auto orchestrator = createOrchestrator();

    EXPECT_EQ(
        waitForOutcome(orchestrator->resumeSync(nullptr)),
        SyncOutcome::NothingToResume);

    EXPECT_FALSE(orchestrator->isSyncing());
}

TEST_F(SyncOrchestratorTest, ExhaustedBudgetPausesSync)
{
    const auto orchestrator = createOrchestrator();

    const auto mockBudget =
        std::make_shared<NiceMock<mocks::MockIExecutionBudget>>();
    EXPECT_CALL(*mockBudget, isConstrained).WillRepeatedly(Return(true));
    EXPECT_CALL(*mockBudget, isExhausted)
        .WillOnce(Return(false))
        .WillRepeatedly(Return(true));

    EXPECT_CALL(*m_mockTypeStreamer, stream)
        .WillOnce([&](const TypeStreamRequest & request) {
            EXPECT_EQ(request.chunkSize, 10);
            EXPECT_EQ(request.budget, mockBudget);
            return completeType(request);
        });

    EXPECT_EQ(
        waitForOutcome(orchestrator->startSync(false, mockBudget)),
        SyncOutcome::BudgetExhausted);

    EXPECT_TRUE(orchestrator->hasResumableSession());
    EXPECT_FALSE(m_cursorStorage->isFullExportDone(m_userKey));
}

TEST_F(SyncOrchestratorTest, TypeStreamerBudgetExhaustion)
{
    const auto orchestrator = createOrchestrator();

    EXPECT_CALL(*m_mockTypeStreamer, stream)
        .WillOnce([](const TypeStreamRequest & request) {
            request.session->recordDelivered(request.type, 10, Cursor{"c"});
            return threading::makeReadyFuture(
                TypeStreamStatus::BudgetExhausted);
        });

    EXPECT_EQ(
        waitForOutcome(orchestrator->startSync(false, nullptr)),
        SyncOutcome::BudgetExhausted);

    EXPECT_TRUE(orchestrator->hasResumableSession());
}

TEST_F(SyncOrchestratorTest, AuthenticationFailure)
{
    const auto orchestrator = createOrchestrator();

    EXPECT_CALL(*m_mockTypeStreamer, stream)
        .WillOnce(Return(threading::makeReadyFuture(
            TypeStreamStatus::AuthenticationFailure)));

    std::optional<int> authFailureStatus;
    QObject::connect(
        &m_notifier, &ISyncEventsNotifier::authenticationFailed, &m_notifier,
        [&](const int httpStatus) { authFailureStatus = httpStatus; });

    EXPECT_EQ(
        waitForOutcome(orchestrator->startSync(false, nullptr)),
        SyncOutcome::AuthenticationFailed);

    EXPECT_EQ(authFailureStatus, 401);
}

TEST_F(SyncOrchestratorTest, CancelSync)
{
    const auto orchestrator = createOrchestrator();

    auto streamPromise = std::make_shared<QPromise<TypeStreamStatus>>();
    streamPromise->start();

    utility::cancelers::ICancelerPtr canceler;
    EXPECT_CALL(*m_mockTypeStreamer, stream)
        .WillOnce([&](const TypeStreamRequest & request) {
            canceler = request.canceler;
            return streamPromise->future();
        });

    auto future = orchestrator->startSync(false, nullptr);
    ASSERT_TRUE(canceler);
    EXPECT_FALSE(canceler->isCanceled());

    EXPECT_CALL(*m_mockNetworkClient, abortAll).WillOnce([&] {
        streamPromise->addResult(TypeStreamStatus::Canceled);
        streamPromise->finish();
    });

    orchestrator->cancelSync();
    EXPECT_TRUE(canceler->isCanceled());

    EXPECT_EQ(waitForOutcome(future), SyncOutcome::Canceled);
    EXPECT_FALSE(orchestrator->isSyncing());
}

TEST_F(SyncOrchestratorTest, CancelSyncWhenIdleDoesNothing)
{
    const auto orchestrator = createOrchestrator();
    EXPECT_NO_THROW(orchestrator->cancelSync());
}

TEST_F(SyncOrchestratorTest, ResetProgress)
{
    m_cursorStorage->setFullExportDone(m_userKey, true);
    EXPECT_TRUE(
        m_cursorStorage->commitCursor(m_userKey, gStepsType, Cursor{"c1"}, 1));

    OutboxItem item;
    item.userKey = m_userKey;
    item.typeTag = gStepsType;
    item.payload = QByteArray{"{}"};
    Q_UNUSED(m_outboxStorage->put(std::move(item)));

    const auto orchestrator = createOrchestrator();

    EXPECT_CALL(*m_mockTypeStreamer, stream)
        .WillOnce(Return(threading::makeReadyFuture(
            TypeStreamStatus::NetworkFailure)));

    EXPECT_EQ(
        waitForOutcome(orchestrator->startSync(false, nullptr)),
        SyncOutcome::Interrupted);

    auto future = orchestrator->resetProgress();
    waitForFuture(future);
    EXPECT_TRUE(future.isFinished());

    EXPECT_FALSE(m_syncStateStorage->syncState(m_userKey));
    EXPECT_FALSE(m_cursorStorage->cursor(m_userKey, gStepsType));
    EXPECT_FALSE(m_cursorStorage->isFullExportDone(m_userKey));
    EXPECT_EQ(m_outboxStorage->size(m_userKey), 0);
    EXPECT_FALSE(orchestrator->hasResumableSession());
}

TEST_F(SyncOrchestratorTest, ResetProgressWaitsForRunningSync)
{
    const auto orchestrator = createOrchestrator();

    auto streamPromise = std::make_shared<QPromise<TypeStreamStatus>>();
    streamPromise->start();

    EXPECT_CALL(*m_mockTypeStreamer, stream)
        .WillOnce([&](const TypeStreamRequest & request) {
            request.session->recordDelivered(request.type, 10, Cursor{"c"});
            return streamPromise->future();
        });

    auto syncFuture = orchestrator->startSync(false, nullptr);

    EXPECT_CALL(*m_mockNetworkClient, abortAll);

    auto resetFuture = orchestrator->resetProgress();
    EXPECT_FALSE(resetFuture.isFinished());

    streamPromise->addResult(TypeStreamStatus::Canceled);
    streamPromise->finish();

    EXPECT_EQ(waitForOutcome(syncFuture), SyncOutcome::Canceled);

    waitForFuture(resetFuture);
    EXPECT_TRUE(resetFuture.isFinished());
    EXPECT_FALSE(orchestrator->hasResumableSession());
}

TEST_F(SyncOrchestratorTest, RequestSyncIsDebounced)
{
    m_cursorStorage->setFullExportDone(m_userKey, true);
    const auto orchestrator = createOrchestrator();

    EXPECT_CALL(*m_mockTypeStreamer, stream)
        .Times(3)
        .WillRepeatedly([](const TypeStreamRequest & request) {
            EXPECT_FALSE(request.fullExport);
            return completeType(request);
        });

    int finishedCount = 0;
    QObject::connect(
        &m_notifier, &ISyncEventsNotifier::syncFinished, &m_notifier,
        [&](const SyncOutcome outcome) {
            EXPECT_EQ(outcome, SyncOutcome::Completed);
            ++finishedCount;
        });

    for (int i = 0; i < 5; ++i) {
        orchestrator->requestSync();
        spinEventLoop(5ms);
    }

    spinEventLoop(200ms);
    EXPECT_EQ(finishedCount, 1);
}

TEST_F(SyncOrchestratorTest, CancelSyncDropsPendingRequest)
{
    const auto orchestrator = createOrchestrator();

    orchestrator->requestSync();
    orchestrator->cancelSync();

    // StrictMock type streamer fails the test if sync starts
    spinEventLoop(100ms);
}

TEST_F(SyncOrchestratorTest, StatusCountsPendingOutboxItems)
{
    OutboxItem item;
    item.userKey = m_userKey;
    item.typeTag = gStepsType;
    item.payload = QByteArray{"{}"};
    Q_UNUSED(m_outboxStorage->put(item));
    Q_UNUSED(m_outboxStorage->put(item));

    const auto orchestrator = createOrchestrator();

    const auto status = orchestrator->status();
    EXPECT_EQ(status.pendingOutboxItemCount, 2);
    EXPECT_FALSE(status.hasResumableSession);
    EXPECT_FALSE(status.createdAt);
}

} // namespace healthsync::synchronization::tests
