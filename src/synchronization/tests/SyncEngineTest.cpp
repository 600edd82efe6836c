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

#include <synchronization/ConnectivityMonitor.h>
#include <synchronization/SyncEngine.h>
#include <synchronization/SyncEventsNotifier.h>
#include <synchronization/tests/mocks/MockIChunkTransmitter.h>
#include <synchronization/tests/mocks/MockISyncOrchestrator.h>

#include <healthsync/exception/InvalidArgument.h>
#include <healthsync/exception/RuntimeError.h>
#include <healthsync/synchronization/SyncSettings.h>
#include <healthsync/synchronization/tests/mocks/MockICredentialsStore.h>
#include <healthsync/threading/Future.h>

#include <QDir>
#include <QTemporaryDir>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

// clazy:excludeall=non-pod-global-static
// clazy:excludeall=returning-void-expression

namespace healthsync::synchronization::tests {

using namespace std::chrono_literals;

using testing::_;
using testing::AnyNumber;
using testing::Return;
using testing::StrictMock;

class SyncEngineTest : public testing::Test
{
protected:
    void SetUp() override
    {
        m_options.trackedTypes = QList<TrackedType>{
            QStringLiteral("steps"), QStringLiteral("sleep")};
        m_options.storageRootDirPath = m_temporaryDir.path();
        m_options.outboxRetryMinAge = 30s;

        // The engine cancels running sync on destruction
        EXPECT_CALL(*m_mockOrchestrator, cancelSync).Times(AnyNumber());
    }

    [[nodiscard]] std::shared_ptr<SyncEngine> createEngine()
    {
        auto notifier = std::make_unique<SyncEventsNotifier>();
        m_notifier = notifier.get();

        return std::make_shared<SyncEngine>(
            m_options, m_mockCredentialsStore, m_mockOrchestrator,
            m_mockChunkTransmitter, std::move(notifier));
    }

    [[nodiscard]] QString settingsFilePath() const
    {
        return QDir{m_temporaryDir.path()}.absoluteFilePath(
            QStringLiteral("settings.ini"));
    }

    void startBackgroundSync(SyncEngine & engine)
    {
        EXPECT_CALL(*m_mockCredentialsStore, credentials)
            .WillOnce(Return(tokenCredentials()));

        EXPECT_CALL(*m_mockOrchestrator, startSync(false, _))
            .WillOnce(Return(
                threading::makeReadyFuture(SyncOutcome::Completed)));

        engine.startBackgroundSync();
    }

protected:
    QTemporaryDir m_temporaryDir;
    SyncOptions m_options;
    SyncEventsNotifier * m_notifier = nullptr;

    const std::shared_ptr<mocks::MockICredentialsStore>
        m_mockCredentialsStore =
            std::make_shared<StrictMock<mocks::MockICredentialsStore>>();

    const std::shared_ptr<mocks::MockISyncOrchestrator> m_mockOrchestrator =
        std::make_shared<StrictMock<mocks::MockISyncOrchestrator>>();

    const std::shared_ptr<mocks::MockIChunkTransmitter>
        m_mockChunkTransmitter =
            std::make_shared<StrictMock<mocks::MockIChunkTransmitter>>();
};

TEST_F(SyncEngineTest, Ctor)
{
    EXPECT_NO_THROW(createEngine());
}

TEST_F(SyncEngineTest, CtorNullCredentialsStore)
{
    EXPECT_THROW(
        SyncEngine(
            m_options, nullptr, m_mockOrchestrator, m_mockChunkTransmitter,
            std::make_unique<SyncEventsNotifier>()),
        InvalidArgument);
}

TEST_F(SyncEngineTest, CtorNullOrchestrator)
{
    EXPECT_THROW(
        SyncEngine(
            m_options, m_mockCredentialsStore, nullptr,
            m_mockChunkTransmitter, std::make_unique<SyncEventsNotifier>()),
        InvalidArgument);
}

TEST_F(SyncEngineTest, CtorNullChunkTransmitter)
{
    EXPECT_THROW(
        SyncEngine(
            m_options, m_mockCredentialsStore, m_mockOrchestrator, nullptr,
            std::make_unique<SyncEventsNotifier>()),
        InvalidArgument);
}

TEST_F(SyncEngineTest, CtorNullNotifier)
{
    EXPECT_THROW(
        SyncEngine(
            m_options, m_mockCredentialsStore, m_mockOrchestrator,
            m_mockChunkTransmitter, nullptr),
        InvalidArgument);
}

TEST_F(SyncEngineTest, PersistTrackedTypes)
{
    const auto engine = createEngine();

    const SyncSettings settings{settingsFilePath()};
    EXPECT_EQ(settings.trackedTypes(), m_options.trackedTypes);
    EXPECT_FALSE(settings.isBackgroundSyncActive());
}

TEST_F(SyncEngineTest, RejectSignInWithInvalidCredentials)
{
    const auto engine = createEngine();

    auto credentials = tokenCredentials();
    credentials.accessToken.reset();

    auto future = engine->signIn(credentials);
    ASSERT_TRUE(future.isFinished());
    EXPECT_THROW(future.waitForFinished(), InvalidArgument);
}

TEST_F(SyncEngineTest, SignIn)
{
    const auto engine = createEngine();
    const auto credentials = tokenCredentials();

    EXPECT_CALL(*m_mockOrchestrator, cancelSync);
    EXPECT_CALL(*m_mockCredentialsStore, setCredentials(credentials));
    EXPECT_CALL(*m_mockOrchestrator, resetProgress)
        .WillOnce(Return(threading::makeReadyFuture()));

    auto future = engine->signIn(credentials);
    ASSERT_TRUE(future.isFinished());
    EXPECT_NO_THROW(future.waitForFinished());
}

TEST_F(SyncEngineTest, SignOut)
{
    const auto engine = createEngine();
    startBackgroundSync(*engine);
    ASSERT_TRUE(engine->isBackgroundSyncActive());

    EXPECT_CALL(*m_mockOrchestrator, resetProgress)
        .WillOnce(Return(threading::makeReadyFuture()));
    EXPECT_CALL(*m_mockCredentialsStore, clear);

    auto future = engine->signOut();
    EXPECT_FALSE(engine->isBackgroundSyncActive());
    EXPECT_FALSE(engine->connectivityMonitor()->isActive());

    waitForFuture(future);
    ASSERT_TRUE(future.isFinished());
    EXPECT_NO_THROW(future.waitForFinished());
}

TEST_F(SyncEngineTest, SignOutKeepsCredentialsIfResetFails)
{
    const auto engine = createEngine();

    EXPECT_CALL(*m_mockOrchestrator, resetProgress)
        .WillOnce(Return(threading::makeExceptionalFuture<void>(
            RuntimeError{ErrorString{"Failed to remove outbox"}})));

    auto future = engine->signOut();
    waitForFuture(future);

    ASSERT_TRUE(future.isFinished());
    EXPECT_THROW(future.waitForFinished(), RuntimeError);
}

TEST_F(SyncEngineTest, UpdateTokensRetriesPendingItems)
{
    const auto engine = createEngine();

    const std::optional<QString> refreshToken =
        QStringLiteral("new-refresh-token");

    EXPECT_CALL(
        *m_mockCredentialsStore,
        updateTokens(QStringLiteral("new-access-token"), refreshToken));

    EXPECT_CALL(*m_mockChunkTransmitter, retryPendingItems(30000ms))
        .WillOnce(Return(threading::makeReadyFuture(sweepResult(1))));

    engine->updateTokens(QStringLiteral("new-access-token"), refreshToken);
    spinEventLoop(50ms);
    EXPECT_FALSE(engine->connectivityMonitor()->wasDisconnected());
}

TEST_F(SyncEngineTest, FailedRetryOfPendingItemsMarksNetworkError)
{
    const auto engine = createEngine();

    EXPECT_CALL(
        *m_mockCredentialsStore,
        updateTokens(QStringLiteral("new-access-token"), _));

    EXPECT_CALL(*m_mockChunkTransmitter, retryPendingItems(30000ms))
        .WillOnce(Return(threading::makeReadyFuture(sweepResult(0, true))));

    engine->updateTokens(
        QStringLiteral("new-access-token"), std::optional<QString>{});
    spinEventLoop(50ms);

    // The next reconnect retries the outbox and resumes the sync
    EXPECT_TRUE(engine->connectivityMonitor()->wasDisconnected());
}

TEST_F(SyncEngineTest, BackgroundSyncRequiresCredentials)
{
    const auto engine = createEngine();

    EXPECT_CALL(*m_mockCredentialsStore, credentials)
        .WillOnce(Return(std::nullopt));

    engine->startBackgroundSync();
    EXPECT_FALSE(engine->isBackgroundSyncActive());
    EXPECT_FALSE(engine->connectivityMonitor()->isActive());
}

TEST_F(SyncEngineTest, StartAndStopBackgroundSync)
{
    const auto engine = createEngine();

    startBackgroundSync(*engine);
    EXPECT_TRUE(engine->isBackgroundSyncActive());
    EXPECT_TRUE(engine->connectivityMonitor()->isActive());
    EXPECT_TRUE(SyncSettings{settingsFilePath()}.isBackgroundSyncActive());

    EXPECT_CALL(*m_mockOrchestrator, cancelSync);

    engine->stopBackgroundSync();
    EXPECT_FALSE(engine->isBackgroundSyncActive());
    EXPECT_FALSE(engine->connectivityMonitor()->isActive());
    EXPECT_FALSE(SyncSettings{settingsFilePath()}.isBackgroundSyncActive());
}

TEST_F(SyncEngineTest, BackgroundSyncFlagSurvivesEngineRecreation)
{
    {
        const auto engine = createEngine();
        startBackgroundSync(*engine);
    }

    const auto engine = createEngine();
    EXPECT_TRUE(engine->isBackgroundSyncActive());
}

TEST_F(SyncEngineTest, SyncNowIsIncremental)
{
    const auto engine = createEngine();

    EXPECT_CALL(*m_mockOrchestrator, startSync(false, _))
        .WillOnce(
            Return(threading::makeReadyFuture(SyncOutcome::Completed)));

    auto future = engine->syncNow();
    ASSERT_TRUE(future.isFinished());
    EXPECT_EQ(future.result(), SyncOutcome::Completed);
}

TEST_F(SyncEngineTest, StartFullExport)
{
    const auto engine = createEngine();

    EXPECT_CALL(*m_mockOrchestrator, startSync(true, _))
        .WillOnce(Return(
            threading::makeReadyFuture(SyncOutcome::BudgetExhausted)));

    auto future = engine->startSync(true);
    ASSERT_TRUE(future.isFinished());
    EXPECT_EQ(future.result(), SyncOutcome::BudgetExhausted);
}

TEST_F(SyncEngineTest, ResumeSync)
{
    const auto engine = createEngine();

    EXPECT_CALL(*m_mockOrchestrator, resumeSync(_))
        .WillOnce(Return(
            threading::makeReadyFuture(SyncOutcome::NothingToResume)));

    auto future = engine->resumeSync();
    ASSERT_TRUE(future.isFinished());
    EXPECT_EQ(future.result(), SyncOutcome::NothingToResume);
}

TEST_F(SyncEngineTest, StopSync)
{
    const auto engine = createEngine();

    EXPECT_CALL(*m_mockOrchestrator, cancelSync);
    engine->stopSync();
}

TEST_F(SyncEngineTest, ResetProgressWithoutBackgroundSync)
{
    const auto engine = createEngine();

    EXPECT_CALL(*m_mockOrchestrator, resetProgress)
        .WillOnce(Return(threading::makeReadyFuture()));

    engine->resetProgress();
    spinEventLoop(50ms);
}

TEST_F(SyncEngineTest, ResetProgressWithBackgroundSyncStartsFullExport)
{
    const auto engine = createEngine();
    startBackgroundSync(*engine);

    EXPECT_CALL(*m_mockOrchestrator, resetProgress)
        .WillOnce(Return(threading::makeReadyFuture()));

    EXPECT_CALL(*m_mockOrchestrator, startSync(true, _))
        .WillOnce(
            Return(threading::makeReadyFuture(SyncOutcome::Completed)));

    engine->resetProgress();
    spinEventLoop(50ms);
}

TEST_F(SyncEngineTest, RequestSync)
{
    const auto engine = createEngine();

    EXPECT_CALL(*m_mockOrchestrator, requestSync);
    engine->requestSync();
}

TEST_F(SyncEngineTest, SetDataAvailable)
{
    const auto engine = createEngine();
    const auto * monitor = engine->connectivityMonitor();
    ASSERT_TRUE(monitor);

    engine->setDataAvailable(false);
    EXPECT_EQ(
        monitor->dataAvailability(),
        ConnectivityMonitor::DataAvailability::Unavailable);

    engine->setDataAvailable(true);
    EXPECT_EQ(
        monitor->dataAvailability(),
        ConnectivityMonitor::DataAvailability::Available);
}

TEST_F(SyncEngineTest, SyncFinishedReachesConnectivityMonitor)
{
    const auto engine = createEngine();
    ASSERT_TRUE(m_notifier);
    EXPECT_EQ(engine->notifier(), m_notifier);

    m_notifier->notifySyncFinished(SyncOutcome::DataUnavailable);

    const auto * monitor = engine->connectivityMonitor();
    EXPECT_TRUE(monitor->isDeferredResumePending());
    EXPECT_EQ(
        monitor->dataAvailability(),
        ConnectivityMonitor::DataAvailability::Unavailable);
}

TEST_F(SyncEngineTest, Status)
{
    const auto engine = createEngine();

    SyncStatus status;
    status.hasResumableSession = true;
    status.sentCount = 42;
    status.completedTypeCount = 1;

    EXPECT_CALL(*m_mockOrchestrator, status).WillOnce(Return(status));

    const auto result = engine->status();
    EXPECT_TRUE(result.hasResumableSession);
    EXPECT_EQ(result.sentCount, 42);
    EXPECT_EQ(result.completedTypeCount, 1);
}

} // namespace healthsync::synchronization::tests
