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

#include <synchronization/ChunkTransmitter.h>
#include <synchronization/CursorStorage.h>
#include <synchronization/OutboxStorage.h>
#include <synchronization/SyncEventsNotifier.h>
#include <synchronization/SyncOrchestrator.h>
#include <synchronization/SyncStateStorage.h>
#include <synchronization/TokenRefreshCoordinator.h>
#include <synchronization/TypeStreamer.h>
#include <synchronization/Utils.h>
#include <synchronization/tests/mocks/MockINetworkClient.h>

#include <healthsync/synchronization/tests/mocks/MockICredentialsStore.h>
#include <healthsync/synchronization/tests/mocks/MockIDataProvider.h>
#include <healthsync/synchronization/types/SyncOptionsBuilder.h>
#include <healthsync/threading/Future.h>

#include <QHash>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QPromise>
#include <QSet>
#include <QTemporaryDir>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <optional>

// clazy:excludeall=non-pod-global-static
// clazy:excludeall=returning-void-expression

namespace healthsync::synchronization::tests {

using namespace std::chrono_literals;

using testing::_;
using testing::AnyNumber;
using testing::StrictMock;

namespace {

const TrackedType gStepsType =
    QStringLiteral("HKQuantityTypeIdentifierStepCount");

const TrackedType gHeartRateType =
    QStringLiteral("HKQuantityTypeIdentifierHeartRate");

const TrackedType gSleepType =
    QStringLiteral("HKCategoryTypeIdentifierSleepAnalysis");

constexpr int gChunkSize = 10;

[[nodiscard]] QString recordId(const TrackedType & type, const int index)
{
    return shortTypeName(type) + QStringLiteral("-") + QString::number(index);
}

[[nodiscard]] QByteArray headerValue(
    const NetworkRequest & request, const QByteArray & name)
{
    for (const auto & header: std::as_const(request.headers)) {
        if (header.first == name) {
            return header.second;
        }
    }
    return {};
}

[[nodiscard]] QStringList uploadedRecordIds(const NetworkRequest & request)
{
    const auto payload = QJsonDocument::fromJson(request.body).object();
    const auto records = payload[QStringLiteral("data")]
                             .toObject()[QStringLiteral("records")]
                             .toArray();

    QStringList ids;
    for (const auto & record: records) {
        ids << record.toObject()[QStringLiteral("id")].toString();
    }
    return ids;
}

} // namespace

/**
 * Runs the real sync pipeline over files in a temporary directory. Health
 * data comes from a scripted data provider and uploads go to an in-memory
 * server behind the network client.
 */
class SyncIntegrationTest : public testing::Test
{
protected:
    void SetUp() override
    {
        m_options =
            SyncOptionsBuilder{}
                .setTrackedTypes({gStepsType, gHeartRateType, gSleepType})
                .setForegroundChunkSize(gChunkSize)
                .setBackgroundChunkSize(gChunkSize)
                .setStorageRootDirPath(m_tempDir.path())
                .build();

        m_credentials = tokenCredentials();

        m_recordCounts[gStepsType] = 15;
        m_recordCounts[gHeartRateType] = 20;
        m_recordCounts[gSleepType] = 5;

        EXPECT_CALL(*m_mockCredentialsStore, credentials)
            .WillRepeatedly([this] {
                return std::optional<Credentials>{m_credentials};
            });

        EXPECT_CALL(*m_mockCredentialsStore, updateTokens)
            .Times(AnyNumber())
            .WillRepeatedly([this](
                                QString accessToken,
                                std::optional<QString> refreshToken) {
                m_credentials.accessToken = std::move(accessToken);
                if (refreshToken) {
                    m_credentials.refreshToken = std::move(refreshToken);
                }
            });

        EXPECT_CALL(*m_mockDataProvider, query)
            .WillRepeatedly([this](
                                const TrackedType & type,
                                const std::optional<Cursor> & cursor,
                                const int limit) {
                return threading::makeReadyFuture(
                    queryRecords(type, cursor, limit));
            });

        EXPECT_CALL(*m_mockNetworkClient, post)
            .WillRepeatedly([this](const NetworkRequest & request) {
                return handleRequest(request);
            });

        EXPECT_CALL(*m_mockNetworkClient, abortAll)
            .Times(AnyNumber())
            .WillRepeatedly([this] { abortPendingRequests(); });

        createComponents();
    }

    void TearDown() override
    {
        destroyComponents();
    }

    // Opens the storages from disk and wires the pipeline as a fresh
    // process would
    void createComponents()
    {
        const QDir rootDir{m_tempDir.path()};
        m_syncStateStorage = std::make_shared<SyncStateStorage>(rootDir);
        m_cursorStorage = std::make_shared<CursorStorage>(rootDir);
        m_outboxStorage = std::make_shared<OutboxStorage>(rootDir);

        m_tokenRefreshCoordinator = std::make_shared<TokenRefreshCoordinator>(
            m_mockCredentialsStore, m_mockNetworkClient,
            m_options.refreshPath);

        m_chunkTransmitter = std::make_shared<ChunkTransmitter>(
            m_outboxStorage, m_cursorStorage, m_mockNetworkClient,
            m_tokenRefreshCoordinator, m_mockCredentialsStore,
            m_options.syncPathTemplate, m_options.apiKeyHeaderName);

        m_typeStreamer = std::make_shared<TypeStreamer>(
            m_mockDataProvider, m_chunkTransmitter, m_cursorStorage,
            &m_notifier);

        m_orchestrator = std::make_shared<SyncOrchestrator>(
            m_options, m_mockCredentialsStore, m_syncStateStorage,
            m_cursorStorage, m_outboxStorage, m_typeStreamer,
            m_mockNetworkClient, &m_notifier);
    }

    void destroyComponents()
    {
        m_orchestrator.reset();
        m_typeStreamer.reset();
        m_chunkTransmitter.reset();
        m_tokenRefreshCoordinator.reset();
        m_outboxStorage.reset();
        m_cursorStorage.reset();
        m_syncStateStorage.reset();
    }

    [[nodiscard]] SyncOutcome waitForOutcome(QFuture<SyncOutcome> future)
    {
        waitForFuture(future);
        EXPECT_TRUE(future.isFinished());
        EXPECT_EQ(future.resultCount(), 1);
        return future.resultCount() == 1 ? future.result()
                                         : SyncOutcome::StorageFailure;
    }

    [[nodiscard]] QSet<QString> allRecordIds() const
    {
        QSet<QString> ids;
        for (auto it = m_recordCounts.constBegin(),
                  end = m_recordCounts.constEnd();
             it != end; ++it)
        {
            for (int i = 0; i < it.value(); ++i) {
                ids.insert(recordId(it.key(), i));
            }
        }
        return ids;
    }

    [[nodiscard]] int uploadCount(const QString & id) const
    {
        return static_cast<int>(m_uploadedIds.count(id));
    }

    void expectNoDuplicateUploads() const
    {
        for (const auto & id: std::as_const(m_uploadedIds)) {
            EXPECT_EQ(uploadCount(id), 1) << id.toStdString();
        }
    }

private:
    // Cursor of the scripted provider is the offset of the next record
    [[nodiscard]] DataBatch queryRecords(
        const TrackedType & type, const std::optional<Cursor> & cursor,
        const int limit) const
    {
        const int total = m_recordCounts.value(type);
        const int offset = cursor ? cursor->toInt() : 0;
        const int end = qMin(total, offset + limit);

        DataBatch batch;
        for (int i = offset; i < end; ++i) {
            DataRecord record;
            record.json[QStringLiteral("id")] = recordId(type, i);
            record.json[QStringLiteral("value")] = i;
            batch.records << record;
        }

        batch.newCursor = QByteArray::number(qMax(offset, end));
        return batch;
    }

    [[nodiscard]] QFuture<NetworkResponse> handleRequest(
        const NetworkRequest & request)
    {
        ++m_requestCount;

        if (request.url.path().endsWith(m_options.refreshPath)) {
            return handleRefresh();
        }

        const auto authorization =
            headerValue(request, QByteArrayLiteral("Authorization"));
        if (authorization !=
            QByteArrayLiteral("Bearer ") + m_serverAccessToken.toUtf8())
        {
            return threading::makeReadyFuture(httpResponse(401));
        }

        const int uploadIndex = m_uploadAttempts++;
        const auto ids = uploadedRecordIds(request);

        if (uploadIndex == m_failingUploadIndex) {
            // The server may have stored the chunk before the connection
            // dropped
            if (m_storeFailingUpload) {
                m_uploadedIds << ids;
            }
            return threading::makeReadyFuture(
                noResponse(QStringLiteral("Connection reset by peer")));
        }

        m_uploadedIds << ids;
        return threading::makeReadyFuture(httpResponse(200));
    }

    [[nodiscard]] QFuture<NetworkResponse> handleRefresh()
    {
        ++m_refreshRequestCount;

        if (m_holdRefresh) {
            m_pendingRefresh = std::make_shared<QPromise<NetworkResponse>>();
            m_pendingRefresh->start();
            return m_pendingRefresh->future();
        }

        QJsonObject body;
        body[QStringLiteral("access_token")] = m_serverAccessToken;
        return threading::makeReadyFuture(httpResponse(
            200, QJsonDocument{body}.toJson(QJsonDocument::Compact)));
    }

    void abortPendingRequests()
    {
        if (!m_pendingRefresh) {
            return;
        }

        const auto promise = std::move(m_pendingRefresh);
        m_pendingRefresh.reset();
        promise->addResult(abortedResponse());
        promise->finish();
    }

protected:
    QTemporaryDir m_tempDir;
    const QString m_userKey = userKey(QStringLiteral("user-1"));

    SyncOptions m_options;
    SyncEventsNotifier m_notifier;
    Credentials m_credentials;

    QHash<TrackedType, int> m_recordCounts;

    // Server side state
    QString m_serverAccessToken = QStringLiteral("access-token");
    QStringList m_uploadedIds;
    int m_requestCount = 0;
    int m_uploadAttempts = 0;
    int m_failingUploadIndex = -1;
    bool m_storeFailingUpload = false;
    int m_refreshRequestCount = 0;
    bool m_holdRefresh = false;
    std::shared_ptr<QPromise<NetworkResponse>> m_pendingRefresh;

    std::shared_ptr<SyncStateStorage> m_syncStateStorage;
    std::shared_ptr<CursorStorage> m_cursorStorage;
    std::shared_ptr<OutboxStorage> m_outboxStorage;
    std::shared_ptr<TokenRefreshCoordinator> m_tokenRefreshCoordinator;
    std::shared_ptr<ChunkTransmitter> m_chunkTransmitter;
    std::shared_ptr<TypeStreamer> m_typeStreamer;
    std::shared_ptr<SyncOrchestrator> m_orchestrator;

    const std::shared_ptr<mocks::MockICredentialsStore>
        m_mockCredentialsStore =
            std::make_shared<StrictMock<mocks::MockICredentialsStore>>();

    const std::shared_ptr<mocks::MockIDataProvider> m_mockDataProvider =
        std::make_shared<StrictMock<mocks::MockIDataProvider>>();

    const std::shared_ptr<mocks::MockINetworkClient> m_mockNetworkClient =
        std::make_shared<StrictMock<mocks::MockINetworkClient>>();
};

TEST_F(SyncIntegrationTest, FullExportUploadsEveryRecordOnce)
{
    EXPECT_EQ(
        waitForOutcome(m_orchestrator->startSync(true, nullptr)),
        SyncOutcome::Completed);

    EXPECT_EQ(QSet<QString>(m_uploadedIds.begin(), m_uploadedIds.end()),
              allRecordIds());
    expectNoDuplicateUploads();

    EXPECT_TRUE(m_cursorStorage->isFullExportDone(m_userKey));
    EXPECT_EQ(
        m_cursorStorage->cursor(m_userKey, gStepsType), QByteArray{"15"});
    EXPECT_EQ(
        m_cursorStorage->cursor(m_userKey, gHeartRateType), QByteArray{"20"});
    EXPECT_EQ(
        m_cursorStorage->cursor(m_userKey, gSleepType), QByteArray{"5"});

    EXPECT_FALSE(m_orchestrator->hasResumableSession());
    EXPECT_EQ(m_outboxStorage->size(m_userKey), 0);
}

TEST_F(SyncIntegrationTest, NetworkFailureAfterFirstTypeResumesRemainingTypes)
{
    // Steps take two uploads, the first upload of heart rate fails
    m_failingUploadIndex = 2;

    EXPECT_EQ(
        waitForOutcome(m_orchestrator->startSync(true, nullptr)),
        SyncOutcome::Interrupted);

    EXPECT_TRUE(m_orchestrator->hasResumableSession());
    EXPECT_EQ(m_uploadedIds.size(), 15);
    EXPECT_EQ(
        m_cursorStorage->cursor(m_userKey, gStepsType), QByteArray{"15"});
    EXPECT_FALSE(m_cursorStorage->cursor(m_userKey, gHeartRateType));

    // Process restart
    destroyComponents();
    createComponents();

    EXPECT_TRUE(m_orchestrator->hasResumableSession());
    EXPECT_EQ(
        waitForOutcome(m_orchestrator->resumeSync(nullptr)),
        SyncOutcome::Completed);

    EXPECT_EQ(QSet<QString>(m_uploadedIds.begin(), m_uploadedIds.end()),
              allRecordIds());
    expectNoDuplicateUploads();

    EXPECT_TRUE(m_cursorStorage->isFullExportDone(m_userKey));
    EXPECT_FALSE(m_orchestrator->hasResumableSession());
}

TEST_F(SyncIntegrationTest, ResumeAfterLostAcknowledgementKeepsRemoteRecordSet)
{
    // The server stores the second heart rate chunk but the response is lost
    m_failingUploadIndex = 3;
    m_storeFailingUpload = true;

    EXPECT_EQ(
        waitForOutcome(m_orchestrator->startSync(true, nullptr)),
        SyncOutcome::Interrupted);

    // Only the acknowledged chunk of heart rate has its cursor committed
    EXPECT_EQ(
        m_cursorStorage->cursor(m_userKey, gHeartRateType), QByteArray{"10"});
    EXPECT_EQ(m_outboxStorage->size(m_userKey), 1);

    destroyComponents();
    createComponents();

    EXPECT_EQ(
        waitForOutcome(m_orchestrator->resumeSync(nullptr)),
        SyncOutcome::Completed);

    // Redelivery of the stale outbox item is absorbed by the server
    auto sweepFuture = m_chunkTransmitter->retryPendingItems(0ms);
    waitForFuture(sweepFuture);
    ASSERT_EQ(sweepFuture.resultCount(), 1);
    EXPECT_FALSE(sweepFuture.result().networkFailure);
    EXPECT_EQ(m_outboxStorage->size(m_userKey), 0);

    EXPECT_EQ(QSet<QString>(m_uploadedIds.begin(), m_uploadedIds.end()),
              allRecordIds());

    // Nothing acknowledged before the interruption was sent again
    for (int i = 0; i < 15; ++i) {
        EXPECT_EQ(uploadCount(recordId(gStepsType, i)), 1);
    }
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(uploadCount(recordId(gHeartRateType, i)), 1);
    }
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(uploadCount(recordId(gSleepType, i)), 1);
    }

    EXPECT_EQ(
        m_cursorStorage->cursor(m_userKey, gHeartRateType), QByteArray{"20"});
}

TEST_F(SyncIntegrationTest, ExpiredTokenIsRefreshedAndUploadRetried)
{
    m_recordCounts[gStepsType] = 5;
    m_recordCounts[gHeartRateType] = 0;
    m_recordCounts[gSleepType] = 0;

    // The server no longer accepts the stored access token
    m_serverAccessToken = QStringLiteral("new-access-token");

    int authenticationFailures = 0;
    QObject::connect(
        &m_notifier, &SyncEventsNotifier::authenticationFailed, &m_notifier,
        [&authenticationFailures] { ++authenticationFailures; });

    EXPECT_EQ(
        waitForOutcome(m_orchestrator->startSync(true, nullptr)),
        SyncOutcome::Completed);

    // Rejected upload, refresh request and retried upload
    EXPECT_EQ(m_requestCount, 3);
    EXPECT_EQ(m_refreshRequestCount, 1);
    EXPECT_EQ(m_uploadAttempts, 1);
    EXPECT_EQ(m_uploadedIds.size(), 5);
    EXPECT_EQ(m_credentials.accessToken, QStringLiteral("new-access-token"));
    EXPECT_EQ(authenticationFailures, 0);
    EXPECT_EQ(m_outboxStorage->size(m_userKey), 0);
}

TEST_F(SyncIntegrationTest, CancelDuringTokenRefreshCancelsSync)
{
    m_serverAccessToken = QStringLiteral("new-access-token");
    m_holdRefresh = true;

    int authenticationFailures = 0;
    QObject::connect(
        &m_notifier, &SyncEventsNotifier::authenticationFailed, &m_notifier,
        [&authenticationFailures] { ++authenticationFailures; });

    auto future = m_orchestrator->startSync(true, nullptr);

    spinEventLoop(100ms);
    ASSERT_EQ(m_refreshRequestCount, 1);
    ASSERT_TRUE(m_pendingRefresh);
    EXPECT_FALSE(future.isFinished());

    m_orchestrator->cancelSync();

    EXPECT_EQ(waitForOutcome(std::move(future)), SyncOutcome::Canceled);
    EXPECT_EQ(authenticationFailures, 0);

    // Credentials and the staged chunk survive for the next attempt
    EXPECT_EQ(m_credentials.accessToken, QStringLiteral("access-token"));
    EXPECT_EQ(m_outboxStorage->size(m_userKey), 1);
    EXPECT_FALSE(m_orchestrator->isSyncing());
    EXPECT_TRUE(m_uploadedIds.isEmpty());
}

} // namespace healthsync::synchronization::tests
