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

#include <healthsync/exception/InvalidArgument.h>
#include <healthsync/synchronization/Factory.h>
#include <healthsync/synchronization/ICredentialsStore.h>
#include <healthsync/synchronization/ISyncEngine.h>
#include <healthsync/synchronization/ISyncStateStorage.h>
#include <healthsync/synchronization/tests/mocks/MockICredentialsStore.h>
#include <healthsync/synchronization/tests/mocks/MockIDataProvider.h>
#include <healthsync/utility/Factory.h>
#include <healthsync/utility/tests/mocks/MockIKeychainService.h>

#include <QDir>
#include <QSettings>
#include <QTemporaryDir>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

// clazy:excludeall=non-pod-global-static
// clazy:excludeall=returning-void-expression

namespace healthsync::synchronization::tests {

using testing::StrictMock;

class FactoryTest : public testing::Test
{
protected:
    void SetUp() override
    {
        m_options.trackedTypes =
            QList<TrackedType>{QStringLiteral("heartRate")};
        m_options.storageRootDirPath = QDir{m_temporaryDir.path()}.filePath(
            QStringLiteral("storage"));
    }

    [[nodiscard]] QString settingsFilePath() const
    {
        return QDir{m_temporaryDir.path()}.absoluteFilePath(
            QStringLiteral("credentials.ini"));
    }

protected:
    QTemporaryDir m_temporaryDir;
    SyncOptions m_options;

    const std::shared_ptr<mocks::MockIDataProvider> m_mockDataProvider =
        std::make_shared<StrictMock<mocks::MockIDataProvider>>();

    const std::shared_ptr<mocks::MockICredentialsStore>
        m_mockCredentialsStore =
            std::make_shared<StrictMock<mocks::MockICredentialsStore>>();
};

TEST_F(FactoryTest, CreateSyncEngine)
{
    ISyncEnginePtr engine;
    EXPECT_NO_THROW(
        engine = createSyncEngine(
            m_options, m_mockDataProvider, m_mockCredentialsStore));

    ASSERT_TRUE(engine);
    EXPECT_TRUE(QDir{m_options.storageRootDirPath}.exists());
    EXPECT_FALSE(engine->isBackgroundSyncActive());
    EXPECT_NE(engine->notifier(), nullptr);
}

TEST_F(FactoryTest, CreateSyncEngineNullDataProvider)
{
    EXPECT_THROW(
        Q_UNUSED(createSyncEngine(m_options, nullptr, m_mockCredentialsStore)),
        InvalidArgument);
}

TEST_F(FactoryTest, CreateSyncEngineNullCredentialsStore)
{
    EXPECT_THROW(
        Q_UNUSED(createSyncEngine(m_options, m_mockDataProvider, nullptr)),
        InvalidArgument);
}

TEST_F(FactoryTest, CreateKeychainCredentialsStoreWithoutPersistedUser)
{
    const auto mockKeychainService = std::make_shared<
        StrictMock<utility::tests::mocks::MockIKeychainService>>();

    auto future = createKeychainCredentialsStore(
        QStringLiteral("org.example.healthsync"), settingsFilePath(),
        mockKeychainService);

    waitForFuture(future);
    ASSERT_TRUE(future.isFinished());
    ASSERT_EQ(future.resultCount(), 1);

    const auto store = future.result();
    ASSERT_TRUE(store);
    EXPECT_FALSE(store->credentials());
}

// Without persisted user the system keychain is not queried
TEST_F(FactoryTest, CreateKeychainCredentialsStoreWithSystemKeychain)
{
    auto future = createKeychainCredentialsStore(
        QStringLiteral("org.example.healthsync"), settingsFilePath());

    waitForFuture(future);
    ASSERT_EQ(future.resultCount(), 1);
    ASSERT_TRUE(future.result());
    EXPECT_FALSE(future.result()->credentials());
}

TEST_F(FactoryTest, CreateKeychainCredentialsStoreEmptyServiceName)
{
    EXPECT_THROW(
        Q_UNUSED(createKeychainCredentialsStore(QString{}, settingsFilePath())),
        InvalidArgument);
}

TEST_F(FactoryTest, NewQtKeychainService)
{
    const auto keychainService =
        utility::newQtKeychainService(QStringLiteral("org.example.healthsync"));
    EXPECT_TRUE(keychainService);

    EXPECT_THROW(
        Q_UNUSED(utility::newQtKeychainService(QString{})), InvalidArgument);
}

TEST_F(FactoryTest, CreateSyncStateStorage)
{
    const auto storage = createSyncStateStorage(m_temporaryDir.path());
    ASSERT_TRUE(storage);
}

} // namespace healthsync::synchronization::tests
