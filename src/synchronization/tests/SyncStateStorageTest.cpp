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


#include <synchronization/SyncStateStorage.h>

#include <healthsync/exception/InvalidArgument.h>
#include <healthsync/synchronization/types/serialization/json/SyncState.h>

#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QTemporaryDir>

#include <gtest/gtest.h>

// clazy:excludeall=non-pod-global-static
// clazy:excludeall=returning-void-expression

namespace healthsync::synchronization::tests {

namespace {

[[nodiscard]] SyncState sampleSyncState(const QString & userKey)
{
    SyncState state;
    state.userKey = userKey;
    state.fullExport = true;
    state.createdAt = QDateTime::currentDateTime();
    state.currentTypeIndex = 1;

    auto & progress = state.progressFor(QStringLiteral("steps"));
    progress.sentCount = 42;
    progress.pendingCursor = QByteArray{"cursor"};

    state.totalSentCount = 42;
    return state;
}

void writeFile(const QString & filePath, const QByteArray & contents)
{
    ASSERT_TRUE(QDir{}.mkpath(QFileInfo{filePath}.absolutePath()));
    QFile file{filePath};
    ASSERT_TRUE(file.open(QIODevice::WriteOnly));
    ASSERT_EQ(file.write(contents), contents.size());
    file.close();
}

} // namespace

class SyncStateStorageTest : public testing::Test
{
protected:
    [[nodiscard]] QString stateFilePath(const QString & userKey) const
    {
        return m_tempDir.filePath(userKey + QStringLiteral("/state.json"));
    }

protected:
    QTemporaryDir m_tempDir;
};

TEST_F(SyncStateStorageTest, Ctor)
{
    EXPECT_NO_THROW(SyncStateStorage{QDir{m_tempDir.path()}});
}

TEST_F(SyncStateStorageTest, CtorEmptyRootDir)
{
    EXPECT_THROW(SyncStateStorage{QDir{QString{}}}, InvalidArgument);
}

TEST_F(SyncStateStorageTest, NoStateInitially)
{
    SyncStateStorage storage{QDir{m_tempDir.path()}};
    EXPECT_FALSE(storage.syncState(QStringLiteral("user.1")));
}

TEST_F(SyncStateStorageTest, SetAndGetSyncState)
{
    SyncStateStorage storage{QDir{m_tempDir.path()}};

    const auto state = sampleSyncState(QStringLiteral("user.1"));
    storage.setSyncState(state);

    const auto storedState = storage.syncState(QStringLiteral("user.1"));
    ASSERT_TRUE(storedState);
    EXPECT_EQ(*storedState, state);

    EXPECT_FALSE(storage.syncState(QStringLiteral("user.2")));
}

TEST_F(SyncStateStorageTest, StateSurvivesStorageRecreation)
{
    const auto state = sampleSyncState(QStringLiteral("user.1"));

    {
        SyncStateStorage storage{QDir{m_tempDir.path()}};
        storage.setSyncState(state);
    }

    SyncStateStorage storage{QDir{m_tempDir.path()}};
    const auto storedState = storage.syncState(QStringLiteral("user.1"));
    ASSERT_TRUE(storedState);
    EXPECT_EQ(*storedState, state);
}

TEST_F(SyncStateStorageTest, OverwriteSyncState)
{
    SyncStateStorage storage{QDir{m_tempDir.path()}};

    auto state = sampleSyncState(QStringLiteral("user.1"));
    storage.setSyncState(state);

    state.progressFor(QStringLiteral("steps")).sentCount = 100;
    state.totalSentCount = 100;
    state.completedTypes.insert(QStringLiteral("steps"));
    storage.setSyncState(state);

    const auto storedState = storage.syncState(QStringLiteral("user.1"));
    ASSERT_TRUE(storedState);
    EXPECT_EQ(*storedState, state);
}

TEST_F(SyncStateStorageTest, ClearSyncState)
{
    SyncStateStorage storage{QDir{m_tempDir.path()}};
    storage.setSyncState(sampleSyncState(QStringLiteral("user.1")));
    storage.setSyncState(sampleSyncState(QStringLiteral("user.2")));

    storage.clearSyncState(QStringLiteral("user.1"));

    EXPECT_FALSE(storage.syncState(QStringLiteral("user.1")));
    EXPECT_FALSE(QFile::exists(stateFilePath(QStringLiteral("user.1"))));
    EXPECT_TRUE(storage.syncState(QStringLiteral("user.2")));

    // Clearing non-existing state is fine
    EXPECT_NO_THROW(storage.clearSyncState(QStringLiteral("user.3")));
}

TEST_F(SyncStateStorageTest, DiscardStateOfAnotherUser)
{
    const QJsonDocument doc{
        serializeSyncStateToJson(sampleSyncState(QStringLiteral("user.2")))};
    writeFile(stateFilePath(QStringLiteral("user.1")), doc.toJson());

    SyncStateStorage storage{QDir{m_tempDir.path()}};
    EXPECT_FALSE(storage.syncState(QStringLiteral("user.1")));
    EXPECT_FALSE(QFile::exists(stateFilePath(QStringLiteral("user.1"))));
}

TEST_F(SyncStateStorageTest, DiscardCorruptedState)
{
    writeFile(
        stateFilePath(QStringLiteral("user.1")),
        QByteArray{"{\"userKey\": \"user.1\", \"fullExp"});

    SyncStateStorage storage{QDir{m_tempDir.path()}};
    EXPECT_FALSE(storage.syncState(QStringLiteral("user.1")));
    EXPECT_FALSE(QFile::exists(stateFilePath(QStringLiteral("user.1"))));
}

TEST_F(SyncStateStorageTest, DiscardStateWithMissingFields)
{
    writeFile(
        stateFilePath(QStringLiteral("user.1")),
        QByteArray{"{\"userKey\": \"user.1\", \"fullExport\": true}"});

    SyncStateStorage storage{QDir{m_tempDir.path()}};
    EXPECT_FALSE(storage.syncState(QStringLiteral("user.1")));
    EXPECT_FALSE(QFile::exists(stateFilePath(QStringLiteral("user.1"))));
}

} // namespace healthsync::synchronization::tests
