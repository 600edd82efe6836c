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


#include "KeychainCredentialsStore.h"
#include "Utils.h"

#include <healthsync/exception/InvalidArgument.h>
#include <healthsync/logging/HealthSyncLogger.h>
#include <healthsync/threading/Future.h>
#include <healthsync/threading/QtFutureContinuations.h>
#include <healthsync/utility/IKeychainService.h>

#include <QMutexLocker>
#include <QPromise>
#include <QSettings>
#include <QThread>

#include <array>
#include <string_view>
#include <utility>

namespace healthsync::synchronization {

using namespace std::string_view_literals;

namespace {

constexpr auto gCredentialsGroup = "Credentials"sv;
constexpr auto gUserIdKey = "userId"sv;
constexpr auto gHostKey = "host"sv;

[[nodiscard]] QString settingsKey(const std::string_view key)
{
    return toString(gCredentialsGroup) + QStringLiteral("/") + toString(key);
}

[[nodiscard]] std::optional<QString> nonEmpty(std::optional<QString> value)
{
    if (value && value->isEmpty()) {
        return std::nullopt;
    }
    return value;
}

} // namespace

KeychainCredentialsStore::KeychainCredentialsStore(
    utility::IKeychainServicePtr keychainService, QString settingsFilePath) :
    m_keychainService{std::move(keychainService)},
    m_settingsFilePath{std::move(settingsFilePath)}
{
    if (Q_UNLIKELY(!m_keychainService)) {
        throw InvalidArgument{ErrorString{QStringLiteral(
            "KeychainCredentialsStore ctor: keychain service is null")}};
    }

    if (Q_UNLIKELY(m_settingsFilePath.isEmpty())) {
        throw InvalidArgument{ErrorString{QStringLiteral(
            "KeychainCredentialsStore ctor: settings file path is empty")}};
    }
}

QFuture<void> KeychainCredentialsStore::restore()
{
    const QSettings settings{m_settingsFilePath, QSettings::IniFormat};
    const QString userId = settings.value(settingsKey(gUserIdKey)).toString();
    if (userId.isEmpty()) {
        HSDEBUG(
            "synchronization::KeychainCredentialsStore",
            "No persisted credentials");
        return threading::makeReadyFuture();
    }

    auto restored = std::make_shared<Credentials>();
    restored->userId = userId;
    restored->host = settings.value(settingsKey(gHostKey)).toString();

    auto promise = std::make_shared<QPromise<void>>();
    auto future = promise->future();
    promise->start();

    constexpr std::array<Secret, 3> secrets{
        Secret::AccessToken, Secret::RefreshToken, Secret::ApiKey};

    auto pendingReadCount = std::make_shared<int>(
        static_cast<int>(secrets.size()));

    const auto selfWeak = weak_from_this();
    auto * currentThread = QThread::currentThread();

    // All reads are finished in the current thread so the counter and
    // the restored credentials need no synchronization
    auto onReadFinished = [selfWeak, promise, restored, pendingReadCount] {
        if (--(*pendingReadCount) > 0) {
            return;
        }

        if (const auto self = selfWeak.lock()) {
            HSDEBUG(
                "synchronization::KeychainCredentialsStore",
                "Restored credentials: " << *restored);

            const QMutexLocker locker{&self->m_credentialsMutex};
            self->m_credentials = *restored;
        }

        promise->finish();
    };

    for (const auto secret: secrets) {
        auto readFuture =
            m_keychainService->readSecret(keychainKey(userId, secret));

        auto thenFuture = threading::then(
            std::move(readFuture), currentThread,
            [restored, secret, onReadFinished](QString value) {
                switch (secret) {
                case Secret::AccessToken:
                    restored->accessToken = std::move(value);
                    break;
                case Secret::RefreshToken:
                    restored->refreshToken = std::move(value);
                    break;
                case Secret::ApiKey:
                    restored->apiKey = std::move(value);
                    break;
                }
                onReadFinished();
            });

        threading::onFailed(
            std::move(thenFuture), currentThread,
            [onReadFinished](const QException & e) {
                const auto * keychainException =
                    dynamic_cast<const utility::IKeychainService::Exception *>(
                        &e);
                if (!keychainException ||
                    keychainException->errorCode() !=
                        utility::IKeychainService::ErrorCode::EntryNotFound)
                {
                    HSWARNING(
                        "synchronization::KeychainCredentialsStore",
                        "Failed to read secret from the keychain: "
                            << e.what());
                }
                onReadFinished();
            });
    }

    return future;
}

std::optional<Credentials> KeychainCredentialsStore::credentials() const
{
    const QMutexLocker locker{&m_credentialsMutex};
    return m_credentials;
}

void KeychainCredentialsStore::setCredentials(Credentials credentials)
{
    credentials.accessToken = nonEmpty(std::move(credentials.accessToken));
    credentials.refreshToken = nonEmpty(std::move(credentials.refreshToken));
    credentials.apiKey = nonEmpty(std::move(credentials.apiKey));

    std::optional<Credentials> previous;
    {
        const QMutexLocker locker{&m_credentialsMutex};
        previous = std::exchange(m_credentials, credentials);
    }

    if (previous && previous->userId != credentials.userId) {
        deleteSecrets(previous->userId);
    }

    QSettings settings{m_settingsFilePath, QSettings::IniFormat};
    settings.setValue(settingsKey(gUserIdKey), credentials.userId);
    settings.setValue(settingsKey(gHostKey), credentials.host);
    settings.sync();

    if (Q_UNLIKELY(settings.status() != QSettings::NoError)) {
        HSWARNING(
            "synchronization::KeychainCredentialsStore",
            "Failed to persist user id and host to " << m_settingsFilePath);
    }

    persistSecret(
        credentials.userId, Secret::AccessToken, credentials.accessToken);
    persistSecret(
        credentials.userId, Secret::RefreshToken, credentials.refreshToken);
    persistSecret(credentials.userId, Secret::ApiKey, credentials.apiKey);
}

void KeychainCredentialsStore::updateTokens(
    QString accessToken, std::optional<QString> refreshToken)
{
    QString userId;
    {
        const QMutexLocker locker{&m_credentialsMutex};
        if (!m_credentials) {
            HSDEBUG(
                "synchronization::KeychainCredentialsStore",
                "Ignoring tokens update: no stored credentials");
            return;
        }

        m_credentials->accessToken = nonEmpty(std::move(accessToken));
        if (refreshToken) {
            m_credentials->refreshToken = nonEmpty(std::move(refreshToken));
        }

        userId = m_credentials->userId;
        accessToken = m_credentials->accessToken.value_or(QString{});
        refreshToken = m_credentials->refreshToken;
    }

    persistSecret(userId, Secret::AccessToken, nonEmpty(accessToken));
    persistSecret(userId, Secret::RefreshToken, refreshToken);
}

void KeychainCredentialsStore::clear()
{
    std::optional<Credentials> previous;
    {
        const QMutexLocker locker{&m_credentialsMutex};
        previous = std::exchange(m_credentials, std::nullopt);
    }

    QSettings settings{m_settingsFilePath, QSettings::IniFormat};
    settings.remove(toString(gCredentialsGroup));
    settings.sync();

    if (previous) {
        deleteSecrets(previous->userId);
    }
}

QString KeychainCredentialsStore::keychainKey(
    const QString & userId, const Secret secret) const
{
    QString name;
    switch (secret) {
    case Secret::AccessToken:
        name = QStringLiteral("accessToken");
        break;
    case Secret::RefreshToken:
        name = QStringLiteral("refreshToken");
        break;
    case Secret::ApiKey:
        name = QStringLiteral("apiKey");
        break;
    }

    return userKey(userId) + QStringLiteral("/") + name;
}

void KeychainCredentialsStore::persistSecret(
    const QString & userId, const Secret secret,
    const std::optional<QString> & value)
{
    const auto key = keychainKey(userId, secret);

    if (!value) {
        auto deleteFuture = m_keychainService->deleteSecret(key);
        threading::onFailed(
            std::move(deleteFuture), [key](const QException & e) {
                HSDEBUG(
                    "synchronization::KeychainCredentialsStore",
                    "Failed to delete " << key
                                        << " from the keychain: " << e.what());
            });
        return;
    }

    auto writeFuture = m_keychainService->writeSecret(key, *value);
    threading::onFailed(std::move(writeFuture), [key](const QException & e) {
        HSWARNING(
            "synchronization::KeychainCredentialsStore",
            "Failed to write " << key << " to the keychain: " << e.what());
    });
}

void KeychainCredentialsStore::deleteSecrets(const QString & userId)
{
    persistSecret(userId, Secret::AccessToken, std::nullopt);
    persistSecret(userId, Secret::RefreshToken, std::nullopt);
    persistSecret(userId, Secret::ApiKey, std::nullopt);
}

} // namespace healthsync::synchronization
