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

#include <healthsync/synchronization/ICredentialsStore.h>
#include <healthsync/utility/Fwd.h>

#include <QFuture>
#include <QMutex>

#include <memory>

namespace healthsync::synchronization {

/**
 * @brief ICredentialsStore implementation keeping access token, refresh token
 * and API key in the keychain and user id with host in the ini file.
 *
 * The keychain is asynchronous while ICredentialsStore is not, so the store
 * serves reads from the in-memory copy of credentials. The copy is filled
 * by restore() and kept in sync by writes; keychain writes complete in the
 * background.
 */
class KeychainCredentialsStore final :
    public ICredentialsStore,
    public std::enable_shared_from_this<KeychainCredentialsStore>
{
public:
    KeychainCredentialsStore(
        utility::IKeychainServicePtr keychainService,
        QString settingsFilePath);

    /**
     * Reads secrets of the persisted user from the keychain. Missing
     * entries are not an error, the corresponding secret stays absent.
     */
    [[nodiscard]] QFuture<void> restore();

    [[nodiscard]] std::optional<Credentials> credentials() const override;

    void setCredentials(Credentials credentials) override;

    void updateTokens(
        QString accessToken, std::optional<QString> refreshToken) override;

    void clear() override;

private:
    enum class Secret
    {
        AccessToken,
        RefreshToken,
        ApiKey
    };

    [[nodiscard]] QString keychainKey(
        const QString & userId, Secret secret) const;

    void persistSecret(
        const QString & userId, Secret secret,
        const std::optional<QString> & value);

    void deleteSecrets(const QString & userId);

private:
    const utility::IKeychainServicePtr m_keychainService;
    const QString m_settingsFilePath;

    mutable QMutex m_credentialsMutex;
    std::optional<Credentials> m_credentials;
};

} // namespace healthsync::synchronization
