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

#include <healthsync/utility/IKeychainService.h>

namespace QKeychain {

class Job;

} // namespace QKeychain

namespace healthsync::utility::keychain {

/**
 * IKeychainService implementation on top of QtKeychain, i.e. macOS/iOS
 * Keychain, Windows Credential Store or Secret Service on Linux
 */
class QtKeychainService final : public IKeychainService
{
public:
    explicit QtKeychainService(QString serviceName);
    ~QtKeychainService() noexcept override;

    [[nodiscard]] QFuture<void> writeSecret(
        QString key, QString secret) override;

    [[nodiscard]] QFuture<QString> readSecret(QString key) const override;

    [[nodiscard]] QFuture<void> deleteSecret(QString key) override;

private:
    const QString m_serviceName;
};

} // namespace healthsync::utility::keychain
