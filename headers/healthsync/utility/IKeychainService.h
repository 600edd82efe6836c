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

#include <healthsync/exception/IHealthSyncException.h>
#include <healthsync/types/ErrorString.h>
#include <healthsync/utility/Fwd.h>
#include <healthsync/utility/Linkage.h>

#include <QFuture>

class QDebug;

namespace healthsync::utility {

/**
 * @brief The IKeychainService interface is the asynchronous storage of
 * secrets such as access tokens and API keys. Each instance works with the
 * secrets of a single service so only the key identifies a secret.
 */
class HEALTHSYNC_EXPORT IKeychainService
{
public:
    virtual ~IKeychainService() noexcept;

    enum class ErrorCode
    {
        /**
         * There is no secret stored under the key
         */
        EntryNotFound,
        /**
         * The keychain refused the access, either by itself or because the
         * user rejected the request
         */
        AccessDenied,
        NoBackendAvailable,
        OtherError
    };

    friend HEALTHSYNC_EXPORT QTextStream & operator<<(
        QTextStream & strm, ErrorCode errorCode);

    friend HEALTHSYNC_EXPORT QDebug & operator<<(
        QDebug & dbg, ErrorCode errorCode);

    /**
     * Exception put into futures returned from IKeychainService methods
     */
    class HEALTHSYNC_EXPORT Exception : public IHealthSyncException
    {
    public:
        explicit Exception(ErrorCode errorCode);
        Exception(ErrorCode errorCode, ErrorString errorDescription);

        [[nodiscard]] ErrorCode errorCode() const noexcept;

        void raise() const override;
        [[nodiscard]] Exception * clone() const override;

    protected:
        [[nodiscard]] QString exceptionDisplayName() const override;

    private:
        const ErrorCode m_errorCode;
    };

public:
    [[nodiscard]] virtual QFuture<void> writeSecret(
        QString key, QString secret) = 0;

    /**
     * The returned future contains Exception with EntryNotFound code if
     * nothing is stored under the key
     */
    [[nodiscard]] virtual QFuture<QString> readSecret(QString key) const = 0;

    /**
     * Deleting the secret which doesn't exist is not an error
     */
    [[nodiscard]] virtual QFuture<void> deleteSecret(QString key) = 0;
};

} // namespace healthsync::utility
