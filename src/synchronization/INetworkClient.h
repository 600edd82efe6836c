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

#include <healthsync/utility/Printable.h>

#include <QByteArray>
#include <QFuture>
#include <QList>
#include <QPair>
#include <QUrl>

namespace healthsync::synchronization {

struct NetworkRequest
{
    QUrl url;
    QByteArray body;
    QList<QPair<QByteArray, QByteArray>> headers;
};

struct NetworkResponse : public Printable
{
    [[nodiscard]] bool hasResponse() const noexcept
    {
        return statusCode > 0;
    }

    [[nodiscard]] bool isSuccess() const noexcept
    {
        return statusCode >= 200 && statusCode < 300;
    }

    QTextStream & print(QTextStream & strm) const override;

    /**
     * HTTP status code, zero if no response was received
     */
    int statusCode = 0;

    QByteArray body;

    /**
     * True if the request was aborted via INetworkClient::abortAll
     */
    bool aborted = false;

    /**
     * Description of transport level error, if any
     */
    QString errorString;
};

/**
 * @brief The INetworkClient interface sends json requests to the server.
 * Returned futures never contain exceptions: failures are described within
 * the response.
 */
class INetworkClient
{
public:
    virtual ~INetworkClient() = default;

    [[nodiscard]] virtual QFuture<NetworkResponse> post(
        NetworkRequest request) = 0;

    /**
     * Aborts all requests in flight, their responses are marked as aborted
     */
    virtual void abortAll() = 0;
};

} // namespace healthsync::synchronization
