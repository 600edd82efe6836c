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

#include "INetworkClient.h"

#include <QHash>
#include <QObject>
#include <QPointer>

#include <chrono>
#include <memory>

class QNetworkAccessManager;
class QNetworkReply;

template <class T>
class QPromise;

namespace healthsync::synchronization {

class NetworkClient final : public QObject, public INetworkClient
{
    Q_OBJECT
public:
    /**
     * @param networkAccessManager  Network access manager to use; if null,
     *                              the client creates its own one
     * @param requestTimeout        Max time of no data transfer after which
     *                              the request is considered failed
     */
    NetworkClient(
        QNetworkAccessManager * networkAccessManager,
        std::chrono::milliseconds requestTimeout, QObject * parent = nullptr);

    ~NetworkClient() override;

    [[nodiscard]] QFuture<NetworkResponse> post(
        NetworkRequest request) override;

    void abortAll() override;

private:
    void onReplyFinished(QNetworkReply * reply);

private:
    QPointer<QNetworkAccessManager> m_networkAccessManager;
    const std::chrono::milliseconds m_requestTimeout;

    QHash<QNetworkReply *, std::shared_ptr<QPromise<NetworkResponse>>>
        m_pendingReplies;
};

} // namespace healthsync::synchronization
