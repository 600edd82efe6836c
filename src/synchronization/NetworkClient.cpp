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

#include "NetworkClient.h"

#include <healthsync/logging/HealthSyncLogger.h>

#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QPromise>

namespace healthsync::synchronization {

namespace {

const char * gAbortedPropertyName = "healthsync_aborted";

} // namespace

QTextStream & NetworkResponse::print(QTextStream & strm) const
{
    strm << "NetworkResponse: status code = " << statusCode
         << ", body size = " << body.size()
         << ", aborted = " << (aborted ? "true" : "false");

    if (!errorString.isEmpty()) {
        strm << ", error = " << errorString;
    }

    return strm;
}

NetworkClient::NetworkClient(
    QNetworkAccessManager * networkAccessManager,
    const std::chrono::milliseconds requestTimeout, QObject * parent) :
    QObject(parent), m_networkAccessManager{networkAccessManager},
    m_requestTimeout{requestTimeout}
{
    if (!m_networkAccessManager) {
        m_networkAccessManager = new QNetworkAccessManager(this);
    }
}

NetworkClient::~NetworkClient()
{
    abortAll();
}

QFuture<NetworkResponse> NetworkClient::post(NetworkRequest request)
{
    auto promise = std::make_shared<QPromise<NetworkResponse>>();
    auto future = promise->future();
    promise->start();

    if (Q_UNLIKELY(!m_networkAccessManager)) {
        NetworkResponse response;
        response.errorString = QStringLiteral("Network access manager is gone");
        promise->addResult(std::move(response));
        promise->finish();
        return future;
    }

    QNetworkRequest networkRequest{request.url};
    networkRequest.setHeader(
        QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));
    networkRequest.setTransferTimeout(
        static_cast<int>(m_requestTimeout.count()));

    for (const auto & header: std::as_const(request.headers)) {
        networkRequest.setRawHeader(header.first, header.second);
    }

    HSTRACE(
        "synchronization::NetworkClient",
        "POST " << request.url.toString() << ", body size "
                << request.body.size());

    auto * reply = m_networkAccessManager->post(networkRequest, request.body);
    m_pendingReplies[reply] = std::move(promise);

    QObject::connect(reply, &QNetworkReply::finished, this, [this, reply] {
        onReplyFinished(reply);
    });

    return future;
}

void NetworkClient::abortAll()
{
    // Aborting emits finished synchronously which modifies m_pendingReplies
    const auto replies = m_pendingReplies.keys();
    if (!replies.isEmpty()) {
        HSDEBUG(
            "synchronization::NetworkClient",
            "Aborting " << replies.size() << " requests in flight");
    }

    for (auto * reply: replies) {
        reply->setProperty(gAbortedPropertyName, true);
        reply->abort();
    }
}

void NetworkClient::onReplyFinished(QNetworkReply * reply)
{
    const auto it = m_pendingReplies.find(reply);
    if (Q_UNLIKELY(it == m_pendingReplies.end())) {
        reply->deleteLater();
        return;
    }

    auto promise = it.value();
    m_pendingReplies.erase(it);

    NetworkResponse response;
    response.aborted = reply->property(gAbortedPropertyName).toBool();

    const auto statusCode =
        reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    if (statusCode.isValid()) {
        response.statusCode = statusCode.toInt();
        response.body = reply->readAll();
    }

    if (reply->error() != QNetworkReply::NoError) {
        response.errorString = reply->errorString();
    }

    HSTRACE(
        "synchronization::NetworkClient",
        "Finished request to " << reply->url().toString() << ": "
                               << response);

    reply->deleteLater();

    promise->addResult(std::move(response));
    promise->finish();
}

} // namespace healthsync::synchronization
