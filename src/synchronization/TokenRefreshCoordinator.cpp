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


#include "TokenRefreshCoordinator.h"
#include "INetworkClient.h"
#include "Utils.h"

#include <healthsync/exception/InvalidArgument.h>
#include <healthsync/logging/HealthSyncLogger.h>
#include <healthsync/synchronization/ICredentialsStore.h>
#include <healthsync/threading/Future.h>
#include <healthsync/threading/QtFutureContinuations.h>

#include <QJsonDocument>
#include <QJsonObject>
#include <QMutexLocker>
#include <QPromise>

#include <string_view>

namespace healthsync::synchronization {

using namespace std::string_view_literals;

namespace {

constexpr auto gRefreshTokenKey = "refresh_token"sv;
constexpr auto gAccessTokenKey = "access_token"sv;

} // namespace

QTextStream & operator<<(QTextStream & strm, const TokenRefreshResult result)
{
    switch (result) {
    case TokenRefreshResult::Refreshed:
        strm << "Refreshed";
        return strm;
    case TokenRefreshResult::Failed:
        strm << "Failed";
        return strm;
    case TokenRefreshResult::Aborted:
        strm << "Aborted";
        return strm;
    }

    strm << "Unknown (" << static_cast<int>(result) << ")";
    return strm;
}

TokenRefreshCoordinator::TokenRefreshCoordinator(
    ICredentialsStorePtr credentialsStore, INetworkClientPtr networkClient,
    QString refreshPath) :
    m_credentialsStore{std::move(credentialsStore)},
    m_networkClient{std::move(networkClient)},
    m_refreshPath{std::move(refreshPath)}
{
    if (Q_UNLIKELY(!m_credentialsStore)) {
        throw InvalidArgument{ErrorString{QStringLiteral(
            "TokenRefreshCoordinator ctor: credentials store is null")}};
    }

    if (Q_UNLIKELY(!m_networkClient)) {
        throw InvalidArgument{ErrorString{QStringLiteral(
            "TokenRefreshCoordinator ctor: network client is null")}};
    }
}

QFuture<TokenRefreshResult> TokenRefreshCoordinator::refresh()
{
    std::shared_ptr<QPromise<TokenRefreshResult>> promise;
    NetworkRequest request;

    {
        const QMutexLocker locker{&m_pendingRefreshMutex};
        if (m_pendingRefresh) {
            HSDEBUG(
                "synchronization::TokenRefreshCoordinator",
                "Token refresh is already in progress, joining it");
            return *m_pendingRefresh;
        }

        const auto credentials = m_credentialsStore->credentials();
        if (!credentials || !credentials->refreshToken ||
            credentials->refreshToken->isEmpty() ||
            credentials->host.isEmpty())
        {
            HSINFO(
                "synchronization::TokenRefreshCoordinator",
                "No refresh token or host - cannot refresh");
            return threading::makeReadyFuture(TokenRefreshResult::Failed);
        }

        QJsonObject body;
        body[toString(gRefreshTokenKey)] = *credentials->refreshToken;

        request.url = QUrl{joinUrl(credentials->host, m_refreshPath)};
        request.body = QJsonDocument{body}.toJson(QJsonDocument::Compact);

        promise = std::make_shared<QPromise<TokenRefreshResult>>();
        promise->start();
        m_pendingRefresh = promise->future();
    }

    auto future = promise->future();

    HSINFO(
        "synchronization::TokenRefreshCoordinator",
        "Attempting token refresh...");

    auto postFuture = m_networkClient->post(std::move(request));

    const auto selfWeak = weak_from_this();

    auto thenFuture = threading::then(
        std::move(postFuture),
        [selfWeak, promise](const NetworkResponse & response) {
            const auto self = selfWeak.lock();
            if (!self) {
                promise->addResult(TokenRefreshResult::Aborted);
                promise->finish();
                return;
            }

            self->onRefreshResponse(response, promise);
        });

    threading::onFailed(
        std::move(thenFuture), [selfWeak, promise](const QException & e) {
            HSWARNING(
                "synchronization::TokenRefreshCoordinator",
                "Token refresh failed: " << e.what());

            if (const auto self = selfWeak.lock()) {
                self->finishRefresh(TokenRefreshResult::Failed, promise);
                return;
            }

            promise->addResult(TokenRefreshResult::Aborted);
            promise->finish();
        });

    return future;
}

void TokenRefreshCoordinator::onRefreshResponse(
    const NetworkResponse & response,
    const std::shared_ptr<QPromise<TokenRefreshResult>> & promise)
{
    if (response.aborted) {
        HSINFO(
            "synchronization::TokenRefreshCoordinator",
            "Token refresh was aborted");
        finishRefresh(TokenRefreshResult::Aborted, promise);
        return;
    }

    if (!response.isSuccess()) {
        if (response.hasResponse()) {
            HSWARNING(
                "synchronization::TokenRefreshCoordinator",
                "Token refresh failed: HTTP " << response.statusCode);
        }
        else {
            HSWARNING(
                "synchronization::TokenRefreshCoordinator",
                "Token refresh failed: " << response.errorString);
        }

        finishRefresh(TokenRefreshResult::Failed, promise);
        return;
    }

    QJsonParseError error;
    const auto doc = QJsonDocument::fromJson(response.body, &error);
    if (doc.isNull() || !doc.isObject()) {
        HSWARNING(
            "synchronization::TokenRefreshCoordinator",
            "Token refresh: invalid response body: " << error.errorString());
        finishRefresh(TokenRefreshResult::Failed, promise);
        return;
    }

    const auto json = doc.object();

    const auto accessTokenIt = json.constFind(toString(gAccessTokenKey));
    if (accessTokenIt == json.constEnd() || !accessTokenIt->isString() ||
        accessTokenIt->toString().isEmpty())
    {
        HSWARNING(
            "synchronization::TokenRefreshCoordinator",
            "Token refresh: no access token in response body");
        finishRefresh(TokenRefreshResult::Failed, promise);
        return;
    }

    std::optional<QString> refreshToken;
    if (const auto refreshTokenIt = json.constFind(toString(gRefreshTokenKey));
        refreshTokenIt != json.constEnd() && refreshTokenIt->isString() &&
        !refreshTokenIt->toString().isEmpty())
    {
        refreshToken = refreshTokenIt->toString();
    }

    m_credentialsStore->updateTokens(
        accessTokenIt->toString(), std::move(refreshToken));

    HSINFO(
        "synchronization::TokenRefreshCoordinator",
        "Token refreshed successfully");

    finishRefresh(TokenRefreshResult::Refreshed, promise);
}

void TokenRefreshCoordinator::finishRefresh(
    const TokenRefreshResult result,
    const std::shared_ptr<QPromise<TokenRefreshResult>> & promise)
{
    {
        const QMutexLocker locker{&m_pendingRefreshMutex};
        m_pendingRefresh.reset();
    }

    promise->addResult(result);
    promise->finish();
}

} // namespace healthsync::synchronization
