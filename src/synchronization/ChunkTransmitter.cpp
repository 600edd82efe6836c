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


#include "ChunkTransmitter.h"
#include "ICursorStorage.h"
#include "INetworkClient.h"
#include "ITokenRefreshCoordinator.h"
#include "Utils.h"

#include <healthsync/exception/IHealthSyncException.h>
#include <healthsync/exception/InvalidArgument.h>
#include <healthsync/logging/HealthSyncLogger.h>
#include <healthsync/synchronization/ICredentialsStore.h>
#include <healthsync/threading/Future.h>
#include <healthsync/threading/QtFutureContinuations.h>
#include <healthsync/utility/cancelers/ICanceler.h>

#include <QDateTime>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QPromise>

#include <algorithm>
#include <string_view>

namespace healthsync::synchronization {

using namespace std::string_view_literals;

namespace {

constexpr auto gDataKey = "data"sv;
constexpr auto gRecordsKey = "records"sv;
constexpr auto gWorkoutsKey = "workouts"sv;
constexpr auto gSleepKey = "sleep"sv;
constexpr auto gSyncTimestampKey = "syncTimestamp"sv;

[[nodiscard]] TransmitResult makeResult(
    const TransmitResult::Status status, const int httpStatus = 0)
{
    TransmitResult result;
    result.status = status;
    result.httpStatus = httpStatus;
    return result;
}

void finishTransmit(
    QPromise<TransmitResult> & promise, const TransmitResult::Status status,
    const int httpStatus = 0)
{
    promise.addResult(makeResult(status, httpStatus));
    promise.finish();
}

struct RecordCounts
{
    int records = 0;
    int workouts = 0;
    int sleep = 0;
};

[[nodiscard]] QByteArray serializePayload(
    const QList<DataRecord> & records, RecordCounts & counts)
{
    QJsonArray recordsArray;
    QJsonArray workoutsArray;
    QJsonArray sleepArray;

    for (const auto & record: std::as_const(records)) {
        switch (record.kind) {
        case RecordKind::Record:
            recordsArray.append(record.json);
            break;
        case RecordKind::Workout:
            workoutsArray.append(record.json);
            break;
        case RecordKind::Sleep:
            sleepArray.append(record.json);
            break;
        }
    }

    counts.records = static_cast<int>(recordsArray.size());
    counts.workouts = static_cast<int>(workoutsArray.size());
    counts.sleep = static_cast<int>(sleepArray.size());

    QJsonObject data;
    data[toString(gRecordsKey)] = recordsArray;
    data[toString(gWorkoutsKey)] = workoutsArray;
    data[toString(gSleepKey)] = sleepArray;

    QJsonObject payload;
    payload[toString(gSyncTimestampKey)] =
        QDateTime::currentDateTimeUtc().toString(Qt::ISODate);
    payload[toString(gDataKey)] = data;

    return QJsonDocument{payload}.toJson(QJsonDocument::Compact);
}

[[nodiscard]] QString payloadSizeMb(const QByteArray & payload)
{
    return QString::number(
        static_cast<double>(payload.size()) / (1024.0 * 1024.0), 'f', 2);
}

} // namespace

QTextStream & operator<<(
    QTextStream & strm, const TransmitResult::Status status)
{
    using Status = TransmitResult::Status;

    switch (status) {
    case Status::Delivered:
        strm << "Delivered";
        break;
    case Status::Rejected:
        strm << "Rejected";
        break;
    case Status::NetworkFailure:
        strm << "Network failure";
        break;
    case Status::AuthenticationFailure:
        strm << "Authentication failure";
        break;
    case Status::StorageFailure:
        strm << "Storage failure";
        break;
    case Status::Canceled:
        strm << "Canceled";
        break;
    }

    return strm;
}

QTextStream & TransmitResult::print(QTextStream & strm) const
{
    strm << status;
    if (httpStatus != 0) {
        strm << " (HTTP " << httpStatus << ")";
    }
    return strm;
}

QTextStream & SweepResult::print(QTextStream & strm) const
{
    strm << "delivered " << deliveredCount;
    if (networkFailure) {
        strm << ", stopped by network failure";
    }
    return strm;
}

ChunkTransmitter::ChunkTransmitter(
    IOutboxStoragePtr outboxStorage, ICursorStoragePtr cursorStorage,
    INetworkClientPtr networkClient,
    ITokenRefreshCoordinatorPtr tokenRefreshCoordinator,
    ICredentialsStorePtr credentialsStore, QString syncPathTemplate,
    QString apiKeyHeaderName) :
    m_outboxStorage{std::move(outboxStorage)},
    m_cursorStorage{std::move(cursorStorage)},
    m_networkClient{std::move(networkClient)},
    m_tokenRefreshCoordinator{std::move(tokenRefreshCoordinator)},
    m_credentialsStore{std::move(credentialsStore)},
    m_syncPathTemplate{std::move(syncPathTemplate)},
    m_apiKeyHeaderName{std::move(apiKeyHeaderName)}
{
    if (Q_UNLIKELY(!m_outboxStorage)) {
        throw InvalidArgument{ErrorString{
            QStringLiteral("ChunkTransmitter ctor: outbox storage is null")}};
    }

    if (Q_UNLIKELY(!m_cursorStorage)) {
        throw InvalidArgument{ErrorString{
            QStringLiteral("ChunkTransmitter ctor: cursor storage is null")}};
    }

    if (Q_UNLIKELY(!m_networkClient)) {
        throw InvalidArgument{ErrorString{
            QStringLiteral("ChunkTransmitter ctor: network client is null")}};
    }

    if (Q_UNLIKELY(!m_tokenRefreshCoordinator)) {
        throw InvalidArgument{ErrorString{QStringLiteral(
            "ChunkTransmitter ctor: token refresh coordinator is null")}};
    }

    if (Q_UNLIKELY(!m_credentialsStore)) {
        throw InvalidArgument{ErrorString{QStringLiteral(
            "ChunkTransmitter ctor: credentials store is null")}};
    }
}

QFuture<TransmitResult> ChunkTransmitter::send(
    Chunk chunk, utility::cancelers::ICancelerPtr canceler)
{
    if (canceler && canceler->isCanceled()) {
        return threading::makeReadyFuture(
            makeResult(TransmitResult::Status::Canceled));
    }

    auto credentials = m_credentialsStore->credentials();
    if (!credentials || !credentials->isValid()) {
        HSWARNING(
            "synchronization::ChunkTransmitter",
            "No valid credentials, cannot send chunk of type "
                << shortTypeName(chunk.type));
        return threading::makeReadyFuture(
            makeResult(TransmitResult::Status::AuthenticationFailure));
    }

    RecordCounts counts;

    OutboxItem item;
    item.userKey = userKey(credentials->userId);
    item.typeTag = chunk.type;
    item.payload = serializePayload(chunk.records, counts);
    item.fullExport = chunk.fullExport;
    item.recordCount = static_cast<int>(chunk.records.size());
    if (chunk.cursor) {
        item.cursors[chunk.type] = *chunk.cursor;
    }

    // The chunk must be durably staged before it goes to the network
    OutboxItem stagedItem;
    try {
        stagedItem = m_outboxStorage->put(std::move(item));
    }
    catch (const IHealthSyncException & e) {
        HSWARNING(
            "synchronization::ChunkTransmitter",
            "Failed to stage chunk in the outbox: " << e.what());
        return threading::makeReadyFuture(
            makeResult(TransmitResult::Status::StorageFailure));
    }

    HSINFO(
        "synchronization::ChunkTransmitter",
        "Sending " << shortTypeName(chunk.type) << ": "
                   << payloadSizeMb(stagedItem.payload)
                   << " MB - Records: " << counts.records
                   << ", Workouts: " << counts.workouts
                   << ", Sleep: " << counts.sleep);

    return deliver(std::move(stagedItem), std::move(*credentials), false);
}

QFuture<SweepResult> ChunkTransmitter::retryPendingItems(
    const std::chrono::milliseconds minAge)
{
    if (m_pendingSweep) {
        HSDEBUG(
            "synchronization::ChunkTransmitter",
            "Outbox retry is already in progress");
        return *m_pendingSweep;
    }

    const auto credentials = m_credentialsStore->credentials();
    if (!credentials || !credentials->isValid()) {
        HSDEBUG(
            "synchronization::ChunkTransmitter",
            "No valid credentials, skipping outbox retry");
        return threading::makeReadyFuture(SweepResult{});
    }

    const QString currentUserKey = userKey(credentials->userId);

    QList<OutboxItem> items;
    try {
        const int removedCount =
            m_outboxStorage->removeItemsOfOtherUsers(currentUserKey);
        if (removedCount > 0) {
            HSINFO(
                "synchronization::ChunkTransmitter",
                "Removed " << removedCount
                           << " outbox items of other users");
        }

        items = m_outboxStorage->items(currentUserKey);
    }
    catch (const IHealthSyncException & e) {
        HSWARNING(
            "synchronization::ChunkTransmitter",
            "Failed to read outbox items: " << e.what());
        return threading::makeReadyFuture(SweepResult{});
    }

    // Younger items might still be in flight on the main path
    const auto threshold =
        QDateTime::currentDateTimeUtc().addMSecs(-minAge.count());

    items.erase(
        std::remove_if(
            items.begin(), items.end(),
            [&threshold](const OutboxItem & item) {
                return item.createdAt > threshold;
            }),
        items.end());

    if (items.isEmpty()) {
        HSDEBUG(
            "synchronization::ChunkTransmitter", "No outbox items to retry");
        return threading::makeReadyFuture(SweepResult{});
    }

    HSINFO(
        "synchronization::ChunkTransmitter",
        "Retrying " << items.size() << " outbox items");

    auto context = std::make_shared<SweepContext>();
    context->items = std::move(items);
    context->promise = std::make_shared<QPromise<SweepResult>>();
    context->promise->start();

    auto future = context->promise->future();
    m_pendingSweep = future;

    retryNextPendingItem(context);
    return future;
}

QFuture<TransmitResult> ChunkTransmitter::deliver(
    OutboxItem item, Credentials credentials, const bool tokenRefreshed)
{
    auto promise = std::make_shared<QPromise<TransmitResult>>();
    auto future = promise->future();
    promise->start();

    auto postFuture =
        m_networkClient->post(createRequest(item, credentials));

    const auto selfWeak = weak_from_this();

    auto thenFuture = threading::then(
        std::move(postFuture),
        [selfWeak, promise, item = std::move(item),
         credentials = std::move(credentials),
         tokenRefreshed](const NetworkResponse & response) mutable {
            const auto self = selfWeak.lock();
            if (!self) {
                finishTransmit(*promise, TransmitResult::Status::Canceled);
                return;
            }

            self->onResponse(
                std::move(item), credentials, tokenRefreshed, response,
                promise);
        });

    threading::onFailed(
        std::move(thenFuture), [promise](const QException & e) {
            HSWARNING(
                "synchronization::ChunkTransmitter",
                "Failed to process upload response: " << e.what());
            finishTransmit(*promise, TransmitResult::Status::NetworkFailure);
        });

    return future;
}

void ChunkTransmitter::onResponse(
    OutboxItem item, const Credentials & credentials,
    const bool tokenRefreshed, const NetworkResponse & response,
    const std::shared_ptr<QPromise<TransmitResult>> & promise)
{
    using Status = TransmitResult::Status;

    if (response.isSuccess()) {
        HSINFO(
            "synchronization::ChunkTransmitter",
            (tokenRefreshed ? "Retry HTTP " : "HTTP ") << response.statusCode);

        try {
            reconcile(item);
        }
        catch (const IHealthSyncException & e) {
            HSWARNING(
                "synchronization::ChunkTransmitter",
                "Failed to commit cursors of delivered chunk: " << e.what());
            finishTransmit(
                *promise, Status::StorageFailure, response.statusCode);
            return;
        }

        finishTransmit(*promise, Status::Delivered, response.statusCode);
        return;
    }

    if (response.aborted) {
        HSDEBUG(
            "synchronization::ChunkTransmitter",
            "Upload of outbox item " << item.id << " was aborted");
        finishTransmit(*promise, Status::Canceled);
        return;
    }

    if (!response.hasResponse()) {
        HSWARNING(
            "synchronization::ChunkTransmitter",
            "Upload error: " << response.errorString);
        finishTransmit(*promise, Status::NetworkFailure);
        return;
    }

    if (response.statusCode == 401) {
        onUnauthorized(std::move(item), credentials, tokenRefreshed, promise);
        return;
    }

    HSWARNING(
        "synchronization::ChunkTransmitter",
        "HTTP " << response.statusCode << " - "
                << truncatedResponseBody(response.body));

    if (response.statusCode >= 400 && response.statusCode < 500) {
        HSWARNING(
            "synchronization::ChunkTransmitter",
            "Skipping chunk due to " << response.statusCode
                                     << " - continuing sync");

        try {
            m_outboxStorage->remove(item.userKey, item.id);
        }
        catch (const IHealthSyncException & e) {
            HSWARNING(
                "synchronization::ChunkTransmitter",
                "Failed to drop rejected outbox item " << item.id << ": "
                                                       << e.what());
            finishTransmit(
                *promise, Status::StorageFailure, response.statusCode);
            return;
        }

        finishTransmit(*promise, Status::Rejected, response.statusCode);
        return;
    }

    finishTransmit(*promise, Status::NetworkFailure, response.statusCode);
}

void ChunkTransmitter::onUnauthorized(
    OutboxItem item, const Credentials & credentials,
    const bool tokenRefreshed,
    const std::shared_ptr<QPromise<TransmitResult>> & promise)
{
    using Status = TransmitResult::Status;

    if (credentials.isApiKeyAuth()) {
        HSWARNING(
            "synchronization::ChunkTransmitter",
            "401 with API key - authentication failed");
        finishTransmit(*promise, Status::AuthenticationFailure, 401);
        return;
    }

    if (tokenRefreshed) {
        HSWARNING(
            "synchronization::ChunkTransmitter", "Retry failed: HTTP 401");
        finishTransmit(*promise, Status::AuthenticationFailure, 401);
        return;
    }

    auto refreshFuture = m_tokenRefreshCoordinator->refresh();

    const auto selfWeak = weak_from_this();

    auto thenFuture = threading::then(
        std::move(refreshFuture),
        [selfWeak, promise,
         item = std::move(item)](const TokenRefreshResult result) mutable {
            const auto self = selfWeak.lock();
            if (!self || result == TokenRefreshResult::Aborted) {
                HSDEBUG(
                    "synchronization::ChunkTransmitter",
                    "Token refresh was aborted, upload of outbox item "
                        << item.id << " is canceled");
                finishTransmit(*promise, Status::Canceled);
                return;
            }

            auto newCredentials = self->m_credentialsStore->credentials();
            if (result != TokenRefreshResult::Refreshed || !newCredentials ||
                !newCredentials->isValid())
            {
                HSWARNING(
                    "synchronization::ChunkTransmitter",
                    "Could not refresh token after 401");
                finishTransmit(*promise, Status::AuthenticationFailure, 401);
                return;
            }

            HSINFO(
                "synchronization::ChunkTransmitter",
                "Retrying upload with refreshed token...");

            auto retryFuture = self->deliver(
                std::move(item), std::move(*newCredentials), true);

            threading::then(
                std::move(retryFuture),
                [promise](const TransmitResult & result) {
                    promise->addResult(result);
                    promise->finish();
                });
        });

    threading::onFailed(
        std::move(thenFuture), [promise](const QException & e) {
            HSWARNING(
                "synchronization::ChunkTransmitter",
                "Failed to retry upload after token refresh: " << e.what());
            finishTransmit(*promise, Status::AuthenticationFailure, 401);
        });
}

void ChunkTransmitter::reconcile(const OutboxItem & item)
{
    for (auto it = item.cursors.constBegin(), end = item.cursors.constEnd();
         it != end; ++it)
    {
        if (m_cursorStorage->commitCursor(
                item.userKey, it.key(), it.value(), item.sequence))
        {
            HSDEBUG(
                "synchronization::ChunkTransmitter",
                "Committed cursor of " << shortTypeName(it.key()));
        }
        else {
            HSDEBUG(
                "synchronization::ChunkTransmitter",
                "Cursor of " << shortTypeName(it.key())
                             << " from outbox item " << item.id
                             << " is older than the committed one");
        }
    }

    m_outboxStorage->remove(item.userKey, item.id);
}

NetworkRequest ChunkTransmitter::createRequest(
    const OutboxItem & item, const Credentials & credentials) const
{
    NetworkRequest request;
    request.url = QUrl{
        joinUrl(credentials.host, m_syncPathTemplate.arg(credentials.userId))};
    request.body = item.payload;

    if (credentials.isApiKeyAuth()) {
        request.headers.append(
            {m_apiKeyHeaderName.toUtf8(),
             credentials.apiKey.value_or(QString{}).toUtf8()});
    }
    else {
        request.headers.append(
            {QByteArrayLiteral("Authorization"),
             bearerAuthorizationHeaderValue(
                 credentials.accessToken.value_or(QString{}))});
    }

    return request;
}

void ChunkTransmitter::retryNextPendingItem(const SweepContextPtr & context)
{
    if (context->index >= context->items.size()) {
        finishSweep(context);
        return;
    }

    auto credentials = m_credentialsStore->credentials();
    auto item = context->items[context->index];
    if (!credentials || !credentials->isValid() ||
        userKey(credentials->userId) != item.userKey)
    {
        HSINFO(
            "synchronization::ChunkTransmitter",
            "Credentials changed during outbox retry, stopping it");
        finishSweep(context);
        return;
    }

    HSDEBUG(
        "synchronization::ChunkTransmitter",
        "Retrying outbox item: " << item);

    auto deliverFuture =
        deliver(std::move(item), std::move(*credentials), false);

    const auto selfWeak = weak_from_this();

    threading::then(
        std::move(deliverFuture),
        [selfWeak, context](const TransmitResult & result) {
            const auto self = selfWeak.lock();
            if (!self) {
                context->promise->addResult(context->result);
                context->promise->finish();
                return;
            }

            using Status = TransmitResult::Status;
            if (result.status == Status::Delivered) {
                ++context->result.deliveredCount;
            }
            else if (
                result.status == Status::NetworkFailure ||
                result.status == Status::AuthenticationFailure ||
                result.status == Status::StorageFailure ||
                result.status == Status::Canceled)
            {
                HSINFO(
                    "synchronization::ChunkTransmitter",
                    "Stopping outbox retry: " << result);
                context->result.networkFailure =
                    (result.status == Status::NetworkFailure);
                self->finishSweep(context);
                return;
            }

            ++context->index;
            self->retryNextPendingItem(context);
        });
}

void ChunkTransmitter::finishSweep(const SweepContextPtr & context)
{
    HSINFO(
        "synchronization::ChunkTransmitter",
        "Outbox retry: delivered " << context->result.deliveredCount
                                   << " of " << context->items.size()
                                   << " items");

    m_pendingSweep.reset();

    context->promise->addResult(context->result);
    context->promise->finish();
}

} // namespace healthsync::synchronization
