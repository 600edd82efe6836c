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


#include "TypeStreamer.h"
#include "ICursorStorage.h"
#include "SyncSession.h"
#include "Utils.h"

#include <healthsync/exception/IHealthSyncException.h>
#include <healthsync/exception/InvalidArgument.h>
#include <healthsync/exception/OperationCanceled.h>
#include <healthsync/logging/HealthSyncLogger.h>
#include <healthsync/synchronization/IDataProvider.h>
#include <healthsync/synchronization/IExecutionBudget.h>
#include <healthsync/synchronization/types/Errors.h>
#include <healthsync/threading/Post.h>
#include <healthsync/threading/QtFutureContinuations.h>
#include <healthsync/threading/TrackedTask.h>
#include <healthsync/utility/cancelers/ICanceler.h>

#include <QDateTime>
#include <QPromise>
#include <QThread>

namespace healthsync::synchronization {

QTextStream & operator<<(QTextStream & strm, const TypeStreamStatus status)
{
    switch (status) {
    case TypeStreamStatus::Completed:
        strm << "Completed";
        break;
    case TypeStreamStatus::Skipped:
        strm << "Skipped";
        break;
    case TypeStreamStatus::Canceled:
        strm << "Canceled";
        break;
    case TypeStreamStatus::NetworkFailure:
        strm << "Network failure";
        break;
    case TypeStreamStatus::DataUnavailable:
        strm << "Data unavailable";
        break;
    case TypeStreamStatus::AuthenticationFailure:
        strm << "Authentication failure";
        break;
    case TypeStreamStatus::BudgetExhausted:
        strm << "Budget exhausted";
        break;
    case TypeStreamStatus::StorageFailure:
        strm << "Storage failure";
        break;
    }

    return strm;
}

TypeStreamer::TypeStreamer(
    IDataProviderPtr dataProvider, IChunkTransmitterPtr chunkTransmitter,
    ICursorStoragePtr cursorStorage, SyncEventsNotifier * notifier) :
    m_dataProvider{std::move(dataProvider)},
    m_chunkTransmitter{std::move(chunkTransmitter)},
    m_cursorStorage{std::move(cursorStorage)}, m_notifier{notifier}
{
    if (Q_UNLIKELY(!m_dataProvider)) {
        throw InvalidArgument{ErrorString{
            QStringLiteral("TypeStreamer ctor: data provider is null")}};
    }

    if (Q_UNLIKELY(!m_chunkTransmitter)) {
        throw InvalidArgument{ErrorString{
            QStringLiteral("TypeStreamer ctor: chunk transmitter is null")}};
    }

    if (Q_UNLIKELY(!m_cursorStorage)) {
        throw InvalidArgument{ErrorString{
            QStringLiteral("TypeStreamer ctor: cursor storage is null")}};
    }

    if (Q_UNLIKELY(!m_notifier)) {
        throw InvalidArgument{ErrorString{
            QStringLiteral("TypeStreamer ctor: notifier is null")}};
    }
}

QFuture<TypeStreamStatus> TypeStreamer::stream(TypeStreamRequest request)
{
    if (Q_UNLIKELY(!request.session)) {
        throw InvalidArgument{ErrorString{
            QStringLiteral("TypeStreamer::stream: session is null")}};
    }

    if (Q_UNLIKELY(request.chunkSize <= 0)) {
        throw InvalidArgument{ErrorString{QStringLiteral(
            "TypeStreamer::stream: chunk size is not positive")}};
    }

    auto context = std::make_shared<Context>();
    context->cursor = request.startCursor;
    context->request = std::move(request);
    context->promise = std::make_shared<QPromise<TypeStreamStatus>>();
    context->promise->start();

    auto future = context->promise->future();

    HSINFO(
        "synchronization::TypeStreamer",
        shortTypeName(context->request.type)
            << ": starting from "
            << (context->cursor ? "saved cursor" : "the beginning")
            << ", chunk size " << context->request.chunkSize);

    context->nextStep = Step::Query;
    runStep(context);
    return future;
}

void TypeStreamer::scheduleStep(const ContextPtr & context, const Step step)
{
    context->nextStep = step;

    try {
        threading::postToCurrentThread(threading::TrackedTask{
            weak_from_this(), [this, context] { runStep(context); }});
    }
    catch (const IHealthSyncException & e) {
        HSWARNING(
            "synchronization::TypeStreamer",
            "Failed to schedule the next step, running it directly: "
                << e.what());
        runStep(context);
    }
}

void TypeStreamer::runStep(const ContextPtr & context)
{
    switch (context->nextStep) {
    case Step::Query:
        queryBatch(context);
        return;
    case Step::Transmit:
        transmitChunk(context);
        return;
    case Step::Finish:
        finish(context, context->status);
        return;
    }
}

void TypeStreamer::queryBatch(const ContextPtr & context)
{
    const auto & request = context->request;

    if (request.canceler && request.canceler->isCanceled()) {
        finish(context, TypeStreamStatus::Canceled);
        return;
    }

    if (request.budget && request.budget->isExhausted()) {
        HSINFO(
            "synchronization::TypeStreamer",
            "Execution budget is exhausted, pausing at "
                << shortTypeName(request.type));
        finish(context, TypeStreamStatus::BudgetExhausted);
        return;
    }

    HSDEBUG(
        "synchronization::TypeStreamer",
        shortTypeName(request.type)
            << ": querying chunk #" << (context->chunkIndex + 1));

    auto queryFuture =
        m_dataProvider->query(request.type, context->cursor, request.chunkSize);

    const auto selfWeak = weak_from_this();
    auto * currentThread = QThread::currentThread();

    auto thenFuture = threading::then(
        std::move(queryFuture), currentThread,
        threading::TrackedTask{selfWeak, [this, context](DataBatch batch) {
                                   onBatch(context, std::move(batch));
                               }});

    auto onQExceptionFuture = threading::onFailed(
        std::move(thenFuture), currentThread,
        [this, selfWeak, context](const QException & e) {
            const auto self = selfWeak.lock();
            if (!self) {
                return;
            }

            onQueryFailed(context, &e);
        });

    auto onAnyExceptionFuture = threading::onFailed(
        std::move(onQExceptionFuture), currentThread,
        [this, selfWeak, context] {
            const auto self = selfWeak.lock();
            if (!self) {
                return;
            }

            onQueryFailed(context, nullptr);
        });

    onAnyExceptionFuture.onCanceled(currentThread, [this, selfWeak, context] {
        const auto self = selfWeak.lock();
        if (!self) {
            return;
        }

        HSWARNING(
            "synchronization::TypeStreamer",
            "Query of " << shortTypeName(context->request.type)
                        << " was canceled by the data provider");
        completeType(context, TypeStreamStatus::Skipped);
    });
}

void TypeStreamer::onBatch(const ContextPtr & context, DataBatch batch)
{
    const auto & request = context->request;

    if (request.canceler && request.canceler->isCanceled()) {
        finish(context, TypeStreamStatus::Canceled);
        return;
    }

    if (!batch.deletedIds.isEmpty()) {
        HSDEBUG(
            "synchronization::TypeStreamer",
            shortTypeName(request.type)
                << ": " << batch.deletedIds.size()
                << " deleted records are not propagated");
    }

    if (batch.records.isEmpty()) {
        HSINFO(
            "synchronization::TypeStreamer",
            shortTypeName(request.type) << ": no more records");

        if (batch.newCursor) {
            const QString & userKey = request.session->state().userKey;
            try {
                m_cursorStorage->commitCursor(
                    userKey, request.type, *batch.newCursor,
                    QDateTime::currentMSecsSinceEpoch());
            }
            catch (const IHealthSyncException & e) {
                HSWARNING(
                    "synchronization::TypeStreamer",
                    "Failed to commit cursor of exhausted type "
                        << shortTypeName(request.type) << ": " << e.what());
                finish(context, TypeStreamStatus::StorageFailure);
                return;
            }
        }

        completeType(context, TypeStreamStatus::Completed);
        return;
    }

    const auto recordCount = batch.records.size();

    context->isLastChunk =
        recordCount < request.chunkSize || !batch.newCursor.has_value();

    context->chunk.type = request.type;
    context->chunk.records = std::move(batch.records);
    context->chunk.cursor = std::move(batch.newCursor);
    context->chunk.fullExport = request.fullExport;

    HSDEBUG(
        "synchronization::TypeStreamer",
        shortTypeName(request.type)
            << ": chunk #" << (context->chunkIndex + 1) << " has "
            << recordCount << " records"
            << (context->isLastChunk ? ", last one" : ""));

    context->nextStep = Step::Transmit;
    runStep(context);
}

void TypeStreamer::onQueryFailed(
    const ContextPtr & context, const QException * e)
{
    const auto & type = context->request.type;

    if (e) {
        try {
            e->raise();
        }
        catch (const DataUnavailableError & error) {
            HSINFO(
                "synchronization::TypeStreamer",
                "Health data is unavailable, pausing at "
                    << shortTypeName(type) << ": " << error.what());
            finish(context, TypeStreamStatus::DataUnavailable);
            return;
        }
        catch (const OperationCanceled &) {
            finish(context, TypeStreamStatus::Canceled);
            return;
        }
        catch (const QException & error) {
            HSWARNING(
                "synchronization::TypeStreamer",
                "Failed to query " << shortTypeName(type) << ": "
                                   << error.what() << " - skipping type");
        }
    }
    else {
        HSWARNING(
            "synchronization::TypeStreamer",
            "Failed to query " << shortTypeName(type)
                               << ": unknown error - skipping type");
    }

    completeType(context, TypeStreamStatus::Skipped);
}

void TypeStreamer::transmitChunk(const ContextPtr & context)
{
    auto sendFuture =
        m_chunkTransmitter->send(context->chunk, context->request.canceler);

    const auto selfWeak = weak_from_this();
    auto * currentThread = QThread::currentThread();

    auto thenFuture = threading::then(
        std::move(sendFuture), currentThread,
        threading::TrackedTask{
            selfWeak, [this, context](const TransmitResult & result) {
                onTransmitResult(context, result);
            }});

    threading::onFailed(
        std::move(thenFuture), currentThread,
        [this, selfWeak, context](const QException & e) {
            const auto self = selfWeak.lock();
            if (!self) {
                return;
            }

            HSWARNING(
                "synchronization::TypeStreamer",
                "Failed to process transmit result: " << e.what());
            finish(context, TypeStreamStatus::StorageFailure);
        });
}

void TypeStreamer::onTransmitResult(
    const ContextPtr & context, const TransmitResult & result)
{
    const auto & type = context->request.type;
    const auto & session = context->request.session;
    const int recordCount = static_cast<int>(context->chunk.records.size());

    using Status = TransmitResult::Status;

    switch (result.status) {
    case Status::Delivered:
    {
        try {
            session->recordDelivered(
                type, recordCount, context->chunk.cursor);
        }
        catch (const IHealthSyncException & e) {
            HSWARNING(
                "synchronization::TypeStreamer",
                "Failed to persist progress of " << shortTypeName(type)
                                                 << ": " << e.what());
            finish(context, TypeStreamStatus::StorageFailure);
            return;
        }

        const auto sentCount = session->progress(type).sentCount;
        HSINFO(
            "synchronization::TypeStreamer",
            shortTypeName(type) << ": sent " << recordCount << " (total "
                                << sentCount << ")");

        if (m_notifier) {
            m_notifier->notifyTypeProgress(type, sentCount);
        }
    } break;
    case Status::Rejected:
    {
        try {
            session->recordRejected(type, recordCount);
        }
        catch (const IHealthSyncException & e) {
            HSWARNING(
                "synchronization::TypeStreamer",
                "Failed to persist progress of " << shortTypeName(type)
                                                 << ": " << e.what());
            finish(context, TypeStreamStatus::StorageFailure);
            return;
        }

        if (m_notifier) {
            m_notifier->notifyChunkRejected(
                type, result.httpStatus, recordCount);
        }
    } break;
    case Status::NetworkFailure:
        finish(context, TypeStreamStatus::NetworkFailure);
        return;
    case Status::AuthenticationFailure:
        finish(context, TypeStreamStatus::AuthenticationFailure);
        return;
    case Status::StorageFailure:
        finish(context, TypeStreamStatus::StorageFailure);
        return;
    case Status::Canceled:
        finish(context, TypeStreamStatus::Canceled);
        return;
    }

    if (context->chunk.cursor) {
        context->cursor = context->chunk.cursor;
    }

    context->chunk.records.clear();
    ++context->chunkIndex;

    if (context->isLastChunk) {
        completeType(context, TypeStreamStatus::Completed);
        return;
    }

    scheduleStep(context, Step::Query);
}

void TypeStreamer::completeType(
    const ContextPtr & context, const TypeStreamStatus status)
{
    const auto & type = context->request.type;
    const auto & session = context->request.session;

    try {
        session->markTypeComplete(type);
    }
    catch (const IHealthSyncException & e) {
        HSWARNING(
            "synchronization::TypeStreamer",
            "Failed to mark " << shortTypeName(type)
                              << " complete: " << e.what());
        finish(context, TypeStreamStatus::StorageFailure);
        return;
    }

    const auto sentCount = session->progress(type).sentCount;
    HSINFO(
        "synchronization::TypeStreamer",
        shortTypeName(type) << ": complete, " << sentCount << " records sent");

    if (m_notifier) {
        m_notifier->notifyTypeCompleted(type, sentCount);
    }

    context->status = status;
    context->nextStep = Step::Finish;
    runStep(context);
}

void TypeStreamer::finish(
    const ContextPtr & context, const TypeStreamStatus status)
{
    HSDEBUG(
        "synchronization::TypeStreamer",
        shortTypeName(context->request.type)
            << " finished: " << ToString(status));

    context->promise->addResult(status);
    context->promise->finish();
}

} // namespace healthsync::synchronization
