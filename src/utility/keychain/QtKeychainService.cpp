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


#include "QtKeychainService.h"

#include <healthsync/exception/InvalidArgument.h>
#include <healthsync/logging/HealthSyncLogger.h>

#include <qt6keychain/keychain.h>

#include <QPromise>

#include <memory>

namespace healthsync::utility::keychain {

namespace {

[[nodiscard]] IKeychainService::ErrorCode toErrorCode(
    const QKeychain::Error error) noexcept
{
    using ErrorCode = IKeychainService::ErrorCode;

    switch (error) {
    case QKeychain::EntryNotFound:
        return ErrorCode::EntryNotFound;
    case QKeychain::AccessDeniedByUser:
    case QKeychain::AccessDenied:
        return ErrorCode::AccessDenied;
    case QKeychain::NoBackendAvailable:
        return ErrorCode::NoBackendAvailable;
    default:
        return ErrorCode::OtherError;
    }
}

// Jobs delete themselves after emitting finished signal; the handler turns
// the job's result into the promise's result or exception
template <class T, class ResultHandler>
void startJob(
    QKeychain::Job * job, std::shared_ptr<QPromise<T>> promise,
    ResultHandler && onSucceeded, const bool entryNotFoundIsSuccess = false)
{
    job->setAutoDelete(true);

    QObject::connect(
        job, &QKeychain::Job::finished, job,
        [promise = std::move(promise), entryNotFoundIsSuccess,
         onSucceeded = std::forward<ResultHandler>(onSucceeded)](
            QKeychain::Job * finishedJob) {
            const auto error = finishedJob->error();
            if (error == QKeychain::NoError ||
                (entryNotFoundIsSuccess && error == QKeychain::EntryNotFound))
            {
                onSucceeded(*finishedJob, *promise);
                promise->finish();
                return;
            }

            HSDEBUG(
                "utility::keychain::QtKeychainService",
                "Keychain job for " << finishedJob->key() << " failed: "
                                    << finishedJob->errorString());

            promise->setException(IKeychainService::Exception{
                toErrorCode(error), ErrorString{finishedJob->errorString()}});
            promise->finish();
        });

    job->start();
}

} // namespace

QtKeychainService::QtKeychainService(QString serviceName) :
    m_serviceName{std::move(serviceName)}
{
    if (Q_UNLIKELY(m_serviceName.isEmpty())) {
        throw InvalidArgument{ErrorString{
            QStringLiteral("QtKeychainService ctor: service name is empty")}};
    }
}

QtKeychainService::~QtKeychainService() noexcept = default;

QFuture<void> QtKeychainService::writeSecret(QString key, QString secret)
{
    auto promise = std::make_shared<QPromise<void>>();
    auto future = promise->future();
    promise->start();

    auto * job = new QKeychain::WritePasswordJob(m_serviceName);
    job->setKey(key);
    job->setTextData(secret);

    startJob(
        job, std::move(promise),
        [](const QKeychain::Job & job, QPromise<void> & promise) {
            Q_UNUSED(job)
            Q_UNUSED(promise)
        });

    return future;
}

QFuture<QString> QtKeychainService::readSecret(QString key) const
{
    auto promise = std::make_shared<QPromise<QString>>();
    auto future = promise->future();
    promise->start();

    auto * job = new QKeychain::ReadPasswordJob(m_serviceName);
    job->setKey(key);

    startJob(
        job, std::move(promise),
        [](const QKeychain::Job & job, QPromise<QString> & promise) {
            const auto & readJob =
                static_cast<const QKeychain::ReadPasswordJob &>(job);
            promise.addResult(readJob.textData());
        });

    return future;
}

QFuture<void> QtKeychainService::deleteSecret(QString key)
{
    auto promise = std::make_shared<QPromise<void>>();
    auto future = promise->future();
    promise->start();

    auto * job = new QKeychain::DeletePasswordJob(m_serviceName);
    job->setKey(key);

    startJob(
        job, std::move(promise),
        [](const QKeychain::Job & job, QPromise<void> & promise) {
            Q_UNUSED(job)
            Q_UNUSED(promise)
        },
        /* entryNotFoundIsSuccess = */ true);

    return future;
}

} // namespace healthsync::utility::keychain
