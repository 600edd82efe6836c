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

#include <QException>
#include <QFuture>
#include <QObject>
#include <QPromise>

#include <memory>
#include <utility>

// Thin wrappers around QFuture continuations which make the continuation
// chains in the library read uniformly and keep the promise completion
// boilerplate in one place.

namespace healthsync::threading {

template <class T, class Function>
auto then(QFuture<T> && future, Function && function)
{
    return future.then(std::forward<Function>(function));
}

template <class T, class Function>
auto then(QFuture<T> && future, QObject * context, Function && function)
{
    return future.then(context, std::forward<Function>(function));
}

template <class T, class Function>
QFuture<T> onFailed(QFuture<T> && future, Function && handler)
{
    return future.onFailed(std::forward<Function>(handler));
}

template <class T, class Function>
QFuture<T> onFailed(
    QFuture<T> && future, QObject * context, Function && handler)
{
    return future.onFailed(context, std::forward<Function>(handler));
}

/**
 * Runs the function when the future finishes successfully; if the future
 * or the function itself finishes with exception, the exception is put into
 * the promise which is then finished.
 */
template <class T, class U, class Function>
void thenOrFailed(
    QFuture<T> && future, std::shared_ptr<QPromise<U>> promise,
    Function && function)
{
    auto thenFuture =
        then(std::move(future), std::forward<Function>(function));

    onFailed(std::move(thenFuture), [promise](const QException & e) {
        promise->setException(e);
        promise->finish();
    });
}

template <class T, class U, class Function>
void thenOrFailed(
    QFuture<T> && future, QObject * context,
    std::shared_ptr<QPromise<U>> promise, Function && function)
{
    auto thenFuture =
        then(std::move(future), context, std::forward<Function>(function));

    onFailed(std::move(thenFuture), context, [promise](const QException & e) {
        promise->setException(e);
        promise->finish();
    });
}

} // namespace healthsync::threading
