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

#include <healthsync/exception/RuntimeError.h>

#include <QAbstractEventDispatcher>
#include <QMetaObject>
#include <QObject>
#include <QThread>

#include <utility>

namespace healthsync::threading {

template <typename Function>
void postToObject(QObject * object, Function && function)
{
    Q_ASSERT(object);

    QMetaObject::invokeMethod(
        object, std::forward<Function>(function), Qt::QueuedConnection);
}

/**
 * Schedules the function to be executed by the event loop of the current
 * thread after the control returns to it. Unlike direct invocation it doesn't
 * grow the call stack which matters for long chains of asynchronous steps.
 */
template <typename Function>
void postToCurrentThread(Function && function)
{
    QObject * dispatcher =
        QAbstractEventDispatcher::instance(QThread::currentThread());

    if (Q_UNLIKELY(!dispatcher)) {
        throw RuntimeError{ErrorString{QStringLiteral(
            "postToCurrentThread: current thread has no event dispatcher")}};
    }

    postToObject(dispatcher, std::forward<Function>(function));
}

} // namespace healthsync::threading
