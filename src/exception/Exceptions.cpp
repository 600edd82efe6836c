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


#include <healthsync/exception/InvalidArgument.h>
#include <healthsync/exception/OperationCanceled.h>
#include <healthsync/exception/RuntimeError.h>

#include <utility>

namespace healthsync {

// InvalidArgument

InvalidArgument::InvalidArgument(ErrorString message) :
    IHealthSyncException{std::move(message)}
{}

InvalidArgument * InvalidArgument::clone() const
{
    return new InvalidArgument{*this};
}

void InvalidArgument::raise() const
{
    throw *this;
}

QString InvalidArgument::exceptionDisplayName() const
{
    return QStringLiteral("InvalidArgument");
}

// RuntimeError

RuntimeError::RuntimeError(ErrorString message) :
    IHealthSyncException{std::move(message)}
{}

RuntimeError * RuntimeError::clone() const
{
    return new RuntimeError{*this};
}

void RuntimeError::raise() const
{
    throw *this;
}

QString RuntimeError::exceptionDisplayName() const
{
    return QStringLiteral("RuntimeError");
}

// OperationCanceled

OperationCanceled::OperationCanceled() :
    IHealthSyncException{ErrorString{
        QT_TRANSLATE_NOOP("healthsync::OperationCanceled", "Canceled")}}
{}

OperationCanceled * OperationCanceled::clone() const
{
    return new OperationCanceled{*this};
}

void OperationCanceled::raise() const
{
    throw *this;
}

QString OperationCanceled::exceptionDisplayName() const
{
    return QStringLiteral("OperationCanceled");
}

} // namespace healthsync
