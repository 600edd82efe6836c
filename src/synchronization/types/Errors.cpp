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

#include <healthsync/synchronization/types/Errors.h>

#include <utility>

namespace healthsync::synchronization {

DataUnavailableError::DataUnavailableError(ErrorString message) :
    RuntimeError{std::move(message)}
{}

DataUnavailableError * DataUnavailableError::clone() const
{
    return new DataUnavailableError{*this};
}

void DataUnavailableError::raise() const
{
    throw *this;
}

QString DataUnavailableError::exceptionDisplayName() const
{
    return QStringLiteral("DataUnavailableError");
}

} // namespace healthsync::synchronization
