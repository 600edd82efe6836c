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


#include <healthsync/exception/IHealthSyncException.h>

#include <utility>

namespace healthsync {

IHealthSyncException::IHealthSyncException(ErrorString message) :
    m_message{std::move(message)},
    m_whatMessage{m_message.nonLocalizedString().toUtf8()}
{}

IHealthSyncException::~IHealthSyncException() noexcept = default;

const ErrorString & IHealthSyncException::errorMessage() const noexcept
{
    return m_message;
}

const char * IHealthSyncException::what() const noexcept
{
    return m_whatMessage.constData();
}

QTextStream & IHealthSyncException::print(QTextStream & strm) const
{
    strm << exceptionDisplayName() << ": " << m_message.nonLocalizedString();
    return strm;
}

} // namespace healthsync
