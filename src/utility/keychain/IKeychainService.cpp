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


#include <healthsync/utility/Factory.h>
#include <healthsync/utility/IKeychainService.h>

#include "QtKeychainService.h"

#include <QDebug>
#include <QTextStream>

#include <utility>

namespace healthsync::utility {

namespace {

[[nodiscard]] ErrorString defaultErrorDescription(
    const IKeychainService::ErrorCode errorCode)
{
    ErrorString error{QT_TRANSLATE_NOOP(
        "utility::IKeychainService", "Keychain operation failed")};
    error.setDetails(ToString(errorCode));
    return error;
}

} // namespace

IKeychainService::~IKeychainService() noexcept = default;

QTextStream & operator<<(
    QTextStream & strm, const IKeychainService::ErrorCode errorCode)
{
    using ErrorCode = IKeychainService::ErrorCode;

    switch (errorCode) {
    case ErrorCode::EntryNotFound:
        strm << "Entry not found";
        return strm;
    case ErrorCode::AccessDenied:
        strm << "Access denied";
        return strm;
    case ErrorCode::NoBackendAvailable:
        strm << "No keychain backend available";
        return strm;
    case ErrorCode::OtherError:
        strm << "Other error";
        return strm;
    }

    strm << "<unknown> (" << static_cast<qint64>(errorCode) << ")";
    return strm;
}

QDebug & operator<<(QDebug & dbg, const IKeychainService::ErrorCode errorCode)
{
    dbg << ToString(errorCode);
    return dbg;
}

IKeychainService::Exception::Exception(const ErrorCode errorCode) :
    Exception{errorCode, defaultErrorDescription(errorCode)}
{}

IKeychainService::Exception::Exception(
    const ErrorCode errorCode, ErrorString errorDescription) :
    IHealthSyncException{std::move(errorDescription)},
    m_errorCode{errorCode}
{}

IKeychainService::ErrorCode IKeychainService::Exception::errorCode()
    const noexcept
{
    return m_errorCode;
}

QString IKeychainService::Exception::exceptionDisplayName() const
{
    return QStringLiteral("KeychainError");
}

void IKeychainService::Exception::raise() const
{
    throw *this;
}

IKeychainService::Exception * IKeychainService::Exception::clone() const
{
    return new Exception{m_errorCode, errorMessage()};
}

IKeychainServicePtr newQtKeychainService(QString serviceName)
{
    return std::make_shared<keychain::QtKeychainService>(
        std::move(serviceName));
}

} // namespace healthsync::utility
