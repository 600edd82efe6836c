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

#include <healthsync/types/ErrorString.h>
#include <healthsync/utility/Printable.h>

#include <QByteArray>
#include <QException>

namespace healthsync {

/**
 * @brief Base class of all exceptions thrown by libhealthsync.
 *
 * The exceptions are QExceptions so they can be stored inside QFutures and
 * rethrown in the thread consuming the future; subclasses must override
 * clone and raise for that to preserve the dynamic type. The message is
 * an ErrorString so the host application can show its localized form.
 */
class HEALTHSYNC_EXPORT IHealthSyncException :
    public utility::Printable,
    public QException
{
public:
    ~IHealthSyncException() noexcept override;

    [[nodiscard]] const ErrorString & errorMessage() const noexcept;

    [[nodiscard]] const char * what() const noexcept override;

    /**
     * Prints "<exception name>: <non-localized message>"
     */
    QTextStream & print(QTextStream & strm) const override;

protected:
    explicit IHealthSyncException(ErrorString message);

    [[nodiscard]] virtual QString exceptionDisplayName() const = 0;

private:
    ErrorString m_message;

    // what() must return the pointer valid for the exception's lifetime
    QByteArray m_whatMessage;
};

} // namespace healthsync
