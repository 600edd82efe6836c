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

#include <healthsync/utility/Linkage.h>

#include <QDebug>
#include <QIODevice>
#include <QString>
#include <QTextStream>

// Text form of anything streamable into QTextStream
template <class T>
[[nodiscard]] QString ToString(const T & object)
{
    QString result;
    QTextStream strm{&result, QIODevice::WriteOnly};
    strm << object;
    strm.flush();
    return result;
}

namespace healthsync::utility {

/**
 * Base for types written into logs: implementors provide print() and get
 * QTextStream and QDebug output together with toString()
 */
class HEALTHSYNC_EXPORT Printable
{
public:
    virtual ~Printable() noexcept;

    virtual QTextStream & print(QTextStream & strm) const = 0;

    [[nodiscard]] QString toString() const;
};

HEALTHSYNC_EXPORT QTextStream & operator<<(
    QTextStream & strm, const Printable & printable);

HEALTHSYNC_EXPORT QDebug & operator<<(
    QDebug & debug, const Printable & printable);

} // namespace healthsync::utility

namespace healthsync {

using utility::Printable;

} // namespace healthsync
