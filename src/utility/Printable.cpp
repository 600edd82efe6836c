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


#include <healthsync/utility/Printable.h>

namespace healthsync::utility {

Printable::~Printable() noexcept = default;

QString Printable::toString() const
{
    return ToString(*this);
}

QTextStream & operator<<(QTextStream & strm, const Printable & printable)
{
    return printable.print(strm);
}

QDebug & operator<<(QDebug & debug, const Printable & printable)
{
    const QDebugStateSaver saver{debug};
    debug.noquote() << printable.toString();
    return debug;
}

} // namespace healthsync::utility
