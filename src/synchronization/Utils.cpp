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

#include "Utils.h"

namespace healthsync::synchronization {

namespace {

constexpr int gMaxLoggedResponseBodySize = 200;

} // namespace

QString userKey(const QString & userId)
{
    if (userId.isEmpty()) {
        return QStringLiteral("user.none");
    }

    return QStringLiteral("user.") + userId;
}

QString shortTypeName(const TrackedType & type)
{
    QString name = type;
    name.replace(QStringLiteral("HKQuantityTypeIdentifier"), QString{});
    name.replace(QStringLiteral("HKCategoryTypeIdentifier"), QString{});
    name.replace(QStringLiteral("HKWorkoutType"), QStringLiteral("Workout"));
    return name;
}

QString truncatedResponseBody(const QByteArray & body)
{
    const QString str = QString::fromUtf8(body);
    if (str.size() <= gMaxLoggedResponseBodySize) {
        return str;
    }

    return str.left(gMaxLoggedResponseBodySize) + QStringLiteral("...");
}

QByteArray bearerAuthorizationHeaderValue(const QString & accessToken)
{
    if (accessToken.startsWith(QStringLiteral("Bearer "))) {
        return accessToken.toUtf8();
    }

    return QByteArrayLiteral("Bearer ") + accessToken.toUtf8();
}

QString joinUrl(QString host, const QString & path)
{
    while (host.endsWith(QChar::fromLatin1('/'))) {
        host.chop(1);
    }

    if (path.startsWith(QChar::fromLatin1('/'))) {
        return host + path;
    }

    return host + QStringLiteral("/") + path;
}

QString toString(const std::string_view str)
{
    return QString::fromUtf8(str.data(), static_cast<int>(str.size()));
}

} // namespace healthsync::synchronization
