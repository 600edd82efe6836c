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

#include <QJsonObject>

namespace healthsync::synchronization::tests {

void spinEventLoop(const std::chrono::milliseconds duration)
{
    QEventLoop loop;
    QTimer::singleShot(duration, &loop, &QEventLoop::quit);
    loop.exec();
}

Credentials tokenCredentials(QString userId)
{
    Credentials credentials;
    credentials.userId = std::move(userId);
    credentials.accessToken = QStringLiteral("access-token");
    credentials.refreshToken = QStringLiteral("refresh-token");
    credentials.host = QStringLiteral("https://api.example.com");
    return credentials;
}

Credentials apiKeyCredentials(QString userId)
{
    Credentials credentials;
    credentials.userId = std::move(userId);
    credentials.apiKey = QStringLiteral("api-key");
    credentials.host = QStringLiteral("https://api.example.com/");
    return credentials;
}

DataBatch makeBatch(
    const int recordCount, std::optional<Cursor> newCursor,
    const RecordKind kind)
{
    DataBatch batch;
    batch.records.reserve(recordCount);
    for (int i = 0; i < recordCount; ++i) {
        DataRecord record;
        record.kind = kind;
        record.json[QStringLiteral("value")] = i;
        batch.records << record;
    }
    batch.newCursor = std::move(newCursor);
    return batch;
}

NetworkResponse httpResponse(const int statusCode, QByteArray body)
{
    NetworkResponse response;
    response.statusCode = statusCode;
    response.body = std::move(body);
    return response;
}

NetworkResponse noResponse(QString errorString)
{
    NetworkResponse response;
    response.errorString = std::move(errorString);
    return response;
}

NetworkResponse abortedResponse()
{
    NetworkResponse response;
    response.aborted = true;
    response.errorString = QStringLiteral("Operation canceled");
    return response;
}

SweepResult sweepResult(const int deliveredCount, const bool networkFailure)
{
    SweepResult result;
    result.deliveredCount = deliveredCount;
    result.networkFailure = networkFailure;
    return result;
}

} // namespace healthsync::synchronization::tests
