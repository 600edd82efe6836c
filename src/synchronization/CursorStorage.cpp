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

#include "CursorStorage.h"

#include <healthsync/exception/InvalidArgument.h>
#include <healthsync/exception/RuntimeError.h>
#include <healthsync/logging/HealthSyncLogger.h>

#include "Utils.h"

#include <QFile>
#include <QSettings>
#include <QUrl>

#include <string_view>

namespace healthsync::synchronization {

using namespace std::string_view_literals;

namespace {

constexpr auto gCursorsIniFileName = "cursors.ini"sv;
constexpr auto gCursorsGroup = "Cursors"sv;
constexpr auto gSequencesGroup = "Sequences"sv;
constexpr auto gFullExportDoneKey = "fullExportDone"sv;

// Type identifiers are percent encoded as QSettings treats slashes within
// keys as group separators
[[nodiscard]] QString settingsKey(
    const std::string_view group, const TrackedType & type)
{
    return toString(group) + QStringLiteral("/") +
        QString::fromLatin1(QUrl::toPercentEncoding(type));
}

void checkStatus(const QSettings & settings, const TrackedType & type)
{
    if (Q_UNLIKELY(settings.status() != QSettings::NoError)) {
        ErrorString error{QT_TRANSLATE_NOOP(
            "synchronization::CursorStorage", "Failed to persist cursor")};
        error.details() = settings.fileName();
        if (!type.isEmpty()) {
            error.details() += QStringLiteral(", type ") + type;
        }
        throw RuntimeError{std::move(error)};
    }
}

} // namespace

CursorStorage::CursorStorage(QDir rootDir) : m_rootDir{std::move(rootDir)}
{
    if (Q_UNLIKELY(m_rootDir.path().isEmpty())) {
        throw InvalidArgument{ErrorString{QStringLiteral(
            "CursorStorage ctor: root dir path is empty")}};
    }
}

std::optional<Cursor> CursorStorage::cursor(
    const QString & userKey, const TrackedType & type) const
{
    const QSettings settings{settingsFilePath(userKey), QSettings::IniFormat};
    const auto value = settings.value(settingsKey(gCursorsGroup, type));
    if (!value.isValid()) {
        return std::nullopt;
    }

    Cursor cursor = value.toByteArray();
    if (Q_UNLIKELY(cursor.isEmpty())) {
        HSWARNING(
            "synchronization::CursorStorage",
            "Detected empty cursor for type " << type << ", user key "
                                              << userKey);
        return std::nullopt;
    }

    return cursor;
}

bool CursorStorage::commitCursor(
    const QString & userKey, const TrackedType & type, const Cursor & cursor,
    const qint64 sequence)
{
    QSettings settings{settingsFilePath(userKey), QSettings::IniFormat};

    const auto sequenceKey = settingsKey(gSequencesGroup, type);
    const auto storedSequenceValue = settings.value(sequenceKey);
    if (storedSequenceValue.isValid()) {
        bool conversionResult = false;
        const qint64 storedSequence =
            storedSequenceValue.toLongLong(&conversionResult);
        if (conversionResult && storedSequence > sequence) {
            HSDEBUG(
                "synchronization::CursorStorage",
                "Ignoring stale cursor for " << shortTypeName(type)
                    << ": sequence " << sequence << " < committed "
                    << storedSequence);
            return false;
        }
    }

    settings.setValue(settingsKey(gCursorsGroup, type), cursor);
    settings.setValue(sequenceKey, sequence);
    settings.sync();
    checkStatus(settings, type);

    HSTRACE(
        "synchronization::CursorStorage",
        "Committed cursor for " << shortTypeName(type) << ", sequence "
                                << sequence);
    return true;
}

bool CursorStorage::isFullExportDone(const QString & userKey) const
{
    const QSettings settings{settingsFilePath(userKey), QSettings::IniFormat};
    return settings.value(toString(gFullExportDoneKey), false).toBool();
}

void CursorStorage::setFullExportDone(const QString & userKey, const bool done)
{
    QSettings settings{settingsFilePath(userKey), QSettings::IniFormat};
    settings.setValue(toString(gFullExportDoneKey), done);
    settings.sync();
    checkStatus(settings, QString{});
}

void CursorStorage::clear(const QString & userKey)
{
    const QString filePath = settingsFilePath(userKey);
    if (QFile::exists(filePath) && Q_UNLIKELY(!QFile::remove(filePath))) {
        HSWARNING(
            "synchronization::CursorStorage",
            "Failed to remove cursors file " << filePath
                << ", clearing its contents instead");

        QSettings settings{filePath, QSettings::IniFormat};
        settings.clear();
        settings.sync();
    }
}

QString CursorStorage::settingsFilePath(const QString & userKey) const
{
    return m_rootDir.absoluteFilePath(
        userKey + QStringLiteral("/") + toString(gCursorsIniFileName));
}

} // namespace healthsync::synchronization
