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


#include <healthsync/types/ErrorString.h>

#include <QCoreApplication>

#include <utility>

namespace healthsync {

namespace {

[[nodiscard]] QString joined(QString base, const QString & details)
{
    if (details.isEmpty()) {
        return base;
    }

    if (base.isEmpty()) {
        return details;
    }

    return base + QStringLiteral(": ") + details;
}

} // namespace

ErrorString::ErrorString(const char * base) :
    m_base{QString::fromUtf8(base)}
{}

ErrorString::ErrorString(QString base) : m_base{std::move(base)} {}

const QString & ErrorString::base() const noexcept
{
    return m_base;
}

const QString & ErrorString::details() const noexcept
{
    return m_details;
}

QString & ErrorString::details()
{
    return m_details;
}

void ErrorString::setDetails(QString details)
{
    m_details = std::move(details);
}

bool ErrorString::isEmpty() const noexcept
{
    return m_base.isEmpty() && m_details.isEmpty();
}

QString ErrorString::localizedString() const
{
    QString translated;
    if (!m_base.isEmpty()) {
        const QByteArray source = m_base.toUtf8();
        translated = QCoreApplication::translate("", source.constData());
    }

    QString result = joined(std::move(translated), m_details);
    if (!result.isEmpty()) {
        result[0] = result.at(0).toUpper();
    }
    return result;
}

QString ErrorString::nonLocalizedString() const
{
    return joined(m_base, m_details);
}

QTextStream & ErrorString::print(QTextStream & strm) const
{
    strm << nonLocalizedString();
    return strm;
}

bool operator==(const ErrorString & lhs, const ErrorString & rhs) noexcept
{
    return lhs.m_base == rhs.m_base && lhs.m_details == rhs.m_details;
}

bool operator!=(const ErrorString & lhs, const ErrorString & rhs) noexcept
{
    return !(lhs == rhs);
}

} // namespace healthsync
