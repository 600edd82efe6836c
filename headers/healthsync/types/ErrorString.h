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

#include <healthsync/utility/Printable.h>

#include <QString>

namespace healthsync {

/**
 * @brief Error description made of the base part which is a translatable
 * literal and of the details part, not translatable, which comes from
 * the filesystem, QtKeychain, the server response and so on.
 */
class HEALTHSYNC_EXPORT ErrorString : public Printable
{
public:
    explicit ErrorString(const char * base = nullptr);
    explicit ErrorString(QString base);

    [[nodiscard]] const QString & base() const noexcept;

    [[nodiscard]] const QString & details() const noexcept;
    [[nodiscard]] QString & details();
    void setDetails(QString details);

    [[nodiscard]] bool isEmpty() const noexcept;

    /**
     * Base translated with QCoreApplication::translate followed by details
     */
    [[nodiscard]] QString localizedString() const;
    [[nodiscard]] QString nonLocalizedString() const;

    QTextStream & print(QTextStream & strm) const override;

    friend HEALTHSYNC_EXPORT bool operator==(
        const ErrorString & lhs, const ErrorString & rhs) noexcept;

    friend HEALTHSYNC_EXPORT bool operator!=(
        const ErrorString & lhs, const ErrorString & rhs) noexcept;

private:
    QString m_base;
    QString m_details;
};

} // namespace healthsync
