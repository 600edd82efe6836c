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

#include <healthsync/synchronization/types/SyncOutcome.h>

#include <healthsync/utility/Printable.h>

namespace healthsync::synchronization {

QTextStream & operator<<(QTextStream & strm, const SyncOutcome outcome)
{
    switch (outcome) {
    case SyncOutcome::Completed:
        strm << "Completed";
        break;
    case SyncOutcome::AlreadyInProgress:
        strm << "Already in progress";
        break;
    case SyncOutcome::NothingToResume:
        strm << "Nothing to resume";
        break;
    case SyncOutcome::Canceled:
        strm << "Canceled";
        break;
    case SyncOutcome::Interrupted:
        strm << "Interrupted";
        break;
    case SyncOutcome::DataUnavailable:
        strm << "Data unavailable";
        break;
    case SyncOutcome::BudgetExhausted:
        strm << "Budget exhausted";
        break;
    case SyncOutcome::StorageFailure:
        strm << "Storage failure";
        break;
    case SyncOutcome::AuthenticationFailed:
        strm << "Authentication failed";
        break;
    case SyncOutcome::NotSignedIn:
        strm << "Not signed in";
        break;
    default:
        strm << "Unknown (" << static_cast<qint64>(outcome) << ")";
        break;
    }

    return strm;
}

QDebug & operator<<(QDebug & dbg, const SyncOutcome outcome)
{
    dbg << ToString(outcome);
    return dbg;
}

} // namespace healthsync::synchronization
