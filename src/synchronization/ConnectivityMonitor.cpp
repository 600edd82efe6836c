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


#include "ConnectivityMonitor.h"
#include "IChunkTransmitter.h"
#include "ISyncOrchestrator.h"

#include <healthsync/exception/InvalidArgument.h>
#include <healthsync/logging/HealthSyncLogger.h>
#include <healthsync/threading/QtFutureContinuations.h>

namespace healthsync::synchronization {

ConnectivityMonitor::ConnectivityMonitor(
    ISyncOrchestratorPtr orchestrator, IChunkTransmitterPtr chunkTransmitter,
    const Delays delays, QObject * parent) :
    QObject(parent), m_orchestrator{std::move(orchestrator)},
    m_chunkTransmitter{std::move(chunkTransmitter)}, m_delays{delays}
{
    if (Q_UNLIKELY(!m_orchestrator)) {
        throw InvalidArgument{ErrorString{
            QStringLiteral("ConnectivityMonitor ctor: orchestrator is null")}};
    }

    if (Q_UNLIKELY(!m_chunkTransmitter)) {
        throw InvalidArgument{ErrorString{QStringLiteral(
            "ConnectivityMonitor ctor: chunk transmitter is null")}};
    }

    m_networkSettleTimer.setSingleShot(true);
    m_networkSettleTimer.setInterval(m_delays.networkSettleDelay);
    QObject::connect(
        &m_networkSettleTimer, &QTimer::timeout, this,
        &ConnectivityMonitor::onNetworkSettled);

    m_availabilityTimer.setSingleShot(true);
    m_availabilityTimer.setInterval(m_delays.availabilityResumeDelay);
    QObject::connect(
        &m_availabilityTimer, &QTimer::timeout, this,
        &ConnectivityMonitor::onDataAvailable);
}

ConnectivityMonitor::~ConnectivityMonitor() = default;

void ConnectivityMonitor::start()
{
    if (m_active) {
        return;
    }

    m_active = true;
    HSINFO("synchronization::ConnectivityMonitor", "Monitoring started");
}

void ConnectivityMonitor::stop()
{
    if (!m_active) {
        return;
    }

    m_active = false;
    m_wasDisconnected = false;
    m_deferredResume = false;
    m_networkSettleTimer.stop();
    m_availabilityTimer.stop();

    HSINFO("synchronization::ConnectivityMonitor", "Monitoring stopped");
}

bool ConnectivityMonitor::isActive() const noexcept
{
    return m_active;
}

ConnectivityMonitor::Reachability ConnectivityMonitor::reachability()
    const noexcept
{
    return m_reachability;
}

ConnectivityMonitor::DataAvailability ConnectivityMonitor::dataAvailability()
    const noexcept
{
    return m_dataAvailability;
}

bool ConnectivityMonitor::wasDisconnected() const noexcept
{
    return m_wasDisconnected;
}

bool ConnectivityMonitor::isDeferredResumePending() const noexcept
{
    return m_deferredResume;
}

void ConnectivityMonitor::setReachability(const Reachability reachability)
{
    m_reachability = reachability;

    switch (reachability) {
    case Reachability::Disconnected:
        m_networkSettleTimer.stop();
        if (!m_wasDisconnected) {
            m_wasDisconnected = true;
            HSINFO("synchronization::ConnectivityMonitor", "Network lost");
        }
        return;
    case Reachability::Connected:
        if (!m_wasDisconnected) {
            return;
        }

        m_wasDisconnected = false;
        HSINFO("synchronization::ConnectivityMonitor", "Network restored");

        if (m_active) {
            m_networkSettleTimer.start();
        }
        return;
    case Reachability::Unknown:
        return;
    }
}

void ConnectivityMonitor::setDataAvailability(
    const DataAvailability availability)
{
    m_dataAvailability = availability;

    if (availability == DataAvailability::Unavailable) {
        m_availabilityTimer.stop();
        HSDEBUG(
            "synchronization::ConnectivityMonitor",
            "Health data became unavailable");
        return;
    }

    HSDEBUG(
        "synchronization::ConnectivityMonitor",
        "Health data became available");

    // The flag stays set until the timer fires so that a flicker of
    // availability within the delay keeps the deferred sync pending
    if (!m_deferredResume) {
        return;
    }

    if (m_active) {
        HSINFO(
            "synchronization::ConnectivityMonitor",
            "Triggering deferred sync after health data became available");
        m_availabilityTimer.start();
    }
}

void ConnectivityMonitor::markNetworkError()
{
    m_wasDisconnected = true;
}

void ConnectivityMonitor::setDeferredResume(const bool deferred)
{
    m_deferredResume = deferred;
}

void ConnectivityMonitor::onSyncFinished(const SyncOutcome outcome)
{
    switch (outcome) {
    case SyncOutcome::Interrupted:
        markNetworkError();
        break;
    case SyncOutcome::DataUnavailable:
        m_dataAvailability = DataAvailability::Unavailable;
        setDeferredResume(true);
        break;
    default:
        break;
    }
}

void ConnectivityMonitor::onNetworkSettled()
{
    if (!m_active) {
        return;
    }

    if (m_reachability == Reachability::Disconnected) {
        HSDEBUG(
            "synchronization::ConnectivityMonitor",
            "Network was lost again before settling");
        return;
    }

    auto retryFuture =
        m_chunkTransmitter->retryPendingItems(m_delays.outboxRetryMinAge);
    threading::then(
        std::move(retryFuture), this, [this](const SweepResult & result) {
            HSDEBUG(
                "synchronization::ConnectivityMonitor",
                "Outbox retry after reconnect: " << result);

            if (result.networkFailure && m_active) {
                markNetworkError();
            }
        });

    tryResume("network restored");
}

void ConnectivityMonitor::onDataAvailable()
{
    if (!m_active || !m_deferredResume) {
        return;
    }

    m_deferredResume = false;

    if (m_orchestrator->isSyncing()) {
        HSINFO(
            "synchronization::ConnectivityMonitor",
            "Sync already in progress, not starting deferred sync");
        return;
    }

    // Sync may have paused before anything was sent, so there is not
    // necessarily a resumable session; startSync continues the stored
    // session if it has progress and starts a new one otherwise
    HSINFO(
        "synchronization::ConnectivityMonitor",
        "Starting deferred sync after health data became available");

    auto syncFuture = m_orchestrator->startSync(false, nullptr);
    threading::then(std::move(syncFuture), [](const SyncOutcome outcome) {
        HSINFO(
            "synchronization::ConnectivityMonitor",
            "Deferred sync finished: " << outcome);
    });
}

void ConnectivityMonitor::tryResume(const char * reason)
{
    if (m_orchestrator->isSyncing()) {
        HSINFO(
            "synchronization::ConnectivityMonitor",
            "Sync already in progress, not resuming after " << reason);
        return;
    }

    if (!m_orchestrator->hasResumableSession()) {
        HSINFO(
            "synchronization::ConnectivityMonitor",
            "No sync to resume after " << reason);
        return;
    }

    HSINFO(
        "synchronization::ConnectivityMonitor",
        "Resuming sync after " << reason);

    auto resumeFuture = m_orchestrator->resumeSync(nullptr);
    threading::then(std::move(resumeFuture), [](const SyncOutcome outcome) {
        HSINFO(
            "synchronization::ConnectivityMonitor",
            "Resumed sync finished: " << outcome);
    });
}

} // namespace healthsync::synchronization
