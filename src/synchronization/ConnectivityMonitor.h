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

#include "Fwd.h"

#include <healthsync/synchronization/types/SyncOutcome.h>

#include <QObject>
#include <QTimer>

#include <chrono>

namespace healthsync::synchronization {

/**
 * @brief The ConnectivityMonitor class tracks network reachability and
 * health data availability and re-arms paused sync once the conditions which
 * paused it are gone. It never touches the sync state itself: it only calls
 * the orchestrator which decides whether there is anything to resume.
 *
 * Triggers fire only while the monitor is started.
 */
class ConnectivityMonitor final : public QObject
{
    Q_OBJECT
public:
    enum class Reachability
    {
        Unknown,
        Connected,
        Disconnected
    };
    Q_ENUM(Reachability)

    enum class DataAvailability
    {
        Available,
        Unavailable
    };
    Q_ENUM(DataAvailability)

    struct Delays
    {
        /**
         * Time to wait after reconnect before resuming
         */
        std::chrono::milliseconds networkSettleDelay{2000};

        /**
         * Time to wait after health data became available before resuming
         */
        std::chrono::milliseconds availabilityResumeDelay{1000};

        /**
         * Min age of outbox items retried after reconnect
         */
        std::chrono::milliseconds outboxRetryMinAge{30000};
    };

    ConnectivityMonitor(
        ISyncOrchestratorPtr orchestrator,
        IChunkTransmitterPtr chunkTransmitter, Delays delays,
        QObject * parent = nullptr);

    ~ConnectivityMonitor() override;

    void start();
    void stop();

    [[nodiscard]] bool isActive() const noexcept;
    [[nodiscard]] Reachability reachability() const noexcept;
    [[nodiscard]] DataAvailability dataAvailability() const noexcept;

    /**
     * @return true if network failure or disconnect happened since the last
     *         reconnect
     */
    [[nodiscard]] bool wasDisconnected() const noexcept;

    /**
     * @return true if sync paused because of unavailable health data and
     *         waits for it to become available; the flag is cleared when
     *         the deferred sync is started
     */
    [[nodiscard]] bool isDeferredResumePending() const noexcept;

public Q_SLOTS:
    void setReachability(Reachability reachability);
    void setDataAvailability(DataAvailability availability);

    /**
     * Marks connectivity as degraded after a request failed at the network
     * level, so that the next reconnect resumes sync
     */
    void markNetworkError();

    void setDeferredResume(bool deferred);

    void onSyncFinished(SyncOutcome outcome);

private:
    void onNetworkSettled();
    void onDataAvailable();
    void tryResume(const char * reason);

private:
    const ISyncOrchestratorPtr m_orchestrator;
    const IChunkTransmitterPtr m_chunkTransmitter;
    const Delays m_delays;

    bool m_active = false;
    Reachability m_reachability = Reachability::Unknown;
    DataAvailability m_dataAvailability = DataAvailability::Available;
    bool m_wasDisconnected = false;
    bool m_deferredResume = false;

    QTimer m_networkSettleTimer;
    QTimer m_availabilityTimer;
};

} // namespace healthsync::synchronization
