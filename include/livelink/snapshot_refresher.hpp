#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

#include "analytics_provider.hpp"
#include "diagnostic_manager.hpp"
#include "fetch_pool.hpp"
#include "realtime_hub.hpp"

namespace realtime
{

    struct RefresherOptions
    {
        std::chrono::seconds interval{30};
        int                  windowDays{1};
        std::size_t          workers{4};
    };

    // Re-broadcasts a fresh analytics_update for every topic that has subscribers, once per interval.
    class SnapshotRefresher
    {
      public:
        SnapshotRefresher(RealtimeHub& hub, livelink::AnalyticsProvider& analytics, diag::DiagnosticManager& diag,
                          RefresherOptions opts = {});
        ~SnapshotRefresher();

        SnapshotRefresher(const SnapshotRefresher&)            = delete;
        SnapshotRefresher& operator=(const SnapshotRefresher&) = delete;

        void start();
        void stop();
        bool isRunning() const { return m_running.load(); }

        // Queues one fetch per active topic; a topic whose previous refresh is still queued is
        // coalesced into it. Returns how many new fetches were queued.
        std::size_t refreshOnce();
        bool        waitIdle(std::chrono::milliseconds timeout);

        uint64_t fetchFailures() const { return m_fetchFailures.load(); }

      private:
        void threadFn();
        void refreshTopic(const std::string& topic);

        RealtimeHub&                 m_hub;
        livelink::AnalyticsProvider& m_analytics;
        diag::DiagnosticManager&     m_diag;
        const RefresherOptions       m_opts;

        std::mutex              m_mtx;
        std::condition_variable m_cv;
        std::atomic<bool>       m_running{false};
        std::thread             m_thread;
        std::atomic<uint64_t>   m_fetchFailures{0};

        FetchPool m_pool;
    };

} // namespace realtime
