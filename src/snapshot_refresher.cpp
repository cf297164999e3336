#include "snapshot_refresher.hpp"

#include <nlohmann/json.hpp>

namespace realtime
{

    SnapshotRefresher::SnapshotRefresher(RealtimeHub& hub, livelink::AnalyticsProvider& analytics,
                                         diag::DiagnosticManager& diag, RefresherOptions opts)
        : m_hub(hub),
          m_analytics(analytics),
          m_diag(diag),
          m_opts(opts),
          m_pool("refresh", opts.workers, diag)
    {
    }

    SnapshotRefresher::~SnapshotRefresher()
    {
        stop();
        m_pool.stop();
    }

    void SnapshotRefresher::start()
    {
        if (m_running.exchange(true))
            return;
        m_thread = std::thread(&SnapshotRefresher::threadFn, this);
    }

    void SnapshotRefresher::stop()
    {
        {
            std::lock_guard<std::mutex> lk(m_mtx);
            if (!m_running.exchange(false))
                return;
        }
        m_cv.notify_all();
        if (m_thread.joinable())
            m_thread.join();
        m_pool.stop();
    }

    std::size_t SnapshotRefresher::refreshOnce()
    {
        std::size_t queued    = 0;
        std::size_t coalesced = 0;
        for (const auto& topic : m_hub.activeTopics())
        {
            switch (m_pool.submit(topic, [this, topic]() { refreshTopic(topic); }))
            {
            case FetchPool::SubmitResult::Queued:
                ++queued;
                break;
            case FetchPool::SubmitResult::Coalesced:
                ++coalesced;
                break;
            case FetchPool::SubmitResult::Stopped:
                return queued;
            }
        }
        if (coalesced > 0)
            m_diag.log(diag::Severity::DEBUG, "Refresher",
                       std::to_string(coalesced) + " topics still waiting on their previous refresh");
        return queued;
    }

    bool SnapshotRefresher::waitIdle(std::chrono::milliseconds timeout)
    {
        return m_pool.waitIdle(timeout);
    }

    void SnapshotRefresher::threadFn()
    {
        m_diag.log(diag::Severity::INFO, "Refresher",
                   "refreshing active topics every " + std::to_string(m_opts.interval.count()) + "s");
        std::unique_lock<std::mutex> lk(m_mtx);
        while (m_running.load())
        {
            if (m_cv.wait_for(lk, m_opts.interval, [this]() { return !m_running.load(); }))
                break;
            lk.unlock();
            const auto queued = refreshOnce();
            if (queued > 0)
                m_diag.log(diag::Severity::DEBUG, "Refresher", "queued " + std::to_string(queued) + " refreshes");
            lk.lock();
        }
    }

    void SnapshotRefresher::refreshTopic(const std::string& topic)
    {
        try
        {
            auto snapshot = m_analytics.getAnalyticsSnapshot(topic, m_opts.windowDays);
            m_hub.broadcast(makeUpdate(UpdateKind::AnalyticsSnapshot, topic, snapshot));
        }
        catch (const livelink::AnalyticsError& ex)
        {
            ++m_fetchFailures;
            m_diag.log(diag::Severity::WARN, "Refresher", "skipping " + topic + ": " + ex.what());
        }
    }

} // namespace realtime
