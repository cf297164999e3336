#include "analytics_provider.hpp"

#include <algorithm>

namespace livelink
{

    AnalyticsError::AnalyticsError(const std::string& shortCode, const std::string& message)
        : std::runtime_error("analytics fetch for '" + shortCode + "' failed: " + message), m_shortCode(shortCode)
    {
    }

    CachingAnalyticsProvider::CachingAnalyticsProvider(AnalyticsProvider& upstream, std::chrono::seconds ttl,
                                                       std::size_t maxEntries)
        : m_upstream(upstream), m_ttl(ttl), m_maxEntries(std::max<std::size_t>(maxEntries, 1))
    {
    }

    AggregateAnalytics CachingAnalyticsProvider::getAnalyticsSnapshot(const std::string& shortCode, int windowDays)
    {
        const auto key = std::make_pair(shortCode, windowDays);
        {
            std::lock_guard<std::mutex> lk(m_mtx);
            auto                        it = m_entries.find(key);
            if (it != m_entries.end())
            {
                if (Clock::now() < it->second.expiresAt)
                    return it->second.value;
                m_entries.erase(it);
            }
        }

        // Upstream is called without the lock so a slow fetch does not serialize other codes.
        auto fresh = m_upstream.getAnalyticsSnapshot(shortCode, windowDays);

        std::lock_guard<std::mutex> lk(m_mtx);
        storeLocked(key, fresh, Clock::now());
        return fresh;
    }

    void CachingAnalyticsProvider::storeLocked(std::pair<std::string, int> key, const AggregateAnalytics& value,
                                               Clock::time_point now)
    {
        if (now >= m_nextSweep)
        {
            for (auto it = m_entries.begin(); it != m_entries.end();)
            {
                if (it->second.expiresAt <= now)
                    it = m_entries.erase(it);
                else
                    ++it;
            }
            m_nextSweep = now + m_ttl;
        }

        auto existing = m_entries.find(key);
        if (existing == m_entries.end() && m_entries.size() >= m_maxEntries)
        {
            auto oldest = std::min_element(m_entries.begin(), m_entries.end(), [](const auto& a, const auto& b) {
                return a.second.expiresAt < b.second.expiresAt;
            });
            m_entries.erase(oldest);
        }
        m_entries[std::move(key)] = Entry{value, now + m_ttl};
    }

    void CachingAnalyticsProvider::clear()
    {
        std::lock_guard<std::mutex> lk(m_mtx);
        m_entries.clear();
    }

    std::size_t CachingAnalyticsProvider::size() const
    {
        std::lock_guard<std::mutex> lk(m_mtx);
        return m_entries.size();
    }

} // namespace livelink
