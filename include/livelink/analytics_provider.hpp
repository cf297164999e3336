#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>

#include "analytics_types.hpp"

namespace livelink
{

    class AnalyticsError : public std::runtime_error
    {
      public:
        AnalyticsError(const std::string& shortCode, const std::string& message);

        const std::string& shortCode() const { return m_shortCode; }

      private:
        std::string m_shortCode;
    };

    /**
     * Read side of the analytics store. Implementations may block; callers run them on
     * fetch workers, never on the hub's control loop. A code with no recorded clicks
     * yields emptyAnalytics(code), not an error.
     */
    class AnalyticsProvider
    {
      public:
        virtual ~AnalyticsProvider() = default;

        virtual AggregateAnalytics getAnalyticsSnapshot(const std::string& shortCode, int windowDays) = 0;
    };

    /**
     * TTL cache in front of another provider, keyed on (code, window). Expired entries are swept
     * on insert at most once per TTL, and the table never holds more than maxEntries: when full,
     * the entry closest to expiry makes room.
     */
    class CachingAnalyticsProvider : public AnalyticsProvider
    {
      public:
        using Clock = std::chrono::steady_clock;

        CachingAnalyticsProvider(AnalyticsProvider& upstream, std::chrono::seconds ttl,
                                 std::size_t maxEntries = 10000);

        AggregateAnalytics getAnalyticsSnapshot(const std::string& shortCode, int windowDays) override;

        void        clear();
        std::size_t size() const;

      private:
        struct Entry
        {
            AggregateAnalytics value;
            Clock::time_point  expiresAt;
        };

        void storeLocked(std::pair<std::string, int> key, const AggregateAnalytics& value, Clock::time_point now);

        AnalyticsProvider&                           m_upstream;
        const std::chrono::seconds                   m_ttl;
        const std::size_t                            m_maxEntries;
        mutable std::mutex                           m_mtx;
        std::map<std::pair<std::string, int>, Entry> m_entries;
        Clock::time_point                            m_nextSweep{};
    };

} // namespace livelink
