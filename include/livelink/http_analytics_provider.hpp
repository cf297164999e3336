#pragma once

#include <drogon/HttpClient.h>
#include <trantor/net/EventLoopThread.h>

#include <chrono>
#include <string>

#include "analytics_provider.hpp"

namespace livelink
{

    /**
     * Pulls aggregate snapshots from the platform's REST API:
     *   GET {baseUrl}/api/v1/analytics/{code}?days={N}
     * A 404 means the code has no recorded data and maps to a zero-value snapshot.
     * The client runs on its own event loop thread so that synchronous requests made
     * from fetch workers never depend on the HTTP server's loops.
     */
    class HttpAnalyticsProvider : public AnalyticsProvider
    {
      public:
        HttpAnalyticsProvider(const std::string& baseUrl, std::chrono::milliseconds timeout,
                              const std::string& apiKey = {});
        ~HttpAnalyticsProvider() override;

        AggregateAnalytics getAnalyticsSnapshot(const std::string& shortCode, int windowDays) override;

      private:
        std::string               m_pathPrefix;
        std::chrono::milliseconds m_timeout;
        std::string               m_apiKey;
        trantor::EventLoopThread  m_loopThread;
        drogon::HttpClientPtr     m_client;
    };

} // namespace livelink
