#include "http_analytics_provider.hpp"

#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>
#include <nlohmann/json.hpp>

namespace livelink
{

    namespace
    {

        // Splits "https://host:port/prefix" into the origin and the path prefix.
        std::pair<std::string, std::string> splitBaseUrl(const std::string& baseUrl)
        {
            const auto schemeEnd = baseUrl.find("://");
            const auto hostStart = schemeEnd == std::string::npos ? 0 : schemeEnd + 3;
            const auto pathStart = baseUrl.find('/', hostStart);
            if (pathStart == std::string::npos)
                return {baseUrl, {}};

            std::string prefix = baseUrl.substr(pathStart);
            while (!prefix.empty() && prefix.back() == '/')
                prefix.pop_back();
            return {baseUrl.substr(0, pathStart), prefix};
        }

    } // namespace

    HttpAnalyticsProvider::HttpAnalyticsProvider(const std::string& baseUrl, std::chrono::milliseconds timeout,
                                                 const std::string& apiKey)
        : m_timeout(timeout), m_apiKey(apiKey), m_loopThread("AnalyticsClient")
    {
        auto [origin, prefix] = splitBaseUrl(baseUrl);
        m_pathPrefix          = prefix;
        m_loopThread.run();
        m_client = drogon::HttpClient::newHttpClient(origin, m_loopThread.getLoop());
    }

    HttpAnalyticsProvider::~HttpAnalyticsProvider()
    {
        // The client must go before its loop; the loop thread quits and joins in its own destructor.
        m_client.reset();
    }

    AggregateAnalytics HttpAnalyticsProvider::getAnalyticsSnapshot(const std::string& shortCode, int windowDays)
    {
        auto req = drogon::HttpRequest::newHttpRequest();
        req->setMethod(drogon::Get);
        req->setPath(m_pathPrefix + "/api/v1/analytics/" + shortCode);
        req->setParameter("days", std::to_string(windowDays));
        if (!m_apiKey.empty())
            req->addHeader("X-API-Key", m_apiKey);

        const double timeoutSec = std::chrono::duration<double>(m_timeout).count();
        auto [result, resp]     = m_client->sendRequest(req, timeoutSec);
        if (result != drogon::ReqResult::Ok || !resp)
            throw AnalyticsError(shortCode, "request failed (result " + std::to_string(static_cast<int>(result)) + ")");

        if (resp->getStatusCode() == drogon::k404NotFound)
            return emptyAnalytics(shortCode);
        if (resp->getStatusCode() != drogon::k200OK)
            throw AnalyticsError(shortCode, "HTTP status " + std::to_string(static_cast<int>(resp->getStatusCode())));

        try
        {
            const auto body     = nlohmann::json::parse(std::string(resp->getBody()));
            auto       snapshot = body.get<AggregateAnalytics>();
            if (snapshot.shortCode.empty())
                snapshot.shortCode = shortCode;
            return snapshot;
        }
        catch (const std::exception& ex)
        {
            throw AnalyticsError(shortCode, std::string("invalid response body: ") + ex.what());
        }
    }

} // namespace livelink
