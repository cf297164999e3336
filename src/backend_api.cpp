#include "backend_api.hpp"

#include <chrono>

#include <nlohmann/json.hpp>

#include "analytics_types.hpp"
#include "realtime_protocol.hpp"

namespace api
{

    namespace
    {
        bool readShortCode(const nlohmann::json& body, std::string& code, std::string* error)
        {
            if (!body.is_object())
            {
                if (error)
                    *error = "request body must be a JSON object";
                return false;
            }
            auto it = body.find("short_code");
            if (it == body.end() || !it->is_string())
            {
                if (error)
                    *error = "short_code is required";
                return false;
            }
            code = it->get<std::string>();
            if (!realtime::isValidShortCode(code))
            {
                if (error)
                    *error = "invalid short_code: " + code;
                return false;
            }
            return true;
        }

        std::string optionalString(const nlohmann::json& body, const char* key)
        {
            auto it = body.find(key);
            if (it == body.end() || !it->is_string())
                return {};
            return it->get<std::string>();
        }

        int64_t toMillis(const std::chrono::system_clock::time_point& tp)
        {
            return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
        }
    } // namespace

    BackendApi::BackendApi(realtime::RealtimeHub& hub, diag::DiagnosticManager& diag,
                           const realtime::SnapshotRefresher* refresher)
        : m_hub(hub), m_diag(diag), m_refresher(refresher)
    {
    }

    nlohmann::json BackendApi::getRealtimeStats() const
    {
        nlohmann::json j;
        j["active_clients"]       = m_hub.activeConnectionCount();
        j["active_subscriptions"] = nlohmann::json::object();
        for (const auto& [topic, count] : m_hub.activeSubscriptionCounts())
            j["active_subscriptions"][topic] = count;
        return j;
    }

    IngestResult BackendApi::ingestClick(const nlohmann::json& body, std::string* error)
    {
        std::string code;
        if (!readShortCode(body, code, error))
            return IngestResult::Invalid;

        auto ip = optionalString(body, "ip_address");
        if (ip.empty())
            ip = optionalString(body, "client_ip");

        if (!m_hub.broadcastClick(code, ip, optionalString(body, "user_agent"), optionalString(body, "referrer")))
        {
            if (error)
                *error = "broadcast queue full";
            return IngestResult::Dropped;
        }
        return IngestResult::Accepted;
    }

    IngestResult BackendApi::ingestConversion(const nlohmann::json& body, std::string* error)
    {
        std::string code;
        if (!readShortCode(body, code, error))
            return IngestResult::Invalid;

        livelink::ConversionEvent conversion;
        try
        {
            conversion = body.get<livelink::ConversionEvent>();
        }
        catch (const nlohmann::json::exception& ex)
        {
            if (error)
                *error = std::string("invalid conversion: ") + ex.what();
            return IngestResult::Invalid;
        }
        catch (const std::invalid_argument& ex)
        {
            if (error)
                *error = std::string("invalid conversion: ") + ex.what();
            return IngestResult::Invalid;
        }

        if (!m_hub.broadcastConversion(code, conversion))
        {
            if (error)
                *error = "broadcast queue full";
            return IngestResult::Dropped;
        }
        return IngestResult::Accepted;
    }

    nlohmann::json BackendApi::getRecentEvents(std::size_t maxEvents) const
    {
        nlohmann::json j      = nlohmann::json::array();
        auto           events = m_diag.fetchRecent(maxEvents);
        for (const auto& ev : events)
        {
            nlohmann::json item;
            item["component"]   = ev.component;
            item["message"]     = ev.message;
            item["severity"]    = diag::severityToString(ev.severity);
            item["timestampMs"] = toMillis(ev.timestamp);
            if (ev.extraJson)
                item["extra"] = *ev.extraJson;
            j.push_back(std::move(item));
        }
        return j;
    }

    diag::HubMetrics BackendApi::collectMetrics() const
    {
        auto m = m_hub.metrics();
        if (m_refresher)
            m.fetchFailures += m_refresher->fetchFailures();
        return m;
    }

    nlohmann::json BackendApi::getDiagnosticsMetrics() const
    {
        const auto diagSnapshot = m_diag.getMetrics();
        const auto m            = collectMetrics();

        nlohmann::json j;
        j["timestampMs"]          = toMillis(std::chrono::system_clock::now());
        j["threads"]["hub"]       = m_hub.isRunning();
        j["threads"]["diag"]      = diagSnapshot.diagThreadRunning;
        j["threads"]["refresher"] = m_refresher ? m_refresher->isRunning() : false;

        j["hub"]["connections"]   = m.connections;
        j["hub"]["topics"]        = m.topics;
        j["hub"]["subscriptions"] = m.subscriptions;

        j["broadcast"]["accepted"]    = m.broadcastsAccepted;
        j["broadcast"]["dropped"]     = m.broadcastsDropped;
        j["broadcast"]["deliveries"]  = m.deliveries;
        j["broadcast"]["failedSends"] = m.failedSends;

        j["evictions"]          = m.evictions;
        j["fetchFailures"]      = m.fetchFailures;
        j["discardedLogEvents"] = diagSnapshot.discardedLogEvents;
        return j;
    }

} // namespace api
