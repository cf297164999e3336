#include "analytics_provider.hpp"
#include "backend_api.hpp"
#include "diagnostic_manager.hpp"
#include "http_analytics_provider.hpp"
#include "realtime_hub.hpp"
#include "realtime_stream.hpp"
#include "snapshot_refresher.hpp"
#include "xml_loader.hpp"

#include <drogon/drogon.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

using namespace drogon;

int main(int argc, char* argv[])
{
    std::optional<std::string> configPath;
    std::optional<std::string> hostOverride;
    std::optional<std::string> portOverride;
    std::optional<std::string> logFileOverride;
    std::optional<char>        logLevelOverride;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc)
        {
            configPath = argv[++i];
        }
        else if (arg == "--host" && i + 1 < argc)
        {
            hostOverride = argv[++i];
        }
        else if (arg == "--port" && i + 1 < argc)
        {
            portOverride = argv[++i];
        }
        else if (arg == "--log-file" && i + 1 < argc)
        {
            logFileOverride = argv[++i];
        }
        else if (arg == "--log-level" && i + 1 < argc)
        {
            std::string lvl = argv[++i];
            if (!lvl.empty())
                logLevelOverride = lvl[0];
        }
        else
        {
            std::cerr << "usage: " << argv[0]
                      << " [--config <file>] [--host <addr>] [--port <n>] [--log-file <file>] [--log-level D|I|W|E|F]"
                      << std::endl;
            return 2;
        }
    }

    config::HubConfig cfg;
    try
    {
        config::XmlConfigurationLoader xmlLoader;
        if (configPath)
            cfg = xmlLoader.load(*configPath);

        auto getEnv = [](const char* key) -> std::optional<std::string> {
            const char* val = std::getenv(key);
            if (val && *val)
                return std::string(val);
            return std::nullopt;
        };
        if (auto host = getEnv("LIVELINK_HTTP_HOST"))
            cfg.server.host = *host;
        auto parsePort = [](const std::string& text) {
            const auto v = std::stoul(text);
            if (v == 0 || v > 65535)
                throw std::out_of_range("port out of range: " + text);
            return static_cast<uint16_t>(v);
        };
        if (auto port = getEnv("LIVELINK_HTTP_PORT"))
            cfg.server.port = parsePort(*port);
        if (auto url = getEnv("LIVELINK_ANALYTICS_URL"))
            cfg.analytics.baseUrl = *url;
        if (hostOverride)
            cfg.server.host = *hostOverride;
        if (portOverride)
            cfg.server.port = parsePort(*portOverride);

        config::ConfigManager().validateHubConfig(cfg);
    }
    catch (const std::exception& ex)
    {
        std::cerr << "configuration error: " << ex.what() << std::endl;
        return 1;
    }

    diag::LogConfig logCfg;
    if (cfg.debug)
    {
        logCfg.filePath         = cfg.debug->fileName;
        logCfg.maxFileSizeBytes = cfg.debug->fileSize;
        logCfg.minimumSeverity  = diag::severityFromChar(cfg.debug->level);
    }
    if (logFileOverride)
        logCfg.filePath = *logFileOverride;
    if (logLevelOverride)
        logCfg.minimumSeverity = diag::severityFromChar(*logLevelOverride);

    diag::DiagnosticManager diagMgr(logCfg);
    diagMgr.start();
    diagMgr.log(diag::Severity::INFO, "Server", "starting " + cfg.name);

    livelink::HttpAnalyticsProvider httpAnalytics(
        cfg.analytics.baseUrl, std::chrono::milliseconds(cfg.analytics.timeoutMs), cfg.analytics.apiKey);
    std::unique_ptr<livelink::CachingAnalyticsProvider> cachedAnalytics;
    livelink::AnalyticsProvider*                        analytics = &httpAnalytics;
    if (cfg.analytics.cacheTtlSec > 0)
    {
        cachedAnalytics = std::make_unique<livelink::CachingAnalyticsProvider>(
            httpAnalytics, std::chrono::seconds(cfg.analytics.cacheTtlSec));
        analytics = cachedAnalytics.get();
    }

    realtime::HubOptions hubOpts;
    hubOpts.broadcastQueueCapacity = cfg.realtime.broadcastQueue;
    hubOpts.controlQueueCapacity   = cfg.realtime.controlQueue;
    hubOpts.writeTimeout           = std::chrono::milliseconds(cfg.realtime.writeTimeoutMs);
    hubOpts.keepaliveInterval      = std::chrono::seconds(cfg.realtime.keepaliveSec);
    hubOpts.readTimeout            = std::chrono::seconds(cfg.realtime.readTimeoutSec);
    hubOpts.initialWindowDays      = static_cast<int>(cfg.realtime.initialWindowDays);
    hubOpts.fetchWorkers           = cfg.realtime.fetchWorkers;

    realtime::RefresherOptions refreshOpts;
    refreshOpts.interval   = std::chrono::seconds(cfg.realtime.refreshSec);
    refreshOpts.windowDays = static_cast<int>(cfg.realtime.refreshWindowDays);
    refreshOpts.workers    = cfg.realtime.fetchWorkers;

    realtime::RealtimeHub       hub(*analytics, diagMgr, hubOpts);
    realtime::SnapshotRefresher refresher(hub, *analytics, diagMgr, refreshOpts);
    api::BackendApi             api(hub, diagMgr, &refresher);

    diagMgr.setMetricsSource([&api]() { return api.collectMetrics(); });
    RealtimeStream::bootstrap(&hub, &diagMgr, cfg.realtime.sendBufferBytes);
    hub.start();
    refresher.start();

    // ---------------- Drogon HTTP endpoints ----------------
    auto jsonResponse = [](const nlohmann::json& payload, drogon::HttpStatusCode code = k200OK)
    {
        auto resp = HttpResponse::newHttpResponse();
        resp->setStatusCode(code);
        resp->setContentTypeCode(CT_APPLICATION_JSON);
        resp->setBody(payload.dump());
        return resp;
    };

    auto ingestResponse = [jsonResponse](api::IngestResult result, const std::string& error)
    {
        switch (result)
        {
        case api::IngestResult::Accepted:
            return jsonResponse({{"status", "queued"}}, k202Accepted);
        case api::IngestResult::Dropped:
            return jsonResponse({{"status", "dropped"}, {"error", error}}, k503ServiceUnavailable);
        case api::IngestResult::Invalid:
            break;
        }
        return jsonResponse({{"error", error}}, k400BadRequest);
    };

    app().addListener(cfg.server.host, cfg.server.port);
    app().setThreadNum(cfg.server.threads > 0 ? cfg.server.threads : std::max(2u, std::thread::hardware_concurrency()));

    app().registerHandler("/healthz",
                          [jsonResponse](const HttpRequestPtr&, std::function<void(const HttpResponsePtr&)>&& cb)
                          { cb(jsonResponse({{"status", "ok"}})); },
                          {Get});

    // Realtime
    app().registerHandler("/api/v1/realtime/stats",
                          [&api, jsonResponse](const HttpRequestPtr&, std::function<void(const HttpResponsePtr&)>&& cb)
                          { cb(jsonResponse(api.getRealtimeStats())); },
                          {Get});

    app().registerHandler(
        "/api/v1/realtime/events/click",
        [&api, ingestResponse](const HttpRequestPtr& req, std::function<void(const HttpResponsePtr&)>&& cb)
        {
            auto        body = nlohmann::json::parse(std::string(req->body()), nullptr, false);
            std::string error;
            auto        result = body.is_discarded() ? api::IngestResult::Invalid : api.ingestClick(body, &error);
            if (body.is_discarded())
                error = "invalid JSON body";
            cb(ingestResponse(result, error));
        },
        {Post});

    app().registerHandler(
        "/api/v1/realtime/events/conversion",
        [&api, ingestResponse](const HttpRequestPtr& req, std::function<void(const HttpResponsePtr&)>&& cb)
        {
            auto        body = nlohmann::json::parse(std::string(req->body()), nullptr, false);
            std::string error;
            auto        result = body.is_discarded() ? api::IngestResult::Invalid : api.ingestConversion(body, &error);
            if (body.is_discarded())
                error = "invalid JSON body";
            cb(ingestResponse(result, error));
        },
        {Post});

    // Diagnostics
    app().registerHandler("/api/v1/diag/metrics",
                          [&api, jsonResponse](const HttpRequestPtr&, std::function<void(const HttpResponsePtr&)>&& cb)
                          { cb(jsonResponse(api.getDiagnosticsMetrics())); },
                          {Get});

    app().registerHandler(
        "/api/v1/diag/events",
        [&api, jsonResponse](const HttpRequestPtr& req, std::function<void(const HttpResponsePtr&)>&& cb)
        {
            auto        limitStr  = req->getParameter("limit");
            std::size_t maxEvents = 50;
            if (!limitStr.empty())
            {
                if (limitStr.find_first_not_of("0123456789") != std::string::npos || limitStr.size() > 6)
                {
                    cb(jsonResponse({{"error", "limit must be a non-negative integer"}}, k400BadRequest));
                    return;
                }
                maxEvents = static_cast<std::size_t>(std::stoul(limitStr));
            }
            cb(jsonResponse(api.getRecentEvents(maxEvents)));
        },
        {Get});

    diagMgr.log(diag::Severity::INFO, "Server",
                "listening on " + cfg.server.host + ":" + std::to_string(cfg.server.port));

    // SIGINT/SIGTERM: close the websockets while drogon's IO loops are still running, then quit.
    auto beginShutdown = [&refresher, &hub, &diagMgr]()
    {
        app().getLoop()->queueInLoop(
            [&refresher, &hub, &diagMgr]()
            {
                diagMgr.log(diag::Severity::INFO, "Server", "shutdown requested");
                refresher.stop();
                hub.stop();
                app().quit();
            });
    };
    app().setTermSignalHandler(beginShutdown);
    app().setIntSignalHandler(beginShutdown);

    // ---------------- Run Drogon ----------------
    app().run();

    // Cleanup; no-ops when the signal path already ran.
    refresher.stop();
    hub.stop();
    diagMgr.log(diag::Severity::INFO, "Server", "shut down");
    diagMgr.stop();

    return 0;
}
