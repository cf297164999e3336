#pragma once

#include <cstddef>
#include <string>

#include "diagnostic_manager.hpp"
#include "realtime_hub.hpp"
#include "snapshot_refresher.hpp"

// forward-declare nlohmann::json
#include <nlohmann/json_fwd.hpp>

namespace api
{

    enum class IngestResult
    {
        Accepted,
        Dropped,
        Invalid
    };

    /**
     * JSON views and producer entry points behind the HTTP handlers in main. Nothing here
     * blocks on the hub: ingest goes through the hub's non-blocking broadcast path.
     */
    class BackendApi
    {
      public:
        BackendApi(realtime::RealtimeHub& hub, diag::DiagnosticManager& diag,
                   const realtime::SnapshotRefresher* refresher = nullptr);

        // Realtime:
        nlohmann::json getRealtimeStats() const;
        IngestResult   ingestClick(const nlohmann::json& body, std::string* error = nullptr);
        IngestResult   ingestConversion(const nlohmann::json& body, std::string* error = nullptr);

        // Diagnostics:
        nlohmann::json   getRecentEvents(std::size_t maxEvents) const;
        nlohmann::json   getDiagnosticsMetrics() const;
        diag::HubMetrics collectMetrics() const;

      private:
        realtime::RealtimeHub&             m_hub;
        diag::DiagnosticManager&           m_diag;
        const realtime::SnapshotRefresher* m_refresher;
    };

} // namespace api
