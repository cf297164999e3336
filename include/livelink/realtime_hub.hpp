#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "analytics_provider.hpp"
#include "connection_registry.hpp"
#include "diagnostic_manager.hpp"
#include "fetch_pool.hpp"
#include "hub_mailbox.hpp"
#include "realtime_protocol.hpp"
#include "subscription_index.hpp"

namespace realtime
{

    struct HubOptions
    {
        std::size_t               broadcastQueueCapacity{1000};
        std::size_t               controlQueueCapacity{4096};
        std::chrono::milliseconds writeTimeout{1000};
        std::chrono::seconds      keepaliveInterval{54};
        std::chrono::seconds      readTimeout{60};
        int                       initialWindowDays{30};
        std::size_t               fetchWorkers{4};
    };

    /**
     * Fan-out point for live analytics. One control-loop thread owns the connection registry and
     * the subscription index; every other thread talks to it through the mailbox.
     *
     * A broadcast reaches the handles subscribed to its topic when the loop dispatches it. A
     * handle that unsubscribes while that broadcast is already queued may or may not receive it.
     *
     * Initial snapshots are fetched once per topic: handles that subscribe while a topic's fetch
     * is outstanding wait on that fetch instead of queueing their own.
     *
     * Without start() the hub can be driven synchronously with processPending(),
     * runKeepaliveSweep() and pendingSnapshotTopics(); none of them may be called while the loop
     * thread is running.
     */
    class RealtimeHub
    {
      public:
        RealtimeHub(livelink::AnalyticsProvider& analytics, diag::DiagnosticManager& diag, HubOptions opts = {});
        ~RealtimeHub();

        RealtimeHub(const RealtimeHub&)            = delete;
        RealtimeHub& operator=(const RealtimeHub&) = delete;

        void start();
        void stop();
        bool isRunning() const { return m_running.load(); }

        bool registerConnection(const ConnectionPtr& conn);
        void unregisterConnection(ConnectionId id);
        void subscribe(ConnectionId id, const std::string& topic);
        void unsubscribe(ConnectionId id, const std::string& topic);
        void handleClientMessage(const ConnectionPtr& conn, const std::string& text);

        // Non-blocking. false when the broadcast queue is full (the update is dropped) or the hub is stopped.
        bool broadcast(Update update);
        bool broadcastClick(const std::string& shortCode, const std::string& ipAddress, const std::string& userAgent,
                            const std::string& referrer);
        bool broadcastConversion(const std::string& shortCode, const livelink::ConversionEvent& conversion);

        // Point-in-time copies published by the control loop.
        std::size_t                        activeConnectionCount() const;
        std::map<std::string, std::size_t> activeSubscriptionCounts() const;
        std::vector<std::string>           activeTopics() const;
        diag::HubMetrics                   metrics() const;

        const HubOptions& options() const { return m_opts; }

        std::size_t processPending();
        void        runKeepaliveSweep(Connection::Clock::time_point now);
        bool        waitForFetches(std::chrono::milliseconds timeout);
        std::size_t pendingSnapshotTopics() const;

      private:
        struct PublishedState
        {
            std::size_t                        connections{0};
            std::size_t                        subscriptions{0};
            std::map<std::string, std::size_t> counts;
        };

        void loop();
        void handleInput(HubInput& input);
        void handleCommand(HubCommand& cmd);
        void dispatch(const Update& update);
        void sendTo(const ConnectionPtr& conn, const std::string& frame, const char* what);
        void requestInitialSnapshot(ConnectionId id, const std::string& topic);
        void deliverInitialSnapshot(const Update& update);
        void evict(const ConnectionPtr& conn, ConnectionId id, const std::string& reason);
        void closeAll();
        void publishState();

        livelink::AnalyticsProvider& m_analytics;
        diag::DiagnosticManager&     m_diag;
        const HubOptions             m_opts;

        HubMailbox         m_mailbox;
        ConnectionRegistry m_registry;
        SubscriptionIndex  m_index;

        // Handles waiting for a topic's initial snapshot; one fetch per topic serves them all.
        std::unordered_map<std::string, std::set<ConnectionId>> m_awaitingSnapshot;

        std::atomic<bool> m_running{false};
        std::atomic<bool> m_stopped{false};
        std::thread       m_thread;

        mutable std::mutex m_stateMtx;
        PublishedState     m_published;

        std::atomic<uint64_t> m_broadcastsAccepted{0};
        std::atomic<uint64_t> m_broadcastsDropped{0};
        std::atomic<uint64_t> m_deliveries{0};
        std::atomic<uint64_t> m_failedSends{0};
        std::atomic<uint64_t> m_evictions{0};
        std::atomic<uint64_t> m_fetchFailures{0};

        // Declared last: workers join before anything they capture goes away.
        FetchPool m_fetchPool;
    };

} // namespace realtime
