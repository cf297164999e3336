#include "realtime_hub.hpp"

#include <nlohmann/json.hpp>

#include <exception>
#include <type_traits>
#include <variant>

#include "user_agent.hpp"

namespace realtime
{

    RealtimeHub::RealtimeHub(livelink::AnalyticsProvider& analytics, diag::DiagnosticManager& diag, HubOptions opts)
        : m_analytics(analytics),
          m_diag(diag),
          m_opts(opts),
          m_mailbox(opts.controlQueueCapacity, opts.broadcastQueueCapacity),
          m_fetchPool("initial-snapshot", opts.fetchWorkers, diag)
    {
    }

    RealtimeHub::~RealtimeHub()
    {
        stop();
    }

    void RealtimeHub::start()
    {
        if (m_stopped.load() || m_running.exchange(true))
            return;
        m_thread = std::thread(&RealtimeHub::loop, this);
        m_diag.log(diag::Severity::INFO, "RealtimeHub",
                   "started (broadcast queue " + std::to_string(m_opts.broadcastQueueCapacity) + ", keepalive " +
                       std::to_string(m_opts.keepaliveInterval.count()) + "s)");
    }

    void RealtimeHub::stop()
    {
        if (m_stopped.exchange(true))
            return;
        m_mailbox.close();
        if (m_thread.joinable())
            m_thread.join();
        m_running = false;
        closeAll();
        m_fetchPool.stop();
        m_diag.log(diag::Severity::INFO, "RealtimeHub", "stopped");
    }

    bool RealtimeHub::registerConnection(const ConnectionPtr& conn)
    {
        if (!conn)
            return false;
        return m_mailbox.postControl(HubCommand::registerConn(conn));
    }

    void RealtimeHub::unregisterConnection(ConnectionId id)
    {
        m_mailbox.postControl(HubCommand::unregisterConn(id));
    }

    void RealtimeHub::subscribe(ConnectionId id, const std::string& topic)
    {
        m_mailbox.postControl(HubCommand::subscribe(id, topic));
    }

    void RealtimeHub::unsubscribe(ConnectionId id, const std::string& topic)
    {
        m_mailbox.postControl(HubCommand::unsubscribe(id, topic));
    }

    void RealtimeHub::handleClientMessage(const ConnectionPtr& conn, const std::string& text)
    {
        if (!conn)
            return;
        auto msg = decodeClientMessage(text);
        if (!msg)
        {
            m_diag.log(diag::Severity::DEBUG, "RealtimeHub", "ignoring malformed message from " + conn->peer());
            return;
        }

        std::visit(
            [&](const auto& m) {
                using T = std::decay_t<decltype(m)>;
                if constexpr (std::is_same_v<T, SubscribeRequest>)
                    subscribe(conn->id(), m.topic);
                else if constexpr (std::is_same_v<T, UnsubscribeRequest>)
                    unsubscribe(conn->id(), m.topic);
                else
                    sendTo(conn, encodeUpdate(makeUpdate(UpdateKind::Pong, std::string{}, nullptr)), "pong");
            },
            *msg);
    }

    bool RealtimeHub::broadcast(Update update)
    {
        const auto topic = update.topic;
        if (!m_mailbox.tryPostBroadcast(std::move(update)))
        {
            ++m_broadcastsDropped;
            m_diag.log(diag::Severity::WARN, "RealtimeHub", "broadcast queue full, dropped update for " + topic);
            return false;
        }
        ++m_broadcastsAccepted;
        return true;
    }

    bool RealtimeHub::broadcastClick(const std::string& shortCode, const std::string& ipAddress,
                                     const std::string& userAgent, const std::string& referrer)
    {
        livelink::ClickEvent click;
        click.shortCode = shortCode;
        click.clientIp  = ipAddress;
        click.userAgent = userAgent;
        click.referrer  = referrer;
        click.timestamp = livelink::WallClock::now();

        const auto device = livelink::classifyUserAgent(userAgent);
        click.device      = device.deviceType;
        click.browser     = device.browser;
        click.os          = device.os;

        return broadcast(makeUpdate(UpdateKind::Click, shortCode, click));
    }

    bool RealtimeHub::broadcastConversion(const std::string& shortCode, const livelink::ConversionEvent& conversion)
    {
        return broadcast(makeUpdate(UpdateKind::Conversion, shortCode, conversion));
    }

    std::size_t RealtimeHub::activeConnectionCount() const
    {
        std::lock_guard<std::mutex> lk(m_stateMtx);
        return m_published.connections;
    }

    std::map<std::string, std::size_t> RealtimeHub::activeSubscriptionCounts() const
    {
        std::lock_guard<std::mutex> lk(m_stateMtx);
        return m_published.counts;
    }

    std::vector<std::string> RealtimeHub::activeTopics() const
    {
        std::lock_guard<std::mutex> lk(m_stateMtx);
        std::vector<std::string> out;
        out.reserve(m_published.counts.size());
        for (const auto& [topic, count] : m_published.counts)
            out.push_back(topic);
        return out;
    }

    diag::HubMetrics RealtimeHub::metrics() const
    {
        diag::HubMetrics m;
        {
            std::lock_guard<std::mutex> lk(m_stateMtx);
            m.connections   = m_published.connections;
            m.topics        = m_published.counts.size();
            m.subscriptions = m_published.subscriptions;
        }
        m.broadcastsAccepted = m_broadcastsAccepted.load();
        m.broadcastsDropped  = m_broadcastsDropped.load();
        m.deliveries         = m_deliveries.load();
        m.failedSends        = m_failedSends.load();
        m.evictions          = m_evictions.load();
        m.fetchFailures      = m_fetchFailures.load();
        return m;
    }

    std::size_t RealtimeHub::processPending()
    {
        std::size_t handled = 0;
        while (auto input = m_mailbox.tryNext())
        {
            handleInput(*input);
            ++handled;
        }
        return handled;
    }

    bool RealtimeHub::waitForFetches(std::chrono::milliseconds timeout)
    {
        return m_fetchPool.waitIdle(timeout);
    }

    std::size_t RealtimeHub::pendingSnapshotTopics() const
    {
        return m_awaitingSnapshot.size();
    }

    void RealtimeHub::loop()
    {
        auto nextKeepalive = HubMailbox::Clock::now() + m_opts.keepaliveInterval;
        for (;;)
        {
            auto input = m_mailbox.waitNext(nextKeepalive);
            if (input.kind == HubInput::Kind::Closed)
                return;
            if (input.kind == HubInput::Kind::KeepaliveDue)
            {
                const auto now = HubMailbox::Clock::now();
                runKeepaliveSweep(now);
                nextKeepalive = now + m_opts.keepaliveInterval;
                continue;
            }
            handleInput(input);
        }
    }

    void RealtimeHub::handleInput(HubInput& input)
    {
        switch (input.kind)
        {
        case HubInput::Kind::Control:
            handleCommand(input.command);
            break;
        case HubInput::Kind::Broadcast:
            dispatch(input.update);
            break;
        case HubInput::Kind::KeepaliveDue:
            runKeepaliveSweep(HubMailbox::Clock::now());
            break;
        case HubInput::Kind::Closed:
            break;
        }
    }

    void RealtimeHub::handleCommand(HubCommand& cmd)
    {
        switch (cmd.kind)
        {
        case HubCommand::Kind::Register:
            if (!cmd.conn || !cmd.conn->isOpen())
                return;
            if (m_registry.add(cmd.conn))
            {
                m_diag.log(diag::Severity::DEBUG, "RealtimeHub",
                           "registered " + std::to_string(cmd.id) + " (" + cmd.conn->peer() + ")");
                publishState();
            }
            return;

        case HubCommand::Kind::Unregister:
        {
            const bool known   = m_registry.remove(cmd.id);
            const auto removed = m_index.unregisterAll(cmd.id);
            if (known || removed > 0)
            {
                m_diag.log(diag::Severity::DEBUG, "RealtimeHub",
                           "unregistered " + std::to_string(cmd.id) + ", dropped " + std::to_string(removed) +
                               " subscriptions");
                publishState();
            }
            return;
        }

        case HubCommand::Kind::Subscribe:
            if (!m_registry.contains(cmd.id))
                return;
            if (m_index.subscribe(cmd.id, cmd.topic))
            {
                publishState();
                requestInitialSnapshot(cmd.id, cmd.topic);
            }
            return;

        case HubCommand::Kind::Unsubscribe:
            if (m_index.unsubscribe(cmd.id, cmd.topic))
                publishState();
            return;

        case HubCommand::Kind::SnapshotReady:
            deliverInitialSnapshot(cmd.update);
            return;

        case HubCommand::Kind::SnapshotFailed:
            m_awaitingSnapshot.erase(cmd.topic);
            return;
        }
    }

    void RealtimeHub::dispatch(const Update& update)
    {
        const auto ids = m_index.subscribers(update.topic);
        if (ids.empty())
            return;

        const auto frame = encodeUpdate(update);
        for (auto id : ids)
        {
            auto conn = m_registry.find(id);
            if (!conn)
            {
                m_mailbox.postControlInternal(HubCommand::unregisterConn(id));
                continue;
            }
            sendTo(conn, frame, wireType(update.kind));
        }
    }

    void RealtimeHub::sendTo(const ConnectionPtr& conn, const std::string& frame, const char* what)
    {
        const auto status = conn->send(frame, m_opts.writeTimeout);
        if (status == SendStatus::Ok)
        {
            ++m_deliveries;
            return;
        }

        ++m_failedSends;
        m_diag.log(diag::Severity::WARN, "RealtimeHub",
                   std::string("send of ") + what + " to " + conn->peer() + " failed: " + sendStatusToString(status));
        conn->close();
        m_mailbox.postControlInternal(HubCommand::unregisterConn(conn->id()));
    }

    void RealtimeHub::requestInitialSnapshot(ConnectionId id, const std::string& topic)
    {
        auto&      waiters  = m_awaitingSnapshot[topic];
        const bool inFlight = !waiters.empty();
        waiters.insert(id);
        if (inFlight)
            return;

        const int  days   = m_opts.initialWindowDays;
        const auto result = m_fetchPool.submit(topic, [this, topic, days]() {
            try
            {
                auto snapshot = m_analytics.getAnalyticsSnapshot(topic, days);
                m_mailbox.postControlInternal(
                    HubCommand::snapshotReady(makeUpdate(UpdateKind::InitialSnapshot, topic, snapshot)));
            }
            catch (const livelink::AnalyticsError& ex)
            {
                ++m_fetchFailures;
                m_diag.log(diag::Severity::WARN, "RealtimeHub",
                           "initial analytics for " + topic + " unavailable: " + ex.what());
                m_mailbox.postControlInternal(HubCommand::snapshotFailed(topic));
            }
            catch (const std::exception& ex)
            {
                ++m_fetchFailures;
                m_diag.log(diag::Severity::ERROR, "RealtimeHub",
                           "initial analytics for " + topic + " failed: " + ex.what());
                m_mailbox.postControlInternal(HubCommand::snapshotFailed(topic));
            }
        });

        if (result == FetchPool::SubmitResult::Stopped)
            m_awaitingSnapshot.erase(topic);
    }

    void RealtimeHub::deliverInitialSnapshot(const Update& update)
    {
        auto it = m_awaitingSnapshot.find(update.topic);
        if (it == m_awaitingSnapshot.end())
            return;
        const auto waiters = std::move(it->second);
        m_awaitingSnapshot.erase(it);

        const auto frame = encodeUpdate(update);
        for (auto id : waiters)
        {
            if (!m_index.isSubscribed(id, update.topic))
                continue;
            if (auto conn = m_registry.find(id))
                sendTo(conn, frame, wireType(update.kind));
        }
    }

    void RealtimeHub::runKeepaliveSweep(Connection::Clock::time_point now)
    {
        const auto ping = encodeUpdate(makeUpdate(UpdateKind::Ping, std::string{}, nullptr));
        for (auto id : m_registry.ids())
        {
            auto conn = m_registry.find(id);
            if (!conn || !conn->isOpen())
            {
                evict(conn, id, "connection gone");
                continue;
            }
            if (now - conn->lastActivity() > m_opts.readTimeout)
            {
                evict(conn, id, "no response within " + std::to_string(m_opts.readTimeout.count()) + "s");
                continue;
            }

            const auto status = conn->send(ping, m_opts.writeTimeout);
            if (status != SendStatus::Ok)
            {
                ++m_failedSends;
                evict(conn, id, std::string("ping failed: ") + sendStatusToString(status));
            }
        }
    }

    void RealtimeHub::evict(const ConnectionPtr& conn, ConnectionId id, const std::string& reason)
    {
        ++m_evictions;
        m_diag.log(diag::Severity::INFO, "RealtimeHub", "evicting " + std::to_string(id) + ": " + reason);
        if (conn)
            conn->close();
        m_mailbox.postControlInternal(HubCommand::unregisterConn(id));
    }

    void RealtimeHub::closeAll()
    {
        const auto conns = m_registry.lockAll();
        for (const auto& conn : conns)
            conn->close();
        m_registry.clear();
        m_index.clear();
        m_awaitingSnapshot.clear();
        publishState();
        if (!conns.empty())
            m_diag.log(diag::Severity::INFO, "RealtimeHub", "closed " + std::to_string(conns.size()) + " connections");
    }

    void RealtimeHub::publishState()
    {
        PublishedState next;
        next.connections   = m_registry.size();
        next.subscriptions = m_index.subscriptionCount();
        next.counts        = m_index.subscriberCounts();

        std::lock_guard<std::mutex> lk(m_stateMtx);
        m_published = std::move(next);
    }

} // namespace realtime
