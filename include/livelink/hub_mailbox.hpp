#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

#include "connection.hpp"
#include "realtime_protocol.hpp"

namespace realtime
{

    struct HubCommand
    {
        enum class Kind
        {
            Register,
            Unregister,
            Subscribe,
            Unsubscribe,
            SnapshotReady,
            SnapshotFailed
        };

        Kind          kind{Kind::Register};
        ConnectionId  id{0};
        ConnectionPtr conn;   // Register only
        std::string   topic;  // all but Register and Unregister
        Update        update; // SnapshotReady only

        static HubCommand registerConn(const ConnectionPtr& conn);
        static HubCommand unregisterConn(ConnectionId id);
        static HubCommand subscribe(ConnectionId id, const std::string& topic);
        static HubCommand unsubscribe(ConnectionId id, const std::string& topic);
        // Initial snapshot fetched for every handle waiting on update.topic.
        static HubCommand snapshotReady(Update update);
        static HubCommand snapshotFailed(const std::string& topic);
    };

    struct HubInput
    {
        enum class Kind
        {
            Control,
            Broadcast,
            KeepaliveDue,
            Closed
        };

        Kind       kind{Kind::Closed};
        HubCommand command;
        Update     update;
    };

    /**
     * Inbound side of the hub: a control queue and a broadcast queue behind one lock.
     *
     * Control posts from outside block while the control queue is full; the loop's own
     * unregister requests bypass the bound so it can never wait on itself. Broadcasts never
     * block: a full broadcast queue rejects the newest update. waitNext() alternates between
     * the two queues when both have work.
     */
    class HubMailbox
    {
      public:
        using Clock = std::chrono::steady_clock;

        HubMailbox(std::size_t controlCapacity, std::size_t broadcastCapacity);

        // false once closed
        bool postControl(HubCommand cmd);
        void postControlInternal(HubCommand cmd);
        // false when full or closed; never blocks
        bool tryPostBroadcast(Update update);

        HubInput                waitNext(Clock::time_point keepaliveDue);
        std::optional<HubInput> tryNext();

        void close();
        bool isClosed() const;

        std::size_t controlDepth() const;
        std::size_t broadcastDepth() const;
        std::size_t broadcastCapacity() const { return m_broadcastCapacity; }

      private:
        std::optional<HubInput> popLocked();

        const std::size_t       m_controlCapacity;
        const std::size_t       m_broadcastCapacity;
        mutable std::mutex      m_mtx;
        std::condition_variable m_inputCv;
        std::condition_variable m_spaceCv;
        std::deque<HubCommand>  m_control;
        std::deque<Update>      m_broadcasts;
        bool                    m_preferBroadcast{false};
        bool                    m_closed{false};
    };

} // namespace realtime
