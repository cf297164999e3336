#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace realtime
{

    using ConnectionId = uint64_t;

    enum class SendStatus
    {
        Ok,
        Timeout,
        Closed,
        TransportError
    };

    const char* sendStatusToString(SendStatus status);

    /**
     * One client's duplex channel as seen by the hub. The transport that accepted the client owns
     * the handle; the hub only keeps weak references and talks to it through send/close.
     *
     * send() never retries. A non-Ok status means the hub drops the subscriber.
     */
    class Connection
    {
      public:
        using Clock = std::chrono::steady_clock;

        Connection();
        virtual ~Connection() = default;

        Connection(const Connection&)            = delete;
        Connection& operator=(const Connection&) = delete;

        ConnectionId id() const { return m_id; }

        virtual SendStatus  send(const std::string& frame, std::chrono::milliseconds timeout) = 0;
        virtual void        close()        = 0; // idempotent
        virtual bool        isOpen() const = 0;
        virtual std::string peer() const   = 0;

        // Resets the read deadline; called on every inbound frame, pongs included.
        void              touch();
        void              touch(Clock::time_point at);
        Clock::time_point lastActivity() const;

      private:
        static std::atomic<ConnectionId> s_nextId;

        const ConnectionId      m_id;
        std::atomic<Clock::rep> m_lastActivity;
    };

    using ConnectionPtr = std::shared_ptr<Connection>;
    using ConnectionRef = std::weak_ptr<Connection>;

} // namespace realtime
